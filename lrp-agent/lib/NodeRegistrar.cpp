/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for NodeRegistrar class.
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <lrpagent/NodeRegistrar.h>
#include <lrpagent/Errors.h>
#include <lrpagent/logging.h>

namespace lrpagent {

using std::string;
using std::shared_ptr;
using std::make_shared;
using std::unique_lock;
using std::mutex;

const string NodeRegistrar::NODES_PREFIX("lrpagent/state/nodes/v1");
const string
NodeRegistrar::NODE_REGISTER_PREFIX("lrpagent/state/noderegister/v1");

static StoreKeyPtr createNodeKey() {
    return make_shared<Node>();
}

NodeObserver::NodeObserver(NodeManager& manager_)
    : manager(manager_) {}

void NodeObserver::onUpdate(const StoreKey& key) {
    const Node* n = dynamic_cast<const Node*>(&key);
    if (!n)
        return;
    Node node(*n);
    node.setSource(Node::KVSTORE);
    manager.nodeUpdated(node);
}

void NodeObserver::onDelete(const StoreKey& key) {
    const Node* n = dynamic_cast<const Node*>(&key);
    if (!n)
        return;
    Node node(*n);
    node.setSource(Node::KVSTORE);
    manager.nodeDeleted(node);
}

NodeRegistrar::NodeRegistrar(KVBackend* backend_)
    : backend(backend_) {}

NodeRegistrar::~NodeRegistrar() {
    release();
}

void NodeRegistrar::registerNode(const Node& node, NodeManager& manager) {
    if (!backend) {
        LOG(DEBUG) << "No key-value store configured; not registering "
                   << node.getIdentity();
        return;
    }

    // stores of an earlier registration still refer to the old observer
    release();

    std::unique_ptr<NodeObserver> newObserver(new NodeObserver(manager));

    SharedStoreConfig regConfig;
    regConfig.prefix = NODE_REGISTER_PREFIX;
    regConfig.keyCreator = createNodeKey;
    shared_ptr<SharedStore> reg = SharedStore::join(*backend, regConfig);

    SharedStoreConfig nodeConfig;
    nodeConfig.prefix = NODES_PREFIX;
    nodeConfig.keyCreator = createNodeKey;
    nodeConfig.observer = newObserver.get();
    shared_ptr<SharedStore> nodes;
    try {
        nodes = SharedStore::join(*backend, nodeConfig);
    } catch (const std::exception& e) {
        LOG(ERROR) << "Could not join node store: " << e.what();
        reg->release();
        throw;
    }

    try {
        (reg ? reg : nodes)->updateLocalKeySync(node);
    } catch (const std::exception& e) {
        LOG(ERROR) << "Could not register node " << node.getIdentity()
                   << ": " << e.what();
        nodes->release();
        reg->release();
        throw;
    }

    {
        unique_lock<mutex> guard(registrar_mutex);
        observer.swap(newObserver);
        registerStore = reg;
        nodeStore = nodes;
    }
    LOG(INFO) << "Registered node " << node.getIdentity();
}

shared_ptr<SharedStore> NodeRegistrar::localKeyStore() {
    unique_lock<mutex> guard(registrar_mutex);
    return registerStore ? registerStore : nodeStore;
}

void NodeRegistrar::updateLocalKeySync(const Node& node) {
    if (!backend)
        return;

    shared_ptr<SharedStore> store = localKeyStore();
    if (!store) {
        throw KVStoreError("Node " + node.getKeyName() +
                           " is not registered");
    }
    store->updateLocalKeySync(node);
}

void NodeRegistrar::release() {
    shared_ptr<SharedStore> reg;
    shared_ptr<SharedStore> nodes;
    {
        unique_lock<mutex> guard(registrar_mutex);
        reg.swap(registerStore);
        nodes.swap(nodeStore);
    }
    if (nodes)
        nodes->release();
    if (reg)
        reg->release();
}

shared_ptr<SharedStore> NodeRegistrar::getNodeStore() {
    unique_lock<mutex> guard(registrar_mutex);
    return nodeStore;
}

shared_ptr<SharedStore> NodeRegistrar::getRegisterStore() {
    unique_lock<mutex> guard(registrar_mutex);
    return registerStore;
}

} /* namespace lrpagent */
