/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for node registrar
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef LRPAGENT_NODEREGISTRAR_H
#define LRPAGENT_NODEREGISTRAR_H

#include <lrpagent/SharedStore.h>
#include <lrpagent/NodeManager.h>

#include <boost/noncopyable.hpp>

#include <memory>
#include <mutex>
#include <string>

namespace lrpagent {

/**
 * Forwards node changes seen in the node store to a node manager
 */
class NodeObserver : public StoreObserver {
public:
    /**
     * Construct a node observer
     *
     * @param manager the node manager to notify
     */
    explicit NodeObserver(NodeManager& manager);

    // StoreObserver
    virtual void onUpdate(const StoreKey& key);
    virtual void onDelete(const StoreKey& key);

private:
    NodeManager& manager;
};

/**
 * Registers the local node in the key-value store and tracks the
 * nodes registered by other agents
 */
class NodeRegistrar : private boost::noncopyable {
public:
    /**
     * Key prefix of the store holding all nodes.  Part of the
     * on-store format; do not change.
     */
    static const std::string NODES_PREFIX;

    /**
     * Key prefix of the store nodes register themselves in.  Part of
     * the on-store format; do not change.
     */
    static const std::string NODE_REGISTER_PREFIX;

    /**
     * Construct a node registrar
     *
     * @param backend the key-value store backend, or NULL if no
     * key-value store is configured
     */
    explicit NodeRegistrar(KVBackend* backend);

    /**
     * Release both stores
     */
    ~NodeRegistrar();

    /**
     * Join the node stores and publish the local node.  Does nothing
     * if no key-value store is configured.
     *
     * @param node the local node
     * @param manager the node manager notified of node changes
     * @throws KVStoreError if a store cannot be joined or the node
     * cannot be written
     */
    void registerNode(const Node& node, NodeManager& manager);

    /**
     * Write the local node again and wait for the write to complete
     *
     * @param node the local node
     * @throws KVStoreError if the node cannot be written
     */
    void updateLocalKeySync(const Node& node);

    /**
     * Leave both stores
     */
    void release();

    /**
     * Get the store of all nodes, if joined
     */
    std::shared_ptr<SharedStore> getNodeStore();

    /**
     * Get the registration store, if joined
     */
    std::shared_ptr<SharedStore> getRegisterStore();

private:
    KVBackend* backend;
    std::unique_ptr<NodeObserver> observer;

    std::mutex registrar_mutex;
    std::shared_ptr<SharedStore> nodeStore;
    std::shared_ptr<SharedStore> registerStore;

    std::shared_ptr<SharedStore> localKeyStore();
};

} /* namespace lrpagent */

#endif /* LRPAGENT_NODEREGISTRAR_H */
