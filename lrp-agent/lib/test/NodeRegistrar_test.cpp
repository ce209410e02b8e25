/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Test suite for node registrar
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <boost/test/unit_test.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <lrpagent/NodeRegistrar.h>
#include <lrpagent/InMemoryKVBackend.h>
#include <lrpagent/Errors.h>

#include <string>
#include <vector>

namespace lrpagent {

using std::string;
using std::vector;
using boost::asio::ip::address;

/**
 * An in-memory backend that can be told to fail
 */
class FaultyKVBackend : public InMemoryKVBackend {
public:
    FaultyKVBackend() : failUpdates(false), watches(0) {}

    virtual void update(const string& key, const string& value, bool lease) {
        if (failUpdates)
            throw KVStoreError("update failed");
        InMemoryKVBackend::update(key, value, lease);
    }

    virtual void watchPrefix(const string& prefix, KVWatcher* watcher) {
        if (!failWatchPrefix.empty() &&
            boost::algorithm::starts_with(prefix, failWatchPrefix))
            throw KVStoreError("watch failed");
        watches += 1;
        InMemoryKVBackend::watchPrefix(prefix, watcher);
    }

    virtual void unwatchPrefix(const string& prefix, KVWatcher* watcher) {
        watches -= 1;
        InMemoryKVBackend::unwatchPrefix(prefix, watcher);
    }

    bool failUpdates;
    string failWatchPrefix;
    int watches;
};

class RecordingNodeManager : public NodeManager {
public:
    virtual void nodeUpdated(const Node& node) {
        updated.push_back(node);
    }
    virtual void nodeDeleted(const Node& node) {
        deleted.push_back(node);
    }
    virtual bool exists(const NodeIdentity& id) {
        for (const Node& n : updated) {
            if (n.getIdentity() == id)
                return true;
        }
        return false;
    }

    vector<Node> updated;
    vector<Node> deleted;
};

class RegistrarFixture {
public:
    RegistrarFixture() : local("node1", "default") {
        local.setSource(Node::LOCAL);
        local.addAddress(Node::Address::INTERNAL_IP,
                         address::from_string("192.168.1.1"));
    }

    string registerKey() {
        return NodeRegistrar::NODE_REGISTER_PREFIX + "/default/node1";
    }

    FaultyKVBackend backend;
    RecordingNodeManager nodeManager;
    Node local;
};

BOOST_AUTO_TEST_SUITE(NodeRegistrar_test)

BOOST_AUTO_TEST_CASE(prefixes) {
    BOOST_CHECK_EQUAL("lrpagent/state/nodes/v1",
                      NodeRegistrar::NODES_PREFIX);
    BOOST_CHECK_EQUAL("lrpagent/state/noderegister/v1",
                      NodeRegistrar::NODE_REGISTER_PREFIX);
}

BOOST_FIXTURE_TEST_CASE(no_kvstore, RegistrarFixture) {
    NodeRegistrar registrar(NULL);
    registrar.registerNode(local, nodeManager);
    registrar.updateLocalKeySync(local);
    BOOST_CHECK(!registrar.getNodeStore());
    BOOST_CHECK(!registrar.getRegisterStore());
    BOOST_CHECK_EQUAL(0, backend.size());
}

BOOST_FIXTURE_TEST_CASE(register_node, RegistrarFixture) {
    NodeRegistrar registrar(&backend);
    registrar.registerNode(local, nodeManager);

    string value;
    BOOST_REQUIRE(backend.get(registerKey(), value));
    Node stored;
    stored.unmarshal(value);
    BOOST_CHECK(stored.getIdentity() == local.getIdentity());
    BOOST_CHECK(registrar.getNodeStore());
    BOOST_CHECK(registrar.getRegisterStore());
    BOOST_CHECK_EQUAL(2, backend.watches);

    local.setIPv4AllocCIDR("10.1.0.0/24");
    registrar.updateLocalKeySync(local);
    BOOST_REQUIRE(backend.get(registerKey(), value));
    stored.unmarshal(value);
    BOOST_REQUIRE(stored.getIPv4AllocCIDR());
    BOOST_CHECK_EQUAL("10.1.0.0/24", stored.getIPv4AllocCIDR().get());

    registrar.release();
    BOOST_CHECK(!backend.get(registerKey(), value));
    BOOST_CHECK_EQUAL(0, backend.watches);
    BOOST_CHECK(!registrar.getNodeStore());
}

BOOST_FIXTURE_TEST_CASE(remote_nodes, RegistrarFixture) {
    Node existing("node2", "default");
    existing.setSource(Node::LOCAL);
    backend.update(NodeRegistrar::NODES_PREFIX + "/default/node2",
                   existing.marshal(), false);

    NodeRegistrar registrar(&backend);
    registrar.registerNode(local, nodeManager);

    BOOST_REQUIRE_EQUAL(1, nodeManager.updated.size());
    BOOST_CHECK_EQUAL("node2", nodeManager.updated[0].getName());
    BOOST_CHECK_EQUAL(Node::KVSTORE, nodeManager.updated[0].getSource());
    BOOST_CHECK(nodeManager.exists(NodeIdentity("node2", "default")));

    Node remote("node3", "default");
    backend.update(NodeRegistrar::NODES_PREFIX + "/default/node3",
                   remote.marshal(), false);
    BOOST_REQUIRE_EQUAL(2, nodeManager.updated.size());
    BOOST_CHECK_EQUAL(Node::KVSTORE, nodeManager.updated[1].getSource());

    backend.remove(NodeRegistrar::NODES_PREFIX + "/default/node3");
    BOOST_REQUIRE_EQUAL(1, nodeManager.deleted.size());
    BOOST_CHECK_EQUAL("node3", nodeManager.deleted[0].getName());
    BOOST_CHECK_EQUAL(Node::KVSTORE, nodeManager.deleted[0].getSource());

    // registrations of other nodes are not node updates
    backend.update(NodeRegistrar::NODE_REGISTER_PREFIX + "/default/node4",
                   Node("node4", "default").marshal(), false);
    BOOST_CHECK_EQUAL(2, nodeManager.updated.size());
}

BOOST_FIXTURE_TEST_CASE(node_store_join_failure, RegistrarFixture) {
    backend.failWatchPrefix = NodeRegistrar::NODES_PREFIX;
    NodeRegistrar registrar(&backend);

    BOOST_CHECK_THROW(registrar.registerNode(local, nodeManager),
                      KVStoreError);
    BOOST_CHECK_EQUAL(0, backend.watches);
    BOOST_CHECK(!registrar.getRegisterStore());

    string value;
    BOOST_CHECK(!backend.get(registerKey(), value));
}

BOOST_FIXTURE_TEST_CASE(write_failure, RegistrarFixture) {
    backend.failUpdates = true;
    NodeRegistrar registrar(&backend);

    BOOST_CHECK_THROW(registrar.registerNode(local, nodeManager),
                      KVStoreError);
    BOOST_CHECK_EQUAL(0, backend.watches);
    BOOST_CHECK(!registrar.getNodeStore());
    BOOST_CHECK(!registrar.getRegisterStore());
    BOOST_CHECK_THROW(registrar.updateLocalKeySync(local), KVStoreError);
}

BOOST_FIXTURE_TEST_CASE(reregister, RegistrarFixture) {
    NodeRegistrar registrar(&backend);
    registrar.registerNode(local, nodeManager);
    registrar.registerNode(local, nodeManager);
    BOOST_CHECK_EQUAL(2, backend.watches);

    string value;
    BOOST_CHECK(backend.get(registerKey(), value));
}

BOOST_AUTO_TEST_SUITE_END()

} /* namespace lrpagent */
