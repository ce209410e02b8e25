/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Test suite for agent configuration
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <boost/test/unit_test.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <lrpagent/AgentConfig.h>
#include <lrpagent/test/BaseFixture.h>
#include <lrpagent/logging.h>

#include <stdexcept>

namespace lrpagent {

namespace fs = boost::filesystem;
namespace pt = boost::property_tree;

BOOST_AUTO_TEST_SUITE(AgentConfig_test)

BOOST_AUTO_TEST_CASE(defaults) {
    AgentConfig config;
    BOOST_CHECK(!config.getNodeName());
    BOOST_CHECK_EQUAL("default", config.getClusterName());
    BOOST_CHECK(config.isIPv4Enabled());
    BOOST_CHECK(!config.isIPv6Enabled());
    BOOST_CHECK(!config.isKVStoreEnabled());

    // node name is required
    BOOST_CHECK_THROW(config.applyProperties(), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(properties) {
    pt::ptree properties;
    properties.put("node.name", "node1");
    properties.put("node.cluster", "cluster1");
    properties.put("redirect-policy.enable-ipv6", true);
    properties.put("kvstore.enabled", true);

    AgentConfig config;
    config.setProperties(properties);
    config.applyProperties();

    RedirectPolicyOptions options = config.getRedirectPolicyOptions();
    BOOST_CHECK(options.enableIPv4);
    BOOST_CHECK(options.enableIPv6);
    BOOST_CHECK_EQUAL("node1", options.nodeName);
    BOOST_CHECK(config.isKVStoreEnabled());

    Node node = config.getLocalNode();
    BOOST_CHECK_EQUAL("node1", node.getName());
    BOOST_CHECK_EQUAL("cluster1", node.getCluster());
    BOOST_CHECK_EQUAL(Node::LOCAL, node.getSource());

    // later properties override
    pt::ptree more;
    more.put("redirect-policy.enable-ipv4", false);
    config.setProperties(more);
    BOOST_CHECK(!config.isIPv4Enabled());
    BOOST_CHECK(config.isIPv6Enabled());
    BOOST_CHECK_EQUAL("cluster1", config.getClusterName());
}

BOOST_AUTO_TEST_CASE(no_family) {
    pt::ptree properties;
    properties.put("node.name", "node1");
    properties.put("redirect-policy.enable-ipv4", false);

    AgentConfig config;
    config.setProperties(properties);
    BOOST_CHECK_THROW(config.applyProperties(), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(log_level) {
    pt::ptree properties;
    properties.put("node.name", "node1");
    properties.put("log.level", "WARNING");

    AgentConfig config;
    config.setProperties(properties);
    config.applyProperties();
    BOOST_CHECK_EQUAL(WARNING, logLevel);

    // unknown names fall back to info
    setLoggingLevel("verbose");
    BOOST_CHECK_EQUAL(INFO, logLevel);

    setLoggingLevel("error");
    BOOST_CHECK_EQUAL(ERROR, logLevel);
}

BOOST_FIXTURE_TEST_CASE(read_config, TempGuard) {
    fs::path path(temp_dir / "lrp-agent.conf");
    fs::ofstream os(path);
    os << "# lrp agent configuration\n"
       << "{\n"
       << "    // logging\n"
       << "    \"log\": { \"level\": \"error\" },\n"
       << "    \"node\": { \"name\": \"node7\" },\n"
       << "    \"redirect-policy\": { \"enable-ipv6\": true }\n"
       << "}\n";
    os.close();

    AgentConfig config;
    config.readConfig(path.string());
    config.applyProperties();

    BOOST_REQUIRE(config.getNodeName());
    BOOST_CHECK_EQUAL("node7", config.getNodeName().get());
    BOOST_REQUIRE(config.getLogLevel());
    BOOST_CHECK_EQUAL("error", config.getLogLevel().get());
    BOOST_CHECK(config.isIPv6Enabled());
    BOOST_CHECK_EQUAL("default", config.getLocalNode().getCluster());
}

BOOST_FIXTURE_TEST_CASE(read_config_invalid, TempGuard) {
    fs::path path(temp_dir / "bad.conf");
    fs::ofstream os(path);
    os << "{ \"node\": ";
    os.close();

    AgentConfig config;
    BOOST_CHECK_THROW(config.readConfig(path.string()),
                      pt::json_parser_error);
    BOOST_CHECK_THROW(config.readConfig((temp_dir / "missing.conf").string()),
                      pt::json_parser_error);
}

BOOST_AUTO_TEST_SUITE_END()

} /* namespace lrpagent */
