/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for AgentConfig class.
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <lrpagent/AgentConfig.h>
#include <lrpagent/logging.h>

#include <boost/property_tree/json_parser.hpp>
#include <boost/iostreams/filtering_streambuf.hpp>
#include <boost/iostreams/filter/line.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <fstream>
#include <stdexcept>

namespace lrpagent {

using std::string;
using boost::optional;
namespace pt = boost::property_tree;

static const string LOG_LEVEL("log.level");
static const string NODE_NAME("node.name");
static const string NODE_CLUSTER("node.cluster");
static const string LRP_ENABLE_IPV4("redirect-policy.enable-ipv4");
static const string LRP_ENABLE_IPV6("redirect-policy.enable-ipv6");
static const string KVSTORE_ENABLED("kvstore.enabled");

static const string DEFAULT_CLUSTER("default");

class strip_comments : public boost::iostreams::line_filter {
private:
    string do_filter(const string& line) {
        // only comments that begin the line
        string trimmed = line;
        boost::trim(trimmed);
        if (boost::starts_with(trimmed, "#") ||
            boost::starts_with(trimmed, "//")) {
            return string();
        }
        return line;
    }
};

AgentConfig::AgentConfig()
    : clusterName(DEFAULT_CLUSTER), enableIPv4(true), enableIPv6(false),
      kvstoreEnabled(false) {}

void AgentConfig::readConfig(const string& configFile) {
    pt::ptree properties;

    LOG(INFO) << "Reading configuration from " << configFile;

    std::ifstream file(configFile, std::ios_base::in | std::ios_base::binary);
    if (!file.is_open()) {
        throw pt::json_parser_error("Could not open file", configFile, 0);
    }
    boost::iostreams::filtering_streambuf<boost::iostreams::input> inbuf;
    inbuf.push(strip_comments());
    inbuf.push(file);
    std::istream instream(&inbuf);

    try {
        pt::read_json(instream, properties);
    } catch (const pt::json_parser_error& e) {
        LOG(ERROR) << "Error parsing config file: " << configFile << "("
                   << e.line() << "): " << e.message();
        throw;
    }
    setProperties(properties);
}

void AgentConfig::setProperties(const pt::ptree& properties) {
    optional<string> logLvl = properties.get_optional<string>(LOG_LEVEL);
    if (logLvl)
        logLevelStr = logLvl;

    optional<string> name = properties.get_optional<string>(NODE_NAME);
    if (name)
        nodeName = name;
    clusterName = properties.get<string>(NODE_CLUSTER, clusterName);

    enableIPv4 = properties.get<bool>(LRP_ENABLE_IPV4, enableIPv4);
    enableIPv6 = properties.get<bool>(LRP_ENABLE_IPV6, enableIPv6);
    kvstoreEnabled = properties.get<bool>(KVSTORE_ENABLED, kvstoreEnabled);
}

void AgentConfig::applyProperties() {
    if (!nodeName || nodeName.get().empty()) {
        LOG(ERROR) << "Node name must be set";
        throw std::runtime_error("Node name must be set");
    }
    if (!enableIPv4 && !enableIPv6) {
        LOG(ERROR) << "At least one of IPv4 and IPv6 must be enabled";
        throw std::runtime_error("No address family enabled");
    }

    if (logLevelStr)
        setLoggingLevel(logLevelStr.get());

    if (!kvstoreEnabled)
        LOG(INFO) << "No key-value store configured; node "
                  << nodeName.get() << " will not be registered";
}

RedirectPolicyOptions AgentConfig::getRedirectPolicyOptions() const {
    RedirectPolicyOptions options;
    options.enableIPv4 = enableIPv4;
    options.enableIPv6 = enableIPv6;
    if (nodeName)
        options.nodeName = nodeName.get();
    return options;
}

Node AgentConfig::getLocalNode() const {
    Node node(nodeName ? nodeName.get() : string(), clusterName);
    node.setSource(Node::LOCAL);
    return node;
}

} /* namespace lrpagent */
