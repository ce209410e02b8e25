/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for agent configuration
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef LRPAGENT_AGENTCONFIG_H
#define LRPAGENT_AGENTCONFIG_H

#include <lrpagent/RedirectPolicyManager.h>
#include <lrpagent/Node.h>

#include <boost/property_tree/ptree.hpp>
#include <boost/optional.hpp>

#include <string>

namespace lrpagent {

/**
 * Configuration of the local redirect policy agent.  The
 * configuration is a JSON document such as:
 *
 * {
 *     "log": { "level": "info" },
 *     "node": { "name": "node1", "cluster": "default" },
 *     "redirect-policy": { "enable-ipv4": true, "enable-ipv6": false },
 *     "kvstore": { "enabled": false }
 * }
 */
class AgentConfig {
public:
    /**
     * Instantiate a configuration with the default settings
     */
    AgentConfig();

    /**
     * Read a configuration file.  Lines beginning with "#" or "//"
     * are comments.
     *
     * @param configFile the path to the file
     * @throws boost::property_tree::json_parser_error if the file
     * cannot be parsed
     */
    void readConfig(const std::string& configFile);

    /**
     * Set configuration properties, overriding earlier values
     *
     * @param properties the property tree
     */
    void setProperties(const boost::property_tree::ptree& properties);

    /**
     * Validate the configuration and apply the log level
     *
     * @throws std::runtime_error if the configuration is invalid
     */
    void applyProperties();

    /**
     * Get the configured log level, if any
     */
    const boost::optional<std::string>& getLogLevel() const {
        return logLevelStr;
    }

    /**
     * Get the node name
     */
    const boost::optional<std::string>& getNodeName() const {
        return nodeName;
    }

    /**
     * Get the cluster name
     */
    const std::string& getClusterName() const { return clusterName; }

    /**
     * Check whether IPv4 backends are enabled
     */
    bool isIPv4Enabled() const { return enableIPv4; }

    /**
     * Check whether IPv6 backends are enabled
     */
    bool isIPv6Enabled() const { return enableIPv6; }

    /**
     * Check whether the node should be registered in the key-value
     * store
     */
    bool isKVStoreEnabled() const { return kvstoreEnabled; }

    /**
     * Get the options for the redirect policy manager
     */
    RedirectPolicyOptions getRedirectPolicyOptions() const;

    /**
     * Get the local node as it is published to the key-value store
     */
    Node getLocalNode() const;

private:
    boost::optional<std::string> logLevelStr;
    boost::optional<std::string> nodeName;
    std::string clusterName;
    bool enableIPv4;
    bool enableIPv6;
    bool kvstoreEnabled;
};

} /* namespace lrpagent */

#endif /* LRPAGENT_AGENTCONFIG_H */
