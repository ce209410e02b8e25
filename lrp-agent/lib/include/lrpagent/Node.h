/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for cluster nodes
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef LRPAGENT_NODE_H
#define LRPAGENT_NODE_H

#include <lrpagent/SharedStore.h>

#include <boost/optional.hpp>
#include <boost/asio/ip/address.hpp>

#include <string>
#include <vector>
#include <ostream>
#include <cstdint>

namespace lrpagent {

/**
 * Identifies a node across clusters
 */
class NodeIdentity {
public:
    NodeIdentity() {}
    NodeIdentity(const std::string& name_, const std::string& cluster_)
        : name(name_), cluster(cluster_) {}

    /**
     * The node name
     */
    std::string name;

    /**
     * The cluster name
     */
    std::string cluster;
};

/**
 * Check for node identity equality.
 */
bool operator==(const NodeIdentity& lhs, const NodeIdentity& rhs);

/**
 * Print a node identity to an ostream
 */
std::ostream& operator<<(std::ostream& os, const NodeIdentity& id);

/**
 * A node of a cluster as published in the node store
 */
class Node : public StoreKey {
public:
    /**
     * Where the node information came from
     */
    enum Source {
        UNSPEC,
        /**
         * The node running this agent
         */
        LOCAL,
        /**
         * Learned from the key-value store
         */
        KVSTORE,
        /**
         * Learned from the Kubernetes API
         */
        KUBERNETES
    };

    /**
     * An IP address of the node
     */
    class Address {
    public:
        /**
         * Kinds of node addresses
         */
        enum Type { INTERNAL_IP, EXTERNAL_IP };

        Address(Type type_, const boost::asio::ip::address& ip_)
            : type(type_), ip(ip_) {}

        /**
         * The kind of address
         */
        Type type;

        /**
         * The IP address
         */
        boost::asio::ip::address ip;
    };

    /**
     * Default constructor
     */
    Node() : clusterID(0), source(UNSPEC) {}

    /**
     * Construct a node
     *
     * @param name the node name
     * @param cluster the cluster name
     */
    Node(const std::string& name, const std::string& cluster)
        : name(name), cluster(cluster), clusterID(0), source(UNSPEC) {}

    virtual ~Node() {}

    const std::string& getName() const { return name; }
    void setName(const std::string& name) { this->name = name; }

    const std::string& getCluster() const { return cluster; }
    void setCluster(const std::string& cluster) { this->cluster = cluster; }

    uint32_t getClusterID() const { return clusterID; }
    void setClusterID(uint32_t clusterID) { this->clusterID = clusterID; }

    /**
     * Get the identity of the node
     */
    NodeIdentity getIdentity() const { return NodeIdentity(name, cluster); }

    /**
     * Add an address to the node
     *
     * @param type the kind of address
     * @param ip the IP address
     */
    void addAddress(Address::Type type, const boost::asio::ip::address& ip) {
        addresses.push_back(Address(type, ip));
    }

    /**
     * Get the node addresses
     */
    const std::vector<Address>& getAddresses() const { return addresses; }

    /**
     * Get the IPv4 pod allocation CIDR
     */
    const boost::optional<std::string>& getIPv4AllocCIDR() const {
        return ipv4AllocCIDR;
    }

    /**
     * Set the IPv4 pod allocation CIDR
     *
     * @param cidr the CIDR, for example "10.1.0.0/24"
     */
    void setIPv4AllocCIDR(const std::string& cidr) { ipv4AllocCIDR = cidr; }

    /**
     * Get the IPv6 pod allocation CIDR
     */
    const boost::optional<std::string>& getIPv6AllocCIDR() const {
        return ipv6AllocCIDR;
    }

    /**
     * Set the IPv6 pod allocation CIDR
     *
     * @param cidr the CIDR
     */
    void setIPv6AllocCIDR(const std::string& cidr) { ipv6AllocCIDR = cidr; }

    Source getSource() const { return source; }
    void setSource(Source source) { this->source = source; }

    /**
     * The key name, "cluster/name"
     */
    virtual std::string getKeyName() const;

    /**
     * Serialize the node as JSON
     */
    virtual std::string marshal() const;

    /**
     * Replace the node with the state in a JSON document
     *
     * @param data the JSON document
     * @throws std::runtime_error if the document is malformed
     */
    virtual void unmarshal(const std::string& data);

private:
    std::string name;
    std::string cluster;
    uint32_t clusterID;
    std::vector<Address> addresses;
    boost::optional<std::string> ipv4AllocCIDR;
    boost::optional<std::string> ipv6AllocCIDR;
    Source source;
};

/**
 * Print a node to an ostream
 */
std::ostream& operator<<(std::ostream& os, const Node& node);

} /* namespace lrpagent */

#endif /* LRPAGENT_NODE_H */
