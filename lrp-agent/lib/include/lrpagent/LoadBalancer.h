/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for load balancer frontends, backends and services
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef LRPAGENT_LOADBALANCER_H
#define LRPAGENT_LOADBALANCER_H

#include <boost/optional.hpp>
#include <boost/asio/ip/address.hpp>

#include <string>
#include <vector>
#include <ostream>
#include <cstdint>

namespace lrpagent {

/**
 * A layer 4 protocol and port
 */
class L4Addr {
public:
    /**
     * Layer 4 protocols understood by the load balancer
     */
    enum Protocol { NONE, TCP, UDP, SCTP };

    /**
     * Default constructor
     */
    L4Addr() : protocol(NONE), port(0) {}

    /**
     * Construct a new L4Addr
     *
     * @param protocol_ the protocol
     * @param port_ the port number
     */
    L4Addr(Protocol protocol_, uint16_t port_)
        : protocol(protocol_), port(port_) {}

    /**
     * Parse a protocol name such as "TCP" or "udp".  An empty string
     * is the default protocol, TCP.
     *
     * @param name the protocol name
     * @return the protocol
     * @throws ValidationError if the name is not a known protocol
     */
    static Protocol parseProtocol(const std::string& name);

    /**
     * Get the canonical name of a protocol
     */
    static const char* protocolName(Protocol protocol);

    /**
     * The protocol
     */
    Protocol protocol;

    /**
     * The port number
     */
    uint16_t port;
};

/**
 * An L3 address combined with an L4Addr.  The IP address is unset for
 * a service frontend that has not been resolved yet.
 */
class L3n4Addr {
public:
    /**
     * Default constructor
     */
    L3n4Addr() {}

    /**
     * Construct an address without an IP
     *
     * @param l4_ the protocol and port
     */
    explicit L3n4Addr(const L4Addr& l4_) : l4(l4_) {}

    /**
     * Construct an address
     *
     * @param ip_ the IP address
     * @param l4_ the protocol and port
     */
    L3n4Addr(const boost::asio::ip::address& ip_, const L4Addr& l4_)
        : ip(ip_), l4(l4_) {}

    /**
     * Check whether the IP address is set
     */
    bool isResolved() const { return ip != boost::none; }

    /**
     * Check whether the IP address is set and is an IPv4 address
     */
    bool isIPv4() const { return ip && ip.get().is_v4(); }

    /**
     * Format as "IP:port/protocol", with IPv6 addresses in brackets
     * and "<unset>" in place of a missing IP
     */
    std::string toStringWithProtocol() const;

    /**
     * Key identifying this address in frontend indices
     */
    std::string hash() const { return toStringWithProtocol(); }

    /**
     * The IP address
     */
    boost::optional<boost::asio::ip::address> ip;

    /**
     * The protocol and port
     */
    L4Addr l4;
};

/**
 * A backend address that traffic is redirected to
 */
typedef L3n4Addr Backend;

/**
 * A backend entry in a load balancer service
 */
class LbBackend {
public:
    /**
     * Construct a service backend
     *
     * @param addr_ the backend address
     * @param nodeName_ the node hosting the backend
     */
    LbBackend(const L3n4Addr& addr_, const std::string& nodeName_)
        : addr(addr_), nodeName(nodeName_) {}

    /**
     * The backend address
     */
    L3n4Addr addr;

    /**
     * The node hosting the backend
     */
    std::string nodeName;
};

/**
 * A service entry in the load balancer service table
 */
class LbService {
public:
    /**
     * Types of load balancer services
     */
    enum Type {
        CLUSTER_IP,
        NODE_PORT,
        EXTERNAL_IPS,
        LOAD_BALANCER,
        /**
         * Traffic to the frontend is redirected to node-local backends
         */
        LOCAL_REDIRECT
    };

    /**
     * Which backends are eligible for traffic
     */
    enum TrafficPolicy {
        /**
         * All backends
         */
        CLUSTER,
        /**
         * Node-local backends only
         */
        LOCAL
    };

    /**
     * Default constructor
     */
    LbService()
        : type(CLUSTER_IP), frontendID(0), trafficPolicy(CLUSTER) {}

    /**
     * Get the service name
     */
    const std::string& getName() const { return name; }

    /**
     * Set the service name
     *
     * @param name the service name
     */
    void setName(const std::string& name) { this->name = name; }

    /**
     * Get the service namespace
     */
    const std::string& getNamespace() const { return ns; }

    /**
     * Set the service namespace
     *
     * @param ns the namespace
     */
    void setNamespace(const std::string& ns) { this->ns = ns; }

    /**
     * Get the service type
     */
    Type getType() const { return type; }

    /**
     * Set the service type
     *
     * @param type the service type
     */
    void setType(Type type) { this->type = type; }

    /**
     * Get the frontend address
     */
    const L3n4Addr& getFrontend() const { return frontend; }

    /**
     * Set the frontend address and its numeric ID.  An ID of zero
     * lets the service table allocate one.
     *
     * @param frontend the frontend address
     * @param id the frontend ID
     */
    void setFrontend(const L3n4Addr& frontend, uint32_t id = 0) {
        this->frontend = frontend;
        this->frontendID = id;
    }

    /**
     * Get the frontend ID
     */
    uint32_t getFrontendID() const { return frontendID; }

    /**
     * Get the service backends
     */
    const std::vector<LbBackend>& getBackends() const { return backends; }

    /**
     * Add a backend to the service
     *
     * @param backend the backend to add
     */
    void addBackend(const LbBackend& backend) {
        backends.push_back(backend);
    }

    /**
     * Get the traffic policy
     */
    TrafficPolicy getTrafficPolicy() const { return trafficPolicy; }

    /**
     * Set the traffic policy
     *
     * @param trafficPolicy the traffic policy
     */
    void setTrafficPolicy(TrafficPolicy trafficPolicy) {
        this->trafficPolicy = trafficPolicy;
    }

private:
    std::string name;
    std::string ns;
    Type type;
    L3n4Addr frontend;
    uint32_t frontendID;
    std::vector<LbBackend> backends;
    TrafficPolicy trafficPolicy;
};

/**
 * Check for address equality.
 */
bool operator==(const L4Addr& lhs, const L4Addr& rhs);

/**
 * Check for address inequality.
 */
bool operator!=(const L4Addr& lhs, const L4Addr& rhs);

/**
 * Check for address equality.
 */
bool operator==(const L3n4Addr& lhs, const L3n4Addr& rhs);

/**
 * Check for address inequality.
 */
bool operator!=(const L3n4Addr& lhs, const L3n4Addr& rhs);

/**
 * Print an address to an ostream
 */
std::ostream& operator<<(std::ostream& os, const L3n4Addr& addr);

/**
 * Print a service to an ostream
 */
std::ostream& operator<<(std::ostream& os, const LbService& svc);

} /* namespace lrpagent */

#endif /* LRPAGENT_LOADBALANCER_H */
