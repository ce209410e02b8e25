/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for Node class.
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <lrpagent/Node.h>
#include <lrpagent/Errors.h>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <sstream>

namespace lrpagent {

using std::string;
using boost::optional;
using boost::property_tree::ptree;
using boost::asio::ip::address;

static const char* sourceName(Node::Source source) {
    switch (source) {
    case Node::LOCAL: return "local";
    case Node::KVSTORE: return "kvstore";
    case Node::KUBERNETES: return "kubernetes";
    default: return "unspec";
    }
}

static Node::Source parseSource(const string& name) {
    if (name == "local") return Node::LOCAL;
    if (name == "kvstore") return Node::KVSTORE;
    if (name == "kubernetes") return Node::KUBERNETES;
    return Node::UNSPEC;
}

static const char* addressTypeName(Node::Address::Type type) {
    return type == Node::Address::EXTERNAL_IP ? "ExternalIP" : "InternalIP";
}

bool operator==(const NodeIdentity& lhs, const NodeIdentity& rhs) {
    return lhs.name == rhs.name && lhs.cluster == rhs.cluster;
}

std::ostream& operator<<(std::ostream& os, const NodeIdentity& id) {
    os << id.cluster << "/" << id.name;
    return os;
}

string Node::getKeyName() const {
    return cluster + "/" + name;
}

string Node::marshal() const {
    ptree root;
    root.put("name", name);
    root.put("cluster", cluster);
    root.put("cluster-id", clusterID);
    root.put("source", sourceName(source));

    if (!addresses.empty()) {
        ptree addrs;
        for (const Address& a : addresses) {
            ptree addr;
            addr.put("type", addressTypeName(a.type));
            addr.put("ip", a.ip.to_string());
            addrs.push_back(std::make_pair("", addr));
        }
        root.add_child("addresses", addrs);
    }
    if (ipv4AllocCIDR)
        root.put("ipv4-alloc-cidr", ipv4AllocCIDR.get());
    if (ipv6AllocCIDR)
        root.put("ipv6-alloc-cidr", ipv6AllocCIDR.get());

    std::stringstream ss;
    boost::property_tree::write_json(ss, root, false);
    return ss.str();
}

void Node::unmarshal(const string& data) {
    ptree root;
    std::istringstream is(data);
    boost::property_tree::read_json(is, root);

    Node n(root.get<string>("name"), root.get<string>("cluster", ""));
    n.clusterID = root.get<uint32_t>("cluster-id", 0);
    n.source = parseSource(root.get<string>("source", ""));

    optional<ptree&> addrs = root.get_child_optional("addresses");
    if (addrs) {
        for (const ptree::value_type& v : addrs.get()) {
            const string ipStr = v.second.get<string>("ip");
            boost::system::error_code ec;
            address ip = address::from_string(ipStr, ec);
            if (ec) {
                throw ValidationError("Invalid address " + ipStr +
                                      " for node " + n.name);
            }
            Address::Type type =
                v.second.get<string>("type", "") == "ExternalIP"
                ? Address::EXTERNAL_IP : Address::INTERNAL_IP;
            n.addAddress(type, ip);
        }
    }
    n.ipv4AllocCIDR = root.get_optional<string>("ipv4-alloc-cidr");
    n.ipv6AllocCIDR = root.get_optional<string>("ipv6-alloc-cidr");

    *this = n;
}

std::ostream& operator<<(std::ostream& os, const Node& node) {
    os << "Node[" << node.getIdentity()
       << ",source=" << sourceName(node.getSource());
    for (const Node::Address& a : node.getAddresses())
        os << "," << addressTypeName(a.type) << "=" << a.ip;
    if (node.getIPv4AllocCIDR())
        os << ",ipv4-alloc-cidr=" << node.getIPv4AllocCIDR().get();
    if (node.getIPv6AllocCIDR())
        os << ",ipv6-alloc-cidr=" << node.getIPv6AllocCIDR().get();
    os << "]";
    return os;
}

} /* namespace lrpagent */
