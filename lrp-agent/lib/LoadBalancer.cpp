/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for load balancer address and service classes.
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <lrpagent/LoadBalancer.h>
#include <lrpagent/Errors.h>

#include <boost/algorithm/string/case_conv.hpp>

#include <sstream>

namespace lrpagent {

L4Addr::Protocol L4Addr::parseProtocol(const std::string& name) {
    std::string upper = boost::algorithm::to_upper_copy(name);
    if (upper.empty() || upper == "TCP")
        return TCP;
    if (upper == "UDP")
        return UDP;
    if (upper == "SCTP")
        return SCTP;
    throw ValidationError("Unknown protocol: " + name);
}

const char* L4Addr::protocolName(Protocol protocol) {
    switch (protocol) {
    case TCP:  return "TCP";
    case UDP:  return "UDP";
    case SCTP: return "SCTP";
    default:
    case NONE: return "NONE";
    }
}

std::string L3n4Addr::toStringWithProtocol() const {
    std::stringstream str;
    if (!ip)
        str << "<unset>";
    else if (ip.get().is_v6())
        str << "[" << ip.get().to_string() << "]";
    else
        str << ip.get().to_string();
    str << ":" << l4.port << "/" << L4Addr::protocolName(l4.protocol);
    return str.str();
}

bool operator==(const L4Addr& lhs, const L4Addr& rhs) {
    return lhs.protocol == rhs.protocol && lhs.port == rhs.port;
}

bool operator!=(const L4Addr& lhs, const L4Addr& rhs) {
    return !(lhs == rhs);
}

bool operator==(const L3n4Addr& lhs, const L3n4Addr& rhs) {
    return lhs.ip == rhs.ip && lhs.l4 == rhs.l4;
}

bool operator!=(const L3n4Addr& lhs, const L3n4Addr& rhs) {
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const L3n4Addr& addr) {
    os << addr.toStringWithProtocol();
    return os;
}

static const char* typeName(LbService::Type type) {
    switch (type) {
    case LbService::CLUSTER_IP:     return "ClusterIP";
    case LbService::NODE_PORT:      return "NodePort";
    case LbService::EXTERNAL_IPS:   return "ExternalIPs";
    case LbService::LOAD_BALANCER:  return "LoadBalancer";
    case LbService::LOCAL_REDIRECT: return "LocalRedirect";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& os, const LbService& svc) {
    os << "LbService["
       << "name=" << svc.getNamespace() << "/" << svc.getName()
       << ",type=" << typeName(svc.getType())
       << ",frontend=" << svc.getFrontend();
    if (svc.getTrafficPolicy() == LbService::LOCAL)
        os << ",traffic-policy=local";
    else
        os << ",traffic-policy=cluster";

    if (!svc.getBackends().empty()) {
        bool first = true;
        os << ",backends=[";
        for (const LbBackend& be : svc.getBackends()) {
            if (first) first = false;
            else os << ",";
            os << be.addr;
            if (!be.nodeName.empty())
                os << "@" << be.nodeName;
        }
        os << "]";
    }
    os << "]";
    return os;
}

} /* namespace lrpagent */
