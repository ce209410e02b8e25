/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for redirect policy configuration classes.
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <lrpagent/RedirectPolicy.h>
#include <lrpagent/Errors.h>

#include <boost/lexical_cast.hpp>

namespace lrpagent {

PodMetadata PodMetadata::fromPod(const Pod& pod,
                                 const std::vector<std::string>& ips) {
    PodMetadata md;
    md.id = pod.getID();
    md.labels = pod.getLabels();
    md.ips = ips;

    for (const Pod::ContainerPort& port : pod.getContainerPorts()) {
        if (port.name.empty())
            continue;
        L4Addr::Protocol proto = L4Addr::parseProtocol(port.protocol);
        if (port.containerPort < 1 || port.containerPort > 65535) {
            throw ValidationError("Invalid port number " +
                                  boost::lexical_cast<std::string>
                                  (port.containerPort) +
                                  " for port " + port.name);
        }
        md.namedPorts[port.name] =
            L4Addr(proto, static_cast<uint16_t>(port.containerPort));
    }
    return md;
}

static bool sameBackends(const std::vector<Backend>& lhs,
                         const std::vector<Backend>& rhs) {
    if (lhs.size() != rhs.size())
        return false;
    for (size_t i = 0; i < lhs.size(); ++i) {
        if (lhs[i].toStringWithProtocol() != rhs[i].toStringWithProtocol())
            return false;
    }
    return true;
}

bool operator==(const PodPolicyInfo& lhs, const PodPolicyInfo& rhs) {
    return lhs.policyID == rhs.policyID &&
        sameBackends(lhs.backends, rhs.backends);
}

std::ostream& operator<<(std::ostream& os,
                         const RedirectPolicyConfig& config) {
    os << "RedirectPolicy[" << config.getID();
    if (config.getLrpType() == RedirectPolicyConfig::SERVICE_BASED) {
        os << ",service";
        if (config.getServiceID())
            os << "=" << config.getServiceID().get();
    } else {
        os << ",address";
    }
    switch (config.getFrontendType()) {
    case RedirectPolicyConfig::SINGLE_PORT:
        os << ",single-port"; break;
    case RedirectPolicyConfig::NAMED_PORTS:
        os << ",named-ports"; break;
    case RedirectPolicyConfig::ALL_PORTS:
        os << ",all-ports"; break;
    }

    if (!config.getFrontendMappings().empty()) {
        bool first = true;
        os << ",frontends=[";
        for (const FrontendMapping& fe : config.getFrontendMappings()) {
            if (first) first = false;
            else os << ",";
            os << fe.feAddr;
            if (!fe.fePort.empty())
                os << "(" << fe.fePort << ")";
        }
        os << "]";
    }

    os << ",selector=" << config.getBackendSelector();

    if (!config.getBackendPorts().empty()) {
        bool first = true;
        os << ",backend-ports=[";
        for (const BackendPort& bp : config.getBackendPorts()) {
            if (first) first = false;
            else os << ",";
            if (!bp.name.empty())
                os << bp.name << ":";
            os << bp.l4Addr.port << "/"
               << L4Addr::protocolName(bp.l4Addr.protocol);
        }
        os << "]";
    }
    os << "]";
    return os;
}

} /* namespace lrpagent */
