/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for Pod class.
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <lrpagent/Pod.h>
#include <lrpagent/Errors.h>

#include <boost/asio/ip/address.hpp>
#include <boost/algorithm/string/join.hpp>

#include <algorithm>

namespace lrpagent {

static void addValidIP(const std::string& ip,
                       /* out */ std::vector<std::string>& ips) {
    if (ip.empty())
        return;
    boost::system::error_code ec;
    boost::asio::ip::address::from_string(ip, ec);
    if (ec)
        return;
    if (std::find(ips.begin(), ips.end(), ip) == ips.end())
        ips.push_back(ip);
}

std::vector<std::string> getValidIPs(const Pod& pod) {
    std::vector<std::string> ips;
    for (const std::string& ip : pod.getPodIPs())
        addValidIP(ip, ips);
    addValidIP(pod.getPodIP(), ips);

    if (ips.empty())
        throw ValidationError("No valid IP for pod " + pod.getID().toString());
    return ips;
}

std::ostream& operator<<(std::ostream& os, const Pod& pod) {
    using boost::algorithm::join;

    os << "Pod[" << pod.getID();
    if (!pod.getNodeName().empty())
        os << ",node=" << pod.getNodeName();
    if (!pod.getPodIPs().empty())
        os << ",ips=[" << join(pod.getPodIPs(), ",") << "]";
    else if (!pod.getPodIP().empty())
        os << ",ip=" << pod.getPodIP();
    if (!pod.getLabels().empty()) {
        bool first = true;
        os << ",labels={";
        for (const auto& l : pod.getLabels()) {
            if (first) first = false;
            else os << ",";
            os << l.first << "=" << l.second;
        }
        os << "}";
    }
    os << "]";
    return os;
}

} /* namespace lrpagent */
