/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for the cluster service cache interface
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef LRPAGENT_SERVICECACHE_H
#define LRPAGENT_SERVICECACHE_H

#include <lrpagent/ObjectID.h>
#include <lrpagent/LoadBalancer.h>

#include <boost/optional.hpp>
#include <boost/asio/ip/address.hpp>

#include <map>
#include <string>

namespace lrpagent {

/**
 * An abstract interface to the cache of cluster services
 */
class ServiceCache {
public:
    /**
     * Destroy the service cache and clean up all state
     */
    virtual ~ServiceCache() {}

    /**
     * Get the frontend addresses of a service indexed by port name.
     * An unnamed port is indexed by the empty string.
     *
     * @param svcID the service
     * @param type the type of frontend
     * @return the addresses, or an empty map if the service is unknown
     */
    virtual std::map<std::string, L3n4Addr>
    getServiceAddrsWithType(const ServiceID& svcID, LbService::Type type) = 0;

    /**
     * Get the frontend IP of a service
     *
     * @param svcID the service
     * @param type the type of frontend
     * @return the IP, or boost::none if the service is unknown
     */
    virtual boost::optional<boost::asio::ip::address>
    getServiceFrontendIP(const ServiceID& svcID, LbService::Type type) = 0;
};

} /* namespace lrpagent */

#endif /* LRPAGENT_SERVICECACHE_H */
