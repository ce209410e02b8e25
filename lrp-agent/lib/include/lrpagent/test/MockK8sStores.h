/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for mock service cache and pod store
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef LRPAGENT_TEST_MOCKK8SSTORES_H
#define LRPAGENT_TEST_MOCKK8SSTORES_H

#include <lrpagent/ServiceCache.h>
#include <lrpagent/PodStore.h>

#include <map>
#include <string>
#include <vector>
#include <mutex>

namespace lrpagent {

/**
 * A service cache holding cluster IP services set up by the test
 */
class MockServiceCache : public ServiceCache {
public:
    virtual ~MockServiceCache() {}

    /**
     * Add or replace a service.  All ports share the IP of the
     * first one.
     *
     * @param svcID the service
     * @param ports the frontend addresses indexed by port name
     */
    void setService(const ServiceID& svcID,
                    const std::map<std::string, L3n4Addr>& ports) {
        std::unique_lock<std::mutex> guard(cache_mutex);
        services[svcID] = ports;
    }

    /**
     * Remove a service
     */
    void removeService(const ServiceID& svcID) {
        std::unique_lock<std::mutex> guard(cache_mutex);
        services.erase(svcID);
    }

    virtual std::map<std::string, L3n4Addr>
    getServiceAddrsWithType(const ServiceID& svcID, LbService::Type type) {
        std::unique_lock<std::mutex> guard(cache_mutex);
        std::map<ServiceID, std::map<std::string, L3n4Addr> >::const_iterator
            it = services.find(svcID);
        if (type != LbService::CLUSTER_IP || it == services.end())
            return std::map<std::string, L3n4Addr>();
        return it->second;
    }

    virtual boost::optional<boost::asio::ip::address>
    getServiceFrontendIP(const ServiceID& svcID, LbService::Type type) {
        std::unique_lock<std::mutex> guard(cache_mutex);
        std::map<ServiceID, std::map<std::string, L3n4Addr> >::const_iterator
            it = services.find(svcID);
        if (type != LbService::CLUSTER_IP || it == services.end() ||
            it->second.empty())
            return boost::none;
        return it->second.begin()->second.ip;
    }

private:
    std::mutex cache_mutex;
    std::map<ServiceID, std::map<std::string, L3n4Addr> > services;
};

/**
 * A pod store holding pods set up by the test
 */
class MockPodStore : public PodStore {
public:
    virtual ~MockPodStore() {}

    /**
     * Add or replace a pod
     */
    void setPod(const Pod& pod) {
        std::unique_lock<std::mutex> guard(store_mutex);
        pods[pod.getID()] = pod;
    }

    /**
     * Remove a pod
     */
    void removePod(const PodID& id) {
        std::unique_lock<std::mutex> guard(store_mutex);
        pods.erase(id);
    }

    virtual std::vector<Pod> list() {
        std::unique_lock<std::mutex> guard(store_mutex);
        std::vector<Pod> result;
        for (const std::map<PodID, Pod>::value_type& p : pods)
            result.push_back(p.second);
        return result;
    }

private:
    std::mutex store_mutex;
    std::map<PodID, Pod> pods;
};

} /* namespace lrpagent */

#endif /* LRPAGENT_TEST_MOCKK8SSTORES_H */
