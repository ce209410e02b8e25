/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for mock service table
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef LRPAGENT_TEST_MOCKSERVICETABLE_H
#define LRPAGENT_TEST_MOCKSERVICETABLE_H

#include <lrpagent/ServiceTable.h>

#include <map>
#include <string>
#include <vector>
#include <stdexcept>

namespace lrpagent {

/**
 * A service table that keeps services in memory and records every
 * call made to it
 */
class MockServiceTable : public ServiceTable {
public:
    MockServiceTable() : nextID(1), fail(false) {}
    virtual ~MockServiceTable() {}

    virtual bool upsertService(const LbService& svc,
                               /* out */ uint32_t& id) {
        if (fail)
            throw std::runtime_error("service table unavailable");
        upserts.push_back(svc);

        const std::string key = svc.getFrontend().hash();
        std::map<std::string, uint32_t>::const_iterator it = ids.find(key);
        id = (it == ids.end()) ? (ids[key] = nextID++) : it->second;
        services[key] = svc;
        return true;
    }

    virtual bool deleteService(const L3n4Addr& frontend) {
        if (fail)
            throw std::runtime_error("service table unavailable");
        deletes.push_back(frontend);
        ids.erase(frontend.hash());
        return services.erase(frontend.hash()) > 0;
    }

    /**
     * Get the service with a frontend, or NULL if not present
     */
    const LbService* getService(const L3n4Addr& frontend) const {
        std::map<std::string, LbService>::const_iterator it =
            services.find(frontend.hash());
        return it == services.end() ? NULL : &it->second;
    }

    /**
     * Get the backend addresses of the service with a frontend as
     * strings, in order
     */
    std::vector<std::string> getBackends(const L3n4Addr& frontend) const {
        std::vector<std::string> result;
        const LbService* svc = getService(frontend);
        if (svc) {
            for (const LbBackend& be : svc->getBackends())
                result.push_back(be.addr.toStringWithProtocol());
        }
        return result;
    }

    /**
     * Forget the recorded calls
     */
    void clearCalls() {
        upserts.clear();
        deletes.clear();
    }

    uint32_t nextID;
    bool fail;
    std::map<std::string, LbService> services;
    std::map<std::string, uint32_t> ids;
    std::vector<LbService> upserts;
    std::vector<L3n4Addr> deletes;
};

} /* namespace lrpagent */

#endif /* LRPAGENT_TEST_MOCKSERVICETABLE_H */
