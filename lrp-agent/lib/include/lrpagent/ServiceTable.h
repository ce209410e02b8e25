/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for the load balancer service table interface
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef LRPAGENT_SERVICETABLE_H
#define LRPAGENT_SERVICETABLE_H

#include <lrpagent/LoadBalancer.h>

#include <cstdint>

namespace lrpagent {

/**
 * An abstract interface to the load balancer service table that
 * services produced by redirect policies are written to
 */
class ServiceTable {
public:
    /**
     * Destroy the service table and clean up all state
     */
    virtual ~ServiceTable() {}

    /**
     * Insert or update the service with the frontend of the given
     * service.
     *
     * @param svc the service
     * @param id set to the ID of the service frontend
     * @return true if the service table was changed
     * @throws std::runtime_error if the service could not be written
     */
    virtual bool upsertService(const LbService& svc,
                               /* out */ uint32_t& id) = 0;

    /**
     * Delete the service with the given frontend.  Deleting a
     * frontend that does not exist is not an error.
     *
     * @param frontend the frontend address
     * @return true if a service was found and deleted
     * @throws std::runtime_error if the service could not be deleted
     */
    virtual bool deleteService(const L3n4Addr& frontend) = 0;
};

} /* namespace lrpagent */

#endif /* LRPAGENT_SERVICETABLE_H */
