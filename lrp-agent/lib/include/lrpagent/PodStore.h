/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for the pod store interface
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef LRPAGENT_PODSTORE_H
#define LRPAGENT_PODSTORE_H

#include <lrpagent/Pod.h>

#include <vector>

namespace lrpagent {

/**
 * An abstract interface to the store of pods scheduled on the local
 * node
 */
class PodStore {
public:
    /**
     * Destroy the pod store and clean up all state
     */
    virtual ~PodStore() {}

    /**
     * Get a snapshot of the known pods
     */
    virtual std::vector<Pod> list() = 0;
};

} /* namespace lrpagent */

#endif /* LRPAGENT_PODSTORE_H */
