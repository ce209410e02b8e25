/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for the node manager interface
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef LRPAGENT_NODEMANAGER_H
#define LRPAGENT_NODEMANAGER_H

#include <lrpagent/Node.h>

namespace lrpagent {

/**
 * An abstract interface to the component that tracks the nodes of
 * the cluster
 */
class NodeManager {
public:
    virtual ~NodeManager() {}

    /**
     * A node was created or modified
     *
     * @param node the node
     */
    virtual void nodeUpdated(const Node& node) = 0;

    /**
     * A node was deleted
     *
     * @param node the last known state of the node
     */
    virtual void nodeDeleted(const Node& node) = 0;

    /**
     * Check whether a node is known
     *
     * @param id the node identity
     */
    virtual bool exists(const NodeIdentity& id) = 0;
};

} /* namespace lrpagent */

#endif /* LRPAGENT_NODEMANAGER_H */
