/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for namespaced object identifiers
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef LRPAGENT_OBJECTID_H
#define LRPAGENT_OBJECTID_H

#include <string>
#include <ostream>
#include <functional>

namespace lrpagent {

/**
 * Identifies a cluster object by its namespace and name
 */
class ObjectID {
public:
    /**
     * Default constructor
     */
    ObjectID() {}

    /**
     * Construct an object ID
     *
     * @param ns_ the namespace of the object
     * @param name_ the name of the object
     */
    ObjectID(const std::string& ns_, const std::string& name_)
        : ns(ns_), name(name_) {}

    /**
     * Get the namespace of the object
     */
    const std::string& getNamespace() const { return ns; }

    /**
     * Get the name of the object
     */
    const std::string& getName() const { return name; }

    /**
     * Format as "namespace/name"
     */
    std::string toString() const { return ns + "/" + name; }

private:
    std::string ns;
    std::string name;
};

/**
 * Identifies a redirect policy
 */
typedef ObjectID PolicyID;

/**
 * Identifies a cluster service
 */
typedef ObjectID ServiceID;

/**
 * Identifies a pod
 */
typedef ObjectID PodID;

/**
 * Check for object ID equality.
 */
bool operator==(const ObjectID& lhs, const ObjectID& rhs);

/**
 * Check for object ID inequality.
 */
bool operator!=(const ObjectID& lhs, const ObjectID& rhs);

/**
 * Order object IDs by namespace then name
 */
bool operator<(const ObjectID& lhs, const ObjectID& rhs);

/**
 * Print an object ID to an ostream
 */
std::ostream& operator<<(std::ostream& os, const ObjectID& id);

} /* namespace lrpagent */

namespace std {

/**
 * Template specialization for std::hash<ObjectID>, making
 * it suitable as a key in a std::unordered_map
 */
template<> struct hash<lrpagent::ObjectID> {
    /**
     * Hash the object ID
     */
    std::size_t operator()(const lrpagent::ObjectID& id) const;
};

} /* namespace std */

#endif /* LRPAGENT_OBJECTID_H */
