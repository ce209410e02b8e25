/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <lrpagent/ObjectID.h>

#include <boost/functional/hash.hpp>

namespace std {
std::size_t hash<lrpagent::ObjectID>::
operator()(const lrpagent::ObjectID& id) const {
    std::size_t v = 0;
    boost::hash_combine(v, id.getNamespace());
    boost::hash_combine(v, id.getName());
    return v;
}
} /* namespace std */

namespace lrpagent {

bool operator==(const ObjectID& lhs, const ObjectID& rhs) {
    return lhs.getNamespace() == rhs.getNamespace() &&
        lhs.getName() == rhs.getName();
}

bool operator!=(const ObjectID& lhs, const ObjectID& rhs) {
    return !(lhs == rhs);
}

bool operator<(const ObjectID& lhs, const ObjectID& rhs) {
    if (lhs.getNamespace() != rhs.getNamespace())
        return lhs.getNamespace() < rhs.getNamespace();
    return lhs.getName() < rhs.getName();
}

std::ostream& operator<<(std::ostream& os, const ObjectID& id) {
    os << id.getNamespace() << "/" << id.getName();
    return os;
}

} /* namespace lrpagent */
