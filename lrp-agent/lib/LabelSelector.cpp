/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for LabelSelector class.
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <lrpagent/LabelSelector.h>

#include <boost/algorithm/string/join.hpp>

namespace lrpagent {

bool LabelSelector::Requirement::matches(const labels_t& labels) const {
    labels_t::const_iterator it = labels.find(key);
    switch (op) {
    case IN:
        return it != labels.end() && values.count(it->second) > 0;
    case NOT_IN:
        return it == labels.end() || values.count(it->second) == 0;
    case EXISTS:
        return it != labels.end();
    case DOES_NOT_EXIST:
        return it == labels.end();
    }
    return false;
}

bool LabelSelector::matches(const labels_t& labels) const {
    for (const auto& ml : matchLabels) {
        labels_t::const_iterator it = labels.find(ml.first);
        if (it == labels.end() || it->second != ml.second)
            return false;
    }
    for (const Requirement& r : requirements) {
        if (!r.matches(labels))
            return false;
    }
    return true;
}

std::ostream& operator<<(std::ostream& os, const LabelSelector& selector) {
    using boost::algorithm::join;

    bool first = true;
    os << "{";
    for (const auto& ml : selector.getMatchLabels()) {
        if (first) first = false;
        else os << ",";
        os << ml.first << "=" << ml.second;
    }
    for (const auto& r : selector.getRequirements()) {
        if (first) first = false;
        else os << ",";
        switch (r.op) {
        case LabelSelector::IN:
            os << r.key << " in (" << join(r.values, ",") << ")";
            break;
        case LabelSelector::NOT_IN:
            os << r.key << " notin (" << join(r.values, ",") << ")";
            break;
        case LabelSelector::EXISTS:
            os << r.key;
            break;
        case LabelSelector::DOES_NOT_EXIST:
            os << "!" << r.key;
            break;
        }
    }
    os << "}";
    return os;
}

} /* namespace lrpagent */
