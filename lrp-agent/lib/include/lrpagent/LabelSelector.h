/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for label selectors
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef LRPAGENT_LABELSELECTOR_H
#define LRPAGENT_LABELSELECTOR_H

#include <lrpagent/Pod.h>

#include <string>
#include <vector>
#include <set>
#include <ostream>

namespace lrpagent {

/**
 * A predicate over object labels.  All match labels and all
 * requirements must hold; an empty selector matches everything.
 */
class LabelSelector {
public:
    /**
     * Operators for label requirements
     */
    enum Operator { IN, NOT_IN, EXISTS, DOES_NOT_EXIST };

    /**
     * A requirement on the value of a single label key
     */
    class Requirement {
    public:
        /**
         * Construct a requirement
         *
         * @param key_ the label key
         * @param op_ the operator
         * @param values_ the values for IN and NOT_IN
         */
        Requirement(const std::string& key_, Operator op_,
                    const std::set<std::string>& values_ =
                    std::set<std::string>())
            : key(key_), op(op_), values(values_) {}

        /**
         * Check whether the labels satisfy this requirement
         */
        bool matches(const labels_t& labels) const;

        /**
         * The label key
         */
        std::string key;

        /**
         * The operator
         */
        Operator op;

        /**
         * The values for IN and NOT_IN
         */
        std::set<std::string> values;
    };

    /**
     * Require a label to have exactly the given value
     *
     * @param key the label key
     * @param value the label value
     * @return this selector
     */
    LabelSelector& addMatchLabel(const std::string& key,
                                 const std::string& value) {
        matchLabels[key] = value;
        return *this;
    }

    /**
     * Add a requirement
     *
     * @param requirement the requirement to add
     * @return this selector
     */
    LabelSelector& addRequirement(const Requirement& requirement) {
        requirements.push_back(requirement);
        return *this;
    }

    /**
     * Get the match labels
     */
    const labels_t& getMatchLabels() const { return matchLabels; }

    /**
     * Get the requirements
     */
    const std::vector<Requirement>& getRequirements() const {
        return requirements;
    }

    /**
     * Check whether the selector has no match labels or requirements
     */
    bool empty() const {
        return matchLabels.empty() && requirements.empty();
    }

    /**
     * Check whether the labels are selected
     *
     * @param labels the labels to check
     * @return true if every match label and requirement holds
     */
    bool matches(const labels_t& labels) const;

private:
    labels_t matchLabels;
    std::vector<Requirement> requirements;
};

/**
 * Print a selector to an ostream
 */
std::ostream& operator<<(std::ostream& os, const LabelSelector& selector);

} /* namespace lrpagent */

#endif /* LRPAGENT_LABELSELECTOR_H */
