/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Test suite for label selectors
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <boost/test/unit_test.hpp>

#include <lrpagent/LabelSelector.h>

#include <sstream>

using namespace lrpagent;

BOOST_AUTO_TEST_SUITE(LabelSelector_test)

BOOST_AUTO_TEST_CASE(empty) {
    LabelSelector sel;
    labels_t labels;
    BOOST_CHECK(sel.empty());
    BOOST_CHECK(sel.matches(labels));
    labels["app"] = "dns";
    BOOST_CHECK(sel.matches(labels));
}

BOOST_AUTO_TEST_CASE(match_labels) {
    LabelSelector sel;
    sel.addMatchLabel("app", "dns").addMatchLabel("tier", "node");

    labels_t labels;
    labels["app"] = "dns";
    BOOST_CHECK(!sel.matches(labels));
    labels["tier"] = "node";
    BOOST_CHECK(sel.matches(labels));
    labels["tier"] = "cluster";
    BOOST_CHECK(!sel.matches(labels));
}

BOOST_AUTO_TEST_CASE(requirements) {
    std::set<std::string> values;
    values.insert("a");
    values.insert("b");

    labels_t labels;
    labels["k"] = "a";

    BOOST_CHECK(LabelSelector::Requirement("k", LabelSelector::IN, values)
                .matches(labels));
    BOOST_CHECK(!LabelSelector::Requirement("k", LabelSelector::NOT_IN, values)
                .matches(labels));
    BOOST_CHECK(LabelSelector::Requirement("k", LabelSelector::EXISTS)
                .matches(labels));
    BOOST_CHECK(!LabelSelector::Requirement("k",
                                            LabelSelector::DOES_NOT_EXIST)
                .matches(labels));

    labels_t other;
    BOOST_CHECK(!LabelSelector::Requirement("k", LabelSelector::IN, values)
                .matches(other));
    BOOST_CHECK(LabelSelector::Requirement("k", LabelSelector::NOT_IN, values)
                .matches(other));
    BOOST_CHECK(LabelSelector::Requirement("k",
                                           LabelSelector::DOES_NOT_EXIST)
                .matches(other));

    LabelSelector sel;
    sel.addMatchLabel("app", "dns")
        .addRequirement(LabelSelector::Requirement("k", LabelSelector::IN,
                                                   values));
    BOOST_CHECK(!sel.empty());
    labels["app"] = "dns";
    BOOST_CHECK(sel.matches(labels));
    labels["k"] = "c";
    BOOST_CHECK(!sel.matches(labels));

    std::stringstream ss;
    ss << sel;
    BOOST_CHECK_EQUAL("{app=dns,k in (a,b)}", ss.str());
}

BOOST_AUTO_TEST_SUITE_END()
