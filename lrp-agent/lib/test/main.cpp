/*
 * Test main for lrp-agent library.
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#define BOOST_TEST_MODULE "lrpagent"
#include <boost/test/unit_test.hpp>

#include <lrpagent/logging.h>

struct LogInitializer {
public:
    LogInitializer() {
        // set to "debug" to see all log output
        lrpagent::initLogging("error");
    }
};

static LogInitializer logInit;
