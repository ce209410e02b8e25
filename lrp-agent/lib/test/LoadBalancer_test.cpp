/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Test suite for load balancer addresses and services
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <boost/test/unit_test.hpp>

#include <lrpagent/LoadBalancer.h>
#include <lrpagent/Errors.h>

#include <sstream>

using namespace lrpagent;
using boost::asio::ip::address;

BOOST_AUTO_TEST_SUITE(LoadBalancer_test)

BOOST_AUTO_TEST_CASE(parse_protocol) {
    BOOST_CHECK_EQUAL(L4Addr::TCP, L4Addr::parseProtocol(""));
    BOOST_CHECK_EQUAL(L4Addr::TCP, L4Addr::parseProtocol("tcp"));
    BOOST_CHECK_EQUAL(L4Addr::UDP, L4Addr::parseProtocol("UDP"));
    BOOST_CHECK_EQUAL(L4Addr::SCTP, L4Addr::parseProtocol("Sctp"));
    BOOST_CHECK_THROW(L4Addr::parseProtocol("icmp"), ValidationError);
}

BOOST_AUTO_TEST_CASE(address_string) {
    L3n4Addr v4(address::from_string("10.0.0.1"), L4Addr(L4Addr::TCP, 80));
    BOOST_CHECK_EQUAL("10.0.0.1:80/TCP", v4.toStringWithProtocol());
    BOOST_CHECK(v4.isResolved());
    BOOST_CHECK(v4.isIPv4());

    L3n4Addr v6(address::from_string("f00d::1"), L4Addr(L4Addr::UDP, 53));
    BOOST_CHECK_EQUAL("[f00d::1]:53/UDP", v6.toStringWithProtocol());
    BOOST_CHECK(!v6.isIPv4());

    L3n4Addr unset(L4Addr(L4Addr::TCP, 8080));
    BOOST_CHECK(!unset.isResolved());
    BOOST_CHECK(!unset.isIPv4());
    BOOST_CHECK_EQUAL("<unset>:8080/TCP", unset.hash());
}

BOOST_AUTO_TEST_CASE(address_equality) {
    L3n4Addr a(address::from_string("10.0.0.1"), L4Addr(L4Addr::TCP, 80));
    L3n4Addr b(address::from_string("10.0.0.1"), L4Addr(L4Addr::TCP, 80));
    L3n4Addr c(address::from_string("10.0.0.1"), L4Addr(L4Addr::UDP, 80));
    BOOST_CHECK(a == b);
    BOOST_CHECK(a != c);
    BOOST_CHECK(a.hash() != c.hash());
}

BOOST_AUTO_TEST_CASE(service) {
    LbService svc;
    BOOST_CHECK_EQUAL(LbService::CLUSTER_IP, svc.getType());
    BOOST_CHECK_EQUAL(0, svc.getFrontendID());

    svc.setName("lrp-local-redirect");
    svc.setNamespace("ns");
    svc.setType(LbService::LOCAL_REDIRECT);
    svc.setFrontend(L3n4Addr(address::from_string("169.254.169.254"),
                             L4Addr(L4Addr::TCP, 8080)), 7);
    svc.addBackend(LbBackend(L3n4Addr(address::from_string("10.1.1.1"),
                                      L4Addr(L4Addr::TCP, 80)),
                             "node1"));

    BOOST_CHECK_EQUAL(7, svc.getFrontendID());
    BOOST_REQUIRE_EQUAL(1, svc.getBackends().size());
    BOOST_CHECK_EQUAL("node1", svc.getBackends()[0].nodeName);

    std::stringstream ss;
    ss << svc;
    BOOST_CHECK(ss.str().find("169.254.169.254:8080/TCP") !=
                std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
