/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Test suite for pods and pod metadata
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <boost/test/unit_test.hpp>

#include <lrpagent/Pod.h>
#include <lrpagent/RedirectPolicy.h>
#include <lrpagent/Errors.h>

using namespace lrpagent;
using std::string;
using std::vector;

BOOST_AUTO_TEST_SUITE(Pod_test)

BOOST_AUTO_TEST_CASE(valid_ips) {
    Pod pod("ns", "pod1");
    BOOST_CHECK_THROW(getValidIPs(pod), ValidationError);

    pod.setPodIP("not-an-ip");
    BOOST_CHECK_THROW(getValidIPs(pod), ValidationError);

    pod.setPodIP("10.1.1.1");
    pod.addPodIP("f00d::1");
    pod.addPodIP("10.1.1.1");
    pod.addPodIP("bogus");

    vector<string> ips = getValidIPs(pod);
    BOOST_REQUIRE_EQUAL(2, ips.size());
    BOOST_CHECK_EQUAL("f00d::1", ips[0]);
    BOOST_CHECK_EQUAL("10.1.1.1", ips[1]);
}

BOOST_AUTO_TEST_CASE(metadata) {
    Pod pod("ns", "pod1");
    pod.setLabel("app", "dns");
    pod.setPodIP("10.1.1.1");
    pod.addContainerPort(Pod::ContainerPort("dns", 53, "UDP"));
    pod.addContainerPort(Pod::ContainerPort("dns-tcp", 53, "tcp"));
    pod.addContainerPort(Pod::ContainerPort("", 9999, "bogus"));

    PodMetadata md = PodMetadata::fromPod(pod, getValidIPs(pod));
    BOOST_CHECK_EQUAL(PodID("ns", "pod1"), md.id);
    BOOST_CHECK_EQUAL("dns", md.labels["app"]);
    BOOST_REQUIRE_EQUAL(2, md.namedPorts.size());
    BOOST_CHECK_EQUAL(L4Addr::UDP, md.namedPorts["dns"].protocol);
    BOOST_CHECK_EQUAL(53, md.namedPorts["dns"].port);
    BOOST_CHECK_EQUAL(L4Addr::TCP, md.namedPorts["dns-tcp"].protocol);
}

BOOST_AUTO_TEST_CASE(metadata_invalid) {
    Pod pod("ns", "pod1");
    pod.setPodIP("10.1.1.1");
    pod.addContainerPort(Pod::ContainerPort("http", 70000));
    BOOST_CHECK_THROW(PodMetadata::fromPod(pod, getValidIPs(pod)),
                      ValidationError);

    Pod pod2("ns", "pod2");
    pod2.setPodIP("10.1.1.2");
    pod2.addContainerPort(Pod::ContainerPort("http", 80, "icmp"));
    BOOST_CHECK_THROW(PodMetadata::fromPod(pod2, getValidIPs(pod2)),
                      ValidationError);
}

BOOST_AUTO_TEST_SUITE_END()
