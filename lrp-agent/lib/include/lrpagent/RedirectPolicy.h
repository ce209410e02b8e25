/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for local redirect policy configuration
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef LRPAGENT_REDIRECTPOLICY_H
#define LRPAGENT_REDIRECTPOLICY_H

#include <lrpagent/ObjectID.h>
#include <lrpagent/LoadBalancer.h>
#include <lrpagent/LabelSelector.h>
#include <lrpagent/Pod.h>

#include <boost/optional.hpp>

#include <string>
#include <vector>
#include <map>
#include <ostream>

namespace lrpagent {

class RedirectPolicyManager;

/**
 * A frontend of a redirect policy together with the backends
 * currently materialized for it
 */
class FrontendMapping {
public:
    /**
     * Construct a frontend mapping
     *
     * @param feAddr_ the frontend address; the IP may be unset
     * @param fePort_ the logical port name, or empty if unnamed
     */
    FrontendMapping(const L3n4Addr& feAddr_,
                    const std::string& fePort_ = "")
        : feAddr(feAddr_), fePort(fePort_) {}

    /**
     * The frontend address
     */
    L3n4Addr feAddr;

    /**
     * The logical port name
     */
    std::string fePort;

    /**
     * The current backend set.  Always replaced as a whole.
     */
    std::vector<Backend> backends;
};

/**
 * The port that selected backends receive redirected traffic on
 */
class BackendPort {
public:
    /**
     * Construct a backend port
     *
     * @param name_ the port name, or empty if unnamed
     * @param l4Addr_ the protocol and port number
     */
    BackendPort(const std::string& name_, const L4Addr& l4Addr_)
        : name(name_), l4Addr(l4Addr_) {}

    /**
     * The port name
     */
    std::string name;

    /**
     * The protocol and port number
     */
    L4Addr l4Addr;
};

/**
 * Metadata of a pod relevant for backend selection, computed at
 * event time
 */
class PodMetadata {
public:
    /**
     * Compute the metadata for a pod
     *
     * @param pod the pod
     * @param ips the valid IPs of the pod
     * @return the pod metadata
     * @throws ValidationError if a named container port has an
     * unknown protocol or an out of range port number
     */
    static PodMetadata fromPod(const Pod& pod,
                               const std::vector<std::string>& ips);

    /**
     * The pod namespace and name
     */
    PodID id;

    /**
     * The pod labels
     */
    labels_t labels;

    /**
     * The unique pod IPs
     */
    std::vector<std::string> ips;

    /**
     * Named container ports indexed by name
     */
    std::map<std::string, L4Addr> namedPorts;
};

/**
 * Records the backends a pod contributes to a policy
 */
class PodPolicyInfo {
public:
    /**
     * Construct a pod policy info
     *
     * @param policyID_ the policy selecting the pod
     * @param backends_ the backends derived from the pod
     */
    PodPolicyInfo(const PolicyID& policyID_,
                  const std::vector<Backend>& backends_)
        : policyID(policyID_), backends(backends_) {}

    /**
     * The policy selecting the pod
     */
    PolicyID policyID;

    /**
     * The backends derived from the pod
     */
    std::vector<Backend> backends;
};

/**
 * Check for pod policy info equality.
 */
bool operator==(const PodPolicyInfo& lhs, const PodPolicyInfo& rhs);

/**
 * Configuration of a local redirect policy.  Once handed to the
 * redirect policy manager, the stored copy is mutated only by the
 * manager.
 */
class RedirectPolicyConfig {
public:
    /**
     * How the frontend of the policy is specified
     */
    enum LrpType {
        /**
         * Frontends are explicit IP addresses and ports
         */
        ADDR_BASED,
        /**
         * Frontends are derived from a cluster service
         */
        SERVICE_BASED
    };

    /**
     * How frontends are mapped to backend ports
     */
    enum FrontendType {
        /**
         * One frontend, one backend port
         */
        SINGLE_PORT,
        /**
         * Frontends and backend ports are matched by port name
         */
        NAMED_PORTS,
        /**
         * Every port of the referenced service is a frontend
         */
        ALL_PORTS
    };

    /**
     * Default constructor
     */
    RedirectPolicyConfig()
        : lrpType(ADDR_BASED), frontendType(SINGLE_PORT) {}

    /**
     * Construct a policy config
     *
     * @param id_ the policy namespace and name
     */
    explicit RedirectPolicyConfig(const PolicyID& id_)
        : id(id_), lrpType(ADDR_BASED), frontendType(SINGLE_PORT) {}

    /**
     * Get the policy ID
     */
    const PolicyID& getID() const { return id; }

    /**
     * Get the policy type
     */
    LrpType getLrpType() const { return lrpType; }

    /**
     * Get the frontend type
     */
    FrontendType getFrontendType() const { return frontendType; }

    /**
     * Configure the policy as address based
     *
     * @param frontendType the frontend type; SINGLE_PORT or NAMED_PORTS
     */
    void setAddrBased(FrontendType frontendType) {
        this->lrpType = ADDR_BASED;
        this->frontendType = frontendType;
        serviceID = boost::none;
    }

    /**
     * Configure the policy as service based
     *
     * @param serviceID the service whose frontends are redirected
     * @param frontendType the frontend type
     */
    void setServiceBased(const ServiceID& serviceID,
                         FrontendType frontendType) {
        this->lrpType = SERVICE_BASED;
        this->frontendType = frontendType;
        this->serviceID = serviceID;
    }

    /**
     * Get the targeted service, if service based
     */
    const boost::optional<ServiceID>& getServiceID() const {
        return serviceID;
    }

    /**
     * Add a frontend mapping.  For service based policies the IP of
     * the address is left unset and filled in from the service.
     *
     * @param feAddr the frontend address
     * @param fePort the logical port name, or empty if unnamed
     */
    void addFrontendMapping(const L3n4Addr& feAddr,
                            const std::string& fePort = "") {
        frontendMappings.push_back(FrontendMapping(feAddr, fePort));
    }

    /**
     * Get the frontend mappings
     */
    const std::vector<FrontendMapping>& getFrontendMappings() const {
        return frontendMappings;
    }

    /**
     * Set the selector for backend pods
     *
     * @param backendSelector the label selector
     */
    void setBackendSelector(const LabelSelector& backendSelector) {
        this->backendSelector = backendSelector;
    }

    /**
     * Get the selector for backend pods
     */
    const LabelSelector& getBackendSelector() const {
        return backendSelector;
    }

    /**
     * Add a backend port.  Named ports are also indexed by name.
     *
     * @param port the backend port
     */
    void addBackendPort(const BackendPort& port) {
        backendPorts.push_back(port);
        if (!port.name.empty())
            backendPortsByPortName.insert(std::make_pair(port.name, port));
    }

    /**
     * Get the backend ports
     */
    const std::vector<BackendPort>& getBackendPorts() const {
        return backendPorts;
    }

    /**
     * Get the named backend ports indexed by name
     */
    const std::map<std::string, BackendPort>&
    getBackendPortsByPortName() const {
        return backendPortsByPortName;
    }

    /**
     * Check whether an object in the given namespace may be used by
     * this policy.  A policy without a namespace accepts any.
     *
     * @param ns the namespace to check
     */
    bool checkNamespace(const std::string& ns) const {
        return id.getNamespace().empty() || id.getNamespace() == ns;
    }

    /**
     * Check whether this policy selects the pod as a backend
     *
     * @param pod the pod metadata
     */
    bool selectsPod(const PodMetadata& pod) const {
        return checkNamespace(pod.id.getNamespace()) &&
            backendSelector.matches(pod.labels);
    }

private:
    PolicyID id;
    LrpType lrpType;
    boost::optional<ServiceID> serviceID;
    FrontendType frontendType;
    std::vector<FrontendMapping> frontendMappings;
    LabelSelector backendSelector;
    std::vector<BackendPort> backendPorts;
    std::map<std::string, BackendPort> backendPortsByPortName;

    friend class RedirectPolicyManager;
};

/**
 * Print a policy config to an ostream
 */
std::ostream& operator<<(std::ostream& os, const RedirectPolicyConfig& config);

} /* namespace lrpagent */

#endif /* LRPAGENT_REDIRECTPOLICY_H */
