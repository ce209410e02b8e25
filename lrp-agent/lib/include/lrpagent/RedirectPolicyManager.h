/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for redirect policy manager
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef LRPAGENT_REDIRECTPOLICYMANAGER_H
#define LRPAGENT_REDIRECTPOLICYMANAGER_H

#include <lrpagent/RedirectPolicy.h>
#include <lrpagent/ServiceTable.h>
#include <lrpagent/ServiceCache.h>
#include <lrpagent/PodStore.h>
#include <lrpagent/logging.h>

#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>

#include <string>
#include <vector>
#include <unordered_map>
#include <mutex>

namespace lrpagent {

/**
 * Options controlling how redirect policies are rendered
 */
class RedirectPolicyOptions {
public:
    RedirectPolicyOptions()
        : enableIPv4(true), enableIPv6(false) {}

    /**
     * Generate backends for IPv4 frontends
     */
    bool enableIPv4;

    /**
     * Generate backends for IPv6 frontends
     */
    bool enableIPv6;

    /**
     * Name of the local node, attached to every backend
     */
    std::string nodeName;
};

/**
 * Manage local redirect policies.  A local redirect policy redirects
 * traffic from a frontend to a set of node-local backend pods
 * selected by the policy.  For every frontend with at least one
 * backend, a local redirect service is written to the service table.
 * The manager tracks policy, service and pod events and keeps the
 * services in line with them regardless of the order in which the
 * events arrive.
 */
class RedirectPolicyManager : private boost::noncopyable {
public:
    /**
     * Instantiate a new redirect policy manager
     *
     * @param serviceTable the service table that local redirect
     * services are written to
     * @param serviceCache the cache used to resolve service frontends
     * @param podStore the store of node-local pods
     * @param options rendering options
     * @param logSink the destination of log messages
     */
    RedirectPolicyManager(ServiceTable& serviceTable,
                          ServiceCache& serviceCache,
                          PodStore& podStore,
                          const RedirectPolicyOptions& options,
                          LogSink& logSink);

    /**
     * Add a new redirect policy.  Adding a policy with an ID that is
     * already known has no effect, since policy updates are not
     * supported.
     *
     * @param config the policy configuration
     * @throws ConflictError if a frontend or service of the policy
     * is already claimed by another policy
     * @throws ValidationError if a service based policy has no
     * service
     */
    void addRedirectPolicy(const RedirectPolicyConfig& config);

    /**
     * Delete a redirect policy along with its services
     *
     * @param config the policy configuration; only the ID is used
     * @throws NotFoundError if the policy is not known
     */
    void deleteRedirectPolicy(const RedirectPolicyConfig& config);

    /**
     * Handle a service being added or updated in the service cache
     *
     * @param svcID the service
     */
    void onAddService(const ServiceID& svcID);

    /**
     * Handle a service being deleted from the service cache
     *
     * @param svcID the service
     */
    void onDeleteService(const ServiceID& svcID);

    /**
     * Handle a pod being added.  Pods that are already tracked are
     * ignored; changes to them arrive through onUpdatePod.
     *
     * @param pod the pod
     */
    void onAddPod(const Pod& pod);

    /**
     * Handle a pod being updated
     *
     * @param pod the pod
     */
    void onUpdatePod(const Pod& pod);

    /**
     * Handle a pod being deleted
     *
     * @param pod the pod
     */
    void onDeletePod(const Pod& pod);

    /**
     * Get a copy of the stored state of a policy
     *
     * @param id the policy ID
     * @return the policy config or boost::none if not known
     */
    boost::optional<RedirectPolicyConfig> getPolicyConfig(const PolicyID& id);

    /**
     * Get the IDs of all known policies
     */
    std::vector<PolicyID> getPolicyIDs();

    /**
     * Get the policy that owns a frontend
     *
     * @param frontend the frontend address
     * @return the policy ID or boost::none
     */
    boost::optional<PolicyID> getPolicyForFrontend(const L3n4Addr& frontend);

    /**
     * Get the policy that targets a service
     *
     * @param svcID the service
     * @return the policy ID or boost::none
     */
    boost::optional<PolicyID> getPolicyForService(const ServiceID& svcID);

    /**
     * Get the policies selecting a pod along with the backends the
     * pod contributes to each
     *
     * @param podID the pod
     * @return the list, empty if no policy selects the pod
     */
    std::vector<PodPolicyInfo> getPodPolicies(const PodID& podID);

private:
    typedef std::unordered_map<std::string, PolicyID> frontend_policy_map_t;
    typedef std::unordered_map<ServiceID, PolicyID> service_policy_map_t;
    typedef std::unordered_map<PodID,
                               std::vector<PodPolicyInfo> > pod_policy_map_t;
    typedef std::unordered_map<PolicyID,
                               RedirectPolicyConfig> policy_config_map_t;

    ServiceTable& serviceTable;
    ServiceCache& serviceCache;
    PodStore& podStore;
    RedirectPolicyOptions options;
    LogSink& logSink;

    std::mutex lrp_mutex;

    /**
     * Map frontend address hashes to the owning policy
     */
    frontend_policy_map_t policyFrontendsByHash;

    /**
     * Map targeted services to the owning policy
     */
    service_policy_map_t policyServices;

    /**
     * Map pods to the policies selecting them
     */
    pod_policy_map_t policyPods;

    /**
     * Map policy IDs to their configuration
     */
    policy_config_map_t policyConfigs;

    // The following must be called with lrp_mutex held

    void validateConfig(const RedirectPolicyConfig& config);
    void storePolicyConfig(const RedirectPolicyConfig& config);
    void deletePolicyConfig(const RedirectPolicyConfig& config);

    void resolveServiceFrontends(RedirectPolicyConfig& config);
    void upsertPolicyServiceConfig(RedirectPolicyConfig& config);
    void deletePolicyService(RedirectPolicyConfig& config);
    void deleteFrontendService(const RedirectPolicyConfig& config,
                               const L3n4Addr& frontend);
    void unindexFrontends(const RedirectPolicyConfig& config);

    void onUpdatePodLocked(const Pod& pod);
    boost::optional<PodMetadata> getPodMetadata(const Pod& pod);
    std::vector<PodMetadata>
    getLocalPodsForPolicy(const RedirectPolicyConfig& config);
    void removePodBackends(const PodID& podID);
    void purgePolicyPods(const PolicyID& policyID);

    void upsertConfig(RedirectPolicyConfig& config,
                      const std::vector<PodMetadata>& pods);
    void upsertConfigWithSinglePort(RedirectPolicyConfig& config,
                                    const std::vector<PodMetadata>& pods);
    void upsertConfigWithNamedPorts(RedirectPolicyConfig& config,
                                    const std::vector<PodMetadata>& pods);
    std::vector<Backend> getPodBackends(const FrontendMapping& fe,
                                        const L4Addr& bePort,
                                        const PodMetadata& pod);

    void installBackends(RedirectPolicyConfig& config,
                         FrontendMapping& fe,
                         const PodID& podID,
                         const std::vector<Backend>& backends);
    void removeBackends(RedirectPolicyConfig& config,
                        const std::vector<Backend>& backends);
    void upsertService(const RedirectPolicyConfig& config,
                       const FrontendMapping& fe);
};

} /* namespace lrpagent */

#endif /* LRPAGENT_REDIRECTPOLICYMANAGER_H */
