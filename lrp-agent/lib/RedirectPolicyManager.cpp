/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for RedirectPolicyManager class.
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <lrpagent/RedirectPolicyManager.h>
#include <lrpagent/Errors.h>

#include <boost/asio/ip/address.hpp>

#include <algorithm>
#include <sstream>
#include <unordered_set>

namespace lrpagent {

using std::string;
using std::vector;
using std::map;
using std::unordered_set;
using std::unique_lock;
using std::mutex;
using boost::optional;
using boost::asio::ip::address;

static const string LOCAL_REDIRECT_SUFFIX = "-local-redirect";

RedirectPolicyManager::
RedirectPolicyManager(ServiceTable& serviceTable_,
                      ServiceCache& serviceCache_,
                      PodStore& podStore_,
                      const RedirectPolicyOptions& options_,
                      LogSink& logSink_)
    : serviceTable(serviceTable_), serviceCache(serviceCache_),
      podStore(podStore_), options(options_), logSink(logSink_) {
}

void RedirectPolicyManager::
addRedirectPolicy(const RedirectPolicyConfig& config) {
    unique_lock<mutex> guard(lrp_mutex);

    if (policyConfigs.find(config.getID()) != policyConfigs.end()) {
        SINK_LOG(logSink, WARNING)
            << "Local redirect policy " << config.getID()
            << " already exists; updates are not supported";
        return;
    }

    validateConfig(config);
    storePolicyConfig(config);

    RedirectPolicyConfig& stored = policyConfigs.at(config.getID());
    SINK_LOG(logSink, INFO) << "Added " << stored;

    switch (stored.lrpType) {
    case RedirectPolicyConfig::ADDR_BASED:
        upsertConfig(stored, getLocalPodsForPolicy(stored));
        break;
    case RedirectPolicyConfig::SERVICE_BASED:
        if (stored.checkNamespace(stored.serviceID.get().getNamespace()))
            upsertPolicyServiceConfig(stored);
        break;
    }
}

void RedirectPolicyManager::
deleteRedirectPolicy(const RedirectPolicyConfig& config) {
    unique_lock<mutex> guard(lrp_mutex);

    policy_config_map_t::iterator it = policyConfigs.find(config.getID());
    if (it == policyConfigs.end()) {
        throw NotFoundError("Local redirect policy " +
                            config.getID().toString() + " not found");
    }

    RedirectPolicyConfig& stored = it->second;
    for (const FrontendMapping& fe : stored.frontendMappings) {
        if (fe.feAddr.isResolved())
            deleteFrontendService(stored, fe.feAddr);
    }

    deletePolicyConfig(stored);
    SINK_LOG(logSink, INFO) << "Deleted local redirect policy "
                            << config.getID();
}

void RedirectPolicyManager::onAddService(const ServiceID& svcID) {
    unique_lock<mutex> guard(lrp_mutex);
    if (policyConfigs.empty())
        return;

    service_policy_map_t::const_iterator sit = policyServices.find(svcID);
    if (sit == policyServices.end())
        return;
    policy_config_map_t::iterator it = policyConfigs.find(sit->second);
    if (it == policyConfigs.end())
        return;

    RedirectPolicyConfig& config = it->second;
    if (!config.checkNamespace(svcID.getNamespace()))
        return;

    SINK_LOG(logSink, DEBUG) << "Service " << svcID
                             << " updated for " << config.getID();
    upsertPolicyServiceConfig(config);
}

void RedirectPolicyManager::onDeleteService(const ServiceID& svcID) {
    unique_lock<mutex> guard(lrp_mutex);
    if (policyConfigs.empty())
        return;

    service_policy_map_t::const_iterator sit = policyServices.find(svcID);
    if (sit == policyServices.end())
        return;
    policy_config_map_t::iterator it = policyConfigs.find(sit->second);
    if (it == policyConfigs.end())
        return;

    RedirectPolicyConfig& config = it->second;
    if (!config.checkNamespace(svcID.getNamespace()))
        return;

    SINK_LOG(logSink, DEBUG) << "Service " << svcID
                             << " deleted for " << config.getID();
    deletePolicyService(config);
}

void RedirectPolicyManager::onAddPod(const Pod& pod) {
    unique_lock<mutex> guard(lrp_mutex);
    if (policyConfigs.empty())
        return;

    if (policyPods.find(pod.getID()) != policyPods.end()) {
        SINK_LOG(logSink, DEBUG) << "Pod " << pod.getID()
                                 << " already selected; ignoring add";
        return;
    }
    onUpdatePodLocked(pod);
}

void RedirectPolicyManager::onUpdatePod(const Pod& pod) {
    unique_lock<mutex> guard(lrp_mutex);
    if (policyConfigs.empty())
        return;

    onUpdatePodLocked(pod);
}

void RedirectPolicyManager::onDeletePod(const Pod& pod) {
    unique_lock<mutex> guard(lrp_mutex);
    if (policyConfigs.empty())
        return;

    removePodBackends(pod.getID());
}

optional<RedirectPolicyConfig>
RedirectPolicyManager::getPolicyConfig(const PolicyID& id) {
    unique_lock<mutex> guard(lrp_mutex);
    policy_config_map_t::const_iterator it = policyConfigs.find(id);
    if (it != policyConfigs.end())
        return it->second;
    return boost::none;
}

vector<PolicyID> RedirectPolicyManager::getPolicyIDs() {
    unique_lock<mutex> guard(lrp_mutex);
    vector<PolicyID> ids;
    for (const policy_config_map_t::value_type& p : policyConfigs)
        ids.push_back(p.first);
    std::sort(ids.begin(), ids.end());
    return ids;
}

optional<PolicyID>
RedirectPolicyManager::getPolicyForFrontend(const L3n4Addr& frontend) {
    unique_lock<mutex> guard(lrp_mutex);
    frontend_policy_map_t::const_iterator it =
        policyFrontendsByHash.find(frontend.hash());
    if (it != policyFrontendsByHash.end())
        return it->second;
    return boost::none;
}

optional<PolicyID>
RedirectPolicyManager::getPolicyForService(const ServiceID& svcID) {
    unique_lock<mutex> guard(lrp_mutex);
    service_policy_map_t::const_iterator it = policyServices.find(svcID);
    if (it != policyServices.end())
        return it->second;
    return boost::none;
}

vector<PodPolicyInfo>
RedirectPolicyManager::getPodPolicies(const PodID& podID) {
    unique_lock<mutex> guard(lrp_mutex);
    pod_policy_map_t::const_iterator it = policyPods.find(podID);
    if (it != policyPods.end())
        return it->second;
    return vector<PodPolicyInfo>();
}

void RedirectPolicyManager::
validateConfig(const RedirectPolicyConfig& config) {
    switch (config.lrpType) {
    case RedirectPolicyConfig::ADDR_BASED:
        for (const FrontendMapping& fe : config.frontendMappings) {
            frontend_policy_map_t::const_iterator it =
                policyFrontendsByHash.find(fe.feAddr.hash());
            if (it != policyFrontendsByHash.end() &&
                it->second.getName() != config.getID().getName()) {
                std::stringstream ss;
                ss << "Frontend " << fe.feAddr
                   << " is already in use by local redirect policy "
                   << it->second;
                throw ConflictError(ss.str());
            }
        }
        break;
    case RedirectPolicyConfig::SERVICE_BASED:
        {
            if (!config.serviceID) {
                throw ValidationError("Service based local redirect policy " +
                                      config.getID().toString() +
                                      " has no service");
            }
            service_policy_map_t::const_iterator it =
                policyServices.find(config.serviceID.get());
            if (it != policyServices.end() &&
                !it->second.getNamespace().empty() &&
                it->second.getNamespace() == config.getID().getNamespace()) {
                std::stringstream ss;
                ss << "Service " << config.serviceID.get()
                   << " is already in use by local redirect policy "
                   << it->second;
                throw ConflictError(ss.str());
            }
        }
        break;
    }
}

void RedirectPolicyManager::
storePolicyConfig(const RedirectPolicyConfig& config) {
    RedirectPolicyConfig& stored =
        policyConfigs.insert(std::make_pair(config.getID(),
                                            config)).first->second;

    switch (stored.lrpType) {
    case RedirectPolicyConfig::ADDR_BASED:
        for (FrontendMapping& fe : stored.frontendMappings) {
            fe.backends.clear();
            policyFrontendsByHash[fe.feAddr.hash()] = stored.getID();
        }
        break;
    case RedirectPolicyConfig::SERVICE_BASED:
        for (FrontendMapping& fe : stored.frontendMappings) {
            fe.feAddr.ip = boost::none;
            fe.backends.clear();
        }
        policyServices[stored.serviceID.get()] = stored.getID();
        break;
    }
}

void RedirectPolicyManager::
deletePolicyConfig(const RedirectPolicyConfig& config) {
    // copy since config refers to the map entry being erased
    const PolicyID id = config.getID();

    unindexFrontends(config);
    if (config.serviceID) {
        service_policy_map_t::iterator it =
            policyServices.find(config.serviceID.get());
        if (it != policyServices.end() && it->second == id)
            policyServices.erase(it);
    }
    purgePolicyPods(id);
    policyConfigs.erase(id);
}

void RedirectPolicyManager::
unindexFrontends(const RedirectPolicyConfig& config) {
    for (const FrontendMapping& fe : config.frontendMappings) {
        frontend_policy_map_t::iterator it =
            policyFrontendsByHash.find(fe.feAddr.hash());
        if (it != policyFrontendsByHash.end() &&
            it->second == config.getID())
            policyFrontendsByHash.erase(it);
    }
}

void RedirectPolicyManager::
resolveServiceFrontends(RedirectPolicyConfig& config) {
    const ServiceID& svcID = config.serviceID.get();

    try {
        if (config.frontendType == RedirectPolicyConfig::ALL_PORTS) {
            map<string, L3n4Addr> addrs =
                serviceCache.getServiceAddrsWithType(svcID,
                                                     LbService::CLUSTER_IP);
            config.frontendMappings.clear();
            for (const map<string, L3n4Addr>::value_type& a : addrs) {
                config.frontendMappings.push_back(FrontendMapping(a.second,
                                                                  a.first));
            }
        } else {
            optional<address> ip =
                serviceCache.getServiceFrontendIP(svcID,
                                                  LbService::CLUSTER_IP);
            for (FrontendMapping& fe : config.frontendMappings) {
                fe.feAddr.ip = ip;
                fe.backends.clear();
            }
        }
    } catch (const std::exception& e) {
        SINK_LOG(logSink, ERROR) << "Could not resolve service " << svcID
                                 << " for " << config.getID()
                                 << ": " << e.what();
        if (config.frontendType == RedirectPolicyConfig::ALL_PORTS) {
            config.frontendMappings.clear();
        } else {
            for (FrontendMapping& fe : config.frontendMappings) {
                fe.feAddr.ip = boost::none;
                fe.backends.clear();
            }
        }
    }

    for (const FrontendMapping& fe : config.frontendMappings) {
        if (fe.feAddr.isResolved())
            policyFrontendsByHash[fe.feAddr.hash()] = config.getID();
    }
}

void RedirectPolicyManager::
upsertPolicyServiceConfig(RedirectPolicyConfig& config) {
    vector<L3n4Addr> active;
    for (const FrontendMapping& fe : config.frontendMappings) {
        if (fe.feAddr.isResolved() && !fe.backends.empty())
            active.push_back(fe.feAddr);
    }

    purgePolicyPods(config.getID());
    unindexFrontends(config);
    resolveServiceFrontends(config);
    upsertConfig(config, getLocalPodsForPolicy(config));

    // Frontends that were serving traffic but are gone or left
    // without backends
    for (const L3n4Addr& addr : active) {
        bool stillActive = false;
        for (const FrontendMapping& fe : config.frontendMappings) {
            if (fe.feAddr.isResolved() && !fe.backends.empty() &&
                fe.feAddr.hash() == addr.hash()) {
                stillActive = true;
                break;
            }
        }
        if (!stillActive)
            deleteFrontendService(config, addr);
    }
}

void RedirectPolicyManager::deletePolicyService(RedirectPolicyConfig& config) {
    for (const FrontendMapping& fe : config.frontendMappings) {
        if (fe.feAddr.isResolved())
            deleteFrontendService(config, fe.feAddr);
    }
    unindexFrontends(config);

    if (config.frontendType == RedirectPolicyConfig::ALL_PORTS) {
        config.frontendMappings.clear();
    } else {
        for (FrontendMapping& fe : config.frontendMappings)
            fe.feAddr.ip = boost::none;
    }
}

void RedirectPolicyManager::
deleteFrontendService(const RedirectPolicyConfig& config,
                      const L3n4Addr& frontend) {
    try {
        serviceTable.deleteService(frontend);
    } catch (const std::exception& e) {
        SINK_LOG(logSink, ERROR) << "Could not delete service for "
                                 << config.getID() << " frontend "
                                 << frontend << ": " << e.what();
    }
}

void RedirectPolicyManager::onUpdatePodLocked(const Pod& pod) {
    optional<PodMetadata> md = getPodMetadata(pod);
    if (!md)
        return;

    removePodBackends(md->id);

    for (policy_config_map_t::value_type& p : policyConfigs) {
        RedirectPolicyConfig& config = p.second;
        if (!config.selectsPod(md.get()))
            continue;
        SINK_LOG(logSink, DEBUG) << "Pod " << md->id
                                 << " selected by " << config.getID();
        upsertConfig(config, vector<PodMetadata>(1, md.get()));
    }
}

optional<PodMetadata> RedirectPolicyManager::getPodMetadata(const Pod& pod) {
    try {
        return PodMetadata::fromPod(pod, getValidIPs(pod));
    } catch (const ValidationError& e) {
        SINK_LOG(logSink, DEBUG) << "Skipping pod " << pod.getID()
                                 << ": " << e.what();
    }
    return boost::none;
}

vector<PodMetadata> RedirectPolicyManager::
getLocalPodsForPolicy(const RedirectPolicyConfig& config) {
    vector<PodMetadata> result;
    vector<Pod> pods;
    try {
        pods = podStore.list();
    } catch (const std::exception& e) {
        SINK_LOG(logSink, ERROR) << "Could not list pods for "
                                 << config.getID() << ": " << e.what();
        return result;
    }

    for (const Pod& pod : pods) {
        optional<PodMetadata> md = getPodMetadata(pod);
        if (md && config.selectsPod(md.get()))
            result.push_back(md.get());
    }
    return result;
}

void RedirectPolicyManager::removePodBackends(const PodID& podID) {
    pod_policy_map_t::iterator it = policyPods.find(podID);
    if (it == policyPods.end())
        return;

    for (const PodPolicyInfo& info : it->second) {
        policy_config_map_t::iterator cit = policyConfigs.find(info.policyID);
        if (cit == policyConfigs.end())
            continue;
        removeBackends(cit->second, info.backends);
    }
    policyPods.erase(it);
}

void RedirectPolicyManager::purgePolicyPods(const PolicyID& policyID) {
    pod_policy_map_t::iterator it = policyPods.begin();
    while (it != policyPods.end()) {
        vector<PodPolicyInfo>& infos = it->second;
        infos.erase(std::remove_if(infos.begin(), infos.end(),
                                   [&policyID](const PodPolicyInfo& i) {
                                       return i.policyID == policyID;
                                   }),
                    infos.end());
        if (infos.empty())
            it = policyPods.erase(it);
        else
            ++it;
    }
}

void RedirectPolicyManager::
upsertConfig(RedirectPolicyConfig& config, const vector<PodMetadata>& pods) {
    if (pods.empty())
        return;

    switch (config.frontendType) {
    case RedirectPolicyConfig::SINGLE_PORT:
        upsertConfigWithSinglePort(config, pods);
        break;
    case RedirectPolicyConfig::NAMED_PORTS:
        upsertConfigWithNamedPorts(config, pods);
        break;
    case RedirectPolicyConfig::ALL_PORTS:
        // multi-port services always have named ports
        if (config.frontendMappings.size() > 1)
            upsertConfigWithNamedPorts(config, pods);
        else
            upsertConfigWithSinglePort(config, pods);
        break;
    }
}

void RedirectPolicyManager::
upsertConfigWithSinglePort(RedirectPolicyConfig& config,
                           const vector<PodMetadata>& pods) {
    if (config.frontendMappings.empty() || config.backendPorts.empty())
        return;

    FrontendMapping& fe = config.frontendMappings[0];
    if (!fe.feAddr.isResolved())
        return;
    const L4Addr& bePort = config.backendPorts[0].l4Addr;

    for (const PodMetadata& pod : pods) {
        vector<Backend> backends = getPodBackends(fe, bePort, pod);
        if (!backends.empty())
            installBackends(config, fe, pod.id, backends);
    }
}

void RedirectPolicyManager::
upsertConfigWithNamedPorts(RedirectPolicyConfig& config,
                           const vector<PodMetadata>& pods) {
    for (const PodMetadata& pod : pods) {
        for (FrontendMapping& fe : config.frontendMappings) {
            if (!fe.feAddr.isResolved())
                continue;

            map<string, BackendPort>::const_iterator bit =
                config.backendPortsByPortName.find(fe.fePort);
            if (bit == config.backendPortsByPortName.end()) {
                SINK_LOG(logSink, DEBUG) << "No backend port named \""
                                         << fe.fePort << "\" in "
                                         << config.getID();
                continue;
            }
            const L4Addr& bePort = bit->second.l4Addr;
            if (bePort.protocol != fe.feAddr.l4.protocol)
                continue;
            if (pod.namedPorts.find(fe.fePort) == pod.namedPorts.end())
                continue;

            vector<Backend> backends = getPodBackends(fe, bePort, pod);
            if (!backends.empty())
                installBackends(config, fe, pod.id, backends);
        }
    }
}

vector<Backend>
RedirectPolicyManager::getPodBackends(const FrontendMapping& fe,
                                      const L4Addr& bePort,
                                      const PodMetadata& pod) {
    vector<Backend> backends;
    bool v4 = fe.feAddr.isIPv4();
    if ((v4 && !options.enableIPv4) || (!v4 && !options.enableIPv6))
        return backends;

    for (const string& ipStr : pod.ips) {
        boost::system::error_code ec;
        address ip = address::from_string(ipStr, ec);
        if (ec || ip.is_v4() != v4)
            continue;
        backends.push_back(Backend(ip, bePort));
    }
    return backends;
}

void RedirectPolicyManager::installBackends(RedirectPolicyConfig& config,
                                            FrontendMapping& fe,
                                            const PodID& podID,
                                            const vector<Backend>& backends) {
    unordered_set<string> added;
    for (const Backend& be : backends)
        added.insert(be.hash());

    vector<Backend> newBackends;
    for (const Backend& be : fe.backends) {
        if (added.find(be.hash()) == added.end())
            newBackends.push_back(be);
    }
    newBackends.insert(newBackends.end(), backends.begin(), backends.end());
    fe.backends.swap(newBackends);

    vector<PodPolicyInfo>& infos = policyPods[podID];
    PodPolicyInfo info(config.getID(), backends);
    if (std::find(infos.begin(), infos.end(), info) == infos.end())
        infos.push_back(info);

    upsertService(config, fe);
}

void RedirectPolicyManager::removeBackends(RedirectPolicyConfig& config,
                                           const vector<Backend>& backends) {
    unordered_set<string> removed;
    for (const Backend& be : backends)
        removed.insert(be.hash());

    for (FrontendMapping& fe : config.frontendMappings) {
        vector<Backend> remaining;
        for (const Backend& be : fe.backends) {
            if (removed.find(be.hash()) == removed.end())
                remaining.push_back(be);
        }
        if (remaining.size() == fe.backends.size())
            continue;

        fe.backends.swap(remaining);
        if (!fe.feAddr.isResolved())
            continue;
        if (fe.backends.empty())
            deleteFrontendService(config, fe.feAddr);
        else
            upsertService(config, fe);
    }
}

void RedirectPolicyManager::upsertService(const RedirectPolicyConfig& config,
                                          const FrontendMapping& fe) {
    LbService svc;
    svc.setName(config.getID().getName() + LOCAL_REDIRECT_SUFFIX);
    svc.setNamespace(config.getID().getNamespace());
    svc.setType(LbService::LOCAL_REDIRECT);
    svc.setFrontend(fe.feAddr);
    svc.setTrafficPolicy(LbService::CLUSTER);
    for (const Backend& be : fe.backends)
        svc.addBackend(LbBackend(be, options.nodeName));

    try {
        uint32_t id = 0;
        serviceTable.upsertService(svc, id);
        SINK_LOG(logSink, DEBUG) << "Upserted " << svc << " with ID " << id;
    } catch (const std::exception& e) {
        SINK_LOG(logSink, ERROR) << "Could not upsert service for "
                                 << config.getID() << " frontend "
                                 << fe.feAddr << ": " << e.what();
    }
}

} /* namespace lrpagent */
