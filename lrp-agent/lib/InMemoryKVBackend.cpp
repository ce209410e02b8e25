/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for InMemoryKVBackend class.
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <lrpagent/InMemoryKVBackend.h>

#include <boost/algorithm/string/predicate.hpp>

#include <vector>
#include <algorithm>

namespace lrpagent {

using std::string;
using std::map;
using std::list;
using std::vector;
using std::unique_lock;
using std::mutex;
using boost::algorithm::starts_with;

list<KVWatcher*> InMemoryKVBackend::startDelivery(const string& key) {
    list<KVWatcher*> result;
    for (const watch_t& w : watches) {
        if (starts_with(key, w.first)) {
            result.push_back(w.second);
            inFlight.push_back(std::make_pair(w.second,
                                              std::this_thread::get_id()));
        }
    }
    return result;
}

bool InMemoryKVBackend::isWatched(KVWatcher* watcher) {
    for (const watch_t& w : watches) {
        if (w.second == watcher)
            return true;
    }
    return false;
}

/**
 * Ends the deliveries still pending if a callback throws
 */
class InMemoryKVBackend::DeliveryGuard : private boost::noncopyable {
public:
    DeliveryGuard(InMemoryKVBackend& backend_, list<KVWatcher*>& pending_)
        : backend(backend_), pending(pending_) {}
    ~DeliveryGuard() {
        for (KVWatcher* watcher : pending)
            backend.endDelivery(watcher);
    }

private:
    InMemoryKVBackend& backend;
    list<KVWatcher*>& pending;
};

bool InMemoryKVBackend::beginDelivery(KVWatcher* watcher) {
    unique_lock<mutex> guard(kv_mutex);
    // the watcher may have been removed since the change was made
    return isWatched(watcher);
}

void InMemoryKVBackend::endDelivery(KVWatcher* watcher) {
    {
        unique_lock<mutex> guard(kv_mutex);
        const delivery_t d(watcher, std::this_thread::get_id());
        list<delivery_t>::iterator it =
            std::find(inFlight.begin(), inFlight.end(), d);
        if (it != inFlight.end())
            inFlight.erase(it);
    }
    delivery_cond.notify_all();
}

bool InMemoryKVBackend::deliveringElsewhere(KVWatcher* watcher) {
    const std::thread::id self = std::this_thread::get_id();
    for (const delivery_t& d : inFlight) {
        if (d.first == watcher && d.second != self)
            return true;
    }
    return false;
}

void InMemoryKVBackend::update(const string& key, const string& value,
                               bool lease) {
    list<KVWatcher*> notify;
    {
        unique_lock<mutex> guard(kv_mutex);
        Entry& e = store[key];
        e.value = value;
        e.lease = lease;
        notify = startDelivery(key);
    }
    DeliveryGuard done(*this, notify);
    while (!notify.empty()) {
        KVWatcher* watcher = notify.front();
        if (beginDelivery(watcher))
            watcher->kvUpdated(key, value);
        notify.pop_front();
        endDelivery(watcher);
    }
}

void InMemoryKVBackend::remove(const string& key) {
    list<KVWatcher*> notify;
    {
        unique_lock<mutex> guard(kv_mutex);
        if (store.erase(key) == 0)
            return;
        notify = startDelivery(key);
    }
    DeliveryGuard done(*this, notify);
    while (!notify.empty()) {
        KVWatcher* watcher = notify.front();
        if (beginDelivery(watcher))
            watcher->kvDeleted(key);
        notify.pop_front();
        endDelivery(watcher);
    }
}

map<string, string> InMemoryKVBackend::listPrefix(const string& prefix) {
    unique_lock<mutex> guard(kv_mutex);
    map<string, string> result;
    map<string, Entry>::const_iterator it = store.lower_bound(prefix);
    for (; it != store.end() && starts_with(it->first, prefix); ++it)
        result[it->first] = it->second.value;
    return result;
}

void InMemoryKVBackend::watchPrefix(const string& prefix,
                                    KVWatcher* watcher) {
    unique_lock<mutex> guard(kv_mutex);
    watches.push_back(std::make_pair(prefix, watcher));
}

void InMemoryKVBackend::unwatchPrefix(const string& prefix,
                                      KVWatcher* watcher) {
    unique_lock<mutex> guard(kv_mutex);
    watches.remove(std::make_pair(prefix, watcher));
    // a watcher may unwatch itself from within its own callback
    delivery_cond.wait(guard, [this, watcher] {
            return !deliveringElsewhere(watcher);
        });
}

bool InMemoryKVBackend::get(const string& key, /* out */ string& value) {
    unique_lock<mutex> guard(kv_mutex);
    map<string, Entry>::const_iterator it = store.find(key);
    if (it == store.end())
        return false;
    value = it->second.value;
    return true;
}

size_t InMemoryKVBackend::size() {
    unique_lock<mutex> guard(kv_mutex);
    return store.size();
}

void InMemoryKVBackend::expireLeases() {
    vector<string> expired;
    {
        unique_lock<mutex> guard(kv_mutex);
        for (const map<string, Entry>::value_type& e : store) {
            if (e.second.lease)
                expired.push_back(e.first);
        }
    }
    for (const string& key : expired)
        remove(key);
}

} /* namespace lrpagent */
