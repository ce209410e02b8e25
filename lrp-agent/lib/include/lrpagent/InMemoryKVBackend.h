/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for in-memory key-value store backend
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef LRPAGENT_INMEMORYKVBACKEND_H
#define LRPAGENT_INMEMORYKVBACKEND_H

#include <lrpagent/KVBackend.h>

#include <boost/noncopyable.hpp>

#include <map>
#include <list>
#include <string>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <utility>

namespace lrpagent {

/**
 * A key-value store backend that keeps all keys in process memory.
 * Watch notifications are delivered synchronously on the thread
 * making the change, after the store lock is released.  Once
 * unwatchPrefix returns, no delivery to that watcher is in progress
 * on another thread.
 */
class InMemoryKVBackend : public KVBackend, private boost::noncopyable {
public:
    InMemoryKVBackend() {}
    virtual ~InMemoryKVBackend() {}

    // KVBackend
    virtual void update(const std::string& key, const std::string& value,
                        bool lease);
    virtual void remove(const std::string& key);
    virtual std::map<std::string, std::string>
    listPrefix(const std::string& prefix);
    virtual void watchPrefix(const std::string& prefix, KVWatcher* watcher);
    virtual void unwatchPrefix(const std::string& prefix, KVWatcher* watcher);

    /**
     * Get the value of a key
     *
     * @param key the full key
     * @param value set to the value if found
     * @return true if the key exists
     */
    bool get(const std::string& key, /* out */ std::string& value);

    /**
     * Get the number of keys in the store
     */
    size_t size();

    /**
     * Remove all keys bound to the session of this client, as happens
     * when the session expires
     */
    void expireLeases();

private:
    struct Entry {
        std::string value;
        bool lease;
    };

    typedef std::pair<std::string, KVWatcher*> watch_t;
    typedef std::pair<KVWatcher*, std::thread::id> delivery_t;

    std::mutex kv_mutex;
    std::condition_variable delivery_cond;
    std::map<std::string, Entry> store;
    std::list<watch_t> watches;
    std::list<delivery_t> inFlight;

    class DeliveryGuard;

    std::list<KVWatcher*> startDelivery(const std::string& key);
    bool beginDelivery(KVWatcher* watcher);
    void endDelivery(KVWatcher* watcher);
    bool isWatched(KVWatcher* watcher);
    bool deliveringElsewhere(KVWatcher* watcher);
};

} /* namespace lrpagent */

#endif /* LRPAGENT_INMEMORYKVBACKEND_H */
