/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for shared key-value store
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef LRPAGENT_SHAREDSTORE_H
#define LRPAGENT_SHAREDSTORE_H

#include <lrpagent/KVBackend.h>

#include <boost/noncopyable.hpp>

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <mutex>

namespace lrpagent {

/**
 * An object that can be stored under a key of a shared store
 */
class StoreKey {
public:
    virtual ~StoreKey() {}

    /**
     * Get the name of the key relative to the store prefix
     */
    virtual std::string getKeyName() const = 0;

    /**
     * Serialize the object
     */
    virtual std::string marshal() const = 0;

    /**
     * Replace the object state with serialized data
     *
     * @param data the serialized data
     * @throws std::runtime_error if the data cannot be parsed
     */
    virtual void unmarshal(const std::string& data) = 0;
};

/**
 * Pointer to a store key
 */
typedef std::shared_ptr<StoreKey> StoreKeyPtr;

/**
 * Receives notifications about keys in a shared store
 */
class StoreObserver {
public:
    virtual ~StoreObserver() {}

    /**
     * Called when a key is created or modified
     *
     * @param key the key
     */
    virtual void onUpdate(const StoreKey& key) = 0;

    /**
     * Called when a key is deleted
     *
     * @param key the last known state of the key
     */
    virtual void onDelete(const StoreKey& key) = 0;
};

/**
 * Parameters for joining a shared store
 */
class SharedStoreConfig {
public:
    SharedStoreConfig() : observer(NULL) {}

    /**
     * The key prefix of the store
     */
    std::string prefix;

    /**
     * Create an empty key to unmarshal remote keys into
     */
    std::function<StoreKeyPtr()> keyCreator;

    /**
     * An optional observer for key changes
     */
    StoreObserver* observer;
};

/**
 * A collection of keys under a common prefix that is shared between
 * all the nodes of a cluster.  Each node writes its local keys to the
 * store and watches the keys written by the others.
 */
class SharedStore : public KVWatcher, private boost::noncopyable {
public:
    /**
     * Join a shared store.  The watch is established before the
     * existing keys are listed so that no change is lost.  Every
     * existing key is delivered to the observer before this returns.
     *
     * @param backend the key-value store backend
     * @param config the store parameters
     * @return the joined store
     * @throws KVStoreError if the store cannot be joined
     */
    static std::shared_ptr<SharedStore> join(KVBackend& backend,
                                             const SharedStoreConfig& config);

    /**
     * Release the store if still joined
     */
    virtual ~SharedStore();

    /**
     * Get the key prefix
     */
    const std::string& getPrefix() const { return config.prefix; }

    /**
     * Write a local key and wait for the write to complete
     *
     * @param key the key
     * @throws KVStoreError if the write fails or the store is released
     */
    void updateLocalKeySync(const StoreKey& key);

    /**
     * Delete a local key
     *
     * @param key the key
     * @throws KVStoreError if the delete fails
     */
    void deleteLocalKey(const StoreKey& key);

    /**
     * Get a snapshot of the keys known to the store
     */
    std::vector<StoreKeyPtr> getSharedKeys();

    /**
     * Stop watching the store and delete all local keys.  Calling
     * release more than once has no effect.
     */
    void release();

    // KVWatcher
    virtual void kvUpdated(const std::string& key, const std::string& value);
    virtual void kvDeleted(const std::string& key);

private:
    SharedStore(KVBackend& backend, const SharedStoreConfig& config);

    std::string keyPath(const std::string& keyName) const;
    std::string keyName(const std::string& path) const;

    KVBackend& backend;
    SharedStoreConfig config;

    std::mutex store_mutex;
    bool released;
    std::unordered_map<std::string, StoreKeyPtr> sharedKeys;
    std::unordered_map<std::string, std::string> localKeys;
};

} /* namespace lrpagent */

#endif /* LRPAGENT_SHAREDSTORE_H */
