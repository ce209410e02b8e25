/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for SharedStore class.
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <lrpagent/SharedStore.h>
#include <lrpagent/Errors.h>
#include <lrpagent/logging.h>

#include <boost/algorithm/string/predicate.hpp>

namespace lrpagent {

using std::string;
using std::map;
using std::vector;
using std::shared_ptr;
using std::unique_lock;
using std::mutex;

SharedStore::SharedStore(KVBackend& backend_,
                         const SharedStoreConfig& config_)
    : backend(backend_), config(config_), released(false) {
}

SharedStore::~SharedStore() {
    release();
}

shared_ptr<SharedStore> SharedStore::join(KVBackend& backend,
                                          const SharedStoreConfig& config) {
    if (!config.keyCreator)
        throw KVStoreError("No key creator for store " + config.prefix);

    shared_ptr<SharedStore> store(new SharedStore(backend, config));
    try {
        backend.watchPrefix(store->keyPath(""), store.get());
    } catch (const KVStoreError& e) {
        LOG(ERROR) << "Could not watch store " << config.prefix
                   << ": " << e.what();
        // nothing to release
        store->released = true;
        throw;
    }

    try {
        map<string, string> existing = backend.listPrefix(store->keyPath(""));
        for (const map<string, string>::value_type& kv : existing)
            store->kvUpdated(kv.first, kv.second);
    } catch (const KVStoreError& e) {
        LOG(ERROR) << "Could not list keys of store " << config.prefix
                   << ": " << e.what();
        store->release();
        throw;
    }

    LOG(INFO) << "Joined shared store " << config.prefix;
    return store;
}

string SharedStore::keyPath(const string& name) const {
    return config.prefix + "/" + name;
}

string SharedStore::keyName(const string& path) const {
    const string base = keyPath("");
    if (boost::algorithm::starts_with(path, base))
        return path.substr(base.size());
    return path;
}

void SharedStore::updateLocalKeySync(const StoreKey& key) {
    const string name = key.getKeyName();
    const string value = key.marshal();
    {
        unique_lock<mutex> guard(store_mutex);
        if (released)
            throw KVStoreError("Store " + config.prefix + " is released");
    }
    backend.update(keyPath(name), value, true);

    {
        unique_lock<mutex> guard(store_mutex);
        if (!released) {
            localKeys[name] = value;
            return;
        }
    }
    // released while the write was in progress
    backend.remove(keyPath(name));
    throw KVStoreError("Store " + config.prefix + " is released");
}

void SharedStore::deleteLocalKey(const StoreKey& key) {
    const string name = key.getKeyName();
    {
        unique_lock<mutex> guard(store_mutex);
        localKeys.erase(name);
    }
    backend.remove(keyPath(name));
}

vector<StoreKeyPtr> SharedStore::getSharedKeys() {
    unique_lock<mutex> guard(store_mutex);
    vector<StoreKeyPtr> keys;
    for (const auto& k : sharedKeys)
        keys.push_back(k.second);
    return keys;
}

void SharedStore::release() {
    std::unordered_map<string, string> local;
    {
        unique_lock<mutex> guard(store_mutex);
        if (released)
            return;
        released = true;
        local.swap(localKeys);
    }

    backend.unwatchPrefix(keyPath(""), this);
    for (const auto& k : local) {
        try {
            backend.remove(keyPath(k.first));
        } catch (const std::exception& e) {
            LOG(WARNING) << "Could not remove local key " << k.first
                         << " from store " << config.prefix
                         << ": " << e.what();
        }
    }
    LOG(DEBUG) << "Released shared store " << config.prefix;
}

void SharedStore::kvUpdated(const string& path, const string& value) {
    StoreKeyPtr key = config.keyCreator();
    try {
        key->unmarshal(value);
    } catch (const std::exception& e) {
        LOG(ERROR) << "Could not unmarshal key " << path
                   << " in store " << config.prefix << ": " << e.what();
        return;
    }

    {
        unique_lock<mutex> guard(store_mutex);
        if (released)
            return;
        sharedKeys[keyName(path)] = key;
    }
    if (config.observer)
        config.observer->onUpdate(*key);
}

void SharedStore::kvDeleted(const string& path) {
    StoreKeyPtr key;
    {
        unique_lock<mutex> guard(store_mutex);
        if (released)
            return;
        auto it = sharedKeys.find(keyName(path));
        if (it == sharedKeys.end())
            return;
        key = it->second;
        sharedKeys.erase(it);
    }
    if (config.observer)
        config.observer->onDelete(*key);
}

} /* namespace lrpagent */
