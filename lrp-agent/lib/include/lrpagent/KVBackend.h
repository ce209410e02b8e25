/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Include file for the key-value store backend interface
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef LRPAGENT_KVBACKEND_H
#define LRPAGENT_KVBACKEND_H

#include <map>
#include <string>

namespace lrpagent {

/**
 * A listener that gets notified when keys under a watched prefix
 * change
 */
class KVWatcher {
public:
    /**
     * Destroy the watcher and clean up all state
     */
    virtual ~KVWatcher() {}

    /**
     * Called when a key is created or modified
     *
     * @param key the full key
     * @param value the new value
     */
    virtual void kvUpdated(const std::string& key,
                           const std::string& value) = 0;

    /**
     * Called when a key is deleted
     *
     * @param key the full key
     */
    virtual void kvDeleted(const std::string& key) = 0;
};

/**
 * An abstract interface to a distributed key-value store
 */
class KVBackend {
public:
    /**
     * Destroy the backend and clean up all state
     */
    virtual ~KVBackend() {}

    /**
     * Create or modify a key.  Blocks until the store acknowledges the
     * write.
     *
     * @param key the full key
     * @param value the value
     * @param lease true if the key should be bound to the session of
     * this client and removed when it ends
     * @throws KVStoreError if the write fails
     */
    virtual void update(const std::string& key, const std::string& value,
                        bool lease) = 0;

    /**
     * Delete a key.  Deleting a missing key is not an error.
     *
     * @param key the full key
     * @throws KVStoreError if the delete fails
     */
    virtual void remove(const std::string& key) = 0;

    /**
     * List all keys under a prefix
     *
     * @param prefix the prefix
     * @return a map of full keys to values
     * @throws KVStoreError if the listing fails
     */
    virtual std::map<std::string, std::string>
    listPrefix(const std::string& prefix) = 0;

    /**
     * Start delivering changes to keys under a prefix to a watcher
     *
     * @param prefix the prefix
     * @param watcher the watcher to notify
     * @throws KVStoreError if the watch cannot be established
     */
    virtual void watchPrefix(const std::string& prefix,
                             KVWatcher* watcher) = 0;

    /**
     * Stop delivering changes to a watcher.  When this returns, no
     * delivery to the watcher is in progress on another thread and
     * the watcher may be destroyed.
     *
     * @param prefix the prefix passed to watchPrefix
     * @param watcher the watcher
     */
    virtual void unwatchPrefix(const std::string& prefix,
                               KVWatcher* watcher) = 0;
};

} /* namespace lrpagent */

#endif /* LRPAGENT_KVBACKEND_H */
