/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Exception types raised by the redirect policy agent
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef LRPAGENT_ERRORS_H
#define LRPAGENT_ERRORS_H

#include <stdexcept>
#include <string>

namespace lrpagent {

/**
 * A policy claims a frontend or a service that another policy
 * already owns
 */
class ConflictError : public std::runtime_error {
public:
    explicit ConflictError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * The object referred to is not known
 */
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * Malformed input such as a pod port with an unknown protocol or an
 * out of range port number
 */
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * A key-value store operation failed
 */
class KVStoreError : public std::runtime_error {
public:
    explicit KVStoreError(const std::string& what)
        : std::runtime_error(what) {}
};

} /* namespace lrpagent */

#endif /* LRPAGENT_ERRORS_H */
