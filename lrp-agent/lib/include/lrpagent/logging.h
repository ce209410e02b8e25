/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Definition of logging macros and utility functions.
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#pragma once
#ifndef LRPAGENT_LOGGING_H
#define LRPAGENT_LOGGING_H

#include <string>
#include <iostream>
#include <sstream>

namespace lrpagent {

/**
 * Supported log levels
 */
enum LogLevel { FATAL, ERROR, WARNING, INFO, DEBUG };

extern LogLevel logLevel;

/**
 * Abstract base class for log destination such as console, file etc.
 */
class LogSink {
public:
    virtual ~LogSink() {}

    /**
     * Write a log message to the log destination alongwith information about
     * its origin (source file, line number etc).
     *
     * @param level The log level of the message
     * @param filename Name of source file that generated the message
     * @param lineno Line number in source file that generated the message
     * @param functionName Name of function that generated the message
     * @param message The log message to write
     */
    virtual
    void write(LogLevel level, const char *filename, int lineno,
               const char *functionName, const std::string& message) = 0;
};

/**
 * Initialize logging to the console
 *
 * @param level the log level to log at
 */
void initLogging(const std::string& level);

/**
 * Change the logging level of the agent.
 *
 * @param level the log level to log at. If this is not a valid string,
 * logging level is set to the default level.
 */
void setLoggingLevel(const std::string& level);

/**
 * Get the console log destination used by LOG.  Never NULL.
 */
LogSink * getLogSink();

/**
 * Logger used to construct and write a log message to a log
 * destination.
 */
class Logger {
public:
    /**
     * Constructor that expects the destination and information about
     * the origin of log message.
     * @param s The sink the message is written to
     * @param l The log level of the message
     * @param f Name of source file of the message
     * @param no Line number in source file of the message
     * @param fn Name of function enclosing the message
     */
    Logger(LogSink& s, LogLevel l, const char *f, int no, const char *fn) :
        sink(s), level(l), filename(f), lineNumber(no), functionName(fn) {}

    /**
     * Destroy the logger and log the output
     */
    ~Logger() {
        sink.write(level, filename, lineNumber, functionName, buffer_.str());
    }

    /**
     * Get the ostream to write to
     */
    std::ostream& stream() { return buffer_; }

private:
    /**
     * The internal buffer for the logger
     */
    std::ostringstream buffer_;
    /**
     * The destination of the message
     */
    LogSink& sink;
    /**
     * The log level of the message
     */
    LogLevel level;
    /**
     * Name of source file of the message
     */
    const char *filename;
    /**
     * Line number in source file of the message
     */
    int lineNumber;
    /**
     * Name of function enclosing the message
     */
    const char *functionName;
};

#define LOG(lvl)                                                        \
    if (lvl <= lrpagent::logLevel)                                      \
        lrpagent::Logger(*lrpagent::getLogSink(), lvl,                  \
                         __FILE__, __LINE__, __FUNCTION__).stream()

#define SINK_LOG(sink, lvl)                                             \
    if (lvl <= lrpagent::logLevel)                                      \
        lrpagent::Logger(sink, lvl,                                     \
                         __FILE__, __LINE__, __FUNCTION__).stream()

} /* namespace lrpagent */

#endif /* LRPAGENT_LOGGING_H */
