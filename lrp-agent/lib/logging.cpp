/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation of logging related utility functions.
 *
 * Copyright (c) 2020 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <lrpagent/logging.h>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/algorithm/string/case_conv.hpp>

#include <mutex>

namespace lrpagent {

LogLevel logLevel = DEBUG;

static const char* LEVEL_NAMES[] = {
    "fatal", "error", "warning", "info", "debug"
};

/**
 * Log sink that writes timestamped messages to an output stream
 */
class OStreamLogSink : public LogSink {
public:
    OStreamLogSink(std::ostream& out_) : out(out_) {
        static const boost::posix_time::time_facet facet;
        out.imbue(std::locale(out.getloc(), &facet));
    }

    virtual
    void write(LogLevel level, const char *filename, int lineno,
               const char *functionName, const std::string& message) {
        std::lock_guard<std::mutex> lock(logMtx);
        out << "[" << boost::posix_time::microsec_clock::local_time()
            << "] [" << LEVEL_NAMES[level] << "] [" << filename << ":"
            << lineno << ":" << functionName << "] " << message
            << std::endl;
    }

private:
    std::ostream& out;
    std::mutex logMtx;
};

static OStreamLogSink consoleLogSink(std::cout);

LogSink * getLogSink() {
    return &consoleLogSink;
}

void initLogging(const std::string& level) {
    setLoggingLevel(level);
}

void setLoggingLevel(const std::string& level) {
    const std::string name = boost::algorithm::to_lower_copy(level);
    for (int l = FATAL; l <= DEBUG; ++l) {
        if (name == LEVEL_NAMES[l]) {
            logLevel = static_cast<LogLevel>(l);
            return;
        }
    }
    logLevel = INFO;
}

} /* namespace lrpagent */
