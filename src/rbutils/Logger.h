// Copyright (C) 2016 iNuron NV
//
// This file is part of Open vStorage Open Source Edition (OSE),
// as available from
//
//      http://www.openvstorage.org and
//      http://www.openvstorage.com.
//
// This file is free software; you can redistribute it and/or modify it
// under the terms of the GNU Affero General Public License v3 (GNU AGPLv3)
// as published by the Free Software Foundation, in version 3 as it comes in
// the LICENSE.txt file of the Open vStorage OSE distribution.
// Open vStorage is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY of any kind.

#ifndef RBUTILS_LOGGER_H_
#define RBUTILS_LOGGER_H_

#include "Exception.h"

#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

#include <boost/log/sources/severity_logger.hpp>

namespace rbutils
{

enum class Severity
{
    trace,
    debug,
    periodic,
    info,
    warning,
    error,
    fatal,
    notification
};

std::ostream&
operator<<(std::ostream& os,
           Severity severity);

std::istream&
operator>>(std::istream& is,
           Severity& severity);

MAKE_EXCEPTION(LoggerException, Exception);
MAKE_EXCEPTION(LoggerNotConfiguredException, LoggerException);

// One per class (see DECLARE_LOGGER); records carry the name as attribute.
class NamedLogger
{
public:
    using source_type = boost::log::sources::severity_logger_mt<Severity>;

    explicit NamedLogger(const std::string& name);

    NamedLogger(const NamedLogger&) = delete;

    NamedLogger&
    operator=(const NamedLogger&) = delete;

    const std::string&
    name() const
    {
        return name_;
    }

    source_type&
    get()
    {
        return source_;
    }

private:
    const std::string name_;
    source_type source_;
};

// Process wide logging setup. A record is emitted if its severity reaches
// the filter registered for its logger's name, or the general severity if
// there is none.
class Logger
{
public:
    using filter_t = std::pair<std::string, Severity>;
    using logger_type = NamedLogger;

    Logger() = delete;

    static const std::string&
    console_sink_name()
    {
        static const std::string n("console:");
        return n;
    }

    // sinks: console_sink_name() or file paths. Sinks are only installed by
    // the first call.
    static void
    setupLogging(const std::string& progname,
                 const std::vector<std::string>& sinks,
                 Severity severity);

    static void
    disableLogging();

    static bool
    loggingEnabled();

    static void
    generalLogging(Severity severity);

    static Severity
    generalLogging();

    static void
    add_filter(const std::string& logger_name,
               Severity severity);

    static void
    remove_filter(const std::string& logger_name);

    static void
    remove_all_filters();

    static void
    all_filters(std::vector<filter_t>& out);

    static bool
    filter(const std::string& logger_name,
           Severity severity);
};

}

#endif // !RBUTILS_LOGGER_H_

// Local Variables: **
// mode: c++ **
// End: **
