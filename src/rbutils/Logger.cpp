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

#include "Logger.h"

#include <unistd.h>

#include <algorithm>
#include <iterator>
#include <iostream>
#include <map>

#include <boost/core/null_deleter.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/expressions/formatters/date_time.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/exception_handler.hpp>
#include <boost/make_shared.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/shared_mutex.hpp>

namespace rbutils
{

namespace bl = boost::log;
namespace expr = boost::log::expressions;

namespace
{

const char* const logger_attr = "Logger";
const char* const program_attr = "Program";
const char* const pid_attr = "Pid";
const char* const thread_attr = "ThreadID";
const char* const timestamp_attr = "TimeStamp";
const char* const severity_attr = "Severity";

const std::pair<Severity, const char*> severity_names[] = {
    { Severity::trace, "trace" },
    { Severity::debug, "debug" },
    { Severity::periodic, "periodic" },
    { Severity::info, "info" },
    { Severity::warning, "warning" },
    { Severity::error, "error" },
    { Severity::fatal, "fatal" },
    { Severity::notification, "notice" },
};

// The filter check runs for every LOG_* statement, the rest only at setup.
struct LogState
{
    boost::shared_mutex lock;
    Severity general = Severity::info;
    std::map<std::string, Severity> filters;
    bool configured = false;
};

LogState&
log_state()
{
    static LogState state;
    return state;
}

// <timestamp> <program>[<pid>/<thread>] <severity> <logger>: <message>
template<typename Sink>
void
set_format(Sink& sink)
{
    sink.set_formatter(expr::stream <<
                       expr::format_date_time<boost::posix_time::ptime>(timestamp_attr,
                                                                        "%Y-%m-%d %H:%M:%S.%f") <<
                       " " <<
                       expr::attr<std::string>(program_attr) <<
                       "[" <<
                       expr::attr<pid_t>(pid_attr) <<
                       "/" <<
                       expr::attr<bl::attributes::current_thread_id::value_type>(thread_attr) <<
                       "] " <<
                       expr::attr<Severity>(severity_attr) <<
                       " " <<
                       expr::attr<std::string>(logger_attr) <<
                       ": " <<
                       expr::smessage);
}

boost::shared_ptr<bl::sinks::sink>
make_sink(const std::string& sink_name)
{
    if (sink_name == Logger::console_sink_name())
    {
        using Backend = bl::sinks::text_ostream_backend;
        auto backend(boost::make_shared<Backend>());
        backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog,
                                                            boost::null_deleter()));
        backend->auto_flush(true);

        auto sink(boost::make_shared<bl::sinks::synchronous_sink<Backend>>(backend));
        set_format(*sink);
        return sink;
    }
    else
    {
        using Backend = bl::sinks::text_file_backend;
        auto backend(boost::make_shared<Backend>(bl::keywords::file_name = sink_name,
                                                 bl::keywords::open_mode =
                                                 std::ios::out bitor std::ios::app,
                                                 bl::keywords::auto_flush = true));

        auto sink(boost::make_shared<bl::sinks::synchronous_sink<Backend>>(backend));
        set_format(*sink);
        return sink;
    }
}

void
check_enabled()
{
    if (not Logger::loggingEnabled())
    {
        throw LoggerNotConfiguredException("Logging is disabled");
    }
}

}

NamedLogger::NamedLogger(const std::string& name)
    : name_(name)
{
    source_.add_attribute(logger_attr,
                          bl::attributes::constant<std::string>(name_));
}

void
Logger::setupLogging(const std::string& progname,
                     const std::vector<std::string>& sinks,
                     const Severity severity)
{
    LogState& state = log_state();
    boost::unique_lock<decltype(state.lock)> u(state.lock);

    state.general = severity;

    auto core(bl::core::get());

    if (not state.configured)
    {
        core->add_global_attribute(program_attr,
                                   bl::attributes::constant<std::string>(progname));
        core->add_global_attribute(pid_attr,
                                   bl::attributes::constant<pid_t>(::getpid()));
        core->add_global_attribute(thread_attr,
                                   bl::attributes::current_thread_id());
        core->add_global_attribute(timestamp_attr,
                                   bl::attributes::local_clock());

        for (const auto& s : sinks)
        {
            core->add_sink(make_sink(s));
        }

        core->set_exception_handler(bl::make_exception_suppressor());
        state.configured = true;
    }

    core->set_logging_enabled(true);
}

void
Logger::disableLogging()
{
    bl::core::get()->set_logging_enabled(false);
}

bool
Logger::loggingEnabled()
{
    return bl::core::get()->get_logging_enabled();
}

void
Logger::generalLogging(Severity severity)
{
    check_enabled();

    LogState& state = log_state();
    boost::unique_lock<decltype(state.lock)> u(state.lock);
    state.general = severity;
}

Severity
Logger::generalLogging()
{
    check_enabled();

    LogState& state = log_state();
    boost::shared_lock<decltype(state.lock)> s(state.lock);
    return state.general;
}

void
Logger::add_filter(const std::string& logger_name,
                   const Severity severity)
{
    check_enabled();

    LogState& state = log_state();
    boost::unique_lock<decltype(state.lock)> u(state.lock);
    state.filters[logger_name] = severity;
}

void
Logger::remove_filter(const std::string& logger_name)
{
    check_enabled();

    LogState& state = log_state();
    boost::unique_lock<decltype(state.lock)> u(state.lock);
    state.filters.erase(logger_name);
}

void
Logger::remove_all_filters()
{
    check_enabled();

    LogState& state = log_state();
    boost::unique_lock<decltype(state.lock)> u(state.lock);
    state.filters.clear();
}

void
Logger::all_filters(std::vector<filter_t>& out)
{
    check_enabled();

    LogState& state = log_state();
    boost::shared_lock<decltype(state.lock)> s(state.lock);
    out.insert(out.end(),
               state.filters.begin(),
               state.filters.end());
}

bool
Logger::filter(const std::string& logger_name,
               const Severity severity)
{
    if (not loggingEnabled())
    {
        return false;
    }

    LogState& state = log_state();
    boost::shared_lock<decltype(state.lock)> s(state.lock);

    const auto it = state.filters.find(logger_name);
    return severity >= (it == state.filters.end() ? state.general : it->second);
}

std::ostream&
operator<<(std::ostream& os,
           Severity severity)
{
    for (const auto& p : severity_names)
    {
        if (p.first == severity)
        {
            return os << p.second;
        }
    }

    return os << "(unknown severity)";
}

std::istream&
operator>>(std::istream& is,
           Severity& severity)
{
    std::string str;
    is >> str;

    const auto it = std::find_if(std::begin(severity_names),
                                 std::end(severity_names),
                                 [&](const std::pair<Severity, const char*>& p)
                                 {
                                     return str == p.second;
                                 });

    if (it == std::end(severity_names))
    {
        is.setstate(std::ios_base::failbit);
    }
    else
    {
        severity = it->first;
    }

    return is;
}

}

// Local Variables: **
// mode: c++ **
// End: **
