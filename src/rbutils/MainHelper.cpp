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

#include "MainHelper.h"

#include <chrono>
#include <iostream>
#include <sstream>

#include <boost/filesystem/path.hpp>

#ifndef RBUTILS_BUILD_VERSION
#define RBUTILS_BUILD_VERSION "unknown"
#endif

namespace rbutils
{

namespace po = boost::program_options;

namespace
{

std::vector<std::string>
arguments(int argc,
          char** argv)
{
    if (argc < 2)
    {
        return std::vector<std::string>();
    }

    return std::vector<std::string>(argv + 1,
                                    argv + argc);
}

}

MainHelper::MainHelper(int argc,
                       char** argv)
    : executable_name_(argc > 0 ? argv[0] : "")
    , args_(arguments(argc, argv))
    , unparsed_(args_)
    , standard_options_("General Options")
    , loglevel_(Severity::info)
    , logger_(boost::filesystem::path(executable_name_).filename().string())
{
    standard_options_.add_options()
        ("help,h", "produce help message on stdout and exit")
        ("version,v", "print version and exit")
        ("logsink",
         po::value<std::vector<std::string>>(&logsinks_)->composing(),
         "where to write the log: 'console:' (standard error) or a file path; can be repeated")
        ("loglevel",
         po::value<Severity>(&loglevel_)->default_value(Severity::info),
         "one of trace, debug, periodic, info, warning, error, fatal, notice")
        ("logfilter",
         po::value<std::vector<std::string>>(&logfilters_)->composing(),
         "'<logger name> <level>' overrides the log level for one logger; can be repeated")
        ("disable-logging",
         "don't log at all");
}

std::string
MainHelper::program_name() const
{
    return logger_.name();
}

const char*
MainHelper::version()
{
    return RBUTILS_BUILD_VERSION;
}

int
MainHelper::operator()()
{
    const auto start(std::chrono::steady_clock::now());
    int rc = 1;

    try
    {
        if (not parse_standard_options_())
        {
            return 0;
        }

        setup_logging_();
        parse_command_line_arguments();
        check_no_unrecognized_();

        LOG_NOTIFY(program_name() << " " << version() << " started");
        for (const auto& a : args_)
        {
            LOG_INFO("argument: " << a);
        }

        rc = run();
    }
    catch (std::exception& e)
    {
        LOG_FATAL("caught exception: " << e.what());
        std::cerr << program_name() << ": " << e.what() << std::endl;
    }

    const auto elapsed(std::chrono::steady_clock::now() - start);
    LOG_NOTIFY(program_name() << " exits with " << rc << " after " <<
               std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() << "ms");

    return rc;
}

po::parsed_options
MainHelper::parse_unparsed_options(const po::options_description& opts,
                                   AllowUnregisteredOptions allow_unregistered,
                                   po::variables_map& vm)
{
    po::command_line_parser parser(unparsed_);
    parser.options(opts);
    parser.style(po::command_line_style::default_style bitand
                 ~po::command_line_style::allow_guessing);

    if (T(allow_unregistered))
    {
        parser.allow_unregistered();
    }

    po::parsed_options parsed(parser.run());
    po::store(parsed,
              vm);
    po::notify(vm);

    unparsed_ = po::collect_unrecognized(parsed.options,
                                         po::include_positional);
    return parsed;
}

bool
MainHelper::parse_standard_options_()
{
    parse_unparsed_options(standard_options_,
                           AllowUnregisteredOptions::T,
                           vm_);

    if (vm_.count("version"))
    {
        std::cout << version() << std::endl;
        return false;
    }

    if (vm_.count("help"))
    {
        std::cout << standard_options_ << std::endl;
        log_extra_help(std::cout);
        return false;
    }

    return true;
}

void
MainHelper::setup_logging_()
{
    if (vm_.count("disable-logging"))
    {
        Logger::disableLogging();
        return;
    }

    if (logsinks_.empty())
    {
        logsinks_.push_back(Logger::console_sink_name());
    }

    Logger::setupLogging(program_name(),
                         logsinks_,
                         loglevel_);

    for (const auto& f : logfilters_)
    {
        std::istringstream is(f);
        std::string name;
        Severity sev;

        if (is >> name >> sev)
        {
            LOG_INFO("log filter: " << name << " at " << sev);
            Logger::add_filter(name,
                               sev);
        }
        else
        {
            throw po::invalid_option_value(f);
        }
    }
}

void
MainHelper::check_no_unrecognized_()
{
    if (not unparsed_.empty())
    {
        std::stringstream ss;
        ss << "Unrecognized options:";
        for (const auto& o : unparsed_)
        {
            ss << " " << o;
        }

        LOG_FATAL(ss.str());
        throw UnrecognizedOptionsException(ss.str());
    }
}

}

// Local Variables: **
// mode: c++ **
// End: **
