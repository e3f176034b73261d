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

#ifndef RBUTILS_MAIN_HELPER_H_
#define RBUTILS_MAIN_HELPER_H_

#include "BooleanEnum.h"
#include "Exception.h"
#include "Logger.h"
#include "Logging.h"

#include <iosfwd>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

namespace rbutils
{

BOOLEAN_ENUM(AllowUnregisteredOptions);

MAKE_EXCEPTION(UnrecognizedOptionsException, Exception);

// Skeleton of an executable: the logging and help options are parsed first,
// the derived class picks its own options from what remains and implements
// run(), whose return value becomes the exit status. Options nobody claimed
// are an error.
class MainHelper
{
public:
    virtual ~MainHelper() = default;

    MainHelper(const MainHelper&) = delete;

    MainHelper&
    operator=(const MainHelper&) = delete;

    int
    operator()();

    static const char*
    version();

protected:
    MainHelper(int argc,
               char** argv);

    virtual void
    parse_command_line_arguments() = 0;

    virtual void
    log_extra_help(std::ostream& os) = 0;

    virtual int
    run() = 0;

    // Name the log records carry.
    virtual std::string
    program_name() const;

    const std::vector<std::string>&
    unparsed_options() const
    {
        return unparsed_;
    }

    void
    unparsed_options(std::vector<std::string> opts)
    {
        unparsed_ = std::move(opts);
    }

    // Parses unparsed_options() against opts into vm; whatever opts does not
    // know stays unparsed.
    boost::program_options::parsed_options
    parse_unparsed_options(const boost::program_options::options_description& opts,
                           AllowUnregisteredOptions allow_unregistered,
                           boost::program_options::variables_map& vm);

    NamedLogger&
    getLogger__()
    {
        return logger_;
    }

    const std::string executable_name_;
    boost::program_options::variables_map vm_;

private:
    const std::vector<std::string> args_;
    std::vector<std::string> unparsed_;

    boost::program_options::options_description standard_options_;
    std::vector<std::string> logsinks_;
    Severity loglevel_;
    std::vector<std::string> logfilters_;

    NamedLogger logger_;

    // false if the program is done already (--help, --version)
    bool
    parse_standard_options_();

    void
    setup_logging_();

    void
    check_no_unrecognized_();
};

}

#endif // !RBUTILS_MAIN_HELPER_H_

// Local Variables: **
// mode: c++ **
// End: **
