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

#include "ChildProcess.h"
#include "System.h"

#include <boost/program_options/parsers.hpp>

namespace rbutils
{

std::vector<std::string>
System::split_command_line(const std::string& cmdline)
{
    return boost::program_options::split_unix(cmdline);
}

std::pair<std::string, int>
System::exec(const std::vector<std::string>& argv)
{
    ChildProcess proc(argv);
    const int rc = proc.wait();

    if (not proc.errors().empty())
    {
        LOG_WARN(proc.name() << " (pid " << proc.pid() << ") reported: " << proc.errors());
    }

    return std::make_pair(proc.output(), rc);
}

}

// Local Variables: **
// mode: c++ **
// End: **
