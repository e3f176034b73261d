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

#ifndef RBUTILS_CHILD_PROCESS_H_
#define RBUTILS_CHILD_PROCESS_H_

#include "Exception.h"
#include "Logging.h"

#include <signal.h>
#include <sys/types.h>

#include <string>
#include <vector>

#include <boost/thread/mutex.hpp>

#include <pstreams/pstream.h>

namespace rbutils
{

// A child process started on construction with its standard output and
// standard error piped back to us.
class ChildProcess
{
public:
    explicit ChildProcess(const std::vector<std::string>& argv);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;

    ChildProcess&
    operator=(const ChildProcess&) = delete;

    // Drains standard output and standard error and reaps the child. Returns the exit status,
    // or 128 + signal number if the child was killed.
    int
    wait();

    // Only valid after wait().
    const std::string&
    output() const
    {
        return output_;
    }

    // Standard error; only valid after wait().
    const std::string&
    errors() const
    {
        return errors_;
    }

    // No-op once the child was reaped.
    void
    kill(int signal = SIGKILL);

    pid_t
    pid() const
    {
        return pid_;
    }

    const std::string&
    name() const
    {
        return name_;
    }

private:
    DECLARE_LOGGER("ChildProcess");

    const std::string name_;
    redi::ipstream stream_;
    pid_t pid_;
    boost::mutex lock_;
    bool reaped_;
    std::string output_;
    std::string errors_;

    void
    drain_();
};

}

#endif // !RBUTILS_CHILD_PROCESS_H_

// Local Variables: **
// mode: c++ **
// End: **
