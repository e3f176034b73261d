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

#include "Assert.h"
#include "ChildProcess.h"

#include <sys/wait.h>

#include <cstring>

#include <boost/chrono.hpp>
#include <boost/thread/thread.hpp>

namespace rbutils
{

namespace
{

std::string
program_name(const std::vector<std::string>& argv)
{
    if (argv.empty())
    {
        throw ProcessException("Cannot launch a process without a program name");
    }
    return argv.front();
}

}

ChildProcess::ChildProcess(const std::vector<std::string>& argv)
    : name_(program_name(argv))
    , stream_(name_,
              argv,
              redi::pstreams::pstdout bitor redi::pstreams::pstderr)
    , pid_(0)
    , reaped_(false)
{
    if (not stream_.is_open())
    {
        const int err = stream_.rdbuf()->error();
        LOG_ERROR("Failed to launch " << name_ << ": " << strerror(err));
        throw ProcessException("Failed to launch process",
                               name_.c_str(),
                               err);
    }

    pid_ = stream_.rdbuf()->pid();
    LOG_INFO("Launched " << name_ << ", pid " << pid_);
}

ChildProcess::~ChildProcess()
{
    boost::lock_guard<decltype(lock_)> g(lock_);
    if (not reaped_)
    {
        LOG_WARN(name_ << " (pid " << pid_ << ") still running, killing it");
        stream_.rdbuf()->kill(SIGKILL);
        stream_.close();
    }
}

void
ChildProcess::drain_()
{
    char buf[4096];
    bool out_done = false;
    bool err_done = false;

    // Neither pipe may be left full while the other one is read.
    while (not (out_done and err_done))
    {
        bool idle = true;

        if (not out_done)
        {
            std::streamsize n;
            while ((n = stream_.out().readsome(buf, sizeof(buf))) > 0)
            {
                output_.append(buf, n);
                idle = false;
            }

            if (stream_.eof())
            {
                out_done = true;
                stream_.clear();
            }
        }

        if (not err_done)
        {
            std::streamsize n;
            while ((n = stream_.err().readsome(buf, sizeof(buf))) > 0)
            {
                errors_.append(buf, n);
                idle = false;
            }

            if (stream_.eof())
            {
                err_done = true;
                stream_.clear();
            }
        }

        if (idle and not (out_done and err_done))
        {
            boost::this_thread::sleep_for(boost::chrono::milliseconds(10));
        }
    }
}

int
ChildProcess::wait()
{
    drain_();

    boost::lock_guard<decltype(lock_)> g(lock_);
    VERIFY(not reaped_);

    stream_.close();
    reaped_ = true;

    const int status = stream_.rdbuf()->status();
    int rc;

    if (WIFEXITED(status))
    {
        rc = WEXITSTATUS(status);
    }
    else if (WIFSIGNALED(status))
    {
        rc = 128 + WTERMSIG(status);
    }
    else
    {
        rc = -1;
    }

    LOG_INFO(name_ << " (pid " << pid_ << ") finished with status " << rc);
    return rc;
}

void
ChildProcess::kill(int signal)
{
    boost::lock_guard<decltype(lock_)> g(lock_);
    if (not reaped_)
    {
        LOG_WARN("Sending signal " << signal << " to " << name_ << " (pid " << pid_ << ")");
        if (stream_.rdbuf()->kill(signal) == nullptr)
        {
            LOG_ERROR("Failed to send signal " << signal << " to " << name_ <<
                      " (pid " << pid_ << ")");
        }
    }
}

}

// Local Variables: **
// mode: c++ **
// End: **
