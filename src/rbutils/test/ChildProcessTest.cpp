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

#include "../ChildProcess.h"
#include "../TestBase.h"

#include <errno.h>

#include <future>

namespace rbutilstest
{

using namespace rbutils;

class ChildProcessTest
    : public TestBase
{};

TEST_F(ChildProcessTest, output_and_status)
{
    ChildProcess proc({ "/bin/sh", "-c", "printf 'a\\nb'; exit 5" });
    EXPECT_EQ("/bin/sh", proc.name());
    EXPECT_LT(0, proc.pid());

    EXPECT_EQ(5, proc.wait());
    EXPECT_EQ("a\nb", proc.output());
    EXPECT_TRUE(proc.errors().empty());
}

TEST_F(ChildProcessTest, standard_error)
{
    ChildProcess proc({ "/bin/sh", "-c", "echo out; echo oops >&2; exit 23" });

    EXPECT_EQ(23, proc.wait());
    EXPECT_EQ("out\n", proc.output());
    EXPECT_EQ("oops\n", proc.errors());
}

// more than a pipe's worth on both streams
TEST_F(ChildProcessTest, lots_of_output_on_both_streams)
{
    ChildProcess proc({ "/bin/sh",
                        "-c",
                        "i=0; while [ $i -lt 20000 ]; do echo 0123456789; echo 9876543210 >&2; i=$((i+1)); done" });

    EXPECT_EQ(0, proc.wait());
    EXPECT_EQ(20000U * 11, proc.output().size());
    EXPECT_EQ(20000U * 11, proc.errors().size());
}

TEST_F(ChildProcessTest, kill)
{
    ChildProcess proc({ "/bin/sh", "-c", "exec sleep 60" });

    auto f(std::async(std::launch::async,
                      [&]
                      {
                          return proc.wait();
                      }));

    proc.kill(SIGKILL);
    EXPECT_EQ(128 + SIGKILL, f.get());

    // reaped already: no-op
    proc.kill(SIGKILL);
}

TEST_F(ChildProcessTest, no_such_program)
{
    const std::vector<std::string> args{ "/no/such/program" };
    EXPECT_THROW(ChildProcess proc(args),
                 ProcessException);
}

TEST_F(ChildProcessTest, destruction_kills_running_child)
{
    pid_t pid = 0;

    {
        ChildProcess proc({ "/bin/sh", "-c", "exec sleep 60" });
        pid = proc.pid();
        ASSERT_EQ(0, ::kill(pid, 0));
    }

    // reaped by the destructor, so the pid is gone
    EXPECT_EQ(-1, ::kill(pid, 0));
    EXPECT_EQ(ESRCH, errno);
}

}

// Local Variables: **
// mode: c++ **
// End: **
