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

#include "../SignalThread.h"
#include "../TestBase.h"

#include <signal.h>
#include <unistd.h>

#include <chrono>
#include <future>

namespace rbutilstest
{

using namespace rbutils;

class SignalThreadTest
    : public TestBase
{};

TEST_F(SignalThreadTest, signal_set)
{
    SignalSet set{ SIGUSR2, SIGHUP };

    EXPECT_TRUE(set.contains(SIGUSR2));
    EXPECT_TRUE(set.contains(SIGHUP));
    EXPECT_FALSE(set.contains(SIGTERM));

    set.insert(SIGTERM);
    EXPECT_TRUE(set.contains(SIGTERM));

    set.erase(SIGHUP);
    EXPECT_FALSE(set.contains(SIGHUP));
}

TEST_F(SignalThreadTest, blocker)
{
    auto blocked([]() -> bool
                 {
                     sigset_t cur;
                     EXPECT_EQ(0, pthread_sigmask(SIG_BLOCK, nullptr, &cur));
                     return sigismember(&cur, SIGUSR2) == 1;
                 });

    ASSERT_FALSE(blocked());

    {
        SignalBlocker b(SignalSet{ SIGUSR2 });
        EXPECT_TRUE(blocked());
    }

    EXPECT_FALSE(blocked());
}

TEST_F(SignalThreadTest, handler_is_invoked)
{
    std::promise<int> promise;
    std::future<int> future(promise.get_future());
    bool fulfilled = false;

    {
        SignalThread t(SignalSet{ SIGUSR2 },
                       [&](int sig)
                       {
                           if (not fulfilled)
                           {
                               fulfilled = true;
                               promise.set_value(sig);
                           }
                       });

        ASSERT_EQ(0, ::kill(::getpid(), SIGUSR2));

        ASSERT_EQ(std::future_status::ready,
                  future.wait_for(std::chrono::seconds(10)));
    }

    EXPECT_EQ(SIGUSR2, future.get());
}

}

// Local Variables: **
// mode: c++ **
// End: **
