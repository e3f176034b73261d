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

#include "TestMainHelper.h"

#include <signal.h>
#include <string.h>

#include <iostream>
#include <memory>

#include <gtest/gtest.h>

namespace rbutils
{

namespace
{

// googletest wants a mutable argc / argv pair
struct ArgcArgv
{
    ArgcArgv(const std::string& executable_name,
             const std::vector<std::string>& args)
        : argc_(static_cast<int>(args.size() + 1))
    {
        storage_.push_back(executable_name);
        storage_.insert(storage_.end(),
                        args.begin(),
                        args.end());

        for (auto& s : storage_)
        {
            argv_.push_back(&s[0]);
        }
        argv_.push_back(nullptr);
    }

    std::vector<std::string>
    remaining() const
    {
        std::vector<std::string> res;
        for (int i = 1; i < argc_; ++i)
        {
            res.emplace_back(argv_[i]);
        }
        return res;
    }

    int argc_;
    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

}

void
TestMainHelper::sighand(int)
{}

TestMainHelper::TestMainHelper(int argc,
                               char** argv)
    : MainHelper(argc,
                 argv)
{
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = SIG_IGN;
    sigaction(SIGPIPE, &sa, 0);
    sa.sa_handler = &sighand;
    sigaction(SIGUSR1, &sa, 0);
}

void
TestMainHelper::log_google_test_help(std::ostream& ostr)
{
    ArgcArgv args(executable_name_,
                  { "--help" });

    std::streambuf* old_rdbuf = std::cout.rdbuf(ostr.rdbuf());
    testing::InitGoogleTest(&args.argc_,
                            args.argv_.data());
    std::cout.rdbuf(old_rdbuf);
}

void
TestMainHelper::init_google_test()
{
    ArgcArgv args(executable_name_,
                  unparsed_options());

    testing::InitGoogleTest(&args.argc_,
                            args.argv_.data());
    unparsed_options(args.remaining());
}

int
TestMainHelper::run()
{
    return RUN_ALL_TESTS();
}

}

// Local Variables: **
// mode: c++ **
// End: **
