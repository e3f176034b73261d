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

#ifndef RBUTILS_TEST_BASE_H_
#define RBUTILS_TEST_BASE_H_

#include <string>

#include <boost/filesystem.hpp>

#include <gtest/gtest.h>

namespace rbutilstest
{

class TestBase
    : public testing::Test
{
public:
    static boost::filesystem::path
    getTempPath(const std::string& ipath);
};

// Gives each test a fresh, empty directory. It is wiped on SetUp rather than
// on TearDown so the results of a failed test can be inspected.
class TestWithDir
    : public TestBase
{
public:
    explicit TestWithDir(const std::string& dir_name);

    const boost::filesystem::path&
    getDir() const
    {
        return directory_;
    }

protected:
    virtual void
    SetUp() override;

    virtual void
    TearDown() override;

    const boost::filesystem::path directory_;
};

}

#endif // !RBUTILS_TEST_BASE_H_

// Local Variables: **
// mode: c++ **
// End: **
