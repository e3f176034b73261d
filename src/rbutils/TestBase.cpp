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

#include "FileUtils.h"
#include "TestBase.h"

namespace rbutilstest
{

using namespace rbutils;

fs::path
TestBase::getTempPath(const std::string& ipath)
{
    const fs::path tmp_path(FileUtils::temp_path() / "rbutilstest");
    fs::create_directories(tmp_path);
    return tmp_path / ipath;
}

TestWithDir::TestWithDir(const std::string& dir_name)
    : directory_(getTempPath(dir_name))
{}

void
TestWithDir::SetUp()
{
    TestBase::SetUp();
    fs::remove_all(directory_);
    fs::create_directories(directory_);
}

void
TestWithDir::TearDown()
{
    TestBase::TearDown();
}

}

// Local Variables: **
// mode: c++ **
// End: **
