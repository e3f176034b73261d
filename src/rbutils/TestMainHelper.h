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

#ifndef RBUTILS_TEST_MAIN_HELPER_H_
#define RBUTILS_TEST_MAIN_HELPER_H_

#include "MainHelper.h"

#include <iosfwd>

namespace rbutils
{

// MainHelper for googletest executables: logging options are handled like in
// any other executable, everything else is handed to googletest.
class TestMainHelper
    : public MainHelper
{
public:
    TestMainHelper(int argc,
                   char** argv);

    virtual ~TestMainHelper() = default;

protected:
    void
    log_google_test_help(std::ostream& ostr);

    void
    init_google_test();

    virtual int
    run() override;

private:
    static void
    sighand(int);
};

}

#endif // !RBUTILS_TEST_MAIN_HELPER_H_

// Local Variables: **
// mode: c++ **
// End: **
