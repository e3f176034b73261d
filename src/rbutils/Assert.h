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

#ifndef RBUTILS_ASSERT_H_
#define RBUTILS_ASSERT_H_

#include "Exception.h"
#include "Logging.h"

#include <assert.h>

// Internal invariant: logged and thrown, also in release builds.
#define VERIFY(x)                                                       \
    do                                                                  \
    {                                                                   \
        if(not (x))                                                     \
        {                                                               \
            LOG_FATAL(__PRETTY_FUNCTION__ << ": " #x);                  \
            assert(x);                                                  \
            throw ::rbutils::Exception("ASSERT: " #x, __PRETTY_FUNCTION__); \
        }                                                               \
    } while(false)

#define UNREACHABLE __builtin_unreachable();

#endif // !RBUTILS_ASSERT_H_

// Local Variables: **
// mode: c++ **
// End: **
