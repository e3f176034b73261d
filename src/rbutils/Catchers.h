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

#ifndef RBUTILS_CATCHERS_H_
#define RBUTILS_CATCHERS_H_

#include <exception>

// EWHAT is bound to the exception's what() inside body.
#define CATCH_STD_EWHAT(body)                   \
    catch (std::exception& e)                   \
    {                                           \
        const char* EWHAT = e.what();           \
        body                                    \
    }

#define CATCH_STD_LOGLEVEL_IGNORE(msg, loglevel)                \
    CATCH_STD_EWHAT(                                            \
        LOG_##loglevel(msg << ": " << EWHAT << " - ignored"); )

#define CATCH_STD_LOG_IGNORE(msg)               \
    CATCH_STD_LOGLEVEL_IGNORE(msg, ERROR)

#define CATCH_STD_LOG_RETHROW(msg)              \
    CATCH_STD_EWHAT(                            \
        LOG_ERROR(msg << ": " << EWHAT);        \
        throw; )

#endif // !RBUTILS_CATCHERS_H_

// Local Variables: **
// mode: c++ **
// End: **
