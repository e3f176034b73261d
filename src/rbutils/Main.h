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

#ifndef RBUTILS_MAIN_H_
#define RBUTILS_MAIN_H_

#include "MainHelper.h"

#include <type_traits>

// main() for a MainHelper derived class T constructible from (argc, argv).
#define MAIN(T)                                                         \
    int                                                                 \
    main(int argc,                                                      \
         char** argv)                                                   \
    {                                                                   \
        static_assert(std::is_base_of<::rbutils::MainHelper, T>::value, \
                      #T " must derive from rbutils::MainHelper");     \
        T helper(argc,                                                  \
                 argv);                                                 \
        return helper();                                                \
    }

#endif // !RBUTILS_MAIN_H_

// Local Variables: **
// mode: c++ **
// End: **
