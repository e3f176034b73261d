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

#ifndef RBUTILS_BOOLEAN_ENUM_H_
#define RBUTILS_BOOLEAN_ENUM_H_

#include <iostream>

// Named booleans for function arguments: foo(ClusteredMode::T) instead of
// foo(true).
#define BOOLEAN_ENUM(name)                                              \
    enum class name : bool                                              \
    {                                                                   \
        F = false,                                                      \
        T = true                                                        \
    };                                                                  \
                                                                        \
    inline std::ostream&                                                \
    operator<<(std::ostream& os,                                        \
               const name& in)                                          \
    {                                                                   \
        return os << (in == name::T ? (#name "::T") : (#name "::F"));   \
    }                                                                   \
                                                                        \
    inline bool                                                         \
    T(const name& in)                                                   \
    {                                                                   \
        return in == name::T;                                           \
    }                                                                   \
                                                                        \
    inline bool                                                         \
    F(const name& in)                                                   \
    {                                                                   \
        return in == name::F;                                           \
    }                                                                   \
                                                                        \
    inline name                                                         \
    name##_from_bool(bool b)                                            \
    {                                                                   \
        return b ? name::T : name::F;                                   \
    }

#endif // !RBUTILS_BOOLEAN_ENUM_H_

// Local Variables: **
// mode: c++ **
// End: **
