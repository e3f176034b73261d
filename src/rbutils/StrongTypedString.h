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

#ifndef RBUTILS_STRONG_TYPED_STRING_H_
#define RBUTILS_STRONG_TYPED_STRING_H_

#include <functional>
#include <ostream>
#include <string>

// A std::string that does not silently convert from or to other strong
// string types. Ordering and hashing follow std::string.
#define STRONG_TYPED_STRING(ns, name)                                   \
    namespace ns                                                        \
    {                                                                   \
    class name : public std::string                                     \
    {                                                                   \
    public:                                                             \
        name()                                                          \
        {}                                                              \
                                                                        \
        explicit name(const char* str)                                  \
            : std::string(str)                                          \
        {}                                                              \
                                                                        \
        explicit name(const std::string& str)                           \
            : std::string(str)                                          \
        {}                                                              \
                                                                        \
        explicit name(std::string&& str)                                \
            : std::string(std::move(str))                               \
        {}                                                              \
                                                                        \
        const std::string&                                              \
        str() const                                                     \
        {                                                               \
            return *this;                                               \
        }                                                               \
                                                                        \
        bool                                                            \
        operator==(const name& other) const                             \
        {                                                               \
            return str() == other.str();                                \
        }                                                               \
                                                                        \
        bool                                                            \
        operator!=(const name& other) const                             \
        {                                                               \
            return str() != other.str();                                \
        }                                                               \
                                                                        \
        bool                                                            \
        operator<(const name& other) const                              \
        {                                                               \
            return str() < other.str();                                 \
        }                                                               \
                                                                        \
        friend std::ostream&                                            \
        operator<<(std::ostream& os,                                    \
                   const name& in)                                      \
        {                                                               \
            return (os << in.str());                                    \
        }                                                               \
    };                                                                  \
    }                                                                   \
                                                                        \
    namespace std                                                       \
    {                                                                   \
    template<>                                                          \
    struct hash<ns::name>                                               \
    {                                                                   \
        size_t                                                          \
        operator()(const ns::name& n) const                             \
        {                                                               \
            return std::hash<string>()(static_cast<const string&>(n));  \
        }                                                               \
    };                                                                  \
    }

#endif // !RBUTILS_STRONG_TYPED_STRING_H_

// Local Variables: **
// mode: c++ **
// End: **
