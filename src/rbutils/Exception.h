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

#ifndef RBUTILS_EXCEPTION_H_
#define RBUTILS_EXCEPTION_H_

#include <exception>
#include <string>

namespace rbutils
{

// Root of all exceptions thrown by rbutils and routebackup. The optional name
// is appended to the message, a non-zero error code adds its strerror text.
class Exception
    : public std::exception
{
public:
    Exception(const char* msg,
              const char* name = 0,
              int error_code = 0);

    Exception(std::string&& str);

    Exception(const std::string&);

    virtual ~Exception() noexcept;

    virtual const char*
    what() const noexcept;

    int
    getErrorCode() const;

private:
    int error_code_;
    std::string msg_;
};

}

#define MAKE_EXCEPTION(myex, parentex)                                  \
    class myex: public parentex                                         \
    {                                                                   \
        public:                                                         \
        myex(const char *msg,                                           \
             const char *name = 0,                                      \
             int error_code = 0)                                        \
            : parentex(msg, name, error_code)                           \
        {}                                                              \
                                                                        \
        myex(std::string&& str)                                         \
            : parentex(std::move(str))                                  \
        {}                                                              \
                                                                        \
        myex(const std::string& str)                                    \
            : parentex(str)                                             \
        {}                                                              \
    };

namespace rbutils
{

MAKE_EXCEPTION(ProcessException, Exception);

}

#endif // !RBUTILS_EXCEPTION_H_

// Local Variables: **
// mode: c++ **
// End: **
