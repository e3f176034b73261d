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

#include "Exception.h"

#include <cstring>
#include <sstream>

namespace rbutils
{

Exception::Exception(const char* msg,
                     const char* name,
                     int error_code)
    : error_code_(error_code)
    , msg_(msg)
{
    std::stringstream ss;
    if (name != 0)
    {
        ss << " " << name;
    }

    if (error_code != 0)
    {
        ss << ": " << strerror(error_code) << " (" << error_code << ")";
    }

    msg_ += ss.str();
}

Exception::Exception(std::string&& str)
    : error_code_(0)
    , msg_(std::move(str))
{}

Exception::Exception(const std::string& str)
    : error_code_(0)
    , msg_(str)
{}

Exception::~Exception() noexcept
{}

const char*
Exception::what() const noexcept
{
    return msg_.c_str();
}

int
Exception::getErrorCode() const
{
    return error_code_;
}

}

// Local Variables: **
// mode: c++ **
// End: **
