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

#ifndef RBUTILS_SYSTEM_H_
#define RBUTILS_SYSTEM_H_

#include "Assert.h"
#include "Exception.h"
#include "Logging.h"

#include <cstdlib>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/lexical_cast.hpp>

namespace rbutils
{

MAKE_EXCEPTION(EnvironmentException, Exception);

struct System
{
    DECLARE_LOGGER("System");

    static bool
    get_bool_from_env(const std::string& name,
                      const bool default_value)
    {
        const char* val = getenv(name.c_str());

        if (val == nullptr)
        {
            return default_value;
        }

        const std::string read(val);
        if (read == "yes" or
            read == "YES" or
            read == "Y" or
            read == "T" or
            read == "TRUE" or
            read == "true" or
            read == "1")
        {
            return true;
        }
        else if (read == "no" or
                 read == "NO" or
                 read == "N" or
                 read == "F" or
                 read == "FALSE" or
                 read == "false" or
                 read == "0")
        {
            return false;
        }
        else
        {
            LOG_ERROR("Environment variable " << name <<
                      " has value " << read <<
                      " which is not recognized, try one of yes,YES,Y,T,TRUE,true,1,no,NO,N,F,FALSE,false or 0");
            throw EnvironmentException("Unrecognized environment variable value, cannot interpret it as boolean",
                                       name.c_str());
        }
    }

    // don't use with (u)char or (u)int8_t
    template<typename T>
    static T
    get_env_with_default(const std::string& name,
                         const T& default_value)
    {
        typedef typename std::remove_cv<T>::type T_;

        static_assert(not (std::is_same<T_, uint8_t>::value or
                           std::is_same<T_, int8_t>::value or
                           std::is_same<T_, char>::value or
                           std::is_same<T_, unsigned char>::value),
                      "this doesn't work with byte sized types");

        const char* val = getenv(name.c_str());

        if (val == nullptr)
        {
            return default_value;
        }
        else
        {
            try
            {
                return boost::lexical_cast<T>(val);
            }
            catch (boost::bad_lexical_cast&)
            {
                LOG_ERROR("Environment variable " << name << " has value " <<
                          val << " which cannot be converted");
                throw EnvironmentException("Failed to convert environment variable",
                                           name.c_str());
            }
        }
    }

    template<typename T>
    static void
    set_env(const std::string& name,
            const T& value,
            const bool replace)
    {
        VERIFY(not name.empty());
        const std::string out(boost::lexical_cast<std::string>(value));
        int res = setenv(name.c_str(),
                         out.c_str(),
                         replace);
        VERIFY(not res);
    }

    static void
    unset_env(const std::string& name)
    {
        VERIFY(not name.empty());
        int res = unsetenv(name.c_str());
        VERIFY(not res);
    }

    // Splits a command line the way a POSIX shell would (quotes and
    // backslash escapes), without any expansion.
    static std::vector<std::string>
    split_command_line(const std::string& cmdline);

    // Runs argv[0] with the given arguments, waits for it and returns its
    // standard output and exit status.
    static std::pair<std::string, int>
    exec(const std::vector<std::string>& argv);
};

}

#endif // !RBUTILS_SYSTEM_H_

// Local Variables: **
// mode: c++ **
// End: **
