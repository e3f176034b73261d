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

#ifndef RBUTILS_LOGGING_MACROS_H_
#define RBUTILS_LOGGING_MACROS_H_

#include "Logger.h"

#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_feature.hpp>

#define _LOG_SEV(sev, message)                                          \
    if (::rbutils::Logger::filter(getLogger__().name(),                 \
                                  sev))                                 \
    {                                                                   \
        BOOST_LOG_SEV(getLogger__().get(), sev) << __FUNCTION__  << ": " << message; \
    }

#define LOG_NOTIFY(message) _LOG_SEV(::rbutils::Severity::notification, message)

#define LOG_FATAL(message) _LOG_SEV(::rbutils::Severity::fatal, message)

#define LOG_ERROR(message) _LOG_SEV(::rbutils::Severity::error, message)

#define LOG_WARN(message) _LOG_SEV(::rbutils::Severity::warning, message)

#ifdef LOG_INFO
#undef LOG_INFO
#endif
#define LOG_INFO(message) _LOG_SEV(::rbutils::Severity::info, message)

#define LOG_PERIODIC(message) _LOG_SEV(::rbutils::Severity::periodic, message)

#ifdef LOG_DEBUG
#undef LOG_DEBUG
#endif

#ifdef RBUTILS_ENABLE_DEBUG_LOGGING

#define LOG_DEBUG(message) _LOG_SEV(::rbutils::Severity::debug, message)

#define LOG_TRACE(message) _LOG_SEV(::rbutils::Severity::trace, message)

#else

#define LOG_DEBUG(message)

#define LOG_TRACE(message)

#endif

#endif // !RBUTILS_LOGGING_MACROS_H_

// Local Variables: **
// mode: c++ **
// End: **
