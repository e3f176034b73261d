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

#ifndef ROUTEBACKUP_ROUTE_RESOLVER_H_
#define ROUTEBACKUP_ROUTE_RESOLVER_H_

#include "RemoteExecutor.h"
#include "Route.h"
#include "Types.h"

#include <string>
#include <vector>

#include <boost/filesystem.hpp>

#include <rbutils/Exception.h>
#include <rbutils/Logging.h>

namespace routebackup
{

MAKE_EXCEPTION(RouteQueryException, rbutils::Exception);

// Fetches the object -> node mapping from the source cluster. The routes are
// computed cluster side by query_command; the dump is stored locally before
// it is decoded.
class RouteResolver
{
public:
    RouteResolver(RemoteExecutor& executor,
                  const NodeId& host,
                  const std::string& query_command,
                  unsigned object_path_depth,
                  const TransportCompression compression);

    ~RouteResolver() = default;

    RouteResolver(const RouteResolver&) = delete;

    RouteResolver&
    operator=(const RouteResolver&) = delete;

    // Throws RouteQueryException if the query fails and
    // RouteFormatException if its output can't be decoded.
    std::vector<Route>
    resolve(const boost::filesystem::path& dump_file);

private:
    DECLARE_LOGGER("RouteResolver");

    RemoteExecutor& executor_;
    const NodeId host_;
    const std::string query_command_;
    const unsigned depth_;
    const TransportCompression compression_;
};

}

#endif // !ROUTEBACKUP_ROUTE_RESOLVER_H_

// Local Variables: **
// mode: c++ **
// End: **
