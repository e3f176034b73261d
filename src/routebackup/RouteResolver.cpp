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

#include "RouteResolver.h"

#include <boost/filesystem/fstream.hpp>
#include <boost/optional.hpp>

namespace routebackup
{

namespace fs = boost::filesystem;

RouteResolver::RouteResolver(RemoteExecutor& executor,
                             const NodeId& host,
                             const std::string& query_command,
                             unsigned object_path_depth,
                             const TransportCompression compression)
    : executor_(executor)
    , host_(host)
    , query_command_(query_command)
    , depth_(object_path_depth)
    , compression_(compression)
{}

std::vector<Route>
RouteResolver::resolve(const fs::path& dump_file)
{
    LOG_INFO("Querying routes on " << host_ << ": '" << query_command_ << "'");

    boost::optional<RemoteResult> res;
    try
    {
        res = executor_.run(host_,
                            query_command_,
                            compression_);
    }
    catch (std::exception& e)
    {
        LOG_FATAL("Route query on " << host_ << " could not be run: " << e.what());
        throw RouteQueryException("Failed to run route query",
                                  host_.c_str());
    }

    if (not res->succeeded())
    {
        LOG_FATAL("Route query on " << host_ << " exited with status " <<
                  res->exit_status);
        throw RouteQueryException("Route query failed",
                                  host_.c_str());
    }

    {
        fs::ofstream ofs(dump_file,
                         std::ios::out bitor std::ios::trunc);
        ofs << res->output;
        ofs.close();
        if (ofs.fail())
        {
            LOG_ERROR("Failed to store route dump in " << dump_file);
            throw RouteQueryException("Failed to store route dump",
                                      dump_file.string().c_str());
        }
    }

    LOG_INFO("Stored " << res->output.size() << " bytes of routes in " << dump_file);

    fs::ifstream ifs(dump_file);
    if (not ifs)
    {
        LOG_ERROR("Failed to reopen route dump " << dump_file);
        throw RouteQueryException("Failed to read route dump",
                                  dump_file.string().c_str());
    }

    RouteReader reader(ifs,
                       depth_);
    return reader.read_all();
}

}

// Local Variables: **
// mode: c++ **
// End: **
