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

#ifndef ROUTEBACKUP_WORK_LIST_H_
#define ROUTEBACKUP_WORK_LIST_H_

#include "Route.h"
#include "Types.h"

#include <map>
#include <vector>

#include <boost/filesystem.hpp>

#include <rbutils/Logging.h>

namespace routebackup
{

MAKE_EXCEPTION(WorkListException, rbutils::Exception);

// Turns routes into per node work lists. In clustered mode each route is
// assigned to every node that owns it; otherwise everything goes to the one
// node that is backed up. Within a list objects are unique and sorted.
class RoutePartitioner
{
public:
    RoutePartitioner(const ClusteredMode clustered,
                     const NodeId& single_node);

    NodeWorkLists
    partition(const std::vector<Route>& routes) const;

private:
    DECLARE_LOGGER("RoutePartitioner");

    const ClusteredMode clustered_;
    const NodeId single_node_;
};

struct WorkListFile
{
    boost::filesystem::path path;
    size_t entries;
};

using WorkListFiles = std::map<NodeId, WorkListFile>;

// One file per node (<dir>/<node>.list), one object path per line: the file
// selector handed to the transfer tool.
class WorkListWriter
{
public:
    explicit WorkListWriter(const boost::filesystem::path& dir);

    WorkListFile
    write(const NodeId& node,
          const ObjectPaths& objects) const;

    WorkListFiles
    write(const NodeWorkLists& lists) const;

private:
    DECLARE_LOGGER("WorkListWriter");

    const boost::filesystem::path dir_;
};

struct WorkListReader
{
    DECLARE_LOGGER("WorkListReader");

    static ObjectPaths
    read(const boost::filesystem::path& p,
         unsigned depth = default_object_path_depth);
};

}

#endif // !ROUTEBACKUP_WORK_LIST_H_

// Local Variables: **
// mode: c++ **
// End: **
