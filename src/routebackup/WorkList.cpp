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

#include "WorkList.h"

#include <set>

#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem/fstream.hpp>

#include <rbutils/Assert.h>

namespace routebackup
{

namespace fs = boost::filesystem;

RoutePartitioner::RoutePartitioner(const ClusteredMode clustered,
                                   const NodeId& single_node)
    : clustered_(clustered)
    , single_node_(single_node)
{
    if (F(clustered_) and single_node_.empty())
    {
        throw WorkListException("Single node mode requires a node");
    }
}

NodeWorkLists
RoutePartitioner::partition(const std::vector<Route>& routes) const
{
    std::map<NodeId, std::set<ObjectPath>> sets;

    for (const auto& r : routes)
    {
        if (T(clustered_))
        {
            VERIFY(not r.nodes.empty());
            for (const auto& n : r.nodes)
            {
                sets[n].insert(r.path);
            }
        }
        else
        {
            sets[single_node_].insert(r.path);
        }
    }

    NodeWorkLists lists;
    for (auto& p : sets)
    {
        LOG_INFO(p.first << ": " << p.second.size() << " objects");
        lists.emplace(p.first,
                      ObjectPaths(p.second.begin(),
                                  p.second.end()));
    }

    LOG_INFO(routes.size() << " routes partitioned over " << lists.size() <<
             " nodes, clustered mode: " << clustered_);
    return lists;
}

WorkListWriter::WorkListWriter(const fs::path& dir)
    : dir_(dir)
{
    fs::create_directories(dir_);
}

WorkListFile
WorkListWriter::write(const NodeId& node,
                      const ObjectPaths& objects) const
{
    const fs::path p(dir_ / (node.str() + ".list"));

    fs::ofstream ofs(p,
                     std::ios::out bitor std::ios::trunc);
    if (not ofs)
    {
        LOG_ERROR("Failed to open " << p);
        throw WorkListException("Failed to open work list",
                                p.string().c_str());
    }

    for (const auto& o : objects)
    {
        ofs << o << '\n';
    }

    ofs.close();
    if (ofs.fail())
    {
        LOG_ERROR("Failed to write " << p);
        throw WorkListException("Failed to write work list",
                                p.string().c_str());
    }

    LOG_INFO("wrote " << objects.size() << " entries for " << node << " to " << p);

    WorkListFile f;
    f.path = p;
    f.entries = objects.size();
    return f;
}

WorkListFiles
WorkListWriter::write(const NodeWorkLists& lists) const
{
    WorkListFiles files;

    for (const auto& p : lists)
    {
        files.emplace(p.first,
                      write(p.first,
                            p.second));
    }

    return files;
}

ObjectPaths
WorkListReader::read(const fs::path& p,
                     unsigned depth)
{
    fs::ifstream ifs(p);
    if (not ifs)
    {
        LOG_ERROR("Failed to open " << p);
        throw WorkListException("Failed to open work list",
                                p.string().c_str());
    }

    ObjectPaths objects;
    std::string line;

    while (std::getline(ifs, line))
    {
        boost::algorithm::trim(line);
        if (not line.empty())
        {
            objects.emplace_back(make_object_path(line,
                                                  depth));
        }
    }

    if (ifs.bad())
    {
        LOG_ERROR("I/O error reading " << p);
        throw WorkListException("Failed to read work list",
                                p.string().c_str());
    }

    return objects;
}

}

// Local Variables: **
// mode: c++ **
// End: **
