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

#include "ClusterTopology.h"
#include "Route.h"

#include <set>
#include <sstream>

#include <boost/algorithm/string/trim.hpp>

namespace routebackup
{

StaticClusterTopology::StaticClusterTopology(const NodeIds& nodes)
    : nodes_(nodes)
{}

NodeIds
StaticClusterTopology::list_nodes(const std::string& role)
{
    LOG_INFO(role << ": " << nodes_.size() << " configured nodes");
    return nodes_;
}

RemoteClusterTopology::RemoteClusterTopology(RemoteExecutor& executor,
                                             const NodeId& host,
                                             const std::string& command)
    : executor_(executor)
    , host_(host)
    , command_(command)
{}

NodeIds
RemoteClusterTopology::list_nodes(const std::string& role)
{
    const RemoteResult res(executor_.run(host_,
                                         command_ + " " + shell_quote(role),
                                         TransportCompression::F));
    if (not res.succeeded())
    {
        LOG_ERROR("Failed to list " << role << " nodes on " << host_ <<
                  ", exit status " << res.exit_status);
        throw ClusterTopologyException("Failed to list cluster nodes",
                                       host_.c_str());
    }

    NodeIds nodes;
    std::set<NodeId> seen;
    std::stringstream ss(res.output);
    std::string line;

    while (std::getline(ss, line))
    {
        boost::algorithm::trim(line);
        if (line.empty())
        {
            continue;
        }

        NodeId n(make_node_id(line));
        if (seen.insert(n).second)
        {
            nodes.push_back(n);
        }
    }

    LOG_INFO(role << ": " << nodes.size() << " nodes reported by " << host_);
    return nodes;
}

}

// Local Variables: **
// mode: c++ **
// End: **
