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

#ifndef ROUTEBACKUP_CLUSTER_TOPOLOGY_H_
#define ROUTEBACKUP_CLUSTER_TOPOLOGY_H_

#include "RemoteExecutor.h"
#include "Types.h"

#include <string>

#include <rbutils/Exception.h>
#include <rbutils/Logging.h>

namespace routebackup
{

MAKE_EXCEPTION(ClusterTopologyException, rbutils::Exception);

// Current members of the source cluster with a given role.
class ClusterTopology
{
public:
    virtual ~ClusterTopology() = default;

    virtual NodeIds
    list_nodes(const std::string& role) = 0;
};

// A fixed node list from the configuration, whatever the role.
class StaticClusterTopology
    : public ClusterTopology
{
public:
    explicit StaticClusterTopology(const NodeIds& nodes);

    virtual NodeIds
    list_nodes(const std::string& role) override final;

private:
    DECLARE_LOGGER("StaticClusterTopology");

    const NodeIds nodes_;
};

// Asks the cluster: runs "<command> <role>" on host, which prints one node
// per line.
class RemoteClusterTopology
    : public ClusterTopology
{
public:
    RemoteClusterTopology(RemoteExecutor& executor,
                          const NodeId& host,
                          const std::string& command);

    virtual NodeIds
    list_nodes(const std::string& role) override final;

private:
    DECLARE_LOGGER("RemoteClusterTopology");

    RemoteExecutor& executor_;
    const NodeId host_;
    const std::string command_;
};

}

#endif // !ROUTEBACKUP_CLUSTER_TOPOLOGY_H_

// Local Variables: **
// mode: c++ **
// End: **
