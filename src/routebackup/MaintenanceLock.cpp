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

#include "MaintenanceLock.h"

#include <iostream>
#include <sstream>

#include <boost/optional.hpp>

#include <rbutils/Assert.h>
#include <rbutils/Catchers.h>

namespace routebackup
{

std::ostream&
operator<<(std::ostream& os,
           const MaintenanceState s)
{
    switch (s)
    {
    case MaintenanceState::Active:
        return os << "Active";
    case MaintenanceState::Suspended:
        return os << "Suspended";
    case MaintenanceState::Unknown:
        return os << "Unknown";
    }
    UNREACHABLE;
}

LockCoordinator::LockCoordinator(RemoteExecutor& executor,
                                 const std::string& disable_command,
                                 const std::string& enable_command)
    : executor_(executor)
    , disable_command_(disable_command)
    , enable_command_(enable_command)
{}

MaintenanceState
LockCoordinator::state(const NodeId& node) const
{
    auto it = states_.find(node);
    if (it == states_.end())
    {
        return MaintenanceState::Active;
    }
    else
    {
        return it->second;
    }
}

void
LockCoordinator::disable_maintenance(const NodeIds& nodes)
{
    for (const auto& n : nodes)
    {
        if (state(n) == MaintenanceState::Suspended)
        {
            LOG_INFO(n << ": maintenance already suspended");
            continue;
        }

        LOG_INFO(n << ": suspending maintenance");

        // Once the command was attempted its effect is unknown until it
        // reports success.
        states_[n] = MaintenanceState::Unknown;

        boost::optional<RemoteResult> res;
        try
        {
            res = executor_.run(n,
                                disable_command_,
                                TransportCompression::F);
        }
        catch (std::exception& e)
        {
            LOG_FATAL(n << ": failed to suspend maintenance: " << e.what());
            throw MaintenanceLockException("Failed to suspend maintenance",
                                           n.c_str());
        }

        if (not res->succeeded())
        {
            LOG_FATAL(n << ": failed to suspend maintenance, '" << disable_command_ <<
                      "' exited with status " << res->exit_status);
            throw MaintenanceLockException("Failed to suspend maintenance",
                                           n.c_str());
        }

        states_[n] = MaintenanceState::Suspended;
    }
}

NodeIds
LockCoordinator::enable_maintenance(const NodeIds& nodes)
{
    NodeIds failed;

    for (const auto& n : nodes)
    {
        if (state(n) == MaintenanceState::Active)
        {
            LOG_INFO(n << ": maintenance already active");
            continue;
        }

        LOG_INFO(n << ": resuming maintenance");

        bool ok = false;
        try
        {
            const RemoteResult res(executor_.run(n,
                                                 enable_command_,
                                                 TransportCompression::F));
            ok = res.succeeded();
            if (not ok)
            {
                LOG_ERROR(n << ": '" << enable_command_ << "' exited with status " <<
                          res.exit_status);
            }
        }
        CATCH_STD_EWHAT(LOG_ERROR(n << ": failed to resume maintenance: " << EWHAT););

        if (ok)
        {
            states_[n] = MaintenanceState::Active;
        }
        else
        {
            LOG_ERROR(n << ": maintenance is still suspended. " << remediation(n));
            failed.push_back(n);
        }
    }

    return failed;
}

NodeIds
LockCoordinator::locked_nodes() const
{
    NodeIds nodes;
    for (const auto& p : states_)
    {
        if (p.second != MaintenanceState::Active)
        {
            nodes.push_back(p.first);
        }
    }
    return nodes;
}

std::string
LockCoordinator::remediation(const NodeId& node) const
{
    std::stringstream ss;
    ss << "Run '" << enable_command_ << "' on " << node << " manually to resume maintenance";
    return ss.str();
}

ScopedMaintenanceSuspension::ScopedMaintenanceSuspension(LockCoordinator& coordinator,
                                                         const NodeIds& nodes)
    : coordinator_(coordinator)
    , released_(false)
{
    try
    {
        coordinator_.disable_maintenance(nodes);
    }
    catch (...)
    {
        LOG_ERROR("Suspending maintenance failed, resuming it on the nodes touched so far");
        release();
        throw;
    }
}

ScopedMaintenanceSuspension::~ScopedMaintenanceSuspension()
{
    if (not released_)
    {
        try
        {
            release();
        }
        CATCH_STD_LOG_IGNORE("Failed to release maintenance suspension");
    }
}

NodeIds
ScopedMaintenanceSuspension::release()
{
    if (released_)
    {
        return NodeIds();
    }

    released_ = true;
    return coordinator_.enable_maintenance(coordinator_.locked_nodes());
}

}

// Local Variables: **
// mode: c++ **
// End: **
