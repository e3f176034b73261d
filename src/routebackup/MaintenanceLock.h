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

#ifndef ROUTEBACKUP_MAINTENANCE_LOCK_H_
#define ROUTEBACKUP_MAINTENANCE_LOCK_H_

#include "RemoteExecutor.h"
#include "Types.h"

#include <iosfwd>
#include <map>
#include <string>

#include <rbutils/Exception.h>
#include <rbutils/Logging.h>

namespace routebackup
{

MAKE_EXCEPTION(MaintenanceLockException, rbutils::Exception);

enum class MaintenanceState
{
    Active,
    Suspended,
    // the disable command failed half way, treated like Suspended on release
    Unknown,
};

std::ostream&
operator<<(std::ostream& os,
           const MaintenanceState s);

// Suspends and resumes background maintenance (garbage collection) on the
// source nodes and keeps track of the state of every node it touched.
class LockCoordinator
{
public:
    LockCoordinator(RemoteExecutor& executor,
                    const std::string& disable_command,
                    const std::string& enable_command);

    ~LockCoordinator() = default;

    LockCoordinator(const LockCoordinator&) = delete;

    LockCoordinator&
    operator=(const LockCoordinator&) = delete;

    // Stops at the first node that fails, throwing
    // MaintenanceLockException. Nodes already suspended are skipped.
    void
    disable_maintenance(const NodeIds& nodes);

    // Tries every node that is not known to be active and returns the ones
    // that could not be re-enabled.
    NodeIds
    enable_maintenance(const NodeIds& nodes);

    // Nodes that need re-enabling: suspended or unknown.
    NodeIds
    locked_nodes() const;

    MaintenanceState
    state(const NodeId& node) const;

    // What an operator has to run by hand if re-enabling node failed.
    std::string
    remediation(const NodeId& node) const;

private:
    DECLARE_LOGGER("LockCoordinator");

    RemoteExecutor& executor_;
    const std::string disable_command_;
    const std::string enable_command_;
    std::map<NodeId, MaintenanceState> states_;
};

// Maintenance is suspended on the given nodes for the lifetime of this
// object. Whatever happens afterwards, release() runs at the latest in the
// destructor; if suspending fails the nodes suspended so far are resumed
// before the exception propagates.
class ScopedMaintenanceSuspension
{
public:
    ScopedMaintenanceSuspension(LockCoordinator& coordinator,
                                const NodeIds& nodes);

    ~ScopedMaintenanceSuspension();

    ScopedMaintenanceSuspension(const ScopedMaintenanceSuspension&) = delete;

    ScopedMaintenanceSuspension&
    operator=(const ScopedMaintenanceSuspension&) = delete;

    // Idempotent. Returns the nodes that could not be re-enabled.
    NodeIds
    release();

private:
    DECLARE_LOGGER("ScopedMaintenanceSuspension");

    LockCoordinator& coordinator_;
    bool released_;
};

}

#endif // !ROUTEBACKUP_MAINTENANCE_LOCK_H_

// Local Variables: **
// mode: c++ **
// End: **
