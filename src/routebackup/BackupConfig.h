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

#ifndef ROUTEBACKUP_BACKUP_CONFIG_H_
#define ROUTEBACKUP_BACKUP_CONFIG_H_

#include "Route.h"
#include "Types.h"

#include <iosfwd>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/optional.hpp>
#include <boost/property_tree/ptree_fwd.hpp>

#include <rbutils/Exception.h>
#include <rbutils/Logging.h>

namespace routebackup
{

MAKE_EXCEPTION(ConfigurationException, rbutils::Exception);

// Everything a backup run needs to know. Values come from (in increasing
// order of precedence) the defaults below, a JSON file, the environment and
// the command line.
struct BackupConfig
{
    DECLARE_LOGGER("BackupConfig");

    NodeId host;
    ClusteredMode clustered = ClusteredMode::F;
    boost::filesystem::path storage_root = "/var/lib/objstore/storage";
    std::string route_query_command = "objstore-admin routes";
    std::string node_role = "storage";
    // static node list; if unset nodes are listed with node_list_command
    boost::optional<NodeIds> nodes;
    std::string node_list_command = "objstore-admin nodes";
    std::string maintenance_disable_command = "objstore-admin gc disable";
    std::string maintenance_enable_command = "objstore-admin gc enable";
    std::string default_owner = "root";

    boost::filesystem::path snapshot_root = "/snapshots";
    boost::filesystem::path scratch_dir = "/tmp";

    std::string ssh_binary = "ssh";
    std::string transport_options;
    TransportCompression compress = TransportCompression::T;

    std::string rsync_binary = "rsync";
    std::string rsync_extra_options;

    unsigned object_path_depth = default_object_path_depth;
    SkipVerification skip_verification = SkipVerification::F;

    static const char*
    host_env_var()
    {
        return "ROUTEBACKUP_HOST";
    }

    static const char*
    clustered_env_var()
    {
        return "ROUTEBACKUP_CLUSTERED";
    }

    static const char*
    skip_verification_env_var()
    {
        return "ROUTEBACKUP_SKIP_VERIFICATION";
    }

    static const char*
    transport_options_env_var()
    {
        return "ROUTEBACKUP_TRANSPORT_OPTIONS";
    }

    static const char*
    snapshot_root_env_var()
    {
        return "ROUTEBACKUP_SNAPSHOT_ROOT";
    }

    // Keys missing from pt keep their defaults.
    static BackupConfig
    from_ptree(const boost::property_tree::ptree& pt);

    static BackupConfig
    from_json_file(const boost::filesystem::path& p);

    void
    apply_environment();

    // Throws ConfigurationException.
    void
    validate() const;

    std::vector<std::string>
    ssh_options() const;

    std::vector<std::string>
    rsync_options() const;

    boost::property_tree::ptree
    to_ptree() const;

    void
    dump(std::ostream& os) const;

    static void
    print_configuration_documentation(std::ostream& os);
};

}

#endif // !ROUTEBACKUP_BACKUP_CONFIG_H_

// Local Variables: **
// mode: c++ **
// End: **
