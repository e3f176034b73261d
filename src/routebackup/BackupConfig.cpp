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

#include "BackupConfig.h"

#include <iomanip>
#include <iostream>

#include <boost/lexical_cast.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <rbutils/System.h>

namespace routebackup
{

namespace bpt = boost::property_tree;
namespace fs = boost::filesystem;

using rbutils::System;

namespace
{

struct ParameterDoc
{
    const char* key;
    const char* default_value;
    const char* doc;
};

const ParameterDoc parameter_docs[] = {
    { "source.host", "(required)", "host that answers the route query (env: ROUTEBACKUP_HOST)" },
    { "source.clustered", "false", "back up all nodes of the cluster instead of source.host only (env: ROUTEBACKUP_CLUSTERED)" },
    { "source.storage_root", "/var/lib/objstore/storage", "root of the object tree on the nodes" },
    { "source.route_query_command", "objstore-admin routes", "prints one route (object path, owning nodes) per line" },
    { "source.node_role", "storage", "role of the nodes to back up" },
    { "source.nodes", "(unset)", "static list of nodes; if unset source.node_list_command is used" },
    { "source.node_list_command", "objstore-admin nodes", "prints the nodes with the role given as argument, one per line" },
    { "source.maintenance_disable_command", "objstore-admin gc disable", "suspends background maintenance on a node" },
    { "source.maintenance_enable_command", "objstore-admin gc enable", "resumes background maintenance on a node" },
    { "source.default_owner", "root", "remote user to read objects as if the owner of the storage root can't be determined" },
    { "target.snapshot_root", "/snapshots", "directory holding the snapshots and the current link (env: ROUTEBACKUP_SNAPSHOT_ROOT)" },
    { "target.scratch_dir", "/tmp", "parent of the private work directory of a run" },
    { "transport.ssh_binary", "ssh", "ssh executable" },
    { "transport.options", "", "extra ssh options (env: ROUTEBACKUP_TRANSPORT_OPTIONS)" },
    { "transport.compress", "true", "compress the route query transfer" },
    { "transfer.rsync_binary", "rsync", "rsync executable" },
    { "transfer.extra_options", "", "extra rsync options" },
    { "object_path_depth", "6", "number of path components of an object" },
    { "skip_verification", "false", "don't verify the snapshot (env: ROUTEBACKUP_SKIP_VERIFICATION)" },
};

template<typename T>
T
get_checked(const bpt::ptree& pt,
            const std::string& key,
            const T& default_value)
{
    try
    {
        return pt.get<T>(key,
                         default_value);
    }
    catch (bpt::ptree_error& e)
    {
        throw ConfigurationException("Invalid value for configuration key " + key +
                                     ": " + e.what());
    }
}

}

BackupConfig
BackupConfig::from_ptree(const bpt::ptree& pt)
{
    BackupConfig cfg;

    cfg.host = NodeId(get_checked<std::string>(pt,
                                               "source.host",
                                               cfg.host.str()));
    cfg.clustered =
        ClusteredMode_from_bool(get_checked<bool>(pt,
                                                  "source.clustered",
                                                  T(cfg.clustered)));
    cfg.storage_root = get_checked<std::string>(pt,
                                                "source.storage_root",
                                                cfg.storage_root.string());
    cfg.route_query_command = get_checked<std::string>(pt,
                                                       "source.route_query_command",
                                                       cfg.route_query_command);
    cfg.node_role = get_checked<std::string>(pt,
                                             "source.node_role",
                                             cfg.node_role);

    const auto nodes(pt.get_child_optional("source.nodes"));
    if (nodes)
    {
        NodeIds ids;
        for (const auto& c : *nodes)
        {
            ids.emplace_back(c.second.get_value<std::string>());
        }
        cfg.nodes = ids;
    }

    cfg.node_list_command = get_checked<std::string>(pt,
                                                     "source.node_list_command",
                                                     cfg.node_list_command);
    cfg.maintenance_disable_command =
        get_checked<std::string>(pt,
                                 "source.maintenance_disable_command",
                                 cfg.maintenance_disable_command);
    cfg.maintenance_enable_command =
        get_checked<std::string>(pt,
                                 "source.maintenance_enable_command",
                                 cfg.maintenance_enable_command);
    cfg.default_owner = get_checked<std::string>(pt,
                                                 "source.default_owner",
                                                 cfg.default_owner);

    cfg.snapshot_root = get_checked<std::string>(pt,
                                                 "target.snapshot_root",
                                                 cfg.snapshot_root.string());
    cfg.scratch_dir = get_checked<std::string>(pt,
                                               "target.scratch_dir",
                                               cfg.scratch_dir.string());

    cfg.ssh_binary = get_checked<std::string>(pt,
                                              "transport.ssh_binary",
                                              cfg.ssh_binary);
    cfg.transport_options = get_checked<std::string>(pt,
                                                     "transport.options",
                                                     cfg.transport_options);
    cfg.compress =
        TransportCompression_from_bool(get_checked<bool>(pt,
                                                         "transport.compress",
                                                         T(cfg.compress)));

    cfg.rsync_binary = get_checked<std::string>(pt,
                                                "transfer.rsync_binary",
                                                cfg.rsync_binary);
    cfg.rsync_extra_options = get_checked<std::string>(pt,
                                                       "transfer.extra_options",
                                                       cfg.rsync_extra_options);

    cfg.object_path_depth = get_checked<unsigned>(pt,
                                                  "object_path_depth",
                                                  cfg.object_path_depth);
    cfg.skip_verification =
        SkipVerification_from_bool(get_checked<bool>(pt,
                                                     "skip_verification",
                                                     T(cfg.skip_verification)));

    return cfg;
}

BackupConfig
BackupConfig::from_json_file(const fs::path& p)
{
    LOG_INFO("Reading configuration from " << p);

    bpt::ptree pt;
    try
    {
        bpt::json_parser::read_json(p.string(),
                                    pt);
    }
    catch (bpt::json_parser_error& e)
    {
        LOG_FATAL("Failed to read configuration file " << p << ": " << e.what());
        throw ConfigurationException(std::string("Failed to read configuration file: ") +
                                     e.what());
    }

    return from_ptree(pt);
}

void
BackupConfig::apply_environment()
{
    host = NodeId(System::get_env_with_default<std::string>(host_env_var(),
                                                            host.str()));
    clustered =
        ClusteredMode_from_bool(System::get_bool_from_env(clustered_env_var(),
                                                          T(clustered)));
    skip_verification =
        SkipVerification_from_bool(System::get_bool_from_env(skip_verification_env_var(),
                                                             T(skip_verification)));
    transport_options =
        System::get_env_with_default<std::string>(transport_options_env_var(),
                                                  transport_options);
    snapshot_root =
        System::get_env_with_default<std::string>(snapshot_root_env_var(),
                                                  snapshot_root.string());
}

void
BackupConfig::validate() const
{
    if (host.empty())
    {
        throw ConfigurationException("source.host is not set");
    }

    try
    {
        make_node_id(host.str());
        if (nodes)
        {
            for (const auto& n : *nodes)
            {
                make_node_id(n.str());
            }
        }
    }
    catch (RouteFormatException& e)
    {
        throw ConfigurationException(std::string("Invalid node in configuration: ") +
                                     e.what());
    }

    if (nodes and nodes->empty())
    {
        throw ConfigurationException("source.nodes is empty");
    }

    if (object_path_depth == 0)
    {
        throw ConfigurationException("object_path_depth must be at least 1");
    }

    if (storage_root.empty() or snapshot_root.empty() or scratch_dir.empty())
    {
        throw ConfigurationException("storage root, snapshot root and scratch dir must be set");
    }

    if (route_query_command.empty() or
        maintenance_disable_command.empty() or
        maintenance_enable_command.empty())
    {
        throw ConfigurationException("route query and maintenance commands must be set");
    }

    if (not nodes and T(clustered) and node_list_command.empty())
    {
        throw ConfigurationException("clustered mode needs source.nodes or source.node_list_command");
    }

    if (default_owner.empty())
    {
        throw ConfigurationException("source.default_owner must be set");
    }

    try
    {
        ssh_options();
        rsync_options();
    }
    catch (std::exception& e)
    {
        throw ConfigurationException(std::string("Failed to parse extra options: ") +
                                     e.what());
    }
}

std::vector<std::string>
BackupConfig::ssh_options() const
{
    return System::split_command_line(transport_options);
}

std::vector<std::string>
BackupConfig::rsync_options() const
{
    return System::split_command_line(rsync_extra_options);
}

bpt::ptree
BackupConfig::to_ptree() const
{
    bpt::ptree pt;

    pt.put("source.host", host.str());
    pt.put("source.clustered", T(clustered));
    pt.put("source.storage_root", storage_root.string());
    pt.put("source.route_query_command", route_query_command);
    pt.put("source.node_role", node_role);

    if (nodes)
    {
        bpt::ptree arr;
        for (const auto& n : *nodes)
        {
            bpt::ptree c;
            c.put("", n.str());
            arr.push_back(std::make_pair("", c));
        }
        pt.add_child("source.nodes", arr);
    }

    pt.put("source.node_list_command", node_list_command);
    pt.put("source.maintenance_disable_command", maintenance_disable_command);
    pt.put("source.maintenance_enable_command", maintenance_enable_command);
    pt.put("source.default_owner", default_owner);
    pt.put("target.snapshot_root", snapshot_root.string());
    pt.put("target.scratch_dir", scratch_dir.string());
    pt.put("transport.ssh_binary", ssh_binary);
    pt.put("transport.options", transport_options);
    pt.put("transport.compress", T(compress));
    pt.put("transfer.rsync_binary", rsync_binary);
    pt.put("transfer.extra_options", rsync_extra_options);
    pt.put("object_path_depth", object_path_depth);
    pt.put("skip_verification", T(skip_verification));

    return pt;
}

void
BackupConfig::dump(std::ostream& os) const
{
    bpt::json_parser::write_json(os,
                                 to_ptree());
}

void
BackupConfig::print_configuration_documentation(std::ostream& os)
{
    os << "Back up the objects of a storage cluster to a local snapshot" << std::endl <<
        std::endl <<
        "Configuration file keys (JSON):" << std::endl;

    for (const auto& d : parameter_docs)
    {
        os << "  " << std::left << std::setw(36) << d.key <<
            " default: " << std::setw(28) << (*d.default_value ? d.default_value : "(empty)") <<
            " " << d.doc << std::endl;
    }
}

}

// Local Variables: **
// mode: c++ **
// End: **
