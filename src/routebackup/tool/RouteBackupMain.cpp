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

#include "../Backup.h"
#include "../BackupConfig.h"
#include "../ClusterTopology.h"
#include "../RemoteExecutor.h"
#include "../TransferTool.h"

#include <signal.h>

#include <iostream>
#include <memory>
#include <sstream>

#include <boost/optional.hpp>
#include <boost/program_options.hpp>

#include <rbutils/Main.h>
#include <rbutils/SignalThread.h>

namespace
{

namespace po = boost::program_options;
namespace rb = routebackup;
namespace rbu = rbutils;

class RouteBackupMain
    : public rbu::MainHelper
{
public:
    RouteBackupMain(int argc,
                    char** argv)
        : MainHelper(argc,
                     argv)
        , backup_options_("Backup Options")
    {
        backup_options_.add_options()
            ("config-file",
             po::value<std::string>(&config_file_),
             "JSON file holding the configuration of this backup")
            ("host",
             po::value<std::string>(),
             "host that answers the route query, overrides source.host")
            ("clustered",
             po::value<bool>()->implicit_value(true),
             "back up all nodes of the cluster, overrides source.clustered")
            ("skip-verification",
             po::value<bool>()->implicit_value(true),
             "don't verify the snapshot, overrides skip_verification")
            ("transport-options",
             po::value<std::string>(),
             "extra ssh options, overrides transport.options")
            ("snapshot-root",
             po::value<std::string>(),
             "directory holding the snapshots, overrides target.snapshot_root")
            ("print-config-documentation",
             "print the configuration keys and exit");
    }

    virtual void
    log_extra_help(std::ostream& strm) override final
    {
        strm << backup_options_;
    }

    virtual void
    parse_command_line_arguments() override final
    {
        parse_unparsed_options(backup_options_,
                               rbu::AllowUnregisteredOptions::T,
                               vm_);
    }

    virtual int
    run() override final
    {
        if (vm_.count("print-config-documentation"))
        {
            rb::BackupConfig::print_configuration_documentation(std::cout);
            return 0;
        }

        const rb::BackupConfig config(make_config_());

        LOG_INFO("Configuration:");
        {
            std::stringstream ss;
            config.dump(ss);
            LOG_INFO(ss.str());
        }

        rb::SshRemoteExecutor executor(config.ssh_binary,
                                       config.ssh_options());

        std::unique_ptr<rb::ClusterTopology> topology;
        if (config.nodes)
        {
            topology.reset(new rb::StaticClusterTopology(*config.nodes));
        }
        else
        {
            topology.reset(new rb::RemoteClusterTopology(executor,
                                                         config.host,
                                                         config.node_list_command));
        }

        rb::RsyncTransferTool tool(config.rsync_binary,
                                   executor.remote_shell(),
                                   config.rsync_options());

        rb::Backup backup(config,
                          executor,
                          *topology,
                          tool);

        // Blocks the signals in this thread and in every thread and process
        // started afterwards.
        rbu::SignalThread signal_thread(rbu::SignalSet{ SIGINT, SIGTERM, SIGHUP },
                                        [&](int sig)
                                        {
                                            LOG_NOTIFY("Received signal " << sig <<
                                                       ", interrupting the backup");
                                            backup.interrupt();
                                        });

        const rb::BackupStatus status = backup();
        const int rc = rb::exit_status(status);

        LOG_NOTIFY("Backup status " << status << ", exiting with " << rc);
        return rc;
    }

private:
    po::options_description backup_options_;
    std::string config_file_;

    rb::BackupConfig
    make_config_() const
    {
        rb::BackupConfig config;

        if (not config_file_.empty())
        {
            config = rb::BackupConfig::from_json_file(config_file_);
        }

        config.apply_environment();

        if (vm_.count("host"))
        {
            config.host = rb::NodeId(vm_["host"].as<std::string>());
        }

        if (vm_.count("clustered"))
        {
            config.clustered = rb::ClusteredMode_from_bool(vm_["clustered"].as<bool>());
        }

        if (vm_.count("skip-verification"))
        {
            config.skip_verification =
                rb::SkipVerification_from_bool(vm_["skip-verification"].as<bool>());
        }

        if (vm_.count("transport-options"))
        {
            config.transport_options = vm_["transport-options"].as<std::string>();
        }

        if (vm_.count("snapshot-root"))
        {
            config.snapshot_root = vm_["snapshot-root"].as<std::string>();
        }

        config.validate();
        return config;
    }
};

}

MAIN(RouteBackupMain)

// Local Variables: **
// mode: c++ **
// End: **
