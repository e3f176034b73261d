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

#include "../BackupConfig.h"

#include <sstream>

#include <boost/filesystem/fstream.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <rbutils/System.h>
#include <rbutils/TestBase.h>

namespace routebackuptest
{

namespace bpt = boost::property_tree;
namespace fs = boost::filesystem;

using namespace routebackup;

using rbutils::System;

class BackupConfigTest
    : public rbutilstest::TestWithDir
{
public:
    BackupConfigTest()
        : TestWithDir("BackupConfigTest")
    {}

    virtual void
    TearDown() override
    {
        System::unset_env(BackupConfig::host_env_var());
        System::unset_env(BackupConfig::clustered_env_var());
        System::unset_env(BackupConfig::skip_verification_env_var());
        System::unset_env(BackupConfig::transport_options_env_var());
        System::unset_env(BackupConfig::snapshot_root_env_var());

        TestWithDir::TearDown();
    }

protected:
    BackupConfig
    valid_config() const
    {
        BackupConfig cfg;
        cfg.host = NodeId("node1");
        return cfg;
    }

    fs::path
    write_file(const std::string& name,
               const std::string& content)
    {
        const fs::path p(directory_ / name);
        fs::ofstream ofs(p);
        ofs << content;
        return p;
    }
};

TEST_F(BackupConfigTest, defaults)
{
    const BackupConfig cfg;

    EXPECT_TRUE(cfg.host.empty());
    EXPECT_EQ(ClusteredMode::F, cfg.clustered);
    EXPECT_EQ(fs::path("/var/lib/objstore/storage"), cfg.storage_root);
    EXPECT_FALSE(cfg.nodes);
    EXPECT_EQ(fs::path("/snapshots"), cfg.snapshot_root);
    EXPECT_EQ(TransportCompression::T, cfg.compress);
    EXPECT_EQ(6U, cfg.object_path_depth);
    EXPECT_EQ(SkipVerification::F, cfg.skip_verification);
    EXPECT_EQ("root", cfg.default_owner);

    // the host is mandatory
    EXPECT_THROW(cfg.validate(),
                 ConfigurationException);
    EXPECT_NO_THROW(valid_config().validate());
}

TEST_F(BackupConfigTest, from_json_file)
{
    const fs::path p(write_file("config.json",
                                R"({
    "source": {
        "host": "node7",
        "clustered": true,
        "storage_root": "/srv/objects",
        "nodes": [ "node7", "node8" ]
    },
    "target": {
        "snapshot_root": "/backup/objects"
    },
    "transport": {
        "options": "-p 2222 -o 'BatchMode yes'",
        "compress": false
    },
    "object_path_depth": 4,
    "skip_verification": true
})"));

    const BackupConfig cfg(BackupConfig::from_json_file(p));

    EXPECT_EQ(NodeId("node7"), cfg.host);
    EXPECT_EQ(ClusteredMode::T, cfg.clustered);
    EXPECT_EQ(fs::path("/srv/objects"), cfg.storage_root);
    ASSERT_TRUE(static_cast<bool>(cfg.nodes));
    const NodeIds exp_nodes{ NodeId("node7"),
                             NodeId("node8") };
    EXPECT_EQ(exp_nodes, *cfg.nodes);
    EXPECT_EQ(fs::path("/backup/objects"), cfg.snapshot_root);
    EXPECT_EQ(TransportCompression::F, cfg.compress);
    EXPECT_EQ(4U, cfg.object_path_depth);
    EXPECT_EQ(SkipVerification::T, cfg.skip_verification);

    // untouched
    EXPECT_EQ(fs::path("/tmp"), cfg.scratch_dir);
    EXPECT_EQ("objstore-admin routes", cfg.route_query_command);

    const std::vector<std::string> exp_opts{ "-p",
                                             "2222",
                                             "-o",
                                             "BatchMode yes" };
    EXPECT_EQ(exp_opts, cfg.ssh_options());
    EXPECT_TRUE(cfg.rsync_options().empty());

    EXPECT_NO_THROW(cfg.validate());
}

TEST_F(BackupConfigTest, broken_json_file)
{
    EXPECT_THROW(BackupConfig::from_json_file(write_file("broken.json",
                                                         "{ \"source\": ")),
                 ConfigurationException);
    EXPECT_THROW(BackupConfig::from_json_file(directory_ / "no_such_file.json"),
                 ConfigurationException);
    EXPECT_THROW(BackupConfig::from_json_file(write_file("bad_value.json",
                                                         "{ \"object_path_depth\": \"six\" }")),
                 ConfigurationException);
}

TEST_F(BackupConfigTest, environment)
{
    BackupConfig cfg(valid_config());

    System::set_env(BackupConfig::host_env_var(), "node3", true);
    System::set_env(BackupConfig::clustered_env_var(), "yes", true);
    System::set_env(BackupConfig::skip_verification_env_var(), "1", true);
    System::set_env(BackupConfig::transport_options_env_var(), "-i /root/.ssh/backup", true);
    System::set_env(BackupConfig::snapshot_root_env_var(), "/mnt/backup", true);

    cfg.apply_environment();

    EXPECT_EQ(NodeId("node3"), cfg.host);
    EXPECT_EQ(ClusteredMode::T, cfg.clustered);
    EXPECT_EQ(SkipVerification::T, cfg.skip_verification);
    EXPECT_EQ("-i /root/.ssh/backup", cfg.transport_options);
    EXPECT_EQ(fs::path("/mnt/backup"), cfg.snapshot_root);

    System::set_env(BackupConfig::clustered_env_var(), "maybe", true);
    EXPECT_THROW(cfg.apply_environment(),
                 rbutils::EnvironmentException);
}

TEST_F(BackupConfigTest, environment_unset)
{
    BackupConfig cfg(valid_config());
    cfg.clustered = ClusteredMode::T;

    cfg.apply_environment();

    EXPECT_EQ(NodeId("node1"), cfg.host);
    EXPECT_EQ(ClusteredMode::T, cfg.clustered);
    EXPECT_EQ(fs::path("/snapshots"), cfg.snapshot_root);
}

TEST_F(BackupConfigTest, validation)
{
    {
        BackupConfig cfg(valid_config());
        cfg.host = NodeId("node/1");
        EXPECT_THROW(cfg.validate(),
                     ConfigurationException);
    }

    {
        BackupConfig cfg(valid_config());
        cfg.nodes = NodeIds();
        EXPECT_THROW(cfg.validate(),
                     ConfigurationException);
    }

    {
        BackupConfig cfg(valid_config());
        cfg.nodes = NodeIds{ NodeId("..") };
        EXPECT_THROW(cfg.validate(),
                     ConfigurationException);
    }

    {
        BackupConfig cfg(valid_config());
        cfg.object_path_depth = 0;
        EXPECT_THROW(cfg.validate(),
                     ConfigurationException);
    }

    {
        BackupConfig cfg(valid_config());
        cfg.snapshot_root = fs::path();
        EXPECT_THROW(cfg.validate(),
                     ConfigurationException);
    }

    {
        BackupConfig cfg(valid_config());
        cfg.maintenance_enable_command.clear();
        EXPECT_THROW(cfg.validate(),
                     ConfigurationException);
    }

    {
        BackupConfig cfg(valid_config());
        cfg.clustered = ClusteredMode::T;
        cfg.node_list_command.clear();
        EXPECT_THROW(cfg.validate(),
                     ConfigurationException);

        cfg.nodes = NodeIds{ NodeId("node1") };
        EXPECT_NO_THROW(cfg.validate());
    }

    {
        BackupConfig cfg(valid_config());
        cfg.default_owner.clear();
        EXPECT_THROW(cfg.validate(),
                     ConfigurationException);
    }

    {
        BackupConfig cfg(valid_config());
        cfg.rsync_extra_options = "--bwlimit=1000 \\";
        EXPECT_THROW(cfg.validate(),
                     ConfigurationException);
    }
}

TEST_F(BackupConfigTest, ptree_round_trip)
{
    BackupConfig cfg(valid_config());
    cfg.clustered = ClusteredMode::T;
    cfg.nodes = NodeIds{ NodeId("node1"),
                         NodeId("node2") };
    cfg.rsync_extra_options = "--bwlimit=1000";
    cfg.object_path_depth = 3;

    std::stringstream ss;
    cfg.dump(ss);

    bpt::ptree pt;
    bpt::json_parser::read_json(ss,
                                pt);

    const BackupConfig cfg2(BackupConfig::from_ptree(pt));
    EXPECT_EQ(cfg.host, cfg2.host);
    EXPECT_EQ(cfg.clustered, cfg2.clustered);
    ASSERT_TRUE(static_cast<bool>(cfg2.nodes));
    EXPECT_EQ(*cfg.nodes, *cfg2.nodes);
    EXPECT_EQ(cfg.rsync_extra_options, cfg2.rsync_extra_options);
    EXPECT_EQ(cfg.object_path_depth, cfg2.object_path_depth);
    EXPECT_EQ(cfg.compress, cfg2.compress);
}

TEST_F(BackupConfigTest, documentation)
{
    std::stringstream ss;
    BackupConfig::print_configuration_documentation(ss);

    const std::string doc(ss.str());
    EXPECT_NE(std::string::npos, doc.find("source.host"));
    EXPECT_NE(std::string::npos, doc.find("ROUTEBACKUP_SNAPSHOT_ROOT"));
    EXPECT_NE(std::string::npos, doc.find("skip_verification"));
}

}

// Local Variables: **
// mode: c++ **
// End: **
