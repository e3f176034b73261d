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

#include "../SnapshotLayout.h"

#include <rbutils/FileUtils.h>
#include <rbutils/TestBase.h>

namespace routebackuptest
{

namespace fs = boost::filesystem;

using namespace routebackup;

class SnapshotLayoutTest
    : public rbutilstest::TestWithDir
{
public:
    SnapshotLayoutTest()
        : TestWithDir("SnapshotLayoutTest")
        , layout_(directory_ / "snapshots")
    {}

protected:
    const NodeId node1 = NodeId("node1");
    const NodeId node2 = NodeId("node2");

    SnapshotLayout layout_;
};

TEST_F(SnapshotLayoutTest, paths)
{
    EXPECT_EQ(getDir() / "snapshots" / "current", layout_.current_link());
    EXPECT_EQ(fs::path("/s/x/storage"),
              SnapshotLayout::storage_directory("/s/x"));
    EXPECT_EQ(fs::path("/s/x/storage/node1"),
              SnapshotLayout::node_directory("/s/x", node1));

    const std::string ts(SnapshotLayout::timestamp_name());
    EXPECT_EQ(15U, ts.size()) << ts;
    EXPECT_EQ('T', ts[8]) << ts;
}

TEST_F(SnapshotLayoutTest, create)
{
    EXPECT_FALSE(layout_.current_snapshot());

    const fs::path s(layout_.create_snapshot("20240101T000000"));
    EXPECT_EQ(layout_.root() / "20240101T000000", s);
    EXPECT_TRUE(fs::is_directory(SnapshotLayout::storage_directory(s)));

    EXPECT_THROW(layout_.create_snapshot("20240101T000000"),
                 SnapshotLayoutException);
    EXPECT_THROW(layout_.create_snapshot("current"),
                 SnapshotLayoutException);
    EXPECT_THROW(layout_.create_snapshot("a/b"),
                 SnapshotLayoutException);
    EXPECT_THROW(layout_.create_snapshot(""),
                 SnapshotLayoutException);

    // creating does not make it current
    EXPECT_FALSE(layout_.current_snapshot());
}

TEST_F(SnapshotLayoutTest, promote)
{
    const fs::path s1(layout_.create_snapshot("1"));
    layout_.promote(s1);

    ASSERT_TRUE(static_cast<bool>(layout_.current_snapshot()));
    EXPECT_TRUE(fs::equivalent(s1, *layout_.current_snapshot()));
    EXPECT_EQ(fs::path("1"), fs::read_symlink(layout_.current_link()));

    const fs::path s2(layout_.create_snapshot("2"));
    layout_.promote(s2);
    EXPECT_TRUE(fs::equivalent(s2, *layout_.current_snapshot()));

    EXPECT_THROW(layout_.promote(getDir()),
                 SnapshotLayoutException);
    EXPECT_THROW(layout_.promote(layout_.root() / "3"),
                 SnapshotLayoutException);
}

TEST_F(SnapshotLayoutTest, baseline)
{
    EXPECT_FALSE(layout_.baseline_for(node1));

    const fs::path s(layout_.create_snapshot("1"));
    fs::create_directories(SnapshotLayout::node_directory(s, node1) / "a");
    fs::create_directories(SnapshotLayout::node_directory(s, node2));

    // not current yet
    EXPECT_FALSE(layout_.baseline_for(node1));

    layout_.promote(s);

    const auto b1(layout_.baseline_for(node1));
    ASSERT_TRUE(static_cast<bool>(b1));
    EXPECT_TRUE(fs::equivalent(SnapshotLayout::node_directory(s, node1), *b1));

    // empty
    EXPECT_FALSE(layout_.baseline_for(node2));
    // missing
    EXPECT_FALSE(layout_.baseline_for(NodeId("node3")));
}

TEST_F(SnapshotLayoutTest, broken_current)
{
    fs::create_directories(layout_.root());

    fs::create_symlink("gone", layout_.current_link());
    EXPECT_FALSE(layout_.current_snapshot());

    fs::remove(layout_.current_link());
    fs::create_directories(layout_.current_link());
    EXPECT_THROW(layout_.current_snapshot(),
                 SnapshotLayoutException);
}

}

// Local Variables: **
// mode: c++ **
// End: **
