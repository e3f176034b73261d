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

#include "FakeRemoteExecutor.h"
#include "../RouteResolver.h"

#include <iterator>

#include <boost/filesystem/fstream.hpp>

#include <rbutils/TestBase.h>

namespace routebackuptest
{

namespace fs = boost::filesystem;

using namespace routebackup;

class RouteResolverTest
    : public rbutilstest::TestWithDir
{
public:
    RouteResolverTest()
        : TestWithDir("RouteResolverTest")
        , resolver_(executor_,
                    host_,
                    query_,
                    default_object_path_depth,
                    TransportCompression::T)
    {}

protected:
    FakeRemoteExecutor executor_;
    const NodeId host_ = NodeId("admin1");
    const std::string query_ = "objstore-admin routes";
    RouteResolver resolver_;

    fs::path
    dump_file() const
    {
        return getDir() / "routes.dump";
    }
};

TEST_F(RouteResolverTest, resolve)
{
    const std::string dump("a/b/c/d/e/1 node1\na/b/c/d/e/2 node1 node2\n");
    executor_.set_result(host_,
                         query_,
                         RemoteResult(dump, 0));

    const std::vector<Route> routes(resolver_.resolve(dump_file()));
    ASSERT_EQ(2U, routes.size());
    EXPECT_EQ(ObjectPath("a/b/c/d/e/2"), routes[1].path);
    EXPECT_EQ(2U, routes[1].nodes.size());

    const std::vector<RemoteInvocation> inv(executor_.invocations());
    ASSERT_EQ(1U, inv.size());
    EXPECT_EQ(host_, inv[0].host);
    EXPECT_EQ(query_, inv[0].command);
    EXPECT_EQ(TransportCompression::T, inv[0].compression);

    // the dump is kept for the rest of the run
    fs::ifstream ifs(dump_file());
    const std::string stored((std::istreambuf_iterator<char>(ifs)),
                             std::istreambuf_iterator<char>());
    EXPECT_EQ(dump, stored);
}

TEST_F(RouteResolverTest, no_routes)
{
    EXPECT_TRUE(resolver_.resolve(dump_file()).empty());
    EXPECT_TRUE(fs::exists(dump_file()));
}

TEST_F(RouteResolverTest, query_fails)
{
    executor_.set_result(host_,
                         query_,
                         RemoteResult("a/b/c/d/e/1 node1\n", 255));

    EXPECT_THROW(resolver_.resolve(dump_file()),
                 RouteQueryException);
}

TEST_F(RouteResolverTest, host_unreachable)
{
    executor_.set_unreachable(host_);

    EXPECT_THROW(resolver_.resolve(dump_file()),
                 RouteQueryException);
}

TEST_F(RouteResolverTest, malformed)
{
    executor_.set_result(host_,
                         query_,
                         RemoteResult("a/b/c/d/e/1 node1\nbogus\n", 0));

    EXPECT_THROW(resolver_.resolve(dump_file()),
                 RouteFormatException);
}

}

// Local Variables: **
// mode: c++ **
// End: **
