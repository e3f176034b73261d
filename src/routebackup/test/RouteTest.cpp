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

#include "../Route.h"

#include <sstream>

#include <rbutils/TestBase.h>

namespace routebackuptest
{

using namespace routebackup;

class RouteTest
    : public rbutilstest::TestBase
{};

TEST_F(RouteTest, object_paths)
{
    EXPECT_TRUE(is_object_path("a/b/c/d/e/1", 6));
    EXPECT_TRUE(is_object_path("3f/a2/07/c1/9e/3fa207c19e.data", 6));
    EXPECT_TRUE(is_object_path("a/b", 2));

    EXPECT_FALSE(is_object_path("", 6));
    EXPECT_FALSE(is_object_path("a/b/c/d/e", 6));
    EXPECT_FALSE(is_object_path("a/b/c/d/e/f/g", 6));
    EXPECT_FALSE(is_object_path("/a/b/c/d/e", 6));
    EXPECT_FALSE(is_object_path("a/b/c/d/e/", 6));
    EXPECT_FALSE(is_object_path("a//c/d/e/1", 6));
    EXPECT_FALSE(is_object_path("a/../c/d/e/1", 6));
    EXPECT_FALSE(is_object_path("a/./c/d/e/1", 6));

    EXPECT_EQ(ObjectPath("a/b/c/d/e/1"), make_object_path("a/b/c/d/e/1", 6));
    EXPECT_THROW(make_object_path("a/b/c", 6),
                 RouteFormatException);
}

TEST_F(RouteTest, node_ids)
{
    EXPECT_EQ(NodeId("node1"), make_node_id("node1"));
    EXPECT_EQ(NodeId("node-1.example.com"), make_node_id("node-1.example.com"));

    EXPECT_THROW(make_node_id(""), RouteFormatException);
    EXPECT_THROW(make_node_id(".hidden"), RouteFormatException);
    EXPECT_THROW(make_node_id(".."), RouteFormatException);
    EXPECT_THROW(make_node_id("a/b"), RouteFormatException);
    // would be taken for an ssh option
    EXPECT_THROW(make_node_id("-oProxyCommand=reboot"), RouteFormatException);
}

TEST_F(RouteTest, read_routes)
{
    std::stringstream ss;
    ss << "# routes of the cluster" << std::endl <<
        "a/b/c/d/e/1 node1" << std::endl <<
        std::endl <<
        "   a/b/c/d/e/2\tnode1   node2  " << std::endl <<
        "a/b/c/d/e/3 node2";

    RouteReader reader(ss);
    const std::vector<Route> routes(reader.read_all());

    ASSERT_EQ(3U, routes.size());

    EXPECT_EQ(Route(ObjectPath("a/b/c/d/e/1"),
                    NodeIds{ NodeId("node1") }),
              routes[0]);
    EXPECT_EQ(Route(ObjectPath("a/b/c/d/e/2"),
                    NodeIds{ NodeId("node1"), NodeId("node2") }),
              routes[1]);
    EXPECT_EQ(Route(ObjectPath("a/b/c/d/e/3"),
                    NodeIds{ NodeId("node2") }),
              routes[2]);

    EXPECT_EQ(5U, reader.line_number());
    EXPECT_FALSE(reader.next());
}

TEST_F(RouteTest, empty_input)
{
    std::stringstream ss("\n# nothing here\n\n");
    RouteReader reader(ss);
    EXPECT_TRUE(reader.read_all().empty());
}

TEST_F(RouteTest, route_without_node)
{
    std::stringstream ss("a/b/c/d/e/1 node1\na/b/c/d/e/2\n");
    RouteReader reader(ss);

    EXPECT_TRUE(static_cast<bool>(reader.next()));

    try
    {
        reader.next();
        FAIL() << "malformed route was accepted";
    }
    catch (RouteFormatException& e)
    {
        EXPECT_NE(std::string::npos,
                  std::string(e.what()).find("line 2"));
    }
}

TEST_F(RouteTest, malformed_routes)
{
    const std::vector<std::string> bad{ "a/b/c node1",
                                        "/a/b/c/d/e/1 node1",
                                        "a/b/c/d/e/1 ../node1",
                                        "a/b/c/d/e/1 node1 dir/node2",
                                        "a/b/c/d/e/1 -oProxyCommand=reboot" };

    for (const auto& b : bad)
    {
        std::stringstream ss(b);
        RouteReader reader(ss);
        EXPECT_THROW(reader.read_all(),
                     RouteFormatException) << b;
    }
}

TEST_F(RouteTest, other_depth)
{
    std::stringstream ss("ab/cdef node1\n");
    RouteReader reader(ss, 2);

    const std::vector<Route> routes(reader.read_all());
    ASSERT_EQ(1U, routes.size());
    EXPECT_EQ(ObjectPath("ab/cdef"), routes[0].path);
}

}

// Local Variables: **
// mode: c++ **
// End: **
