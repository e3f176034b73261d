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

#ifndef ROUTEBACKUP_ROUTE_H_
#define ROUTEBACKUP_ROUTE_H_

#include "Types.h"

#include <iosfwd>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include <rbutils/Exception.h>
#include <rbutils/Logging.h>

namespace routebackup
{

MAKE_EXCEPTION(RouteFormatException, rbutils::Exception);

// An object and the nodes that hold a copy of it at the time the routes were
// computed.
struct Route
{
    Route(const ObjectPath& p,
          const NodeIds& n)
        : path(p)
        , nodes(n)
    {}

    ObjectPath path;
    NodeIds nodes;

    bool
    operator==(const Route& other) const
    {
        return path == other.path and nodes == other.nodes;
    }
};

std::ostream&
operator<<(std::ostream& os,
           const Route& route);

// Default number of path components of an object: five levels of hash prefix
// directories and the object itself.
const unsigned default_object_path_depth = 6;

// Throw RouteFormatException unless p is a relative path of exactly depth
// components, none of them empty, "." or "..".
ObjectPath
make_object_path(const std::string& p,
                 unsigned depth);

bool
is_object_path(const std::string& p,
               unsigned depth);

// Node ids end up as directory and file names and as ssh host arguments, so
// they are restricted to non-empty strings without '/' that start with neither '.' nor '-'.
NodeId
make_node_id(const std::string& s);

// Decodes the route dump produced by the cluster: one route per line, the
// object path followed by one or more whitespace separated owning nodes.
// Blank lines and lines starting with '#' are skipped.
class RouteReader
{
public:
    RouteReader(std::istream& is,
                unsigned depth = default_object_path_depth);

    ~RouteReader() = default;

    RouteReader(const RouteReader&) = delete;

    RouteReader&
    operator=(const RouteReader&) = delete;

    boost::optional<Route>
    next();

    std::vector<Route>
    read_all();

    size_t
    line_number() const
    {
        return line_number_;
    }

private:
    DECLARE_LOGGER("RouteReader");

    std::istream& is_;
    const unsigned depth_;
    size_t line_number_;
};

}

#endif // !ROUTEBACKUP_ROUTE_H_

// Local Variables: **
// mode: c++ **
// End: **
