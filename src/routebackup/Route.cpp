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

#include "Route.h"

#include <iostream>
#include <sstream>

#include <boost/algorithm/string.hpp>

namespace routebackup
{

namespace ba = boost::algorithm;

std::ostream&
operator<<(std::ostream& os,
           const Route& route)
{
    os << route.path << " ->";
    for (const auto& n : route.nodes)
    {
        os << " " << n;
    }
    return os;
}

bool
is_object_path(const std::string& p,
               unsigned depth)
{
    if (p.empty() or p.front() == '/' or p.back() == '/')
    {
        return false;
    }

    std::vector<std::string> components;
    ba::split(components,
              p,
              ba::is_any_of("/"));

    if (components.size() != depth)
    {
        return false;
    }

    for (const auto& c : components)
    {
        if (c.empty() or c == "." or c == "..")
        {
            return false;
        }
    }

    return true;
}

ObjectPath
make_object_path(const std::string& p,
                 unsigned depth)
{
    if (not is_object_path(p, depth))
    {
        std::stringstream ss;
        ss << "Invalid object path '" << p << "', expected a relative path of " <<
            depth << " components";
        throw RouteFormatException(ss.str());
    }

    return ObjectPath(p);
}

NodeId
make_node_id(const std::string& s)
{
    if (s.empty() or
        s.front() == '.' or
        s.front() == '-' or
        s.find('/') != std::string::npos)
    {
        throw RouteFormatException("Invalid node id",
                                   s.c_str());
    }

    return NodeId(s);
}

RouteReader::RouteReader(std::istream& is,
                         unsigned depth)
    : is_(is)
    , depth_(depth)
    , line_number_(0)
{}

boost::optional<Route>
RouteReader::next()
{
    std::string line;

    while (std::getline(is_, line))
    {
        ++line_number_;
        ba::trim(line);

        if (line.empty() or line.front() == '#')
        {
            continue;
        }

        std::vector<std::string> fields;
        ba::split(fields,
                  line,
                  ba::is_space(),
                  ba::token_compress_on);

        if (fields.size() < 2)
        {
            LOG_ERROR("line " << line_number_ << ": route without owning node: '" <<
                      line << "'");
            std::stringstream ss;
            ss << "Route without owning node on line " << line_number_;
            throw RouteFormatException(ss.str());
        }

        try
        {
            NodeIds nodes;
            nodes.reserve(fields.size() - 1);

            for (size_t i = 1; i < fields.size(); ++i)
            {
                nodes.emplace_back(make_node_id(fields[i]));
            }

            return Route(make_object_path(fields[0],
                                          depth_),
                         nodes);
        }
        catch (RouteFormatException& e)
        {
            LOG_ERROR("line " << line_number_ << ": " << e.what());
            std::stringstream ss;
            ss << "Malformed route on line " << line_number_ << ": " << e.what();
            throw RouteFormatException(ss.str());
        }
    }

    if (is_.bad())
    {
        LOG_ERROR("I/O error reading routes after line " << line_number_);
        throw RouteFormatException("I/O error reading routes");
    }

    return boost::none;
}

std::vector<Route>
RouteReader::read_all()
{
    std::vector<Route> routes;

    while (true)
    {
        boost::optional<Route> r(next());
        if (not r)
        {
            break;
        }
        routes.emplace_back(std::move(*r));
    }

    LOG_INFO("read " << routes.size() << " routes from " << line_number_ << " lines");
    return routes;
}

}

// Local Variables: **
// mode: c++ **
// End: **
