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

#ifndef ROUTEBACKUP_TYPES_H_
#define ROUTEBACKUP_TYPES_H_

#include <map>
#include <vector>

#include <rbutils/BooleanEnum.h>
#include <rbutils/StrongTypedString.h>

// A storage node of the source cluster. Node ids double as the host names
// used to reach the nodes.
STRONG_TYPED_STRING(routebackup, NodeId);

// Relative path of an object below a node's storage root, e.g.
// 3f/a2/07/c1/9e/3fa207c19e...
STRONG_TYPED_STRING(routebackup, ObjectPath);

namespace routebackup
{

BOOLEAN_ENUM(ClusteredMode);
BOOLEAN_ENUM(SkipVerification);
BOOLEAN_ENUM(TransportCompression);

using NodeIds = std::vector<NodeId>;
using ObjectPaths = std::vector<ObjectPath>;

// node -> objects to request from it
using NodeWorkLists = std::map<NodeId, ObjectPaths>;

}

#endif // !ROUTEBACKUP_TYPES_H_

// Local Variables: **
// mode: c++ **
// End: **
