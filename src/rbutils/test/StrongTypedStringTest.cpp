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

#include "../BooleanEnum.h"
#include "../StrongTypedString.h"
#include "../TestBase.h"

#include <sstream>
#include <type_traits>
#include <unordered_set>

#include <boost/lexical_cast.hpp>

STRONG_TYPED_STRING(rbutilstest, StrongName);
STRONG_TYPED_STRING(rbutilstest, OtherName);

namespace rbutilstest
{

BOOLEAN_ENUM(Flavoured);

class StrongTypedStringTest
    : public TestBase
{};

TEST_F(StrongTypedStringTest, basics)
{
    const StrongName a("a");
    const StrongName b(std::string("b"));

    EXPECT_EQ("a", a.str());
    EXPECT_NE(a, b);
    EXPECT_TRUE(a < b);
    EXPECT_EQ(a, StrongName("a"));
    EXPECT_EQ("b", boost::lexical_cast<std::string>(b));

    static_assert(not std::is_convertible<std::string, StrongName>::value,
                  "no implicit conversion from std::string");
    static_assert(not std::is_convertible<OtherName, StrongName>::value,
                  "no conversion between strong strings");
}

TEST_F(StrongTypedStringTest, hashing)
{
    std::unordered_set<StrongName> set;
    EXPECT_TRUE(set.insert(StrongName("x")).second);
    EXPECT_FALSE(set.insert(StrongName("x")).second);
    EXPECT_TRUE(set.insert(StrongName("y")).second);
    EXPECT_EQ(2U, set.size());
}

TEST_F(StrongTypedStringTest, boolean_enum)
{
    EXPECT_TRUE(T(Flavoured::T));
    EXPECT_FALSE(F(Flavoured::T));
    EXPECT_TRUE(F(Flavoured::F));

    EXPECT_EQ(Flavoured::T, Flavoured_from_bool(true));
    EXPECT_EQ(Flavoured::F, Flavoured_from_bool(false));

    std::stringstream ss;
    ss << Flavoured::T << " " << Flavoured::F;
    EXPECT_EQ("Flavoured::T Flavoured::F", ss.str());
}

}

// Local Variables: **
// mode: c++ **
// End: **
