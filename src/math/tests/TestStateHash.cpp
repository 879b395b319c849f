/**
 * @file TestStateHash.cpp
 * @brief Unit tests for the FNV-1a state hasher.
 *
 * @version 0.1.0
 * @copyright MIT License
 */

#include <catch2/catch.hpp>

#include <rlog/math/StateHash.hpp>

using namespace rlog;

TEST_CASE("StateHash is deterministic", "[math][hash]")
{
    math::StateHash a;
    math::StateHash b;
    a.combine(core::u32{7}).hashString("Enabled");
    b.combine(core::u32{7}).hashString("Enabled");

    REQUIRE(math::StateHash::match(a.digest(), b.digest()));

    a.reset();
    REQUIRE(a.digest() == math::StateHash{}.digest());
}

TEST_CASE("StateHash separates string boundaries", "[math][hash]")
{
    math::StateHash split1;
    split1.hashString("ab").hashString("c");

    math::StateHash split2;
    split2.hashString("a").hashString("bc");

    REQUIRE(split1.digest() != split2.digest());
}
