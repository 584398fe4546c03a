// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <hydro/state/map.hpp>
#include <hydro/state/storage.hpp>
#include <hydro/state/storage_variable.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

using namespace hydro;

struct StorageTest : public ::testing::Test
{
    Storage storage;
};

TEST_F(StorageTest, variable)
{
    StorageVariable<uint64_t> var{storage};
    ASSERT_FALSE(var.load_checked().has_value());
    EXPECT_EQ(var.load(), 0);
    var.store(5);
    ASSERT_TRUE(var.load_checked().has_value());
    EXPECT_EQ(var.load(), 5);
    var.store(2000);
    EXPECT_EQ(var.load(), 2000);
    var.clear();
    EXPECT_FALSE(var.load_checked().has_value());
}

TEST_F(StorageTest, variable_pop_reject)
{
    StorageVariable<uint64_t> var{storage};
    var.store(1);

    storage.push();
    var.store(2);
    EXPECT_EQ(var.load(), 2);
    storage.pop_reject();
    EXPECT_EQ(var.load(), 1);

    storage.push();
    var.clear();
    storage.pop_accept();
    EXPECT_FALSE(var.load_checked().has_value());
}

TEST_F(StorageTest, map)
{
    Map<uint64_t, std::string> map{storage};
    EXPECT_FALSE(map.contains(1));
    EXPECT_EQ(map.load(1), "");

    map.store(1, "one");
    map.store(3, "three");
    map.store(2, "two");
    EXPECT_EQ(map.load(2), "two");
    EXPECT_EQ(map.keys(), (std::vector<uint64_t>{1, 2, 3}));

    map.clear(2);
    EXPECT_FALSE(map.contains(2));
    EXPECT_FALSE(map.load_checked(2).has_value());
    EXPECT_EQ(map.keys(), (std::vector<uint64_t>{1, 3}));
}

TEST_F(StorageTest, map_range)
{
    using Key = std::tuple<uint64_t, uint64_t>;
    Map<Key, uint64_t> map{storage};
    map.store({0, 1}, 10);
    map.store({1, 0}, 20);
    map.store({1, 5}, 25);
    map.store({1, 9}, 29);
    map.store({2, 0}, 30);

    auto const res = map.range({1, 0}, {1, UINT64_MAX});
    ASSERT_EQ(res.size(), 3);
    EXPECT_EQ(res[0].second, 20);
    EXPECT_EQ(res[1].second, 25);
    EXPECT_EQ(res[2].second, 29);

    map.clear({1, 0});
    auto const first = map.first_in({1, 0}, {1, UINT64_MAX});
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->first, (Key{1, 5}));

    EXPECT_FALSE(map.first_in({3, 0}, {3, UINT64_MAX}).has_value());
}

TEST_F(StorageTest, map_range_window)
{
    Map<uint64_t, uint64_t> map{storage};
    for (uint64_t i = 0; i < 6; ++i) {
        map.store(i, i * 10);
    }

    storage.push();
    map.clear(1);

    // cleared keys are not counted
    auto const res = map.range(0, UINT64_MAX, 1, 2);
    ASSERT_EQ(res.size(), 2);
    EXPECT_EQ(res[0].first, 2);
    EXPECT_EQ(res[1].first, 3);

    EXPECT_EQ(map.range(0, 3, 2, 10).size(), 1);
    EXPECT_TRUE(map.range(0, UINT64_MAX, 5, 2).empty());
    EXPECT_TRUE(map.range(0, UINT64_MAX, 0, 0).empty());
    storage.pop_reject();

    EXPECT_EQ(map.range(0, UINT64_MAX, 1, 1)[0].first, 1);
}

TEST_F(StorageTest, map_nested_versions)
{
    Map<uint64_t, uint64_t> map{storage};
    map.store(1, 100);

    storage.push();
    map.store(1, 101);
    map.store(2, 200);

    storage.push();
    map.store(1, 102);
    map.clear(2);
    map.store(3, 300);
    storage.pop_reject();

    EXPECT_EQ(map.load(1), 101);
    EXPECT_EQ(map.load(2), 200);
    EXPECT_FALSE(map.contains(3));

    storage.push();
    map.store(3, 301);
    map.clear(1);
    storage.pop_accept();

    EXPECT_FALSE(map.contains(1));
    EXPECT_EQ(map.load(3), 301);

    storage.pop_reject();

    EXPECT_EQ(map.load(1), 100);
    EXPECT_FALSE(map.contains(2));
    EXPECT_FALSE(map.contains(3));
    EXPECT_EQ(map.keys(), (std::vector<uint64_t>{1}));
}

TEST_F(StorageTest, map_accept_into_committed)
{
    Map<uint64_t, uint64_t> map{storage};

    storage.push();
    map.store(7, 70);
    storage.push();
    map.store(8, 80);
    storage.pop_accept();
    storage.pop_accept();

    EXPECT_EQ(storage.version(), 0);
    EXPECT_EQ(map.load(7), 70);
    EXPECT_EQ(map.load(8), 80);

    storage.push();
    map.clear(7);
    storage.pop_accept();
    EXPECT_EQ(map.keys(), (std::vector<uint64_t>{8}));
}
