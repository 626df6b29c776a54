#include "vmbench/orchestrator/port_pool.hpp"
#include <set>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "fakes.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;
using vmbench::orchestrator::DefaultPortKeys;
using vmbench::orchestrator::GeneratePortPool;
using vmbench::orchestrator::PortBlock;
using vmbench::orchestrator::SavePortPool;

TEST(PortPoolTest, DefaultKeys) {
    EXPECT_THAT(DefaultPortKeys(), ElementsAre("ssh", "vnc", "observation", "kernel"));
}

TEST(PortPoolTest, BlocksAreContiguousAndDisjoint) {
    auto pool = GeneratePortPool(60000, 3);
    ASSERT_EQ(pool.size(), 3u);

    EXPECT_EQ(pool[0].at("ssh"), 60000);
    EXPECT_EQ(pool[0].at("vnc"), 60001);
    EXPECT_EQ(pool[0].at("observation"), 60002);
    EXPECT_EQ(pool[0].at("kernel"), 60003);
    EXPECT_EQ(pool[2].at("ssh"), 60008);
    EXPECT_EQ(pool[2].at("kernel"), 60011);

    std::set<int> seen;
    for (const auto& block : pool) {
        for (const auto& entry : block) {
            EXPECT_TRUE(seen.insert(entry.second).second) << "port reused: " << entry.second;
        }
    }
    EXPECT_EQ(seen.size(), 12u);
}

TEST(PortPoolTest, CustomKeys) {
    auto pool = GeneratePortPool(5000, 2, {"ssh", "rdp"});
    ASSERT_EQ(pool.size(), 2u);
    EXPECT_EQ(pool[1], (PortBlock{{"rdp", 5003}, {"ssh", 5002}}));
}

TEST(PortPoolTest, AtLeastOneBlock) {
    EXPECT_EQ(GeneratePortPool(60000, 0).size(), 1u);
}

TEST(PortPoolTest, InvalidInput) {
    EXPECT_THROW(GeneratePortPool(60000, 1, {}), std::invalid_argument);
    EXPECT_THROW(GeneratePortPool(0, 1), std::invalid_argument);
    EXPECT_THROW(GeneratePortPool(65530, 2), std::invalid_argument);
    EXPECT_NO_THROW(GeneratePortPool(65532, 1));
}

TEST(PortPoolTest, SaveWritesJsonArray) {
    vmbench::testing::TempDir tmp;
    auto path = tmp.Path() / "results" / "port_pool.json";
    SavePortPool(GeneratePortPool(60000, 2), path);

    auto saved = nlohmann::json::parse(vmbench::testing::ReadFile(path));
    ASSERT_TRUE(saved.is_array());
    ASSERT_EQ(saved.size(), 2u);
    EXPECT_EQ(saved[1]["ssh"], 60004);
}

}  // namespace
