/**
 * @file server_config_test.cpp
 * @brief Unit tests for startup configuration.
 */

#include "include/server_config.hpp"

#include <gtest/gtest.h>

#include <map>
#include <optional>
#include <string>

#include "tests/support/scratch_dir.hpp"

using spindle::CopyOptions;
using spindle::EnvLookup;
using spindle::load_server_config;
using spindle::testing::ScratchDir;

namespace {

EnvLookup fake_env(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](std::string_view name) -> std::optional<std::string> {
        auto it = vars.find(std::string(name));
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

}  // namespace

/** @test Single-directory mode needs no environment. */
TEST(ServerConfig, SingleDirectory) {
    auto config = load_server_config(true, CopyOptions{}, fake_env({}));
    ASSERT_TRUE(config) << config.error();
    ASSERT_EQ(config->targets.size(), 1u);
    EXPECT_EQ(config->targets[0].route, "/persistent-storage");
    EXPECT_EQ(config->port, 5555);
}

/** @test Both directories present gives three routes. */
TEST(ServerConfig, DualDirectory) {
    ScratchDir persistent;
    ScratchDir ephemeral;
    auto config = load_server_config(false,
                                     CopyOptions{1, true},
                                     fake_env({{"BM_PERSISTENT_DIR", persistent.path().string()},
                                               {"BM_EPHEMERAL_DIR", ephemeral.path().string()}}));
    ASSERT_TRUE(config) << config.error();
    ASSERT_EQ(config->targets.size(), 3u);
    EXPECT_EQ(config->targets[1].route, "/persistent-disk");
    EXPECT_EQ(config->targets[1].directory, persistent.path());
    EXPECT_EQ(config->targets[2].route, "/ephemeral-disk");
    EXPECT_EQ(config->targets[2].directory, ephemeral.path());
    EXPECT_EQ(config->copy.concurrency, 1u);
    EXPECT_TRUE(config->copy.abort_on_cleanup_failure);
}

/** @test A missing variable is named in the error. */
TEST(ServerConfig, MissingVariable) {
    ScratchDir persistent;
    auto config = load_server_config(
        false, CopyOptions{}, fake_env({{"BM_PERSISTENT_DIR", persistent.path().string()}}));
    ASSERT_FALSE(config);
    EXPECT_NE(config.error().find("BM_EPHEMERAL_DIR"), std::string::npos);
}

/** @test An empty variable counts as unset. */
TEST(ServerConfig, EmptyVariable) {
    ScratchDir ephemeral;
    auto config = load_server_config(false,
                                     CopyOptions{},
                                     fake_env({{"BM_PERSISTENT_DIR", ""},
                                               {"BM_EPHEMERAL_DIR", ephemeral.path().string()}}));
    ASSERT_FALSE(config);
    EXPECT_NE(config.error().find("BM_PERSISTENT_DIR"), std::string::npos);
}

/** @test A variable naming something other than a directory is rejected. */
TEST(ServerConfig, NotADirectory) {
    ScratchDir persistent;
    auto config = load_server_config(
        false,
        CopyOptions{},
        fake_env({{"BM_PERSISTENT_DIR", persistent.path().string()},
                  {"BM_EPHEMERAL_DIR", (persistent.path() / "missing").string()}}));
    ASSERT_FALSE(config);
    EXPECT_NE(config.error().find("not an existing directory"), std::string::npos);
}
