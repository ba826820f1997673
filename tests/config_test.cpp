#include <cstdio>
#include <string>
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <unistd.h>

#include <gtest/gtest.h>

#include "config.h"
#include "constants.h"

namespace
{

std::atomic<bool> g_force_fread_error{false};
std::atomic<bool> g_injected_fread_error{false};

}    // namespace

extern "C" std::size_t __real_fread(void* ptr, std::size_t size, std::size_t count, FILE* stream);
extern "C" int __real_ferror(FILE* stream);

extern "C" std::size_t __wrap_fread(void* ptr, std::size_t size, std::size_t count, FILE* stream)
{
    if (g_force_fread_error.exchange(false))
    {
        g_injected_fread_error.store(true);
        errno = EIO;
        return 0;
    }
    return __real_fread(ptr, size, count, stream);
}

extern "C" int __wrap_ferror(FILE* stream)
{
    if (g_injected_fread_error.exchange(false))
    {
        return 1;
    }
    return __real_ferror(stream);
}

class config_test : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tmp_file_ = std::string("test_config_") + info->test_suite_name() + "_" + info->name() + "_" + std::to_string(::getpid()) + ".json";
    }

    void TearDown() override
    {
        std::remove(tmp_file_.c_str());
        unsetenv("LOG_LEVEL");
        unsetenv("XRAY_LOCATION_ASSET");
    }

    void write_config_file(const std::string& content)
    {
        std::ofstream out(tmp_file_);
        out << content;
        out.close();
    }

    const std::string& tmp_file() const { return tmp_file_; }

   private:
    std::string tmp_file_;
};

TEST_F(config_test, DefaultConfigValid)
{
    const auto json = xnode::dump_default_config();
    ASSERT_FALSE(json.empty());
    EXPECT_NE(json.find("\"log\""), std::string::npos);
    EXPECT_NE(json.find("\"api_port\":61012"), std::string::npos);

    write_config_file(json);
    const auto cfg = xnode::parse_config(tmp_file());
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->log.level, "info");
    EXPECT_EQ(cfg->log.file, "xnode.log");
    EXPECT_EQ(cfg->engine.api_port, xnode::constants::engine::kDefaultApiPort);
    EXPECT_TRUE(cfg->engine.asset_dir.empty());
    EXPECT_TRUE(cfg->startup.file.empty());
}

TEST_F(config_test, ParseValues)
{
    write_config_file(R"({
        "log": {"level": "debug", "file": "/var/log/xnode.log"},
        "engine": {"api_port": 10085, "asset_dir": "/opt/assets"},
        "startup": {"file": "/etc/xnode/start.json"}
    })");

    const auto cfg = xnode::parse_config_with_error(tmp_file());
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->log.level, "debug");
    EXPECT_EQ(cfg->log.file, "/var/log/xnode.log");
    EXPECT_EQ(cfg->engine.api_port, 10085);
    EXPECT_EQ(cfg->engine.asset_dir, "/opt/assets");
    EXPECT_EQ(cfg->startup.file, "/etc/xnode/start.json");
}

TEST_F(config_test, PartialConfigKeepsDefaults)
{
    const auto cfg = xnode::parse_config_text(R"({"engine": {"asset_dir": "/a"}})");
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->engine.api_port, 61012);
    EXPECT_EQ(cfg->log.level, "info");
}

TEST_F(config_test, MissingFile)
{
    const auto cfg = xnode::parse_config_with_error("definitely_missing_xnode_config.json");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().path, "/");
    EXPECT_NE(cfg.error().reason.find("open file failed"), std::string::npos);
    EXPECT_FALSE(xnode::parse_config("definitely_missing_xnode_config.json").has_value());
}

TEST_F(config_test, ReadFailure)
{
    write_config_file("{}");
    g_force_fread_error.store(true);
    const auto cfg = xnode::parse_config_with_error(tmp_file());
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().reason, "read file failed");
}

TEST_F(config_test, InvalidJson)
{
    const auto cfg = xnode::parse_config_text("{\"log\": ");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().path, "/");
    EXPECT_EQ(cfg.error().reason.rfind("invalid json at offset", 0), 0U);

    const auto array = xnode::parse_config_text("[]");
    ASSERT_FALSE(array.has_value());
    EXPECT_EQ(array.error().reason, "root must be an object");
}

TEST_F(config_test, TypeMismatchReportsPath)
{
    const auto cfg = xnode::parse_config_text(R"({"engine": {"api_port": "61012"}})");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().path, "/engine/api_port");
    EXPECT_EQ(cfg.error().reason, "type mismatch");

    const auto overflow = xnode::parse_config_text(R"({"engine": {"api_port": 70000}})");
    ASSERT_FALSE(overflow.has_value());
    EXPECT_EQ(overflow.error().path, "/engine/api_port");
}

TEST_F(config_test, ValidationErrors)
{
    const auto level = xnode::parse_config_text(R"({"log": {"level": "loud"}})");
    ASSERT_FALSE(level.has_value());
    EXPECT_EQ(level.error().path, "/log/level");

    const auto file = xnode::parse_config_text(R"({"log": {"file": ""}})");
    ASSERT_FALSE(file.has_value());
    EXPECT_EQ(file.error().path, "/log/file");

    const auto port = xnode::parse_config_text(R"({"engine": {"api_port": 0}})");
    ASSERT_FALSE(port.has_value());
    EXPECT_EQ(port.error().path, "/engine/api_port");
}

TEST_F(config_test, EnvOverrides)
{
    xnode::config cfg;
    setenv("LOG_LEVEL", "trace", 1);
    setenv("XRAY_LOCATION_ASSET", "/srv/geo", 1);
    xnode::apply_env_overrides(cfg);
    EXPECT_EQ(cfg.log.level, "trace");
    EXPECT_EQ(cfg.engine.asset_dir, "/srv/geo");
}

TEST_F(config_test, EnvOverridesIgnoreUnusableValues)
{
    xnode::config cfg;
    cfg.engine.asset_dir = "/keep";
    setenv("LOG_LEVEL", "verbose", 1);
    setenv("XRAY_LOCATION_ASSET", "", 1);
    xnode::apply_env_overrides(cfg);
    EXPECT_EQ(cfg.log.level, "info");
    EXPECT_EQ(cfg.engine.asset_dir, "/keep");
}

TEST_F(config_test, ReadTextFile)
{
    write_config_file("payload body");
    const auto text = xnode::read_text_file(tmp_file());
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "payload body");
}
