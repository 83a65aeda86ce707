#include <gtest/gtest.h>
#include <core/config.hpp>
#include <fstream>
#include <cstdlib>
#include "test_helpers.hpp"

namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* prev = std::getenv("MRILABS_HOME");
        if (prev) saved_ = prev;
        setenv("MRILABS_HOME", home.path().c_str(), 1);
    }
    void TearDown() override {
        if (saved_.empty()) {
            unsetenv("MRILABS_HOME");
        } else {
            setenv("MRILABS_HOME", saved_.c_str(), 1);
        }
    }

    fs::path write_config(const std::string& name, const std::string& text) {
        fs::path p = home / name;
        std::ofstream out(p);
        out << text;
        return p;
    }

    TempDir home;
    std::string saved_;
};

} // namespace

TEST_F(ConfigTest, HomeFromEnvironment) {
    EXPECT_EQ(get_global_config_dir(), home.path());
    EXPECT_EQ(get_global_config_path(), home / "config.yaml");
    EXPECT_FALSE(global_config_exists());
}

TEST_F(ConfigTest, MissingGlobalYieldsDefaults) {
    auto r = Config::load_global();
    ASSERT_TRUE(r.is_ok()) << r.error;
    const LabConfig& lab = r.value.lab();
    EXPECT_FALSE(lab.hardware_mock);
    EXPECT_EQ(fs::path(lab.data_dir), home / "data");
    EXPECT_EQ(fs::path(lab.logs_dir), home / "logs");
    EXPECT_EQ(lab.lock_timeout, 10);
    EXPECT_EQ(lab.tick_interval_ms, 500);
    EXPECT_EQ(lab.oscilloscope_buffer_size, 512);
    EXPECT_TRUE(lab.instruments.tcpip.empty());
    EXPECT_TRUE(lab.instruments.usbtmc);
}

TEST_F(ConfigTest, CreateDefaultThenLoad) {
    ASSERT_TRUE(create_default_global_config().is_ok());
    EXPECT_TRUE(global_config_exists());

    auto r = Config::load_global();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.data_dir(), home / "data");
    EXPECT_EQ(r.value.lab().instruments.timeout_ms, 2000);
}

TEST_F(ConfigTest, CreateDefaultKeepsExisting) {
    write_config("config.yaml", "hardware_mock: true\n");
    ASSERT_TRUE(create_default_global_config().is_ok());
    auto r = Config::load_global();
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.lab().hardware_mock);
}

TEST_F(ConfigTest, LoadCustomFile) {
    auto path = write_config("lab.yaml", R"(
hardware_mock: true
data_dir: /srv/lab/data
lock_timeout: 3
tick_interval_ms: 100
oscilloscope_buffer_size: 2048
instruments:
  tcpip: 192.168.1.40
  usbtmc: false
  timeout_ms: 500
)");
    auto r = Config::load_file(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    const LabConfig& lab = r.value.lab();
    EXPECT_TRUE(lab.hardware_mock);
    EXPECT_EQ(lab.data_dir, "/srv/lab/data");
    EXPECT_EQ(fs::path(lab.logs_dir), home / "logs");
    EXPECT_EQ(lab.lock_timeout, 3);
    EXPECT_EQ(lab.tick_interval_ms, 100);
    EXPECT_EQ(lab.oscilloscope_buffer_size, 2048);
    ASSERT_EQ(lab.instruments.tcpip.size(), 1u);
    EXPECT_EQ(lab.instruments.tcpip[0], "192.168.1.40");
    EXPECT_FALSE(lab.instruments.usbtmc);
    EXPECT_EQ(lab.instruments.timeout_ms, 500);
}

TEST_F(ConfigTest, TcpipList) {
    auto path = write_config("lab.yaml", "instruments:\n  tcpip: [a.local, \"b.local:5555\"]\n");
    auto r = Config::load_file(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.lab().instruments.tcpip,
              (std::vector<std::string>{"a.local", "b.local:5555"}));
}

TEST_F(ConfigTest, EmptyFileIsDefaults) {
    auto path = write_config("empty.yaml", "");
    auto r = Config::load_file(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.lab().lock_timeout, 10);
}

TEST_F(ConfigTest, Rejections) {
    EXPECT_TRUE(Config::load_file(home / "nope.yaml").is_err());

    auto seq = write_config("seq.yaml", "- 1\n- 2\n");
    auto r = Config::load_file(seq);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("not a mapping"), std::string::npos);

    auto zero = write_config("zero.yaml", "lock_timeout: 0\n");
    r = Config::load_file(zero);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "lock_timeout must be positive");

    auto bad = write_config("bad.yaml", "tick_interval_ms: [\n");
    r = Config::load_file(bad);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Failed to parse config"), std::string::npos);
}

TEST_F(ConfigTest, CommandLineMockWins) {
    auto path = write_config("lab.yaml", "hardware_mock: false\n");
    auto r = Config::load_file(path);
    ASSERT_TRUE(r.is_ok());
    Config config = r.value;
    config.set_hardware_mock(true);
    EXPECT_TRUE(config.lab().hardware_mock);
}

TEST(ConfigDefaults, RootedAtGivenHome) {
    Config c = Config::defaults("/tmp/labhome");
    EXPECT_EQ(c.data_dir(), fs::path("/tmp/labhome/data"));
    EXPECT_EQ(c.logs_dir(), fs::path("/tmp/labhome/logs"));
}

TEST(ConfigDefaults, MatchBuiltInConstants) {
    LabConfig lab;
    EXPECT_EQ(lab.lock_timeout, LOCK_TIMEOUT_SECS);
    EXPECT_EQ(lab.tick_interval_ms, TICK_INTERVAL_MS);
    EXPECT_EQ(lab.oscilloscope_buffer_size, OSCILLOSCOPE_BUFFER_SIZE);
    EXPECT_EQ(lab.instruments.timeout_ms, SCPI_TIMEOUT_MS);
}
