#include <gtest/gtest.h>
#include <cli/commands/command_helpers.hpp>
#include <ctime>
#include "test_helpers.hpp"

using namespace std::chrono_literals;

TEST(SplitArgs, WhitespaceAndQuotes) {
    EXPECT_EQ(split_args("  DG4202_TOGGLE   +30\tchannel=1 "),
              (std::vector<std::string>{"DG4202_TOGGLE", "+30", "channel=1"}));
    EXPECT_EQ(split_args("\"Toggle Output\" now"),
              (std::vector<std::string>{"Toggle Output", "now"}));
    EXPECT_EQ(split_args("waveform_type=\"SQU\"", true),
              (std::vector<std::string>{"waveform_type=\"SQU\""}));
    EXPECT_EQ(split_args("name=\"\""), (std::vector<std::string>{"name="}));
    EXPECT_TRUE(split_args("   ").empty());
}

TEST(ParseCliValue, Scalars) {
    EXPECT_EQ(parse_cli_value("true"), true);
    EXPECT_EQ(parse_cli_value("ON"), true);
    EXPECT_EQ(parse_cli_value("off"), false);
    EXPECT_TRUE(parse_cli_value("none").is_null());
    EXPECT_TRUE(parse_cli_value("2").is_number_integer());
    EXPECT_EQ(parse_cli_value("-4"), -4);
    EXPECT_TRUE(parse_cli_value("2.5").is_number_float());
    EXPECT_DOUBLE_EQ(parse_cli_value("1e3").get<double>(), 1000.0);
    EXPECT_EQ(parse_cli_value("SQUARE"), "SQUARE");
    EXPECT_EQ(parse_cli_value("\"2\""), "2");
    EXPECT_EQ(parse_cli_value(""), "");
}

TEST(ParseKwargs, KeyValuePairs) {
    auto r = parse_kwargs({"channel=1", "status=on", "waveform_type=\"ramp\""});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value["channel"], 1);
    EXPECT_EQ(r.value["status"], true);
    EXPECT_EQ(r.value["waveform_type"], "ramp");

    auto empty = parse_kwargs({});
    ASSERT_TRUE(empty.is_ok());
    EXPECT_TRUE(empty.value.is_object());
    EXPECT_TRUE(empty.value.empty());
}

TEST(ParseKwargs, RejectsBareWords) {
    auto r = parse_kwargs({"channel=1", "status"});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "Expected key=value, got 'status'");
    EXPECT_TRUE(parse_kwargs({"=1"}).is_err());
}

TEST(ParseWhen, RelativeAndNow) {
    TimePoint now = Clock::now();
    EXPECT_EQ(parse_when("now", now), now);
    EXPECT_EQ(parse_when("+30", now), now + 30s);
    EXPECT_EQ(parse_when("+0.5", now), now + 500ms);
    EXPECT_FALSE(parse_when("+-5", now).has_value());
    EXPECT_FALSE(parse_when("+soon", now).has_value());
    EXPECT_FALSE(parse_when("", now).has_value());
    EXPECT_FALSE(parse_when("tomorrow", now).has_value());
}

TEST(ParseWhen, IsoTimestamp) {
    TimePoint expected;
    ASSERT_TRUE(parse_iso_ms("2026-03-01T09:15:00.250", expected));
    auto when = parse_when("2026-03-01T09:15:00.250");
    ASSERT_TRUE(when.has_value());
    EXPECT_EQ(*when, expected);
    EXPECT_FALSE(parse_when("2026-13-01Tnonsense").has_value());
}

TEST(ParseWhen, ClockTimeIsNextOccurrence) {
    // Noon today, local time
    std::time_t t = std::time(nullptr);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    tm_buf.tm_hour = 12;
    tm_buf.tm_min = 0;
    tm_buf.tm_sec = 0;
    tm_buf.tm_isdst = -1;
    TimePoint noon = Clock::from_time_t(std::mktime(&tm_buf));

    auto later_today = parse_when("13:30", noon);
    ASSERT_TRUE(later_today.has_value());
    EXPECT_EQ(*later_today - noon, 90min);

    auto with_seconds = parse_when("12:00:45", noon);
    ASSERT_TRUE(with_seconds.has_value());
    EXPECT_EQ(*with_seconds - noon, 45s);

    auto tomorrow = parse_when("11:00", noon);
    ASSERT_TRUE(tomorrow.has_value());
    EXPECT_GT(*tomorrow, noon);
    EXPECT_GE(*tomorrow - noon, 22h);
    EXPECT_LE(*tomorrow - noon, 24h);

    EXPECT_FALSE(parse_when("25:00", noon).has_value());
    EXPECT_FALSE(parse_when("12:61", noon).has_value());
    EXPECT_FALSE(parse_when("12", noon).has_value());
}

// ── Completion ───────────────────────────────────────────────

namespace {

class CompletionTest : public ::testing::Test {
protected:
    void SetUp() override {
        cli.config = Config::defaults(dir.path());
        cli.config.set_hardware_mock(true);
        auto noop = [](BaseCLI&, const std::string&) {};
        cli.add_command("schedule", noop, "");
        cli.add_command("status", noop, "");
        cli.add_command("kill", noop, "");
    }
    void TearDown() override {
        cli.clear_service();
    }

    TempDir dir;
    BaseCLI cli;
};

} // namespace

TEST_F(CompletionTest, CommandNames) {
    EXPECT_EQ(cli.complete("", "s"), (std::vector<std::string>{"schedule", "status"}));
    EXPECT_EQ(cli.complete("", "ki"), (std::vector<std::string>{"kill"}));
    EXPECT_TRUE(cli.complete("", "x").empty());
}

TEST_F(CompletionTest, ArgumentsNeedService) {
    EXPECT_TRUE(cli.complete("schedule ", "").empty());
    cli.init_service();
    EXPECT_EQ(cli.complete("schedule ", "edux").size(), 1u);
    EXPECT_EQ(cli.complete("schedule ", "dg4202_t"),
              (std::vector<std::string>{"DG4202_TOGGLE"}));
    EXPECT_EQ(cli.complete("kill ", ""),
              (std::vector<std::string>{DG4202_IDN, EDUX1002A_IDN}));
}

TEST_F(CompletionTest, ParameterNamesAfterTime) {
    cli.init_service();
    EXPECT_TRUE(cli.complete("schedule DG4202_TOGGLE ", "").empty());
    EXPECT_EQ(cli.complete("schedule DG4202_TOGGLE +5 ", ""),
              (std::vector<std::string>{"channel=", "status="}));
    EXPECT_EQ(cli.complete("schedule DG4202_TOGGLE +5 channel=1 ", "st"),
              (std::vector<std::string>{"status="}));
}

TEST_F(CompletionTest, PendingJobIds) {
    cli.init_service();
    cli.add_command("cancel", [](BaseCLI&, const std::string&) {}, "");
    auto id = cli.service->schedule("EDUX1002A_AUTO", Clock::now() + std::chrono::hours(1),
                                    nlohmann::json::object());
    ASSERT_TRUE(id.is_ok());
    EXPECT_EQ(cli.complete("cancel ", ""), (std::vector<std::string>{id.value}));
}
