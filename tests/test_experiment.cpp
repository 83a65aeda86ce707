#include <gtest/gtest.h>
#include <tasks/experiment.hpp>
#include <fstream>
#include "test_helpers.hpp"

static const char* kGoodExperiment = R"(
experiment:
  name: Sweep check
  steps:
    - task: DG4202_SET_WAVEFORM
      description: Square on CH1
      parameters:
        channel: 1
        send_on: yes
        waveform_type: SQUARE
        amplitude: 2
        frequency: 1000.5
        offset: 0
    - task: dg4202_toggle
      delay: 5
      parameters:
        channel: 1
        status: off
    - task: Press Auto
      at_time: 2
)";

TEST(Experiment, ParsesStepsAndScalars) {
    auto r = parse_experiment(kGoodExperiment);
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& exp = r.value;
    EXPECT_EQ(exp.name, "Sweep check");
    ASSERT_EQ(exp.steps.size(), 3u);

    const auto& p = exp.steps[0].parameters;
    EXPECT_EQ(exp.steps[0].description, "Square on CH1");
    EXPECT_TRUE(p["channel"].is_number_integer());
    EXPECT_EQ(p["send_on"], true);
    EXPECT_EQ(p["waveform_type"], "SQUARE");
    EXPECT_TRUE(p["frequency"].is_number_float());

    EXPECT_DOUBLE_EQ(exp.steps[1].wait, 5.0);
    EXPECT_EQ(exp.steps[1].parameters["status"], false);
    ASSERT_TRUE(exp.steps[2].at_time.has_value());
    EXPECT_DOUBLE_EQ(*exp.steps[2].at_time, 2.0);
    EXPECT_TRUE(exp.steps[2].parameters.empty());
}

TEST(Experiment, QuotedScalarsStayStrings) {
    auto r = parse_experiment(R"(
experiment:
  steps:
    - task: DG4202_TOGGLE
      parameters: {channel: "1", status: "true"}
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.name, "Unnamed Experiment");
    EXPECT_EQ(r.value.steps[0].parameters["channel"], "1");
    EXPECT_EQ(r.value.steps[0].parameters["status"], "true");
}

TEST(Experiment, StructuralErrors) {
    EXPECT_TRUE(parse_experiment("experiment: [unclosed").is_err());
    EXPECT_TRUE(parse_experiment("steps: []").is_err());
    EXPECT_TRUE(parse_experiment("experiment:\n  steps: 3\n").is_err());
    EXPECT_TRUE(parse_experiment("experiment:\n  steps:\n    - description: no task\n").is_err());
    EXPECT_TRUE(parse_experiment("experiment:\n  steps:\n    - task: X\n      delay: soon\n").is_err());
    EXPECT_TRUE(parse_experiment("experiment:\n  steps:\n    - task: X\n      parameters: [1]\n").is_err());
}

TEST(Experiment, ComplexMappingKeyIsInvalidYaml) {
    const char* text = R"(
experiment:
  steps:
    - task: DG4202_TOGGLE
      parameters:
        channel: 1
        ? [1, 2]
        : 3
)";
    Result<Experiment> r = Result<Experiment>::Err("not run");
    EXPECT_NO_THROW(r = parse_experiment(text));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.rfind("Step 1: mapping key", 0), 0u) << r.error;
    EXPECT_NE(r.error.find("is not a scalar"), std::string::npos) << r.error;

    TempDir dir;
    {
        std::ofstream out(dir / "complex_key.yaml");
        out << text;
    }
    auto report = check_experiment_file(build_default_registry(), dir / "complex_key.yaml");
    EXPECT_FALSE(report.ok);
    EXPECT_EQ(report.level, ErrorLevel::InvalidYaml);
    EXPECT_TRUE(report.steps.empty());
}

TEST(Experiment, ValidReportIsInfo) {
    auto registry = build_default_registry();
    auto exp = parse_experiment(kGoodExperiment).value;
    auto report = validate_experiment(registry, exp);
    EXPECT_TRUE(report.ok);
    EXPECT_EQ(report.level, ErrorLevel::Info);
    ASSERT_EQ(report.steps.size(), 3u);
    EXPECT_EQ(report.steps[0].label, "Step 1: DG4202_SET_WAVEFORM");
    EXPECT_EQ(report.steps[1].label, "Step 2: DG4202_TOGGLE");
    EXPECT_TRUE(report.steps[0].message.empty());
}

TEST(Experiment, UnknownTaskIsBadConfig) {
    auto registry = build_default_registry();
    auto exp = parse_experiment(R"(
experiment:
  steps:
    - task: EDUX1002A_AUTO
    - task: dg9000_explode
)").value;
    auto report = validate_experiment(registry, exp);
    EXPECT_FALSE(report.ok);
    EXPECT_EQ(report.level, ErrorLevel::BadConfig);
    EXPECT_TRUE(report.steps[0].ok);
    EXPECT_FALSE(report.steps[1].ok);
    EXPECT_EQ(report.steps[1].label, "Step 2: DG9000_EXPLODE");
    EXPECT_EQ(report.steps[1].message, "Task function not found.");
}

TEST(Experiment, ParameterErrorsAreBadConfig) {
    auto registry = build_default_registry();
    auto exp = parse_experiment(R"(
experiment:
  steps:
    - task: DG4202_TOGGLE
      parameters: {channel: 1}
)").value;
    auto report = validate_experiment(registry, exp);
    EXPECT_EQ(report.level, ErrorLevel::BadConfig);
    EXPECT_EQ(report.steps[0].message, "Validation issues: Missing required param: status.");
}

TEST(Experiment, CheckFileLevels) {
    TempDir dir;
    auto registry = build_default_registry();

    auto missing = check_experiment_file(registry, dir / "missing.yaml");
    EXPECT_EQ(missing.level, ErrorLevel::InvalidYaml);
    EXPECT_FALSE(missing.error.empty());

    {
        std::ofstream out(dir / "good.yaml");
        out << kGoodExperiment;
    }
    auto good = check_experiment_file(registry, dir / "good.yaml");
    EXPECT_TRUE(good.ok);
    EXPECT_STREQ(error_level_name(good.level), "INFO");
}

TEST(Experiment, ScheduleTimes) {
    auto exp = parse_experiment(R"(
experiment:
  steps:
    - task: EDUX1002A_AUTO
      wait: 10
    - task: EDUX1002A_AUTO
      delay: 2.5
    - task: EDUX1002A_AUTO
      at_time: 1
    - task: EDUX1002A_AUTO
      wait: 4
)").value;

    TimePoint now = Clock::now();
    auto times = calculate_schedule_times(exp, now);
    ASSERT_EQ(times.size(), 4u);
    using ms = std::chrono::milliseconds;
    EXPECT_EQ(std::chrono::duration_cast<ms>(times[0] - now).count(), 10000);
    EXPECT_EQ(std::chrono::duration_cast<ms>(times[1] - now).count(), 12500);
    EXPECT_EQ(std::chrono::duration_cast<ms>(times[2] - now).count(), 1000);
    EXPECT_EQ(std::chrono::duration_cast<ms>(times[3] - now).count(), 5000);
}

TEST(Experiment, Summary) {
    auto exp = parse_experiment(kGoodExperiment).value;
    std::string s = experiment_summary(exp);
    EXPECT_NE(s.find("Experiment: Sweep check"), std::string::npos);
    EXPECT_NE(s.find("Step 1: DG4202_SET_WAVEFORM - Square on CH1"), std::string::npos);
    EXPECT_NE(s.find("Step 2: dg4202_toggle - No description"), std::string::npos);
}
