#include <gtest/gtest.h>

#include "mode_service.hpp"
#include "test_support.hpp"

using pm::CommandResult;
using pm::PowerModeService;
using pm_test::FakeRunner;

namespace {

FakeRunner::Handler Respond(int exit_code, std::string output) {
  return [=](const std::vector<std::string>&) { return CommandResult{exit_code, output}; };
}

} // namespace

TEST(CurrentModeParseTest, TakesTrimmedLineAfterMarker) {
  EXPECT_EQ(pm::parse_current_mode(pm_test::kStatusWithMarker, "current mode"), "1");
  EXPECT_EQ(pm::parse_current_mode("Current mode:\n   7  \n", "current mode"), "7");
}

TEST(CurrentModeParseTest, UnknownWithoutDefinitiveAnswer) {
  EXPECT_EQ(pm::parse_current_mode("", "current mode"), pm::kUnknownModeId);
  EXPECT_EQ(pm::parse_current_mode("NV Power Mode: MAXN\n0\n", "current mode"), pm::kUnknownModeId);
  EXPECT_EQ(pm::parse_current_mode("x\nCurrent mode: NV Power Mode: MAXN\n", "current mode"),
            pm::kUnknownModeId);
  EXPECT_EQ(pm::parse_current_mode("Current mode: NV Power Mode: MAXN\n   \n", "current mode"),
            pm::kUnknownModeId);
}

TEST(CurrentModeParseTest, LastMarkerWins) {
  EXPECT_EQ(pm::parse_current_mode("current mode\n0\ncurrent mode\n2\n", "current mode"), "2");
}

TEST(ModeQueryTest, RunsVerboseQueryWithoutPrivilege) {
  FakeRunner runner(Respond(0, pm_test::kStatusWithMarker));
  PowerModeService svc(runner, pm::ModeCommands{});
  EXPECT_EQ(svc.QueryCurrentMode(), "1");
  ASSERT_EQ(runner.calls.size(), 1u);
  std::vector<std::string> expected = {"nvpmodel", "-q", "--verbose"};
  EXPECT_EQ(runner.calls[0].argv, expected);
  EXPECT_EQ(runner.calls[0].mode, pm::StderrMode::Discard);
}

TEST(ModeQueryTest, FailedOrSilentCommandGivesSentinel) {
  FakeRunner failing(Respond(127, pm_test::kStatusWithMarker));
  PowerModeService svc_fail(failing, pm::ModeCommands{});
  EXPECT_EQ(svc_fail.QueryCurrentMode(), pm::kUnknownModeId);

  FakeRunner silent(Respond(0, ""));
  PowerModeService svc_silent(silent, pm::ModeCommands{});
  EXPECT_EQ(svc_silent.QueryCurrentMode(), pm::kUnknownModeId);
}

TEST(ModeChangeTest, SuccessReportNamesIdAndName) {
  FakeRunner runner(Respond(0, "irrelevant\n"));
  PowerModeService svc(runner, pm::ModeCommands{});
  pm::ChangeReport report = svc.ChangeMode("1", "MAXN");

  ASSERT_EQ(runner.calls.size(), 1u);
  std::vector<std::string> expected = {"sudo", "nvpmodel", "-m", "1"};
  EXPECT_EQ(runner.calls[0].argv, expected);
  EXPECT_EQ(runner.calls[0].mode, pm::StderrMode::Merge);
  EXPECT_TRUE(report.ok);
  EXPECT_EQ(pm::format_change_report(report),
            "Successfully changed power mode to: 1 (\"MAXN\")\n");
}

TEST(ModeChangeTest, FailurePassesOutputThroughVerbatim) {
  const std::string diag = "sudo: a password is required\nNVPM ERROR: failed\n";
  FakeRunner runner(Respond(1, diag));
  PowerModeService svc(runner, pm::ModeCommands{});
  pm::ChangeReport report = svc.ChangeMode("0", "15W");

  EXPECT_FALSE(report.ok);
  EXPECT_EQ(report.output, diag);
  EXPECT_EQ(pm::format_change_report(report),
            "Failed to change power mode to: 0 (\"15W\")\nError output:\n" + diag);
}

TEST(ModeChangeTest, EmptyPrivilegePrefixRunsCommandDirectly) {
  FakeRunner runner(Respond(0, ""));
  pm::ModeCommands cmds;
  cmds.privilege_command.clear();
  PowerModeService svc(runner, cmds);
  svc.ChangeMode("2", "30W");
  std::vector<std::string> expected = {"nvpmodel", "-m", "2"};
  EXPECT_EQ(runner.calls.at(0).argv, expected);
}

// Config with 15W/MAXN, status output lacking the marker, operator picks 1.
TEST(ModeServiceScenario, UnknownCurrentModeThenSwitchToMaxn) {
  FakeRunner runner([](const std::vector<std::string>& argv) {
    if (argv.back() == "--verbose") return CommandResult{0, "NV Power Mode: MAXN\n"};
    return CommandResult{0, ""};
  });
  PowerModeService svc(runner, pm::ModeCommands{});
  EXPECT_EQ(svc.QueryCurrentMode(), "???");

  pm::ChangeReport report = svc.ChangeMode("1", "MAXN");
  EXPECT_EQ(runner.calls.back().argv.back(), "1");
  EXPECT_TRUE(report.ok);
  EXPECT_NE(pm::format_change_report(report).find("Successfully changed power mode to: 1 (\"MAXN\")"),
            std::string::npos);
}
