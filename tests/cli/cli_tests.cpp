#include <filesystem>
#include <string>

#include <unistd.h>

#include <gtest/gtest.h>

#include "tests/cli/cli_test_fixture.hpp"

namespace verdict::test {
namespace {

class CliTest : public CliTestFixture {};

// =============================================================================
// Verdicts and exit codes
// =============================================================================

// Test: a matching test case exits 0 and prints nothing
TEST_F(CliTest, PassingTestExitsZeroQuietly) {
  WriteTestCase("add.lox", "print(1+1)\n", "2\n", "");

  auto result =
      Run({"-s", Interpreter(), "--scratch-root", "scratch", "add.lox"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_EQ(result.combined_output, "");
  EXPECT_EQ(ScratchEntryCount(), 0U);
}

// Test: a stdout mismatch exits 1 and shows a unified diff
TEST_F(CliTest, MismatchExitsOneWithDiff) {
  WriteTestCase("add.lox", "print(1+1)\n", "3\n", "");

  auto result =
      Run({"-s", Interpreter(), "--scratch-root", "scratch", "add.lox"});

  EXPECT_EQ(result.exit_code, 1) << result.combined_output;
  EXPECT_TRUE(result.Contains(
      "mismatch: stdout differs from add.lox.out "
      "(first difference at byte 0)\n"))
      << result.combined_output;
  EXPECT_TRUE(result.Contains("+++ captured stdout\n"));
  EXPECT_TRUE(result.Contains("\n-3\n+2\n")) << result.combined_output;
  EXPECT_EQ(ScratchEntryCount(), 0U);
}

// Test: stderr is compared too
TEST_F(CliTest, StderrMismatchIsReported) {
  WriteTestCase("fail.lox", "fail boom\n", "", "runtime error: bang\n");

  auto result =
      Run({"-s", Interpreter(), "--scratch-root", "scratch", "fail.lox"});

  EXPECT_EQ(result.exit_code, 1) << result.combined_output;
  EXPECT_TRUE(result.Contains("mismatch: stderr differs from fail.lox.err"));
  EXPECT_TRUE(result.Contains("+runtime error: boom"));
}

// Test: subject exit status alone does not fail a test
TEST_F(CliTest, NonZeroSubjectExitCanPass) {
  WriteTestCase("fail.lox", "fail boom\n", "", "runtime error: boom\n");

  auto result =
      Run({"-s", Interpreter(), "--scratch-root", "scratch", "fail.lox"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
}

// =============================================================================
// Errors
// =============================================================================

// Test: the test path is required
TEST_F(CliTest, MissingArgumentIsUsageError) {
  auto result = Run({"-s", Interpreter()});

  EXPECT_EQ(result.exit_code, 2) << result.combined_output;
  EXPECT_TRUE(result.Contains("Usage")) << result.combined_output;
}

// Test: missing test file exits 2 without running the subject
TEST_F(CliTest, MissingTestFileExitsTwo) {
  auto result =
      Run({"-s", Interpreter(), "--scratch-root", "scratch", "absent.lox"});

  EXPECT_EQ(result.exit_code, 2);
  EXPECT_TRUE(result.Contains("error: test file not found: absent.lox"))
      << result.combined_output;
  EXPECT_EQ(ScratchEntryCount(), 0U);
}

// Test: missing fixture is an error, not a mismatch
TEST_F(CliTest, MissingFixtureExitsTwo) {
  WriteFile("add.lox", "print(1+1)\n");
  WriteFile("add.lox.out", "2\n");

  auto result =
      Run({"-s", Interpreter(), "--scratch-root", "scratch", "add.lox"});

  EXPECT_EQ(result.exit_code, 2);
  EXPECT_TRUE(result.Contains("expected stderr fixture not found"))
      << result.combined_output;
  EXPECT_EQ(ScratchEntryCount(), 0U);
}

// Test: an unlaunchable subject exits 2
TEST_F(CliTest, MissingSubjectExitsTwo) {
  WriteTestCase("add.lox", "print(1+1)\n", "2\n", "");

  auto result = Run(
      {"-s", "./no-such-interpreter", "--scratch-root", "scratch",
       "add.lox"});

  EXPECT_EQ(result.exit_code, 2);
  EXPECT_TRUE(result.Contains("cannot execute './no-such-interpreter'"))
      << result.combined_output;
  EXPECT_EQ(ScratchEntryCount(), 0U);
}

// Test: without --subject, config or environment there is nothing to run
TEST_F(CliTest, NoSubjectConfiguredExitsTwo) {
  WriteTestCase("add.lox", "print(1+1)\n", "2\n", "");

  auto result = Run({"add.lox"});

  EXPECT_EQ(result.exit_code, 2);
  EXPECT_TRUE(result.Contains("no subject executable configured"));
  EXPECT_TRUE(result.Contains("note:"));
}

// Test: a negative timeout is rejected
TEST_F(CliTest, NegativeTimeoutIsRejected) {
  WriteTestCase("add.lox", "print(1+1)\n", "2\n", "");

  auto result = Run({"-s", Interpreter(), "--timeout", "-1", "add.lox"});

  EXPECT_EQ(result.exit_code, 2);
  EXPECT_TRUE(result.Contains("--timeout")) << result.combined_output;
}

// Test: a broken verdict.toml is reported
TEST_F(CliTest, InvalidConfigExitsTwo) {
  WriteTestCase("add.lox", "print(1+1)\n", "2\n", "");
  WriteFile("verdict.toml", "[subject]\nexecutable = 7\n");

  auto result = Run({"add.lox"});

  EXPECT_EQ(result.exit_code, 2);
  EXPECT_TRUE(result.Contains("'subject.executable' must be a string"))
      << result.combined_output;
}

// =============================================================================
// Subject configuration
// =============================================================================

// Test: verdict.toml supplies subject and scratch root
TEST_F(CliTest, ConfigSuppliesSubject) {
  WriteVerdictToml();
  WriteTestCase("add.lox", "print(2*21)\n", "42\n", "");

  auto result = Run({"add.lox"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_EQ(ScratchEntryCount(), 0U);
}

// Test: verdict.toml is found from a subdirectory
TEST_F(CliTest, ConfigFoundFromSubdirectory) {
  WriteVerdictToml();
  WriteTestCase("suite/add.lox", "print(2*21)\n", "42\n", "");

  auto result = RunIn(TestDir() / "suite", {"add.lox"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
}

// Test: $VERDICT_SUBJECT is the last fallback
TEST_F(CliTest, EnvironmentSuppliesSubject) {
  WriteTestCase("add.lox", "print(1+1)\n", "2\n", "");

  auto result =
      RunShell("VERDICT_SUBJECT=./interp \"$VERDICT\" add.lox; echo $?");

  EXPECT_EQ(result.combined_output, "0\n");
}

// Test: default search path is <test dir>/imports
TEST_F(CliTest, DefaultSearchPathIsBesideTest) {
  WriteTestCase("suite/mod.lox", "search\n", "suite/imports\n", "");

  auto result = Run({"-s", Interpreter(), "suite/mod.lox"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
}

// Test: --search-path overrides the default
TEST_F(CliTest, SearchPathOverride) {
  WriteTestCase("mod.lox", "search\n", "/opt/lox/lib\n", "");

  auto result =
      Run({"-s", Interpreter(), "-p", "/opt/lox/lib", "mod.lox"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
}

// Test: extra subject args precede the search flag
TEST_F(CliTest, SubjectArgsPrecedeSearchFlag) {
  WriteTestCase("add.lox", "print(1+1)\n", "2\n", "");

  auto result = Run({"-s", Interpreter(), "-a", "--strict", "add.lox"});

  // The fake interpreter insists on "-p" first.
  EXPECT_EQ(result.exit_code, 1) << result.combined_output;
  EXPECT_TRUE(result.Contains("+usage: interp -p <path>"));
}

// Test: custom fixture suffixes from config
TEST_F(CliTest, ConfigFixtureSuffixes) {
  WriteVerdictToml(
      "\n[fixtures]\noutput_suffix = \".expected\"\n"
      "error_suffix = \".expected_err\"\n");
  WriteFile("add.lox", "print(1+1)\n");
  WriteFile("add.lox.expected", "2\n");
  WriteFile("add.lox.expected_err", "");

  auto result = Run({"add.lox"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
}

// Test: -v logs the invocation lifecycle
TEST_F(CliTest, VerboseLogsLifecycle) {
  WriteVerdictToml();
  WriteTestCase("add.lox", "print(1+1)\n", "2\n", "");

  auto result = Run({"-v", "add.lox"});

  EXPECT_TRUE(result.Success()) << result.combined_output;
  EXPECT_TRUE(result.Contains("scratch-allocated")) << result.combined_output;
  EXPECT_TRUE(result.Contains("cleaned-up"));
}

// =============================================================================
// Timeouts and interrupts
// =============================================================================

// Test: --timeout kills a hung subject and exits 2
TEST_F(CliTest, TimeoutExitsTwo) {
  WriteVerdictToml();
  WriteTestCase("slow.lox", "sleep 30\n", "", "");

  auto result = Run({"--timeout", "0.2", "slow.lox"});

  EXPECT_EQ(result.exit_code, 2);
  EXPECT_TRUE(result.Contains("did not finish within 200 ms"))
      << result.combined_output;
  EXPECT_EQ(ScratchEntryCount(), 0U);
}

// Test: a scratch directory that cannot be removed only warns
TEST_F(CliTest, CleanupFailureWarnsAndKeepsVerdict) {
  if (geteuid() == 0) {
    GTEST_SKIP() << "root can remove read-only directories";
  }
  WriteVerdictToml();
  WriteTestCase("lock.lox", "print(1+1)\nlock\n", "2\n", "");

  auto result = Run({"lock.lox"});

  EXPECT_EQ(result.exit_code, 0) << result.combined_output;
  EXPECT_TRUE(
      result.Contains("verdict: warning: failed to remove scratch directory"))
      << result.combined_output;
  EXPECT_FALSE(result.Contains("mismatch:"));

  // Unlock so TearDown can remove the test directory.
  for (const auto& entry : std::filesystem::directory_iterator(ScratchRoot())) {
    std::filesystem::permissions(
        entry.path() / "locked", std::filesystem::perms::owner_all);
  }
}

// Test: SIGTERM cleans up and terminates the harness with the same signal
TEST_F(CliTest, TerminationSignalCleansUp) {
  WriteVerdictToml();
  WriteTestCase("slow.lox", "sleep 30\n", "", "");

  auto result = RunShell(
      "\"$VERDICT\" slow.lox & pid=$!; sleep 1; kill -TERM $pid; "
      "wait $pid; echo status=$?");

  EXPECT_TRUE(result.Contains("status=143")) << result.combined_output;
  EXPECT_EQ(ScratchEntryCount(), 0U);
}

}  // namespace
}  // namespace verdict::test
