#include "taskrunner/executor/process_supervisor.hpp"

#include "test_utils.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace taskrunner;
using namespace std::chrono_literals;

class ProcessSupervisorTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_FALSE(dir_.path().empty());
    env_ = Environment::inherit();
  }

  auto run_script(const std::string& body,
                  std::chrono::seconds max_time = 10s) -> Result<TaskOutcome> {
    auto path = dir_.write_script("task.sh", body);
    std::vector<std::string> argv{path.string()};
    return supervisor_->run_once(argv, env_, max_time);
  }

  taskrunner::test::TempDir dir_;
  Environment env_;
  std::unique_ptr<IProcessSupervisor> supervisor_ = create_process_supervisor();
};

TEST(TaskOutcomeTest, ExitCodeProtocol) {
  EXPECT_EQ(outcome_from_exit_code(0), TaskOutcome::Ok);
  EXPECT_EQ(outcome_from_exit_code(2), TaskOutcome::Halt);
  EXPECT_EQ(outcome_from_exit_code(1), TaskOutcome::Retry);
  EXPECT_EQ(outcome_from_exit_code(3), TaskOutcome::Retry);
  EXPECT_EQ(outcome_from_exit_code(127), TaskOutcome::Retry);
  EXPECT_EQ(outcome_from_exit_code(-1), TaskOutcome::Retry);
}

TEST(TaskOutcomeTest, Names) {
  EXPECT_EQ(to_string_view(TaskOutcome::Ok), "OK");
  EXPECT_EQ(to_string_view(TaskOutcome::Retry), "RETRY");
  EXPECT_EQ(to_string_view(TaskOutcome::Halt), "HALT");
}

TEST_F(ProcessSupervisorTest, ExitZero_Ok) {
  auto result = run_script("exit 0");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, TaskOutcome::Ok);
}

TEST_F(ProcessSupervisorTest, ExitTwo_Halt) {
  auto result = run_script("exit 2");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, TaskOutcome::Halt);
}

TEST_F(ProcessSupervisorTest, ExitOne_Retry) {
  auto result = run_script("exit 1");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, TaskOutcome::Retry);
}

TEST_F(ProcessSupervisorTest, KilledBySignal_Retry) {
  auto result = run_script("kill -KILL $$");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, TaskOutcome::Retry);
}

TEST_F(ProcessSupervisorTest, Timeout_TerminatesAndRetries) {
  auto start = std::chrono::steady_clock::now();
  auto result = run_script("exec sleep 30", 1s);
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, TaskOutcome::Retry);
  EXPECT_GE(elapsed, 1s);
  EXPECT_LT(elapsed, 10s);
}

TEST_F(ProcessSupervisorTest, Timeout_SendsSigterm) {
  // The trap records SIGTERM; the supervisor returns without waiting for it
  auto marker = dir_.path() / "terminated";
  auto result = run_script(
      "trap 'echo term > " + marker.string() + "; exit 1' TERM\n"
      "while true; do sleep 1; done",
      1s);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, TaskOutcome::Retry);

  auto deadline = std::chrono::steady_clock::now() + 5s;
  while (!std::filesystem::exists(marker) &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(50ms);
  }
  EXPECT_TRUE(std::filesystem::exists(marker));
}

TEST_F(ProcessSupervisorTest, UnboundedMaxTime_WaitsForExit) {
  auto result = run_script("sleep 1; exit 0", 0s);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, TaskOutcome::Ok);
}

TEST_F(ProcessSupervisorTest, StdinIsEmpty) {
  auto result = run_script("if read -r line; then exit 1; fi\nexit 0");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, TaskOutcome::Ok);
}

TEST_F(ProcessSupervisorTest, EnvironmentIsPassed) {
  env_.set("TASKRUNNER_TEST_VALUE", "expected");
  auto result = run_script(R"(test "$TASKRUNNER_TEST_VALUE" = expected)");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, TaskOutcome::Ok);
}

TEST_F(ProcessSupervisorTest, ArgumentsArePassed) {
  auto path = dir_.write_script("args.sh", R"(test "$1" = "a b" && test "$2" = c)");
  std::vector<std::string> argv{path.string(), "a b", "c"};

  auto result = supervisor_->run_once(argv, env_, 10s);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, TaskOutcome::Ok);
}

TEST_F(ProcessSupervisorTest, InterpreterFoundThroughPath) {
  env_.set("PATH", "/usr/bin:/bin");
  auto script = dir_.write_file("plain.sh", "exit 2\n");
  std::vector<std::string> argv{"sh", script.string()};

  auto result = supervisor_->run_once(argv, env_, 10s);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, TaskOutcome::Halt);
}

TEST_F(ProcessSupervisorTest, MissingCommand_SpawnFailed) {
  std::vector<std::string> argv{"taskrunner-no-such-command"};

  auto result = supervisor_->run_once(argv, env_, 10s);

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::SpawnFailed));
}

TEST_F(ProcessSupervisorTest, MissingPath_SpawnFailed) {
  std::vector<std::string> argv{(dir_.path() / "absent.sh").string()};

  auto result = supervisor_->run_once(argv, env_, 10s);

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::SpawnFailed));
}

TEST_F(ProcessSupervisorTest, NotExecutable_SpawnFailed) {
  auto path = dir_.write_file("noexec.sh", "#!/bin/sh\nexit 0\n");
  std::vector<std::string> argv{path.string()};

  auto result = supervisor_->run_once(argv, env_, 10s);

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::SpawnFailed));
}

TEST_F(ProcessSupervisorTest, EmptyArgv_InvalidArgument) {
  auto result = supervisor_->run_once(std::vector<std::string>{}, env_, 10s);

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::InvalidArgument));
}

class PollingSupervisorTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_FALSE(dir_.path().empty());
  }

  auto run_script(const std::string& body, std::chrono::seconds max_time)
      -> Result<TaskOutcome> {
    auto path = dir_.write_script("task.sh", body);
    std::vector<std::string> argv{path.string()};
    return supervisor_->run_once(argv, Environment::inherit(), max_time);
  }

  taskrunner::test::TempDir dir_;
  std::unique_ptr<IProcessSupervisor> supervisor_ =
      create_process_supervisor(WaitMode::Polling);
};

TEST_F(PollingSupervisorTest, ExitCodesMapToOutcomes) {
  auto success = run_script("exit 0", 10s);
  ASSERT_TRUE(success.has_value());
  EXPECT_EQ(*success, TaskOutcome::Ok);

  auto halt = run_script("exit 2", 10s);
  ASSERT_TRUE(halt.has_value());
  EXPECT_EQ(*halt, TaskOutcome::Halt);

  auto retry = run_script("exit 5", 10s);
  ASSERT_TRUE(retry.has_value());
  EXPECT_EQ(*retry, TaskOutcome::Retry);
}

TEST_F(PollingSupervisorTest, Timeout_RetriesAfterBudget) {
  auto start = std::chrono::steady_clock::now();
  auto result = run_script("exec sleep 30", 1s);
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, TaskOutcome::Retry);
  EXPECT_GT(elapsed, 1s);
  // One bounded poll interval past the budget at most, plus slack
  EXPECT_LT(elapsed, 1s + kBoundedPollInterval + 3s);
}

TEST_F(PollingSupervisorTest, SpawnFailureIsStillAnError) {
  std::vector<std::string> argv{(dir_.path() / "absent.sh").string()};

  auto result = supervisor_->run_once(argv, Environment::inherit(), 10s);

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::SpawnFailed));
}
