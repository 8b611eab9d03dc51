#include "session/backend_session.hpp"

#include <thread>

#include "absl/synchronization/notification.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "runtime/mock_runtime.hpp"

namespace {

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

using runtime::Both;
using runtime::Err;
using runtime::MockRuntime;
using runtime::Out;
using runtime::Result;
using runtime::VectorChunkStream;
using session::BackendOptions;
using session::BackendSession;
using session::invalid_state;

class BackendSessionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ON_CALL(runtime_, CreateContainer(_)).WillByDefault(Return("c1"));
    ON_CALL(runtime_, IsRunning("c1")).WillByDefault(Return(true));
    options_.container.image = "image";
  }

  std::unique_ptr<BackendSession> OpenSession() {
    std::unique_ptr<BackendSession> session(
        new BackendSession(&runtime_, options_));
    session->Open();
    return session;
  }

  NiceMock<MockRuntime> runtime_;
  BackendOptions options_;
};

// NOLINTNEXTLINE
TEST_F(BackendSessionTest, OpenAndClose) {
  EXPECT_CALL(runtime_, CreateContainer(_)).WillOnce(Return("c1"));
  EXPECT_CALL(runtime_, StartContainer("c1"));
  EXPECT_CALL(runtime_, StopContainer("c1"));
  EXPECT_CALL(runtime_, RemoveContainer("c1"));
  auto session = OpenSession();
  EXPECT_TRUE(session->IsOpen());
  EXPECT_TRUE(session->IsHealthy());
  session->Close();
  EXPECT_FALSE(session->IsOpen());
  session->Close();
}

// NOLINTNEXTLINE
TEST_F(BackendSessionTest, DestructorCloses) {
  EXPECT_CALL(runtime_, RemoveContainer("c1"));
  OpenSession();
}

// NOLINTNEXTLINE
TEST_F(BackendSessionTest, DestructorDoesNotThrow) {
  EXPECT_CALL(runtime_, RemoveContainer("c1"))
      .WillOnce(Throw(runtime::runtime_failure("gone")));
  OpenSession();
}

// NOLINTNEXTLINE
TEST_F(BackendSessionTest, FailedRemovalCanBeRetried) {
  EXPECT_CALL(runtime_, RemoveContainer("c1"))
      .WillOnce(Throw(runtime::runtime_failure("daemon busy")))
      .WillOnce(Return());
  auto session = OpenSession();
  EXPECT_THROW(session->Close(), runtime::runtime_failure);
  EXPECT_TRUE(session->IsOpen());
  session->Close();
  EXPECT_FALSE(session->IsOpen());
}

// NOLINTNEXTLINE
TEST_F(BackendSessionTest, OpenTwice) {
  auto session = OpenSession();
  EXPECT_THROW(session->Open(), invalid_state);
}

// NOLINTNEXTLINE
TEST_F(BackendSessionTest, FailedStartRemovesContainer) {
  EXPECT_CALL(runtime_, StartContainer("c1"))
      .WillOnce(Throw(runtime::runtime_failure("no start")));
  EXPECT_CALL(runtime_, RemoveContainer("c1"));
  BackendSession session(&runtime_, options_);
  EXPECT_THROW(session.Open(), runtime::runtime_failure);
  EXPECT_FALSE(session.IsOpen());
}

// NOLINTNEXTLINE
TEST_F(BackendSessionTest, ExecuteWhenNotOpen) {
  BackendSession session(&runtime_, options_);
  EXPECT_THROW(session.ExecuteCommand("ls", "", {}, {}, 0), invalid_state);
  EXPECT_THROW(session.CopyToRuntime("a", "b"), invalid_state);
  session.Open();
  session.Close();
  EXPECT_THROW(session.ExecuteCommand("ls", "", {}, {}, 0), invalid_state);
}

// NOLINTNEXTLINE
TEST_F(BackendSessionTest, BufferedByDefaultWhenNotStreaming) {
  options_.stream = false;
  options_.execution_timeout_millis = 1234;
  auto session = OpenSession();
  EXPECT_CALL(runtime_, Exec("c1", "echo hi", "/sandbox", 1234))
      .WillOnce(Return(Result(0, "hi\n", "warn")));
  EXPECT_CALL(runtime_, ExecStreamProxy(_, _, _)).Times(0);
  core::ConsoleOutput output = session->ExecuteCommand("echo hi", "", {}, {}, 0);
  EXPECT_EQ(output.exit_code, 0);
  EXPECT_EQ(output.stdout_text, "hi\n");
  EXPECT_EQ(output.stderr_text, "warn");
}

// NOLINTNEXTLINE
TEST_F(BackendSessionTest, BufferedOutputIsDecoded) {
  options_.stream = false;
  auto session = OpenSession();
  EXPECT_CALL(runtime_, Exec(_, _, _, _))
      .WillOnce(Return(Result(2, "a\xFF", "b\xE2\x82")));
  core::ConsoleOutput output = session->ExecuteCommand("x", "", {}, {}, 0);
  EXPECT_EQ(output.exit_code, 2);
  EXPECT_EQ(output.stdout_text, "a\xEF\xBF\xBD");
  EXPECT_EQ(output.stderr_text, "b\xEF\xBF\xBD");
}

// NOLINTNEXTLINE
TEST_F(BackendSessionTest, CallbackForcesStreaming) {
  options_.stream = false;
  auto session = OpenSession();
  EXPECT_CALL(runtime_, Exec(_, _, _, _)).Times(0);
  EXPECT_CALL(runtime_, ExecStreamProxy("c1", "run", "/work"))
      .WillOnce(Return(new VectorChunkStream(
          {Out("o1"), Err("e1"), Both("o2", "e2")}, 3)));
  std::vector<std::string> received;
  core::ConsoleOutput output = session->ExecuteCommand(
      "run", "/work",
      [&](const std::string& chunk) { received.push_back(chunk); }, {}, 0);
  EXPECT_EQ(output.exit_code, 3);
  EXPECT_EQ(output.stdout_text, "o1o2");
  EXPECT_EQ(output.stderr_text, "e1e2");
  EXPECT_THAT(received, ElementsAre("o1", "o2"));
}

// NOLINTNEXTLINE
TEST_F(BackendSessionTest, StreamedByDefault) {
  auto session = OpenSession();
  EXPECT_CALL(runtime_, ExecStreamProxy(_, _, _))
      .WillOnce(Return(new VectorChunkStream({Out("x")})));
  core::ConsoleOutput output = session->ExecuteCommand("x", "", {}, {}, 0);
  EXPECT_EQ(output.stdout_text, "x");
}

// NOLINTNEXTLINE
TEST_F(BackendSessionTest, NegativeTimeoutMeansUnbounded) {
  options_.stream = false;
  auto session = OpenSession();
  EXPECT_CALL(runtime_, Exec(_, _, _, 0)).WillOnce(Return(Result(0)));
  session->ExecuteCommand("x", "", {}, {}, -1);
}

// NOLINTNEXTLINE
TEST_F(BackendSessionTest, TimeoutTaintsSession) {
  auto session = OpenSession();
  EXPECT_CALL(runtime_, ExecStreamProxy(_, _, _))
      .WillOnce(Return(new VectorChunkStream({Out("a")}, 0, 1)));
  EXPECT_THROW(session->ExecuteCommand("sleep 100", "", {}, {}, 10),
               runtime::execution_timeout);
  EXPECT_TRUE(session->IsTainted());
  EXPECT_FALSE(session->IsHealthy());
}

// NOLINTNEXTLINE
TEST_F(BackendSessionTest, NonZeroExitDoesNotTaint) {
  auto session = OpenSession();
  EXPECT_CALL(runtime_, ExecStreamProxy(_, _, _))
      .WillOnce(Return(new VectorChunkStream({Err("boom")}, 1)));
  core::ConsoleOutput output = session->ExecuteCommand("false", "", {}, {}, 0);
  EXPECT_EQ(output.exit_code, 1);
  EXPECT_FALSE(session->IsTainted());
}

// NOLINTNEXTLINE
TEST_F(BackendSessionTest, StoppedContainerIsUnhealthy) {
  auto session = OpenSession();
  EXPECT_CALL(runtime_, IsRunning("c1")).WillOnce(Return(false));
  EXPECT_FALSE(session->IsHealthy());
}

// NOLINTNEXTLINE
TEST_F(BackendSessionTest, ConcurrentExecutionFailsFast) {
  options_.stream = false;
  auto session = OpenSession();
  absl::Notification started;
  absl::Notification finish;
  EXPECT_CALL(runtime_, Exec(_, "slow", _, _))
      .WillOnce(Invoke([&](const std::string&, const std::string&,
                           const std::string&, int64_t) {
        started.Notify();
        finish.WaitForNotification();
        return Result(0, "done");
      }));
  std::thread worker([&]() {
    EXPECT_EQ(session->ExecuteCommand("slow", "", {}, {}, 0).stdout_text,
              "done");
  });
  started.WaitForNotification();
  EXPECT_THROW(session->ExecuteCommand("fast", "", {}, {}, 0), invalid_state);
  finish.Notify();
  worker.join();
}

}  // namespace
