#include "pool/session_pool.hpp"

#include <atomic>
#include <set>
#include <thread>

#include "absl/synchronization/mutex.h"
#include "absl/time/clock.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "runtime/mock_runtime.hpp"

namespace {

using ::testing::_;
using ::testing::InvokeWithoutArgs;
using ::testing::NiceMock;
using ::testing::Return;

using pool::PoolOptions;
using pool::SessionPool;
using runtime::MockRuntime;
using session::SandboxSession;
using session::SessionOptions;

class SessionPoolTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ON_CALL(runtime_, CreateContainer(_))
        .WillByDefault(InvokeWithoutArgs(
            [this]() { return "c" + std::to_string(++created_); }));
    ON_CALL(runtime_, IsRunning(_)).WillByDefault(Return(true));
    options_.skip_environment_setup = true;
    options_.temp_directory = "/tmp/codebox_testdir";
    pool_options_.max_size = 2;
    pool_options_.acquire_timeout_millis = 5000;
  }

  std::unique_ptr<SessionPool> MakePool() {
    return std::unique_ptr<SessionPool>(
        new SessionPool(&runtime_, pool_options_));
  }

  NiceMock<MockRuntime> runtime_;
  std::atomic<int> created_{0};
  SessionOptions options_;
  PoolOptions pool_options_;
};

// NOLINTNEXTLINE
TEST_F(SessionPoolTest, ReleasedSessionIsReused) {
  auto pool = MakePool();
  SandboxSession* first;
  {
    SessionPool::Lease lease = pool->Acquire(options_);
    first = lease.get();
    EXPECT_TRUE(first->IsOpen());
    EXPECT_EQ(pool->GetStats().leased, 1);
  }
  EXPECT_EQ(pool->GetStats().free, 1);
  SessionPool::Lease lease = pool->Acquire(options_);
  EXPECT_EQ(lease.get(), first);
  EXPECT_EQ(created_.load(), 1);
}

// NOLINTNEXTLINE
TEST_F(SessionPoolTest, LeasedSessionIsNotHandedOutTwice) {
  auto pool = MakePool();
  SessionPool::Lease a = pool->Acquire(options_);
  SessionPool::Lease b = pool->Acquire(options_);
  EXPECT_NE(a.get(), b.get());
  EXPECT_EQ(pool->GetStats().total, 2);
}

// NOLINTNEXTLINE
TEST_F(SessionPoolTest, ExhaustedPoolTimesOut) {
  auto pool = MakePool();
  SessionPool::Lease a = pool->Acquire(options_);
  SessionPool::Lease b = pool->Acquire(options_);
  absl::Time start = absl::Now();
  EXPECT_THROW(pool->Acquire(options_, 100), pool::pool_exhausted);
  EXPECT_GE(absl::Now() - start, absl::Milliseconds(90));
}

// NOLINTNEXTLINE
TEST_F(SessionPoolTest, FailFast) {
  pool_options_.max_size = 1;
  pool_options_.exhaustion = PoolOptions::Exhaustion::FAIL_FAST;
  auto pool = MakePool();
  SessionPool::Lease a = pool->Acquire(options_);
  absl::Time start = absl::Now();
  EXPECT_THROW(pool->Acquire(options_, 10000), pool::pool_exhausted);
  EXPECT_LT(absl::Now() - start, absl::Seconds(5));
}

// NOLINTNEXTLINE
TEST_F(SessionPoolTest, WaiterGetsReleasedSession) {
  pool_options_.max_size = 1;
  auto pool = MakePool();
  SessionPool::Lease lease = pool->Acquire(options_);
  SandboxSession* session = lease.get();
  std::thread releaser([&lease]() {
    absl::SleepFor(absl::Milliseconds(50));
    lease.Release();
  });
  SessionPool::Lease other = pool->Acquire(options_);
  EXPECT_EQ(other.get(), session);
  releaser.join();
}

// NOLINTNEXTLINE
TEST_F(SessionPoolTest, TaintedSessionIsDiscarded) {
  auto pool = MakePool();
  {
    SessionPool::Lease lease = pool->Acquire(options_);
    EXPECT_CALL(runtime_, ExecStreamProxy(_, _, _))
        .WillOnce(Return(new runtime::VectorChunkStream(
            std::vector<runtime::Chunk>(), 0, 0)));
    EXPECT_THROW(lease->ExecuteCommand("sleep 1000"),
                 runtime::execution_timeout);
    EXPECT_CALL(runtime_, RemoveContainer("c1"));
  }
  EXPECT_EQ(pool->GetStats().total, 0);
  SessionPool::Lease lease = pool->Acquire(options_);
  EXPECT_EQ(created_.load(), 2);
}

// NOLINTNEXTLINE
TEST_F(SessionPoolTest, UnhealthySessionIsReplaced) {
  auto pool = MakePool();
  pool->Acquire(options_);
  EXPECT_CALL(runtime_, IsRunning("c1")).WillOnce(Return(false));
  SessionPool::Lease lease = pool->Acquire(options_);
  EXPECT_EQ(created_.load(), 2);
  EXPECT_EQ(pool->GetStats().total, 1);
}

// NOLINTNEXTLINE
TEST_F(SessionPoolTest, MaxUses) {
  pool_options_.max_uses = 2;
  auto pool = MakePool();
  pool->Acquire(options_);
  pool->Acquire(options_);
  EXPECT_EQ(created_.load(), 1);
  EXPECT_EQ(pool->GetStats().total, 0);
  pool->Acquire(options_);
  EXPECT_EQ(created_.load(), 2);
}

// NOLINTNEXTLINE
TEST_F(SessionPoolTest, SessionsAreKeyedByOptions) {
  auto pool = MakePool();
  SessionOptions go = options_;
  go.language = language::Language::GO;
  SandboxSession* python_session;
  {
    SessionPool::Lease lease = pool->Acquire(options_);
    python_session = lease.get();
  }
  SessionPool::Lease lease = pool->Acquire(go);
  EXPECT_NE(lease.get(), python_session);
  EXPECT_EQ(lease->Options().language, language::Language::GO);
  EXPECT_EQ(pool->GetStats().total, 2);
}

// NOLINTNEXTLINE
TEST_F(SessionPoolTest, FreeSessionOfOtherOptionsIsEvicted) {
  pool_options_.max_size = 1;
  auto pool = MakePool();
  pool->Acquire(options_);
  SessionOptions go = options_;
  go.language = language::Language::GO;
  EXPECT_CALL(runtime_, RemoveContainer("c1"));
  SessionPool::Lease lease = pool->Acquire(go);
  EXPECT_EQ(lease->Options().language, language::Language::GO);
  EXPECT_EQ(pool->GetStats().total, 1);
}

// NOLINTNEXTLINE
TEST_F(SessionPoolTest, IdleSessionsAreEvicted) {
  pool_options_.idle_timeout_millis = 1;
  auto pool = MakePool();
  pool->Acquire(options_);
  absl::SleepFor(absl::Milliseconds(20));
  EXPECT_EQ(pool->EvictIdle(), 1);
  EXPECT_EQ(pool->GetStats().total, 0);
}

// NOLINTNEXTLINE
TEST_F(SessionPoolTest, Prewarm) {
  pool_options_.min_size = 2;
  auto pool = MakePool();
  pool->Prewarm(options_);
  pool::PoolStats stats = pool->GetStats();
  EXPECT_EQ(stats.total, 2);
  EXPECT_EQ(stats.free, 2);
  pool->Acquire(options_);
  EXPECT_EQ(created_.load(), 2);
}

// NOLINTNEXTLINE
TEST_F(SessionPoolTest, FailedOpenFreesSlot) {
  pool_options_.max_size = 1;
  auto pool = MakePool();
  EXPECT_CALL(runtime_, CreateContainer(_))
      .WillOnce(::testing::Throw(runtime::runtime_failure("no image")))
      .WillOnce(Return("c9"));
  EXPECT_THROW(pool->Acquire(options_), runtime::runtime_failure);
  EXPECT_EQ(pool->GetStats().opening, 0);
  SessionPool::Lease lease = pool->Acquire(options_);
  EXPECT_TRUE(lease->IsOpen());
}

// NOLINTNEXTLINE
TEST_F(SessionPoolTest, Shutdown) {
  auto pool = MakePool();
  SessionPool::Lease leased = pool->Acquire(options_);
  pool->Acquire(options_);
  pool->Shutdown();
  EXPECT_EQ(pool->GetStats().total, 1);
  EXPECT_THROW(pool->Acquire(options_), session::invalid_state);
  leased.Release();
  EXPECT_EQ(pool->GetStats().total, 0);
}

// NOLINTNEXTLINE
TEST_F(SessionPoolTest, ConcurrentLeasesAreExclusive) {
  pool_options_.max_size = 3;
  pool_options_.acquire_timeout_millis = 60000;
  auto pool = MakePool();
  absl::Mutex mutex;
  std::set<SandboxSession*> in_use;
  std::atomic<int> conflicts{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; t++) {
    threads.emplace_back([&]() {
      for (int i = 0; i < 20; i++) {
        SessionPool::Lease lease = pool->Acquire(options_);
        {
          absl::MutexLock lock(&mutex);
          if (!in_use.insert(lease.get()).second) conflicts++;
        }
        absl::SleepFor(absl::Microseconds(100));
        absl::MutexLock lock(&mutex);
        in_use.erase(lease.get());
      }
    });
  }
  for (std::thread& thread : threads) thread.join();
  EXPECT_EQ(conflicts.load(), 0);
  EXPECT_LE(created_.load(), 3);
}

}  // namespace
