#ifndef POOL_SESSION_POOL_HPP
#define POOL_SESSION_POOL_HPP

#include <functional>
#include <list>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "runtime/runtime.hpp"
#include "session/sandbox_session.hpp"

namespace pool {

// No session could be leased within the allowed time.
class pool_exhausted : public std::runtime_error {
 public:
  explicit pool_exhausted(const std::string& msg) : std::runtime_error(msg) {}
};

struct PoolOptions {
  enum class Exhaustion { WAIT, FAIL_FAST };

  int max_size = 4;
  // Number of sessions opened by Prewarm.
  int min_size = 0;
  int64_t acquire_timeout_millis = 30 * 1000;
  // Free sessions unused for this long are closed. 0 disables eviction.
  int64_t idle_timeout_millis = 5 * 60 * 1000;
  // Sessions are closed after this many leases. 0 means no limit.
  int max_uses = 0;
  Exhaustion exhaustion = Exhaustion::WAIT;

  static PoolOptions FromFlags();
};

struct PoolStats {
  int total = 0;
  int free = 0;
  int leased = 0;
  // Sessions being opened.
  int opening = 0;
};

// Keeps open sessions around so that they can be reused, up to max_size at
// the same time. Sessions are matched by the key of their options. All the
// leases must be released before the pool is destroyed.
class SessionPool {
  struct Entry;

 public:
  using SessionFactory = std::function<std::unique_ptr<session::SandboxSession>(
      const session::SessionOptions& options)>;

  // Exclusive use of a session of the pool, until the lease is destroyed.
  class Lease {
   public:
    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&& other) noexcept;
    ~Lease() { Release(); }
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    session::SandboxSession* get() const;
    session::SandboxSession* operator->() const { return get(); }
    session::SandboxSession& operator*() const { return *get(); }

    // Gives the session back to the pool. Called by the destructor.
    void Release();

   private:
    friend class SessionPool;
    Lease(SessionPool* pool, Entry* entry) : pool_(pool), entry_(entry) {}

    SessionPool* pool_ = nullptr;
    Entry* entry_ = nullptr;
  };

  SessionPool(runtime::Runtime* runtime, PoolOptions options);
  SessionPool(PoolOptions options, SessionFactory factory);
  ~SessionPool();

  // Leases a session opened with options. A free session with the same
  // options is reused if possible, otherwise a new one is opened. If the pool
  // is full, a free session with different options is closed to make room;
  // if there is none the call waits for a release, for at most
  // wait_timeout_millis (0 means the pool default), and then throws
  // pool_exhausted. With FAIL_FAST it throws immediately.
  Lease Acquire(const session::SessionOptions& options,
                int64_t wait_timeout_millis = 0);

  // Opens free sessions with options until the pool has min_size sessions.
  void Prewarm(const session::SessionOptions& options);

  // Closes the free sessions that have been idle for too long. Returns how
  // many were closed.
  int EvictIdle();

  PoolStats GetStats();

  // Closes the free sessions. Leased sessions are closed when released, and
  // Acquire fails from now on.
  void Shutdown();

  const PoolOptions& Options() const { return options_; }

  SessionPool(const SessionPool&) = delete;
  SessionPool& operator=(const SessionPool&) = delete;

 private:
  struct Entry {
    std::unique_ptr<session::SandboxSession> session;
    std::string key;
    bool leased = false;
    absl::Time last_used;
    int uses = 0;
  };

  void Release(Entry* entry);

  // Opens a session in a slot reserved by the caller.
  std::unique_ptr<session::SandboxSession> OpenReserved(
      const session::SessionOptions& options);

  // Moves out the free sessions that match pred.
  void TakeFree(const std::function<bool(const Entry&)>& pred,
                std::vector<std::unique_ptr<session::SandboxSession>>* out)
      EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  bool IsIdle(const Entry& entry, absl::Time now) const;

  int Size() const EXCLUSIVE_LOCKS_REQUIRED(mutex_) {
    return static_cast<int>(entries_.size()) + opening_;
  }

  PoolOptions options_;
  SessionFactory factory_;

  absl::Mutex mutex_;
  std::list<Entry> entries_ GUARDED_BY(mutex_);
  int opening_ GUARDED_BY(mutex_) = 0;
  bool shutdown_ GUARDED_BY(mutex_) = false;
};

}  // namespace pool

#endif
