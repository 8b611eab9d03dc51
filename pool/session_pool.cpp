#include "pool/session_pool.hpp"

#include <algorithm>

#include "glog/logging.h"
#include "util/flags.hpp"

namespace pool {

PoolOptions PoolOptions::FromFlags() {
  PoolOptions options;
  options.max_size = FLAGS_pool_max_size;
  options.min_size = FLAGS_pool_min_size;
  options.acquire_timeout_millis = FLAGS_pool_acquire_timeout_millis;
  options.idle_timeout_millis = FLAGS_pool_idle_timeout_millis;
  options.max_uses = FLAGS_pool_max_uses;
  options.exhaustion =
      FLAGS_pool_fail_fast ? Exhaustion::FAIL_FAST : Exhaustion::WAIT;
  return options;
}

SessionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), entry_(other.entry_) {
  other.pool_ = nullptr;
  other.entry_ = nullptr;
}

SessionPool::Lease& SessionPool::Lease::operator=(Lease&& other) noexcept {
  if (this != &other) {
    Release();
    pool_ = other.pool_;
    entry_ = other.entry_;
    other.pool_ = nullptr;
    other.entry_ = nullptr;
  }
  return *this;
}

session::SandboxSession* SessionPool::Lease::get() const {
  CHECK(entry_) << "The lease was already released";
  return entry_->session.get();
}

void SessionPool::Lease::Release() {
  if (!entry_) return;
  pool_->Release(entry_);
  pool_ = nullptr;
  entry_ = nullptr;
}

SessionPool::SessionPool(runtime::Runtime* runtime, PoolOptions options)
    : SessionPool(std::move(options),
                  [runtime](const session::SessionOptions& session_options) {
                    return std::unique_ptr<session::SandboxSession>(
                        new session::SandboxSession(runtime, session_options));
                  }) {}

SessionPool::SessionPool(PoolOptions options, SessionFactory factory)
    : options_(std::move(options)), factory_(std::move(factory)) {
  CHECK_GT(options_.max_size, 0) << "The pool needs room for one session";
}

SessionPool::~SessionPool() {
  Shutdown();
  absl::MutexLock lock(&mutex_);
  if (!entries_.empty()) {
    LOG(ERROR) << entries_.size() << " sessions are still leased";
  }
}

bool SessionPool::IsIdle(const Entry& entry, absl::Time now) const {
  return options_.idle_timeout_millis > 0 && !entry.leased &&
         now - entry.last_used > absl::Milliseconds(options_.idle_timeout_millis);
}

void SessionPool::TakeFree(
    const std::function<bool(const Entry&)>& pred,
    std::vector<std::unique_ptr<session::SandboxSession>>* out) {
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (!it->leased && pred(*it)) {
      out->push_back(std::move(it->session));
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
}

std::unique_ptr<session::SandboxSession> SessionPool::OpenReserved(
    const session::SessionOptions& options) {
  std::unique_ptr<session::SandboxSession> session;
  try {
    session = factory_(options);
    session->Open();
  } catch (const std::exception& exc) {
    LOG(WARNING) << "Failed to open a pooled session: " << exc.what();
    absl::MutexLock lock(&mutex_);
    opening_--;
    throw;
  }
  LOG(INFO) << "Opened pooled " << session->Handler().Name() << " session";
  return session;
}

SessionPool::Lease SessionPool::Acquire(const session::SessionOptions& options,
                                        int64_t wait_timeout_millis) {
  if (wait_timeout_millis <= 0) {
    wait_timeout_millis = options_.acquire_timeout_millis;
  }
  const std::string key = options.Key();
  const absl::Time deadline =
      absl::Now() + absl::Milliseconds(wait_timeout_millis);
  auto can_progress = [this]() {
    mutex_.AssertHeld();
    return shutdown_ || Size() < options_.max_size ||
           std::any_of(entries_.begin(), entries_.end(),
                       [](const Entry& entry) { return !entry.leased; });
  };

  while (true) {
    // Closed once the lock is released.
    std::vector<std::unique_ptr<session::SandboxSession>> discarded;
    Entry* candidate = nullptr;
    {
      absl::MutexLock lock(&mutex_);
      while (true) {
        if (shutdown_) throw session::invalid_state("The pool is shut down");
        absl::Time now = absl::Now();
        TakeFree([this, now](const Entry& entry) { return IsIdle(entry, now); },
                 &discarded);
        for (Entry& entry : entries_) {
          if (!entry.leased && entry.key == key) {
            candidate = &entry;
            break;
          }
        }
        if (candidate) {
          candidate->leased = true;
          candidate->uses++;
          break;
        }
        if (Size() < options_.max_size) {
          opening_++;
          break;
        }
        // Make room by closing a free session of another configuration.
        size_t evicted = discarded.size();
        bool found = false;
        TakeFree(
            [&found](const Entry&) {
              if (found) return false;
              found = true;
              return true;
            },
            &discarded);
        if (discarded.size() > evicted) {
          VLOG(1) << "Evicting a free session to make room for " << key;
          opening_++;
          break;
        }
        if (options_.exhaustion == PoolOptions::Exhaustion::FAIL_FAST) {
          throw pool_exhausted("All the " + std::to_string(options_.max_size) +
                               " sessions of the pool are leased");
        }
        if (!mutex_.AwaitWithDeadline(absl::Condition(&can_progress),
                                      deadline)) {
          throw pool_exhausted("No session became available in " +
                               std::to_string(wait_timeout_millis) + "ms");
        }
      }
    }
    discarded.clear();

    if (candidate) {
      if (candidate->session->IsHealthy()) return Lease(this, candidate);
      LOG(WARNING) << "Discarding an unhealthy pooled session";
      std::unique_ptr<session::SandboxSession> unhealthy;
      absl::MutexLock lock(&mutex_);
      for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (&*it == candidate) {
          unhealthy = std::move(it->session);
          entries_.erase(it);
          break;
        }
      }
      continue;
    }

    std::unique_ptr<session::SandboxSession> opened = OpenReserved(options);
    absl::MutexLock lock(&mutex_);
    opening_--;
    if (shutdown_) throw session::invalid_state("The pool is shut down");
    entries_.emplace_back();
    Entry* entry = &entries_.back();
    entry->session = std::move(opened);
    entry->key = key;
    entry->leased = true;
    entry->uses = 1;
    entry->last_used = absl::Now();
    return Lease(this, entry);
  }
}

void SessionPool::Release(Entry* entry) {
  std::unique_ptr<session::SandboxSession> discarded;
  absl::MutexLock lock(&mutex_);
  entry->leased = false;
  entry->last_used = absl::Now();
  const char* reason = nullptr;
  if (shutdown_) {
    reason = "the pool is shut down";
  } else if (entry->session->IsTainted() || !entry->session->IsOpen()) {
    reason = "it is broken";
  } else if (options_.max_uses > 0 && entry->uses >= options_.max_uses) {
    reason = "it reached the maximum number of uses";
  }
  if (reason == nullptr) return;
  LOG(INFO) << "Discarding a pooled session: " << reason;
  for (auto it = entries_.begin(); it != entries_.end(); ++it) {
    if (&*it == entry) {
      discarded = std::move(it->session);
      entries_.erase(it);
      break;
    }
  }
}

void SessionPool::Prewarm(const session::SessionOptions& options) {
  const std::string key = options.Key();
  const int target = std::min(options_.min_size, options_.max_size);
  while (true) {
    {
      absl::MutexLock lock(&mutex_);
      if (shutdown_ || Size() >= target) return;
      opening_++;
    }
    std::unique_ptr<session::SandboxSession> opened = OpenReserved(options);
    absl::MutexLock lock(&mutex_);
    opening_--;
    if (shutdown_) return;
    entries_.emplace_back();
    entries_.back().session = std::move(opened);
    entries_.back().key = key;
    entries_.back().last_used = absl::Now();
  }
}

int SessionPool::EvictIdle() {
  std::vector<std::unique_ptr<session::SandboxSession>> evicted;
  {
    absl::MutexLock lock(&mutex_);
    absl::Time now = absl::Now();
    TakeFree([this, now](const Entry& entry) { return IsIdle(entry, now); },
             &evicted);
  }
  if (!evicted.empty()) {
    LOG(INFO) << "Closing " << evicted.size() << " idle sessions";
  }
  return evicted.size();
}

PoolStats SessionPool::GetStats() {
  absl::MutexLock lock(&mutex_);
  PoolStats stats;
  for (const Entry& entry : entries_) {
    (entry.leased ? stats.leased : stats.free)++;
  }
  stats.total = entries_.size();
  stats.opening = opening_;
  return stats;
}

void SessionPool::Shutdown() {
  std::vector<std::unique_ptr<session::SandboxSession>> closing;
  {
    absl::MutexLock lock(&mutex_);
    if (shutdown_) return;
    shutdown_ = true;
    TakeFree([](const Entry&) { return true; }, &closing);
  }
  LOG(INFO) << "Pool shut down, closing " << closing.size() << " sessions";
}

}  // namespace pool
