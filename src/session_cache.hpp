#pragma once

#include "config.hpp"
#include "errors.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace bridge {

using SessionClock = std::chrono::steady_clock;

struct SessionRecord {
  std::string key;
  std::string native_session_id;
  SessionClock::time_point created_at;
  SessionClock::time_point last_used_at;
};

struct SessionCacheStats {
  size_t size = 0;
  size_t capacity = 0;
  size_t in_flight = 0;
  uint64_t hits = 0;
  uint64_t misses = 0;
  uint64_t establishments = 0;
  uint64_t establish_failures = 0;
  uint64_t evictions = 0;
};

// Runs the CLI to create a native session; returns its id or nullopt with err set.
using EstablishFn = std::function<std::optional<std::string>(EngineError* err)>;

class ISessionCache {
 public:
  virtual ~ISessionCache() = default;

  virtual std::optional<std::string> Lookup(const std::string& key) = 0;
  virtual std::optional<std::string> EstablishOrReuse(const std::string& key,
                                                      const EstablishFn& establish,
                                                      EngineError* err) = 0;
  virtual void Invalidate(const std::string& key) = 0;
  virtual size_t Evict() = 0;
  virtual SessionCacheStats Stats() const = 0;
};

class InMemorySessionCache : public ISessionCache {
 public:
  using NowFn = std::function<SessionClock::time_point()>;

  InMemorySessionCache(std::chrono::seconds ttl, size_t capacity, NowFn now = {});

  std::optional<std::string> Lookup(const std::string& key) override;
  std::optional<std::string> EstablishOrReuse(const std::string& key,
                                              const EstablishFn& establish,
                                              EngineError* err) override;
  void Invalidate(const std::string& key) override;
  size_t Evict() override;
  SessionCacheStats Stats() const override;

 private:
  struct Outcome {
    std::optional<std::string> native_session_id;
    EngineError error;
  };

  using LruList = std::list<SessionRecord>;

  SessionClock::time_point Now() const;
  bool ExpiredLocked(const SessionRecord& r, SessionClock::time_point now) const;
  void EraseLocked(std::unordered_map<std::string, LruList::iterator>::iterator it);
  size_t EnforceCapacityLocked();

  const std::chrono::seconds ttl_;
  const size_t capacity_;
  NowFn now_;

  mutable std::mutex mu_;
  // Front is most recently used.
  LruList lru_;
  std::unordered_map<std::string, LruList::iterator> index_;
  std::unordered_map<std::string, std::shared_future<Outcome>> in_flight_;
  SessionCacheStats stats_;
};

// Calls Evict() on a fixed interval until destroyed.
class SessionSweeper {
 public:
  SessionSweeper(ISessionCache* cache, std::chrono::seconds interval);
  ~SessionSweeper();
  SessionSweeper(const SessionSweeper&) = delete;
  SessionSweeper& operator=(const SessionSweeper&) = delete;

 private:
  void Run();

  ISessionCache* cache_;
  std::chrono::seconds interval_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool stop_ = false;
  std::thread thread_;
};

std::unique_ptr<ISessionCache> MakeSessionCache(const SessionConfig& cfg);

}  // namespace bridge
