#include "session_cache.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace bridge {

InMemorySessionCache::InMemorySessionCache(std::chrono::seconds ttl, size_t capacity, NowFn now)
    : ttl_(ttl), capacity_(capacity == 0 ? 1 : capacity), now_(std::move(now)) {
  stats_.capacity = capacity_;
}

SessionClock::time_point InMemorySessionCache::Now() const {
  return now_ ? now_() : SessionClock::now();
}

bool InMemorySessionCache::ExpiredLocked(const SessionRecord& r, SessionClock::time_point now) const {
  return now - r.last_used_at > ttl_;
}

void InMemorySessionCache::EraseLocked(std::unordered_map<std::string, LruList::iterator>::iterator it) {
  lru_.erase(it->second);
  index_.erase(it);
}

size_t InMemorySessionCache::EnforceCapacityLocked() {
  size_t removed = 0;
  while (lru_.size() > capacity_) {
    const auto& victim = lru_.back();
    std::cout << "[session-cache] lru-evict key=" << victim.key.substr(0, 12)
              << " native_session_id=" << victim.native_session_id << "\n";
    index_.erase(victim.key);
    lru_.pop_back();
    removed++;
  }
  stats_.evictions += removed;
  return removed;
}

std::optional<std::string> InMemorySessionCache::Lookup(const std::string& key) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = index_.find(key);
  if (it == index_.end()) return std::nullopt;
  if (ExpiredLocked(*it->second, Now())) return std::nullopt;
  return it->second->native_session_id;
}

std::optional<std::string> InMemorySessionCache::EstablishOrReuse(const std::string& key,
                                                                  const EstablishFn& establish,
                                                                  EngineError* err) {
  std::promise<Outcome> promise;
  std::shared_future<Outcome> pending;
  bool leader = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    const auto now = Now();
    auto it = index_.find(key);
    if (it != index_.end()) {
      if (!ExpiredLocked(*it->second, now)) {
        it->second->last_used_at = now;
        lru_.splice(lru_.begin(), lru_, it->second);
        stats_.hits++;
        return it->second->native_session_id;
      }
      EraseLocked(it);
      stats_.evictions++;
    }
    auto fit = in_flight_.find(key);
    if (fit != in_flight_.end()) {
      pending = fit->second;
    } else {
      stats_.misses++;
      pending = promise.get_future().share();
      in_flight_.emplace(key, pending);
      leader = true;
    }
  }

  if (!leader) {
    const Outcome& shared = pending.get();
    if (!shared.native_session_id && err) *err = shared.error;
    return shared.native_session_id;
  }

  Outcome outcome;
  std::exception_ptr thrown;
  try {
    outcome.native_session_id = establish(&outcome.error);
  } catch (const std::exception& e) {
    outcome.native_session_id.reset();
    SetError(&outcome.error, ErrorKind::kSessionEstablishment, e.what());
  } catch (...) {
    outcome.native_session_id.reset();
    SetError(&outcome.error, ErrorKind::kSessionEstablishment, "session establishment threw");
    thrown = std::current_exception();
  }
  if (outcome.native_session_id && outcome.native_session_id->empty()) outcome.native_session_id.reset();
  if (!outcome.native_session_id && !outcome.error) {
    SetError(&outcome.error, ErrorKind::kSessionEstablishment, "no native session id returned");
  }

  {
    std::lock_guard<std::mutex> lock(mu_);
    in_flight_.erase(key);
    if (outcome.native_session_id) {
      const auto now = Now();
      lru_.push_front(SessionRecord{key, *outcome.native_session_id, now, now});
      index_[key] = lru_.begin();
      stats_.establishments++;
      EnforceCapacityLocked();
    } else {
      stats_.establish_failures++;
    }
  }
  promise.set_value(outcome);

  if (thrown) std::rethrow_exception(thrown);
  if (!outcome.native_session_id && err) *err = outcome.error;
  return outcome.native_session_id;
}

void InMemorySessionCache::Invalidate(const std::string& key) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = index_.find(key);
  if (it == index_.end()) return;
  std::cout << "[session-cache] invalidate key=" << key.substr(0, 12)
            << " native_session_id=" << it->second->native_session_id << "\n";
  EraseLocked(it);
}

size_t InMemorySessionCache::Evict() {
  std::lock_guard<std::mutex> lock(mu_);
  const auto now = Now();
  size_t removed = 0;
  for (auto it = index_.begin(); it != index_.end();) {
    if (ExpiredLocked(*it->second, now)) {
      lru_.erase(it->second);
      it = index_.erase(it);
      removed++;
    } else {
      ++it;
    }
  }
  stats_.evictions += removed;
  return removed + EnforceCapacityLocked();
}

SessionCacheStats InMemorySessionCache::Stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  SessionCacheStats out = stats_;
  out.size = lru_.size();
  out.in_flight = in_flight_.size();
  return out;
}

SessionSweeper::SessionSweeper(ISessionCache* cache, std::chrono::seconds interval)
    : cache_(cache), interval_(interval) {
  thread_ = std::thread([this] { Run(); });
}

SessionSweeper::~SessionSweeper() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void SessionSweeper::Run() {
  std::unique_lock<std::mutex> lock(mu_);
  while (!stop_) {
    if (cv_.wait_for(lock, interval_, [this] { return stop_; })) break;
    lock.unlock();
    const size_t removed = cache_ ? cache_->Evict() : 0;
    if (removed > 0) {
      const auto stats = cache_->Stats();
      std::cout << "[session-cache] sweep evicted=" << removed << " size=" << stats.size << "\n";
    }
    lock.lock();
  }
}

std::unique_ptr<ISessionCache> MakeSessionCache(const SessionConfig& cfg) {
  return std::make_unique<InMemorySessionCache>(std::chrono::seconds(cfg.ttl_seconds), cfg.capacity);
}

}  // namespace bridge
