#pragma once

#include "tablepod/core/model/Session.h"
#include "tablepod/core/model/Settings.h"
#include "tablepod/core/util/SecureRandom.h"
#include "tablepod/core/util/Timestamp.h"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tablepod::core::session {

struct SessionSlot {
    std::mutex mutex;
    model::Session session;
};

// Exclusive access to one session for as long as the lease lives.
class SessionLease {
public:
    SessionLease() = default;
    explicit SessionLease(std::shared_ptr<SessionSlot> slot);
    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;
    SessionLease(SessionLease&& other) noexcept;
    SessionLease& operator=(SessionLease&& other) noexcept;
    ~SessionLease();

    model::Session& session() { return slot_->session; }
    const model::Session& session() const { return slot_->session; }
    model::Session* operator->() { return &slot_->session; }
    bool valid() const { return slot_ != nullptr && lock_.owns_lock(); }

    void Release();

private:
    std::shared_ptr<SessionSlot> slot_;
    std::unique_lock<std::mutex> lock_;
};

// Room code to session map. The map lock is held only for lookup, insert and
// erase; each session has its own lock, so sessions never block each other.
class SessionRegistry {
public:
    using SweepCallback = std::function<void(std::vector<model::Session>)>;

    static constexpr int kMinCodeLength = 4;
    static constexpr int kMaxCodeLength = 12;
    static constexpr int kMaxCodeAttempts = 1000;

    SessionRegistry(util::SecureRandom& random, std::function<void(const std::string&)> log_fn = {});
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Returns a lease on the new session, or an invalid lease with error set.
    SessionLease Create(const std::string& host_id,
                        int code_length,
                        std::chrono::minutes ttl,
                        const model::Settings& settings,
                        util::TimePoint now,
                        std::string* error);

    // Adds a restored session. Fails when its code is taken.
    bool Insert(model::Session session, std::string* error);

    // Invalid lease when the code is unknown. Lookup is case-insensitive.
    SessionLease Acquire(const std::string& code);
    bool Contains(const std::string& code) const;
    // Evicts without touching the session. Returns a snapshot of it.
    bool Remove(const std::string& code, model::Session* removed = nullptr);

    std::vector<std::string> Codes() const;
    size_t size() const;

    // Ends, archives and evicts every session expired at now. Each session is
    // locked individually. Returns snapshots of the evicted sessions.
    std::vector<model::Session> SweepExpired(util::TimePoint now);

    void StartSweeper(std::chrono::milliseconds interval, SweepCallback on_swept);
    void StopSweeper();
    bool sweeper_running() const;

    static std::string NormalizeCode(const std::string& code);
    std::string GenerateCode(int length);

private:
    std::shared_ptr<SessionSlot> FindSlot(const std::string& key) const;
    void SweepLoop(std::chrono::milliseconds interval, SweepCallback on_swept);
    void Log(const std::string& message) const;

    util::SecureRandom& random_;
    std::function<void(const std::string&)> log_fn_;

    mutable std::mutex map_mutex_;
    std::map<std::string, std::shared_ptr<SessionSlot>> sessions_;

    mutable std::mutex sweeper_mutex_;
    std::condition_variable sweeper_cv_;
    bool stop_sweeper_ = false;
    std::thread sweeper_;
};

}  // namespace tablepod::core::session
