#include "tablepod/core/session/SessionRegistry.h"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace tablepod::core::session {

namespace {

// No 0/O, 1/I/L: codes are read aloud and typed on phones.
const char* const kCodeAlphabet = "ABCDEFGHJKMNPQRSTUVWXYZ23456789";

}  // namespace

SessionLease::SessionLease(std::shared_ptr<SessionSlot> slot)
    : slot_(std::move(slot)) {
    if (slot_) {
        lock_ = std::unique_lock<std::mutex>(slot_->mutex);
    }
}

SessionLease::SessionLease(SessionLease&& other) noexcept
    : slot_(std::move(other.slot_)), lock_(std::move(other.lock_)) {}

SessionLease& SessionLease::operator=(SessionLease&& other) noexcept {
    if (this != &other) {
        Release();
        slot_ = std::move(other.slot_);
        lock_ = std::move(other.lock_);
    }
    return *this;
}

SessionLease::~SessionLease() {
    Release();
}

void SessionLease::Release() {
    // Unlock before the slot can go away with its mutex.
    if (lock_.owns_lock()) {
        lock_.unlock();
    }
    lock_ = std::unique_lock<std::mutex>();
    slot_.reset();
}

SessionRegistry::SessionRegistry(util::SecureRandom& random, std::function<void(const std::string&)> log_fn)
    : random_(random), log_fn_(std::move(log_fn)) {}

SessionRegistry::~SessionRegistry() {
    StopSweeper();
}

SessionLease SessionRegistry::Create(const std::string& host_id,
                                     int code_length,
                                     std::chrono::minutes ttl,
                                     const model::Settings& settings,
                                     util::TimePoint now,
                                     std::string* error) {
    if (host_id.empty()) {
        if (error) {
            *error = "hostId is required";
        }
        return {};
    }
    if (code_length < kMinCodeLength || code_length > kMaxCodeLength) {
        if (error) {
            *error = "Code length must be between " + std::to_string(kMinCodeLength) + " and " +
                     std::to_string(kMaxCodeLength);
        }
        return {};
    }
    if (ttl.count() <= 0) {
        if (error) {
            *error = "Session lifetime must be positive";
        }
        return {};
    }

    for (int attempt = 0; attempt < kMaxCodeAttempts; ++attempt) {
        const auto code = GenerateCode(code_length);
        auto slot = std::make_shared<SessionSlot>();
        slot->session.code = code;
        slot->session.host_id = host_id;
        slot->session.created_at = now;
        slot->session.expires_at = now + ttl;
        slot->session.settings = settings;

        {
            std::lock_guard<std::mutex> lock(map_mutex_);
            if (!sessions_.emplace(code, slot).second) {
                continue;
            }
        }
        Log("created session " + code + " for host " + host_id);
        return SessionLease(std::move(slot));
    }

    if (error) {
        *error = "Unable to generate a unique room code. Try increasing code length.";
    }
    return {};
}

bool SessionRegistry::Insert(model::Session session, std::string* error) {
    const auto key = NormalizeCode(session.code);
    if (key.empty()) {
        if (error) {
            *error = "Session code is empty";
        }
        return false;
    }
    session.code = key;
    auto slot = std::make_shared<SessionSlot>();
    slot->session = std::move(session);

    std::lock_guard<std::mutex> lock(map_mutex_);
    if (!sessions_.emplace(key, std::move(slot)).second) {
        if (error) {
            *error = "Session " + key + " already exists";
        }
        return false;
    }
    return true;
}

SessionLease SessionRegistry::Acquire(const std::string& code) {
    auto slot = FindSlot(NormalizeCode(code));
    if (!slot) {
        return {};
    }
    return SessionLease(std::move(slot));
}

bool SessionRegistry::Contains(const std::string& code) const {
    return FindSlot(NormalizeCode(code)) != nullptr;
}

bool SessionRegistry::Remove(const std::string& code, model::Session* removed) {
    std::shared_ptr<SessionSlot> slot;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        const auto it = sessions_.find(NormalizeCode(code));
        if (it == sessions_.end()) {
            return false;
        }
        slot = it->second;
        sessions_.erase(it);
    }
    if (removed) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        *removed = slot->session;
    }
    return true;
}

std::vector<std::string> SessionRegistry::Codes() const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    std::vector<std::string> codes;
    codes.reserve(sessions_.size());
    for (const auto& [code, slot] : sessions_) {
        codes.push_back(code);
    }
    return codes;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    return sessions_.size();
}

std::vector<model::Session> SessionRegistry::SweepExpired(util::TimePoint now) {
    std::vector<std::pair<std::string, std::shared_ptr<SessionSlot>>> slots;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        slots.assign(sessions_.begin(), sessions_.end());
    }

    std::vector<model::Session> swept;
    for (auto& [code, slot] : slots) {
        std::unique_lock<std::mutex> session_lock(slot->mutex);
        auto& session = slot->session;
        if (!session.IsExpired(now)) {
            continue;
        }
        session.ArchiveCurrentRound(now);
        session.ended = true;
        session.archived = true;
        swept.push_back(session);
        session_lock.unlock();

        std::lock_guard<std::mutex> lock(map_mutex_);
        const auto it = sessions_.find(code);
        if (it != sessions_.end() && it->second == slot) {
            sessions_.erase(it);
        }
    }

    if (!swept.empty()) {
        Log("swept " + std::to_string(swept.size()) + " expired sessions");
    }
    return swept;
}

void SessionRegistry::StartSweeper(std::chrono::milliseconds interval, SweepCallback on_swept) {
    StopSweeper();
    std::lock_guard<std::mutex> lock(sweeper_mutex_);
    stop_sweeper_ = false;
    sweeper_ = std::thread(&SessionRegistry::SweepLoop, this, interval, std::move(on_swept));
}

void SessionRegistry::StopSweeper() {
    std::thread sweeper;
    {
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
        stop_sweeper_ = true;
        sweeper = std::move(sweeper_);
    }
    sweeper_cv_.notify_all();
    // Joined outside the lock: the loop reacquires it before exiting.
    if (sweeper.joinable()) {
        sweeper.join();
    }
}

bool SessionRegistry::sweeper_running() const {
    std::lock_guard<std::mutex> lock(sweeper_mutex_);
    return sweeper_.joinable() && !stop_sweeper_;
}

std::string SessionRegistry::NormalizeCode(const std::string& code) {
    std::string key;
    key.reserve(code.size());
    for (const char c : code) {
        const auto ch = static_cast<unsigned char>(c);
        if (std::isspace(ch)) {
            continue;
        }
        key.push_back(static_cast<char>(std::toupper(ch)));
    }
    return key;
}

std::string SessionRegistry::GenerateCode(int length) {
    return random_.Token(static_cast<size_t>(std::max(length, 0)), kCodeAlphabet);
}

std::shared_ptr<SessionSlot> SessionRegistry::FindSlot(const std::string& key) const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    const auto it = sessions_.find(key);
    return it == sessions_.end() ? nullptr : it->second;
}

void SessionRegistry::SweepLoop(std::chrono::milliseconds interval, SweepCallback on_swept) {
    Log("sweeper started, interval " + std::to_string(interval.count()) + " ms");
    std::unique_lock<std::mutex> lock(sweeper_mutex_);
    while (!stop_sweeper_) {
        if (sweeper_cv_.wait_for(lock, interval, [this]() { return stop_sweeper_; })) {
            break;
        }
        lock.unlock();
        auto swept = SweepExpired(util::Clock::now());
        if (!swept.empty() && on_swept) {
            on_swept(std::move(swept));
        }
        lock.lock();
    }
    Log("sweeper stopped");
}

void SessionRegistry::Log(const std::string& message) const {
    if (log_fn_) {
        log_fn_("[registry] " + message);
    } else {
        std::cerr << "[registry] " << message << '\n';
    }
}

}  // namespace tablepod::core::session
