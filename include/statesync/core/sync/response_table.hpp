#pragma once

#include <chrono>
#include <future>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <exception>

#include "statesync/core/protocol/message.hpp"
#include "statesync/core/sync/error.hpp"
#include "lcr/log/logger.hpp"


namespace statesync::core::sync {

/*
===============================================================================
 sync::ResponseTable
===============================================================================

Correlates outbound requests with their eventual response.

    add(id, timeout)    → std::future<Message>
    resolve(message)    → fulfils the entry keyed by message.correlation_id()
    expire(now)         → rejects overdue entries with ResponseTimeout
    reject_all(err)     → rejects everything (disconnect)

Every entry ends exactly once: resolved, timed out or cancelled. The entry is
erased in the same step that completes its promise, so no path can complete
a promise twice and nothing is leaked.

A timeout is a local verdict only. The request may still reach the remote
authority and be processed (at-least-once, not exactly-once). A late
response for an expired id simply finds no entry and goes to the type
handlers like any other message.
===============================================================================
*/
template <typename Clock = std::chrono::steady_clock>
class ResponseTable {
public:
    using time_point = typename Clock::time_point;

    ResponseTable() = default;
    ResponseTable(const ResponseTable&) = delete;
    ResponseTable& operator=(const ResponseTable&) = delete;

    ~ResponseTable() {
        reject_all(Error::Disconnected);
    }

    [[nodiscard]]
    inline std::future<protocol::Message> add(const std::string& id, std::chrono::milliseconds timeout) {
        Entry entry;
        entry.deadline = Clock::now() + timeout;
        auto future = entry.promise.get_future();
        auto [it, inserted] = entries_.emplace(id, std::move(entry));
        if (!inserted) [[unlikely]] {
            // Ids are random uuids; a clash means the caller reused one
            SS_ERROR("[PENDING] Duplicate request id " << id << ". Rejecting the new request.");
            std::promise<protocol::Message> dup;
            auto dup_future = dup.get_future();
            dup.set_exception(std::make_exception_ptr(SyncError(Error::InvalidMessage, "duplicate request id " + id)));
            return dup_future;
        }
        SS_TRACE("[PENDING] Registered " << id << " (timeout " << timeout.count() << " ms)");
        return future;
    }

    // Returns true if the message completed a pending request.
    [[nodiscard]]
    inline bool resolve(const protocol::Message& msg) {
        const std::string& key = msg.correlation_id();
        if (key.empty()) {
            return false;
        }
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return false;
        }
        SS_DEBUG("[PENDING] Resolved " << key << " with '" << msg.type_name() << "'");
        it->second.promise.set_value(msg);
        entries_.erase(it);
        ++resolved_;
        return true;
    }

    // Rejects one entry (e.g. its request could not be queued).
    inline bool reject(std::string_view id, Error err, const std::string& why) {
        auto it = entries_.find(std::string(id));
        if (it == entries_.end()) {
            return false;
        }
        it->second.promise.set_exception(std::make_exception_ptr(SyncError(err, why)));
        entries_.erase(it);
        return true;
    }

    // Rejects entries whose deadline has passed. Returns how many expired.
    inline std::size_t expire(time_point now) {
        std::vector<std::string> overdue;
        for (const auto& [id, entry] : entries_) {
            if (now >= entry.deadline) {
                overdue.push_back(id);
            }
        }
        for (const auto& id : overdue) {
            SS_WARN("[PENDING] Request " << id << " timed out");
            (void)reject(id, Error::ResponseTimeout, "response timeout for " + id);
            ++timed_out_;
        }
        return overdue.size();
    }

    inline std::size_t reject_all(Error err) {
        const std::size_t n = entries_.size();
        if (n > 0) {
            SS_INFO("[PENDING] Rejecting " << n << " pending request(s): " << to_string(err));
        }
        for (auto& [id, entry] : entries_) {
            entry.promise.set_exception(std::make_exception_ptr(SyncError(err, std::string(to_string(err)) + " before response to " + id)));
        }
        entries_.clear();
        return n;
    }

    [[nodiscard]] inline bool contains(const std::string& id) const { return entries_.find(id) != entries_.end(); }
    [[nodiscard]] inline std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] inline bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] inline std::uint64_t resolved() const noexcept { return resolved_; }
    [[nodiscard]] inline std::uint64_t timed_out() const noexcept { return timed_out_; }

private:
    struct Entry {
        std::promise<protocol::Message> promise;
        time_point deadline{};
    };

    std::unordered_map<std::string, Entry> entries_;
    std::uint64_t resolved_{0};
    std::uint64_t timed_out_{0};
};

} // namespace statesync::core::sync
