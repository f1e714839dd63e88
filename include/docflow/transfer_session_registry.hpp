#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace docflow {

struct TransferSessionInfo {
    std::string transfer_id;
    uint32_t total_count = 0;
    size_t received = 0;
    std::chrono::steady_clock::time_point created_at{};
    // Set when the transfer was already reassembled and only its record remains
    bool completed = false;
};

/**
 * Server-side reassembly buffers, one per in-flight transfer.
 *
 * Every operation takes a single short-held lock; fragment delivery, the
 * sweep timer and cancellation may run on different threads. A session is
 * removed by reassemble(), cancel(), sweep_expired() or when a malformed
 * fragment is rejected, and is never observable after that.
 *
 * A reassembled transfer leaves a completion record behind until the next
 * sweep_expired() older than max_age, so a late duplicate fragment cannot
 * open a fresh session and deliver the payload a second time.
 */
class TransferSessionRegistry {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit TransferSessionRegistry(Clock clock = {});

    TransferSessionRegistry(const TransferSessionRegistry&) = delete;
    TransferSessionRegistry& operator=(const TransferSessionRegistry&) = delete;

    // Throws ReassemblyError (CONFLICTING_TOTAL) and discards the session when
    // total_count differs from the value the session was created with.
    // A completed transfer is reported with completed set and is not reopened.
    TransferSessionInfo get_or_create(const std::string& transfer_id, uint32_t total_count);

    // Stores one fragment and reports whether the session is now complete.
    // A repeated index, or any fragment of a completed transfer, is a no-op.
    // Throws ReassemblyError for an index outside [0, total) or a conflicting total.
    bool add_fragment(const std::string& transfer_id, uint32_t index, uint32_t total_count,
                      const std::string& bytes);

    bool is_complete(const std::string& transfer_id) const;

    // Concatenates by index and removes the session in one step; nullopt when
    // the session is unknown or still incomplete
    std::optional<std::string> reassemble(const std::string& transfer_id);

    bool cancel(const std::string& transfer_id);

    // Removes incomplete sessions created more than max_age ago and returns
    // their ids; completion records older than max_age are dropped silently
    std::vector<std::string> sweep_expired(std::chrono::milliseconds max_age);

    std::optional<TransferSessionInfo> find(const std::string& transfer_id) const;
    size_t size() const;

private:
    struct Session {
        uint32_t total_count = 0;
        std::map<uint32_t, std::string> fragments;
        std::chrono::steady_clock::time_point created_at;
    };

    bool completed_locked(const std::string& transfer_id) const;
    Session& get_or_create_locked(const std::string& transfer_id, uint32_t total_count);
    static TransferSessionInfo info_of(const std::string& transfer_id, const Session& session);

    Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Session> sessions_;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> completed_;
};

} // namespace docflow
