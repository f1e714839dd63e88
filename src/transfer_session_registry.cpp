#include "docflow/transfer_session_registry.hpp"
#include "docflow/error.hpp"
#include "docflow/logging.hpp"
#include "docflow/metrics.hpp"

namespace docflow {

TransferSessionRegistry::TransferSessionRegistry(Clock clock)
    : clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); })) {}

TransferSessionInfo TransferSessionRegistry::get_or_create(const std::string& transfer_id, uint32_t total_count) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto done = completed_.find(transfer_id);
    if (done != completed_.end()) {
        return TransferSessionInfo{transfer_id, total_count, total_count, done->second, true};
    }
    return info_of(transfer_id, get_or_create_locked(transfer_id, total_count));
}

bool TransferSessionRegistry::add_fragment(const std::string& transfer_id, uint32_t index, uint32_t total_count,
                                           const std::string& bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (completed_locked(transfer_id)) {
        DOCFLOW_LOG_DEBUG("Late fragment " + std::to_string(index) + " for completed transfer " + transfer_id);
        Metrics::getInstance().increment_counter("fragments_duplicated");
        return false;
    }
    Session& session = get_or_create_locked(transfer_id, total_count);

    if (index >= session.total_count) {
        sessions_.erase(transfer_id);
        Metrics::getInstance().increment_counter("fragments_rejected");
        throw ReassemblyError("Fragment index " + std::to_string(index) + " outside total " +
                              std::to_string(total_count), transfer_id);
    }

    auto inserted = session.fragments.emplace(index, bytes).second;
    if (inserted) {
        Metrics::getInstance().increment_counter("fragments_received");
    } else {
        DOCFLOW_LOG_DEBUG("Duplicate fragment " + std::to_string(index) + " for transfer " + transfer_id);
        Metrics::getInstance().increment_counter("fragments_duplicated");
    }
    return session.fragments.size() == session.total_count;
}

bool TransferSessionRegistry::is_complete(const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(transfer_id);
    return it != sessions_.end() && it->second.fragments.size() == it->second.total_count;
}

std::optional<std::string> TransferSessionRegistry::reassemble(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(transfer_id);
    if (it == sessions_.end() || it->second.fragments.size() != it->second.total_count) {
        return std::nullopt;
    }

    size_t length = 0;
    for (const auto& [index, bytes] : it->second.fragments) {
        length += bytes.size();
    }
    std::string payload;
    payload.reserve(length);
    for (const auto& [index, bytes] : it->second.fragments) {
        payload += bytes;
    }

    sessions_.erase(it);
    completed_[transfer_id] = clock_();
    Metrics::getInstance().increment_counter("transfers_completed");
    return payload;
}

bool TransferSessionRegistry::cancel(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.erase(transfer_id) == 0) {
        return false;
    }
    DOCFLOW_LOG_INFO("Transfer " + transfer_id + " cancelled");
    Metrics::getInstance().increment_counter("transfers_cancelled");
    return true;
}

std::vector<std::string> TransferSessionRegistry::sweep_expired(std::chrono::milliseconds max_age) {
    std::vector<std::string> expired;
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (now - it->second.created_at > max_age) {
            DOCFLOW_LOG_INFO("Discarding stale transfer " + it->first + " (" +
                             std::to_string(it->second.fragments.size()) + "/" +
                             std::to_string(it->second.total_count) + " fragments)");
            expired.push_back(it->first);
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
    for (auto it = completed_.begin(); it != completed_.end();) {
        if (now - it->second > max_age) {
            it = completed_.erase(it);
        } else {
            ++it;
        }
    }
    if (!expired.empty()) {
        Metrics::getInstance().increment_counter("transfers_expired", {}, static_cast<int64_t>(expired.size()));
    }
    return expired;
}

std::optional<TransferSessionInfo> TransferSessionRegistry::find(const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(transfer_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return info_of(it->first, it->second);
}

size_t TransferSessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

bool TransferSessionRegistry::completed_locked(const std::string& transfer_id) const {
    return completed_.find(transfer_id) != completed_.end();
}

TransferSessionRegistry::Session& TransferSessionRegistry::get_or_create_locked(const std::string& transfer_id,
                                                                                uint32_t total_count) {
    if (total_count == 0) {
        sessions_.erase(transfer_id);
        Metrics::getInstance().increment_counter("fragments_rejected");
        throw ReassemblyError("Transfer total must be positive", transfer_id);
    }

    auto it = sessions_.find(transfer_id);
    if (it == sessions_.end()) {
        Session session;
        session.total_count = total_count;
        session.created_at = clock_();
        return sessions_.emplace(transfer_id, std::move(session)).first->second;
    }

    if (it->second.total_count != total_count) {
        uint32_t previous = it->second.total_count;
        sessions_.erase(it);
        Metrics::getInstance().increment_counter("fragments_rejected");
        throw ReassemblyError("Conflicting total " + std::to_string(total_count) + " (session declared " +
                              std::to_string(previous) + ")", transfer_id, ErrorCode::CONFLICTING_TOTAL);
    }
    return it->second;
}

TransferSessionInfo TransferSessionRegistry::info_of(const std::string& transfer_id, const Session& session) {
    return TransferSessionInfo{transfer_id, session.total_count, session.fragments.size(), session.created_at, false};
}

} // namespace docflow
