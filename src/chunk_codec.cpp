#include "docflow/chunk_codec.hpp"
#include "docflow/error.hpp"
#include "docflow/logging.hpp"
#include "docflow/metrics.hpp"
#include <limits>

namespace docflow {

FragmentSequence::FragmentSequence(std::string transfer_id, std::string payload, size_t fragment_size)
    : transfer_id_(std::move(transfer_id)),
      payload_(std::move(payload)),
      fragment_size_(fragment_size) {
    DOCFLOW_CHECK_ARGUMENT(fragment_size_ > 0, "fragment size must be positive");

    size_t count = payload_.empty() ? 1 : (payload_.size() + fragment_size_ - 1) / fragment_size_;
    DOCFLOW_CHECK_ARGUMENT(count <= std::numeric_limits<uint32_t>::max(), "payload needs too many fragments");
    total_ = static_cast<uint32_t>(count);
}

std::optional<TransferFragment> FragmentSequence::next() {
    if (next_index_ >= total_) {
        return std::nullopt;
    }

    TransferFragment fragment;
    fragment.transfer_id = transfer_id_;
    fragment.sequence_index = next_index_;
    fragment.total_count = total_;
    fragment.is_last = next_index_ + 1 == total_;

    size_t offset = static_cast<size_t>(next_index_) * fragment_size_;
    if (offset < payload_.size()) {
        fragment.bytes = payload_.substr(offset, fragment_size_);
    }

    ++next_index_;
    if (next_index_ == total_) {
        // Exhausted, release the copy early
        std::string().swap(payload_);
    }
    return fragment;
}

FragmentSequence ChunkCodec::split(const std::string& transfer_id, std::string payload, size_t fragment_size) {
    return FragmentSequence(transfer_id, std::move(payload), fragment_size);
}

std::optional<std::string> ChunkCodec::feed(const TransferFragment& fragment) {
    if (fragment.total_count > 0 && fragment.is_last != (fragment.sequence_index + 1 == fragment.total_count)) {
        registry_.cancel(fragment.transfer_id);
        Metrics::getInstance().increment_counter("fragments_rejected");
        throw ReassemblyError("Fragment " + std::to_string(fragment.sequence_index) + "/" +
                              std::to_string(fragment.total_count) + " has inconsistent last-fragment flag",
                              fragment.transfer_id);
    }

    if (!registry_.add_fragment(fragment.transfer_id, fragment.sequence_index, fragment.total_count,
                                fragment.bytes)) {
        return std::nullopt;
    }

    auto payload = registry_.reassemble(fragment.transfer_id);
    if (payload) {
        DOCFLOW_LOG_DEBUG("Transfer " + fragment.transfer_id + " reassembled (" +
                          std::to_string(fragment.total_count) + " fragments, " +
                          std::to_string(payload->size()) + " bytes)");
    }
    return payload;
}

} // namespace docflow
