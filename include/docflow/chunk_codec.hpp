#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "docflow/transfer_session_registry.hpp"

namespace docflow {

// One bounded-size slice of a transfer payload
struct TransferFragment {
    std::string transfer_id;
    uint32_t sequence_index = 0;
    uint32_t total_count = 0;
    bool is_last = false;
    std::string bytes;
};

/**
 * Lazily produced fragments of one payload.
 *
 * Holds its own copy of the payload. Not restartable: once next() returns
 * nullopt the sequence is exhausted; call ChunkCodec::split() again for a
 * fresh one.
 */
class FragmentSequence {
public:
    FragmentSequence(std::string transfer_id, std::string payload, size_t fragment_size);

    std::optional<TransferFragment> next();

    uint32_t total() const { return total_; }
    uint32_t emitted() const { return next_index_; }

private:
    std::string transfer_id_;
    std::string payload_;
    size_t fragment_size_;
    uint32_t total_;
    uint32_t next_index_ = 0;
};

/**
 * Splits payloads into fragments and feeds received fragments into a
 * TransferSessionRegistry. The codec keeps no per-transfer state.
 */
class ChunkCodec {
public:
    explicit ChunkCodec(TransferSessionRegistry& registry) : registry_(registry) {}

    // total = ceil(size / fragment_size); an empty payload still yields one
    // empty fragment. Throws InvalidArgumentError for fragment_size 0.
    static FragmentSequence split(const std::string& transfer_id, std::string payload, size_t fragment_size);

    // Returns the payload in sequence order once the transfer is complete, at
    // most once per transfer id while its completion record lasts.
    // Throws ReassemblyError for a malformed fragment; the transfer is dropped.
    std::optional<std::string> feed(const TransferFragment& fragment);

private:
    TransferSessionRegistry& registry_;
};

} // namespace docflow
