#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "docflow/pipeline_stage.hpp"
#include "docflow/stage_registry.hpp"

namespace docflow {

// Loader "Default": the payload is the document text
class TextLoader : public Loader {
public:
    std::vector<LoadedDocument> load(const std::string& raw_payload, const StageConfig& config) override;
};

// Loader "JSON": string values are flattened into text; an array root yields
// one document per element
class JsonLoader : public Loader {
public:
    std::vector<LoadedDocument> load(const std::string& raw_payload, const StageConfig& config) override;
};

// Splitter "Token": windows of `units` whitespace tokens sharing `overlap`
class TokenSplitter : public Splitter {
public:
    std::vector<TextChunk> split(const LoadedDocument& document, const StageConfig& config) override;
};

// Splitter "Sentence": groups of `sentences` sentences
class SentenceSplitter : public Splitter {
public:
    std::vector<TextChunk> split(const LoadedDocument& document, const StageConfig& config) override;
};

// Vectorizer "Hashing": signed feature hashing of lower-cased words, L2-normalized
class HashingVectorizer : public Vectorizer {
public:
    std::vector<Embedding> embed(const std::vector<TextChunk>& chunks, const StageConfig& config) override;
};

struct StoredChunk {
    TextChunk chunk;
    Embedding vector;
};

// Sink "Memory": chunks and vectors per file id; a re-import replaces the file
class InMemoryVectorStore : public Sink {
public:
    StoreAck store(const std::vector<TextChunk>& chunks,
                   const std::vector<Embedding>& vectors,
                   const boost::json::object& metadata) override;

    std::vector<StoredChunk> chunks_of(const std::string& file_id) const;
    std::optional<boost::json::object> metadata_of(const std::string& file_id) const;
    bool remove(const std::string& file_id);
    size_t file_count() const;
    size_t chunk_count() const;

private:
    struct Entry {
        std::vector<StoredChunk> chunks;
        boost::json::object metadata;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Entry> files_;
};

// Registers Default, JSON, Token, Sentence, Hashing and Memory (backed by `store`)
void register_builtin_stages(StageRegistry& registry, std::shared_ptr<InMemoryVectorStore> store);

} // namespace docflow
