#include "docflow/builtin_stages.hpp"
#include "docflow/error.hpp"
#include "docflow/logging.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace docflow {

namespace {

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

void collect_strings(const boost::json::value& value, std::vector<std::string>& out) {
    switch (value.kind()) {
        case boost::json::kind::string: {
            const auto& s = value.get_string();
            if (!s.empty()) {
                out.emplace_back(s.data(), s.size());
            }
            break;
        }
        case boost::json::kind::array:
            for (const auto& element : value.get_array()) {
                collect_strings(element, out);
            }
            break;
        case boost::json::kind::object:
            for (const auto& item : value.get_object()) {
                collect_strings(item.value(), out);
            }
            break;
        default:
            break;
    }
}

LoadedDocument flatten(const boost::json::value& value) {
    LoadedDocument document;
    std::vector<std::string> parts;
    collect_strings(value, parts);
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) document.text += '\n';
        document.text += parts[i];
    }

    if (value.is_object()) {
        const auto& object = value.get_object();
        for (const char* key : {"title", "name"}) {
            const boost::json::value* title = object.if_contains(key);
            if (title && title->is_string()) {
                document.title.assign(title->get_string().data(), title->get_string().size());
                break;
            }
        }
        document.meta["fields"] = object.size();
    }
    return document;
}

std::string join(const std::vector<std::string>& words, size_t begin, size_t end) {
    std::string text;
    for (size_t i = begin; i < end; ++i) {
        if (i > begin) text += ' ';
        text += words[i];
    }
    return text;
}

// 64-bit FNV-1a
uint64_t feature_hash(const std::string& token) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : token) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

bool is_word_byte(unsigned char c) {
    return std::isalnum(c) || c >= 0x80;
}

} // namespace

// =============================================================================
// Loaders
// =============================================================================

std::vector<LoadedDocument> TextLoader::load(const std::string& raw_payload, const StageConfig&) {
    if (trim(raw_payload).empty()) {
        throw LoadError("Document is empty");
    }
    LoadedDocument document;
    document.text = raw_payload;
    return {document};
}

std::vector<LoadedDocument> JsonLoader::load(const std::string& raw_payload, const StageConfig&) {
    boost::system::error_code ec;
    boost::json::value root = boost::json::parse(raw_payload, ec);
    if (ec) {
        throw LoadError("Invalid JSON document: " + ec.message());
    }

    std::vector<LoadedDocument> documents;
    if (root.is_array()) {
        for (const auto& element : root.get_array()) {
            auto document = flatten(element);
            if (!trim(document.text).empty()) {
                documents.push_back(std::move(document));
            }
        }
    } else {
        auto document = flatten(root);
        if (!trim(document.text).empty()) {
            documents.push_back(std::move(document));
        }
    }

    if (documents.empty()) {
        throw LoadError("JSON document contains no text");
    }
    return documents;
}

// =============================================================================
// Splitters
// =============================================================================

std::vector<TextChunk> TokenSplitter::split(const LoadedDocument& document, const StageConfig& config) {
    int64_t units = config_int(config, "units", 250);
    int64_t overlap = config_int(config, "overlap", 50);
    if (units <= 0) {
        throw SplitError("units must be positive");
    }
    if (overlap < 0 || overlap >= units) {
        throw SplitError("overlap (" + std::to_string(overlap) + ") must be smaller than units (" +
                         std::to_string(units) + ")");
    }

    std::vector<std::string> words;
    std::istringstream stream(document.text);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }

    std::vector<TextChunk> chunks;
    if (words.empty()) {
        return chunks;
    }

    const size_t window = static_cast<size_t>(units);
    const size_t step = static_cast<size_t>(units - overlap);
    for (size_t start = 0;; start += step) {
        size_t end = std::min(words.size(), start + window);
        chunks.push_back(TextChunk{chunks.size(), join(words, start, end)});
        if (end == words.size()) {
            break;
        }
    }
    return chunks;
}

std::vector<TextChunk> SentenceSplitter::split(const LoadedDocument& document, const StageConfig& config) {
    int64_t per_chunk = config_int(config, "sentences", 5);
    if (per_chunk <= 0) {
        throw SplitError("sentences must be positive");
    }

    std::vector<std::string> sentences;
    const std::string& text = document.text;
    size_t begin = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        bool boundary = (c == '.' || c == '!' || c == '?') &&
                        (i + 1 == text.size() || std::isspace(static_cast<unsigned char>(text[i + 1])));
        if (boundary) {
            auto sentence = trim(text.substr(begin, i + 1 - begin));
            if (!sentence.empty()) sentences.push_back(std::move(sentence));
            begin = i + 1;
        }
    }
    auto tail = trim(text.substr(begin));
    if (!tail.empty()) {
        sentences.push_back(std::move(tail));
    }

    std::vector<TextChunk> chunks;
    const size_t group = static_cast<size_t>(per_chunk);
    for (size_t start = 0; start < sentences.size(); start += group) {
        size_t end = std::min(sentences.size(), start + group);
        chunks.push_back(TextChunk{chunks.size(), join(sentences, start, end)});
    }
    return chunks;
}

// =============================================================================
// Vectorizer
// =============================================================================

std::vector<Embedding> HashingVectorizer::embed(const std::vector<TextChunk>& chunks, const StageConfig& config) {
    int64_t dimensions = config_int(config, "dimensions", 256);
    if (dimensions <= 0) {
        throw EmbedError("dimensions must be positive");
    }
    const size_t size = static_cast<size_t>(dimensions);

    std::vector<Embedding> vectors;
    vectors.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        Embedding vector(size, 0.0f);
        std::string token;
        auto add_token = [&]() {
            if (token.empty()) return;
            uint64_t hash = feature_hash(token);
            float sign = (hash >> 63) ? -1.0f : 1.0f;
            vector[hash % size] += sign;
            token.clear();
        };
        for (unsigned char c : chunk.text) {
            if (is_word_byte(c)) {
                token += static_cast<char>(c < 0x80 ? std::tolower(c) : c);
            } else {
                add_token();
            }
        }
        add_token();

        double norm = 0.0;
        for (float v : vector) norm += static_cast<double>(v) * v;
        if (norm > 0.0) {
            float scale = static_cast<float>(1.0 / std::sqrt(norm));
            for (float& v : vector) v *= scale;
        }
        vectors.push_back(std::move(vector));
    }
    return vectors;
}

// =============================================================================
// In-memory sink
// =============================================================================

StoreAck InMemoryVectorStore::store(const std::vector<TextChunk>& chunks,
                                    const std::vector<Embedding>& vectors,
                                    const boost::json::object& metadata) {
    const boost::json::value* id = metadata.if_contains("fileID");
    if (!id || !id->is_string() || id->get_string().empty()) {
        throw StoreError("Metadata carries no fileID");
    }
    if (chunks.size() != vectors.size()) {
        throw StoreError("Chunk and vector counts differ");
    }
    std::string file_id(id->get_string().data(), id->get_string().size());

    Entry entry;
    entry.metadata = metadata;
    entry.chunks.reserve(chunks.size());
    for (size_t i = 0; i < chunks.size(); ++i) {
        entry.chunks.push_back(StoredChunk{chunks[i], vectors[i]});
    }

    std::lock_guard<std::mutex> lock(mutex_);
    bool replaced = files_.count(file_id) > 0;
    files_[file_id] = std::move(entry);
    DOCFLOW_LOG_DEBUG("Stored " + std::to_string(chunks.size()) + " chunks for " + file_id +
                      (replaced ? " (replaced previous import)" : ""));
    return StoreAck{chunks.size()};
}

std::vector<StoredChunk> InMemoryVectorStore::chunks_of(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(file_id);
    return it == files_.end() ? std::vector<StoredChunk>{} : it->second.chunks;
}

std::optional<boost::json::object> InMemoryVectorStore::metadata_of(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(file_id);
    if (it == files_.end()) {
        return std::nullopt;
    }
    return it->second.metadata;
}

bool InMemoryVectorStore::remove(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.erase(file_id) > 0;
}

size_t InMemoryVectorStore::file_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.size();
}

size_t InMemoryVectorStore::chunk_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& [id, entry] : files_) {
        total += entry.chunks.size();
    }
    return total;
}

// =============================================================================
// Registration table
// =============================================================================

void register_builtin_stages(StageRegistry& registry, std::shared_ptr<InMemoryVectorStore> store) {
    registry.register_stage(make_loader_stage(
        "Default", "Imports plain text files", {}, std::make_shared<TextLoader>()));
    registry.register_stage(make_loader_stage(
        "JSON", "Imports JSON files; array elements become separate documents", {},
        std::make_shared<JsonLoader>()));

    registry.register_stage(make_splitter_stage(
        "Token", "Splits text into overlapping windows of words",
        {
            {"units", "number", boost::json::value(250), "Words per chunk"},
            {"overlap", "number", boost::json::value(50), "Words shared by consecutive chunks"},
        },
        std::make_shared<TokenSplitter>()));
    registry.register_stage(make_splitter_stage(
        "Sentence", "Splits text into groups of sentences",
        {
            {"sentences", "number", boost::json::value(5), "Sentences per chunk"},
        },
        std::make_shared<SentenceSplitter>()));

    registry.register_stage(make_vectorizer_stage(
        "Hashing", "Feature-hashed bag of words",
        {
            {"dimensions", "number", boost::json::value(256), "Vector dimensions"},
            {"batch_size", "number", boost::json::value(64), "Chunks per embedding call"},
        },
        std::make_shared<HashingVectorizer>()));

    registry.register_stage(make_sink_stage(
        "Memory", "Keeps vectors in process memory", {}, std::move(store)));

    DOCFLOW_LOG_INFO("Registered " + std::to_string(registry.size()) + " built-in pipeline stages");
}

} // namespace docflow
