#include "docflow/pipeline_stage.hpp"
#include "docflow/error.hpp"
#include "docflow/logging.hpp"
#include <algorithm>
#include <cmath>

namespace docflow {

StageConfig with_defaults(const ConfigSchema& schema, const StageConfig& config) {
    StageConfig effective;
    for (const auto& field : schema) {
        effective[field.name] = field.default_value;
    }
    for (const auto& item : config) {
        effective[item.key()] = item.value();
    }
    return effective;
}

int64_t config_int(const StageConfig& config, const std::string& key, int64_t fallback) {
    const boost::json::value* value = config.if_contains(key);
    if (!value || value->is_null()) {
        return fallback;
    }
    if (value->is_int64()) {
        return value->get_int64();
    }
    if (value->is_uint64()) {
        return static_cast<int64_t>(value->get_uint64());
    }
    if (value->is_double()) {
        return static_cast<int64_t>(std::llround(value->get_double()));
    }
    if (value->is_string()) {
        std::string text(value->get_string().data(), value->get_string().size());
        try {
            size_t used = 0;
            int64_t parsed = std::stoll(text, &used);
            if (used == text.size()) {
                return parsed;
            }
        } catch (const std::logic_error&) {
            // Falls through to the error below
        }
    }
    throw InvalidArgumentError("Setting '" + key + "' must be a number");
}

std::string config_string(const StageConfig& config, const std::string& key, const std::string& fallback) {
    const boost::json::value* value = config.if_contains(key);
    if (!value || !value->is_string()) {
        return fallback;
    }
    return std::string(value->get_string().data(), value->get_string().size());
}

ProcessFn inline_process(InlineProcessFn body) {
    return [body = std::move(body)](PipelineWork& work, const StageConfig& config, StageCompletion done) {
        std::string summary;
        try {
            summary = body(work, config);
        } catch (const std::exception&) {
            done({}, std::current_exception());
            return;
        }
        done(std::move(summary), nullptr);
    };
}

PipelineStageDescriptor make_loader_stage(std::string name, std::string description,
                                          ConfigSchema schema, std::shared_ptr<Loader> loader) {
    PipelineStageDescriptor descriptor;
    descriptor.kind = StageKind::Loader;
    descriptor.name = std::move(name);
    descriptor.description = std::move(description);
    descriptor.config_schema = std::move(schema);
    descriptor.process = inline_process([loader](PipelineWork& work, const StageConfig& config) {
        auto documents = loader->load(work.raw_payload, config);
        if (documents.empty()) {
            throw LoadError("Loader produced no documents", work.file_id);
        }
        work.documents = std::move(documents);
        return "Loaded " + std::to_string(work.documents.size()) + " document(s)";
    });
    return descriptor;
}

PipelineStageDescriptor make_splitter_stage(std::string name, std::string description,
                                            ConfigSchema schema, std::shared_ptr<Splitter> splitter) {
    PipelineStageDescriptor descriptor;
    descriptor.kind = StageKind::Splitter;
    descriptor.name = std::move(name);
    descriptor.description = std::move(description);
    descriptor.config_schema = std::move(schema);
    descriptor.process = inline_process([splitter](PipelineWork& work, const StageConfig& config) {
        if (work.documents.empty()) {
            throw SplitError("No document to split", work.file_id);
        }
        auto chunks = splitter->split(work.documents.front(), config);
        if (chunks.empty()) {
            throw SplitError("Document produced no chunks", work.file_id);
        }
        work.chunks = std::move(chunks);
        return "Split into " + std::to_string(work.chunks.size()) + " chunks";
    });
    return descriptor;
}

PipelineStageDescriptor make_vectorizer_stage(std::string name, std::string description,
                                              ConfigSchema schema, std::shared_ptr<Vectorizer> vectorizer) {
    PipelineStageDescriptor descriptor;
    descriptor.kind = StageKind::Vectorizer;
    descriptor.name = std::move(name);
    descriptor.description = std::move(description);
    descriptor.config_schema = std::move(schema);
    descriptor.process = inline_process([vectorizer](PipelineWork& work, const StageConfig& config) {
        int64_t batch_size = config_int(config, "batch_size", 64);
        if (batch_size <= 0) {
            throw EmbedError("batch_size must be positive", work.file_id);
        }

        std::vector<Embedding> vectors;
        vectors.reserve(work.chunks.size());
        size_t batches = 0;
        for (size_t offset = 0; offset < work.chunks.size(); offset += static_cast<size_t>(batch_size)) {
            size_t end = std::min(work.chunks.size(), offset + static_cast<size_t>(batch_size));
            std::vector<TextChunk> batch(work.chunks.begin() + static_cast<std::ptrdiff_t>(offset),
                                         work.chunks.begin() + static_cast<std::ptrdiff_t>(end));
            auto embedded = vectorizer->embed(batch, config);
            if (embedded.size() != batch.size()) {
                throw EmbedError("Vectorizer returned " + std::to_string(embedded.size()) + " vectors for " +
                                 std::to_string(batch.size()) + " chunks", work.file_id);
            }
            for (auto& vector : embedded) {
                vectors.push_back(std::move(vector));
            }
            ++batches;
        }
        DOCFLOW_LOG_DEBUG("Vectorized " + std::to_string(vectors.size()) + " chunks of " + work.file_id +
                          " in " + std::to_string(batches) + " batches");
        work.vectors = std::move(vectors);
        return "Vectorized " + std::to_string(work.vectors.size()) + " chunks";
    });
    return descriptor;
}

PipelineStageDescriptor make_sink_stage(std::string name, std::string description,
                                        ConfigSchema schema, std::shared_ptr<Sink> sink) {
    PipelineStageDescriptor descriptor;
    descriptor.kind = StageKind::Sink;
    descriptor.name = std::move(name);
    descriptor.description = std::move(description);
    descriptor.config_schema = std::move(schema);
    descriptor.process = inline_process([sink](PipelineWork& work, const StageConfig&) {
        if (work.vectors.size() != work.chunks.size()) {
            throw StoreError("Chunk and vector counts differ", work.file_id);
        }
        boost::json::object metadata = work.metadata;
        metadata["fileID"] = work.file_id;
        metadata["filename"] = work.display_name;
        if (!work.documents.empty() && !work.documents.front().meta.empty()) {
            metadata["document"] = work.documents.front().meta;
        }
        work.ack = sink->store(work.chunks, work.vectors, metadata);
        return "Stored " + std::to_string(work.ack.stored) + " chunks";
    });
    return descriptor;
}

} // namespace docflow
