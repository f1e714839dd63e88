/**
 * Pipeline Stages
 * ===============
 *
 * Every stage, whatever its kind, is invoked through one uniform contract:
 *
 *   void process(PipelineWork& work, const StageConfig& config, StageCompletion done)
 *
 * The stage reads what earlier stages left in the work item, stores its own
 * result there and calls done exactly once, with a one-line summary for the
 * stage history or with the exception it failed with (a StageError: LoadError,
 * SplitError, EmbedError, StoreError). done may be called before process
 * returns or later from any thread; the work item stays valid until then, the
 * config only for the duration of the call. Throwing from process counts as
 * a failure too.
 *
 * The collaborator interfaces below are adapted into that contract by the
 * make_*_stage() helpers, which also enforce the output shape each kind must
 * produce. Those stages complete inline.
 */

#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <boost/json.hpp>
#include "docflow/types.hpp"

namespace docflow {

// Everything a file carries through its pipeline run
struct PipelineWork {
    std::string file_id;
    std::string display_name;
    std::string raw_payload;
    boost::json::object metadata;

    std::vector<LoadedDocument> documents;
    std::vector<TextChunk> chunks;
    std::vector<Embedding> vectors;
    StoreAck ack;
};

// Summary on success; error is set on failure and the summary is then ignored
using StageCompletion = std::function<void(std::string summary, std::exception_ptr error)>;
using ProcessFn = std::function<void(PipelineWork& work, const StageConfig& config, StageCompletion done)>;

// Adapts a stage body that finishes on the calling thread: its return value
// completes the stage, an exception it throws fails it
using InlineProcessFn = std::function<std::string(PipelineWork& work, const StageConfig& config)>;
ProcessFn inline_process(InlineProcessFn body);

// One configurable setting of a stage
struct ConfigField {
    std::string name;
    std::string type;       // "number" or "text"
    boost::json::value default_value;
    std::string description;
};

using ConfigSchema = std::vector<ConfigField>;

struct PipelineStageDescriptor {
    StageKind kind = StageKind::Loader;
    std::string name;
    std::string description;
    ConfigSchema config_schema;
    ProcessFn process;
};

// Schema defaults overlaid with the caller's settings
StageConfig with_defaults(const ConfigSchema& schema, const StageConfig& config);

// Typed setting lookup; numeric strings are accepted for numbers
int64_t config_int(const StageConfig& config, const std::string& key, int64_t fallback);
std::string config_string(const StageConfig& config, const std::string& key, const std::string& fallback);

// =============================================================================
// Collaborator interfaces
// =============================================================================

class Loader {
public:
    virtual ~Loader() = default;

    /**
     * Extract documents from a raw payload
     * @param raw_payload File content as transferred
     * @param config Effective stage settings
     * @return At least one document; extra documents become derived files
     */
    virtual std::vector<LoadedDocument> load(const std::string& raw_payload, const StageConfig& config) = 0;
};

class Splitter {
public:
    virtual ~Splitter() = default;

    virtual std::vector<TextChunk> split(const LoadedDocument& document, const StageConfig& config) = 0;
};

class Vectorizer {
public:
    virtual ~Vectorizer() = default;

    /**
     * Embed one batch of chunks
     * @param chunks Batch of at most batch_size chunks
     * @param config Effective stage settings
     * @return Exactly one vector per chunk, in order
     */
    virtual std::vector<Embedding> embed(const std::vector<TextChunk>& chunks, const StageConfig& config) = 0;
};

class Sink {
public:
    virtual ~Sink() = default;

    // metadata always carries "fileID"
    virtual StoreAck store(const std::vector<TextChunk>& chunks,
                           const std::vector<Embedding>& vectors,
                           const boost::json::object& metadata) = 0;
};

PipelineStageDescriptor make_loader_stage(std::string name, std::string description,
                                          ConfigSchema schema, std::shared_ptr<Loader> loader);
PipelineStageDescriptor make_splitter_stage(std::string name, std::string description,
                                            ConfigSchema schema, std::shared_ptr<Splitter> splitter);

// Calls the vectorizer in batches of the "batch_size" setting (default 64)
PipelineStageDescriptor make_vectorizer_stage(std::string name, std::string description,
                                              ConfigSchema schema, std::shared_ptr<Vectorizer> vectorizer);
PipelineStageDescriptor make_sink_stage(std::string name, std::string description,
                                        ConfigSchema schema, std::shared_ptr<Sink> sink);

} // namespace docflow
