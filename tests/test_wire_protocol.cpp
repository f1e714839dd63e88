#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "docflow/config.hpp"
#include "docflow/error.hpp"
#include "docflow/wire_protocol.hpp"

namespace wire = docflow::wire;

class WireProtocolTest : public ::testing::Test {
protected:
    docflow::PipelineDefaults defaults_ = docflow::default_config().pipeline;
};

TEST_F(WireProtocolTest, ClassifiesInboundMessages) {
    EXPECT_EQ(wire::decode(wire::make_ping()).type, wire::MessageType::Ping);
    EXPECT_EQ(wire::decode(wire::make_pong()).type, wire::MessageType::Pong);
    EXPECT_EQ(wire::decode(wire::make_metrics_request()).type, wire::MessageType::Metrics);
    EXPECT_EQ(wire::decode(wire::encode_cancel("f1")).type, wire::MessageType::Cancel);
    EXPECT_EQ(wire::decode(wire::encode_snapshot_request({"f1"})).type, wire::MessageType::Snapshot);
    EXPECT_EQ(wire::decode(R"({"chunk":"x","isLastChunk":true,"total":1,"order":0,"fileID":"f1"})").type,
              wire::MessageType::Fragment);
    EXPECT_EQ(wire::decode(R"({"fileID":"f1","status":"DONE"})").type, wire::MessageType::Status);
    EXPECT_EQ(wire::decode(R"({"new_file_id":"f1_1","original_file_id":"f1"})").type,
              wire::MessageType::Derived);
    EXPECT_EQ(wire::decode(wire::encode_progress({"f1", 1, 2})).type, wire::MessageType::Progress);
    EXPECT_EQ(wire::decode(R"({"type":"hello"})").type, wire::MessageType::Unknown);
}

TEST_F(WireProtocolTest, MalformedTextIsProtocolError) {
    EXPECT_THROW(wire::decode("not json"), docflow::ProtocolError);
    EXPECT_THROW(wire::decode("[1,2]"), docflow::ProtocolError);
    EXPECT_FALSE(wire::is_ping("{"));
    EXPECT_TRUE(wire::is_ping(R"({"type":"ping"})"));
    EXPECT_TRUE(wire::is_pong(wire::make_pong()));
    EXPECT_FALSE(wire::is_pong(wire::make_ping()));
}

TEST_F(WireProtocolTest, FragmentFieldsAreValidated) {
    docflow::TransferFragment fragment;
    fragment.transfer_id = "f1";
    fragment.sequence_index = 2;
    fragment.total_count = 3;
    fragment.is_last = true;
    fragment.bytes = "tail";

    auto message = wire::decode(wire::encode_fragment(fragment));
    auto decoded = wire::decode_fragment(message.body);
    EXPECT_EQ(decoded.transfer_id, "f1");
    EXPECT_EQ(decoded.sequence_index, 2u);
    EXPECT_EQ(decoded.total_count, 3u);
    EXPECT_TRUE(decoded.is_last);
    EXPECT_EQ(decoded.bytes, "tail");
    EXPECT_TRUE(message.body.at("credentials").is_object());

    auto body = wire::decode(R"({"chunk":"x","isLastChunk":"yes","total":1,"order":0,"fileID":"f1"})").body;
    EXPECT_THROW(wire::decode_fragment(body), docflow::ProtocolError);
    body = wire::decode(R"({"chunk":"x","isLastChunk":true,"total":-1,"order":0,"fileID":"f1"})").body;
    EXPECT_THROW(wire::decode_fragment(body), docflow::ProtocolError);
    body = wire::decode(R"({"chunk":"x","isLastChunk":true,"total":1,"order":0.5,"fileID":"f1"})").body;
    EXPECT_THROW(wire::decode_fragment(body), docflow::ProtocolError);
    body = wire::decode(R"({"chunk":"x","isLastChunk":true,"total":1,"order":0,"fileID":""})").body;
    EXPECT_THROW(wire::decode_fragment(body), docflow::ProtocolError);
    body = wire::decode(R"({"chunk":"x","isLastChunk":true,"total":1.0,"order":0,"fileID":"f1"})").body;
    EXPECT_EQ(wire::decode_fragment(body).total_count, 1u);
}

TEST_F(WireProtocolTest, StatusCarriesStageNameAndSeconds) {
    docflow::StatusEvent event;
    event.file_id = "f1";
    event.state = docflow::IngestionState::running(docflow::StageKind::Vectorizer, "Hashing");
    event.stage_name = "Hashing";
    event.message = "Running Vectorizer Hashing";
    event.elapsed_ms = 1234;

    auto status = wire::decode_status(wire::decode(wire::encode_status(event)).body);
    EXPECT_EQ(status.file_id, "f1");
    EXPECT_EQ(status.status, "EMBEDDING");
    EXPECT_EQ(status.stage, "Hashing");
    EXPECT_EQ(status.message, "Running Vectorizer Hashing");
    EXPECT_DOUBLE_EQ(status.took, 1.23);
    EXPECT_FALSE(status.is_terminal());
}

TEST_F(WireProtocolTest, StatusNamesFollowThePipeline) {
    using docflow::IngestionState;
    using docflow::StageKind;
    EXPECT_STREQ(docflow::status_name(IngestionState::waiting()), "WAITING");
    EXPECT_STREQ(docflow::status_name(IngestionState::running(StageKind::Loader, "Default")), "LOADING");
    EXPECT_STREQ(docflow::status_name(IngestionState::running(StageKind::Splitter, "Token")), "CHUNKING");
    EXPECT_STREQ(docflow::status_name(IngestionState::running(StageKind::Sink, "Memory")), "INGESTING");
    EXPECT_STREQ(docflow::status_name(IngestionState::done()), "DONE");
    EXPECT_STREQ(docflow::status_name(IngestionState::error(StageKind::Sink, "Memory")), "ERROR");
}

TEST_F(WireProtocolTest, SnapshotMarksUnknownFiles) {
    auto request = wire::decode(wire::encode_snapshot_request({"f1", "f2"}));
    EXPECT_EQ(wire::decode_snapshot_request(request.body), (std::vector<std::string>{"f1", "f2"}));
    EXPECT_TRUE(wire::decode_snapshot_request(wire::decode(R"({"type":"snapshot"})").body).empty());
    EXPECT_THROW(wire::decode_snapshot_request(wire::decode(R"({"type":"snapshot","fileIDs":"f1"})").body),
                 docflow::ProtocolError);

    wire::FileStatus done;
    done.file_id = "f1";
    done.state = docflow::IngestionState::done();
    done.message = "Stored 3 chunks";
    wire::FileStatus missing;
    missing.file_id = "f2";
    missing.known = false;

    auto response = wire::decode(wire::encode_snapshot_response({done, missing}));
    ASSERT_EQ(response.type, wire::MessageType::Snapshot);
    auto files = wire::decode_snapshot_response(response.body);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].status, "DONE");
    EXPECT_EQ(files[0].message, "Stored 3 chunks");
    EXPECT_TRUE(files[0].is_terminal());
    EXPECT_EQ(files[1].status, "UNKNOWN");
}

TEST_F(WireProtocolTest, CancelAndMetricsMessages) {
    EXPECT_EQ(wire::decode_cancel(wire::decode(wire::encode_cancel("f9")).body), "f9");
    EXPECT_THROW(wire::decode_cancel(wire::decode(R"({"type":"cancel"})").body), docflow::ProtocolError);

    auto metrics = wire::decode(wire::encode_metrics_response("files_done 2\n"));
    EXPECT_EQ(metrics.type, wire::MessageType::Metrics);
    EXPECT_EQ(metrics.body.at("body").as_string(), "files_done 2\n");
}

TEST_F(WireProtocolTest, ProgressCountsAreValidated) {
    auto message = wire::decode(wire::encode_progress({"f1", 3, 7}));
    auto progress = wire::decode_progress(message.body);
    EXPECT_EQ(progress.transfer_id, "f1");
    EXPECT_EQ(progress.received, 3u);
    EXPECT_EQ(progress.total_count, 7u);

    auto overfull = wire::decode(R"({"type":"progress","fileID":"f1","received":8,"total":7})");
    EXPECT_THROW(wire::decode_progress(overfull.body), docflow::ProtocolError);
    auto negative = wire::decode(R"({"type":"progress","fileID":"f1","received":-1,"total":7})");
    EXPECT_THROW(wire::decode_progress(negative.body), docflow::ProtocolError);
}

TEST_F(WireProtocolTest, RagConfigFallsBackToDefaults) {
    auto pipeline = wire::decode_rag_config(boost::json::value(), defaults_);
    EXPECT_EQ(pipeline.at(docflow::StageKind::Loader).name, "Default");
    EXPECT_EQ(pipeline.at(docflow::StageKind::Splitter).name, "Token");
    EXPECT_EQ(pipeline.at(docflow::StageKind::Vectorizer).name, "Hashing");
    EXPECT_EQ(pipeline.at(docflow::StageKind::Sink).name, "Memory");

    auto rag_config = boost::json::parse(R"({
        "Reader": {"selected": "JSON"},
        "Chunker": {"selected": "Sentence",
                    "components": {"Sentence": {"config": {"sentences": {"value": 3}}}}},
        "Generator": {"selected": "Anything"}
    })");
    pipeline = wire::decode_rag_config(rag_config, defaults_);
    EXPECT_EQ(pipeline.at(docflow::StageKind::Loader).name, "JSON");
    EXPECT_EQ(pipeline.at(docflow::StageKind::Splitter).name, "Sentence");
    EXPECT_EQ(pipeline.at(docflow::StageKind::Splitter).config.at("sentences").to_number<int64_t>(), 3);
    EXPECT_EQ(pipeline.at(docflow::StageKind::Vectorizer).name, "Hashing");

    EXPECT_THROW(wire::decode_rag_config(boost::json::value("Token"), defaults_), docflow::ProtocolError);
}

TEST_F(WireProtocolTest, DescriptorIsAsciiAndDecodesToWaitingRecord) {
    wire::FileDescriptor descriptor;
    descriptor.file_id = "f1";
    descriptor.filename = "notes.txt";
    descriptor.extension = "txt";
    descriptor.content = "caf\xc3\xa9 \xf0\x9f\x93\x84";
    descriptor.labels = {"Document"};
    descriptor.source = "/tmp/notes.txt";
    descriptor.pipeline = wire::default_pipeline(defaults_);
    descriptor.pipeline.stages[docflow::StageKind::Splitter].config["units"] = 100;

    std::string payload = wire::encode_file_descriptor(descriptor);
    for (char c : payload) {
        ASSERT_LT(static_cast<unsigned char>(c), 0x80u);
    }

    auto record = wire::decode_file_descriptor(payload, defaults_);
    EXPECT_EQ(record.file_id, "f1");
    EXPECT_EQ(record.display_name, "notes.txt");
    EXPECT_EQ(record.raw_payload, descriptor.content);
    EXPECT_EQ(record.state.phase, docflow::IngestionPhase::WAITING);
    EXPECT_EQ(record.metadata.at("extension").as_string(), "txt");
    EXPECT_EQ(record.metadata.at("source").as_string(), "/tmp/notes.txt");
    EXPECT_EQ(record.metadata.at("labels").as_array().size(), 1u);
    EXPECT_EQ(record.pipeline_config.at(docflow::StageKind::Splitter).config.at("units").to_number<int64_t>(), 100);
}

TEST_F(WireProtocolTest, DescriptorWithoutFileIdIsRejected) {
    EXPECT_THROW(wire::decode_file_descriptor(R"({"filename":"a.txt","content":"x"})", defaults_),
                 docflow::ProtocolError);
    EXPECT_THROW(wire::decode_file_descriptor("{broken", defaults_), docflow::ProtocolError);
    EXPECT_THROW(wire::decode_file_descriptor(R"({"fileID":"","content":"x"})", defaults_),
                 docflow::ProtocolError);

    auto record = wire::decode_file_descriptor(R"({"fileID":"f2","content":"x"})", defaults_);
    EXPECT_EQ(record.display_name, "f2");
    EXPECT_EQ(record.pipeline_config.at(docflow::StageKind::Loader).name, "Default");
}
