#include <gtest/gtest.h>
#include <exception>
#include <string>
#include "docflow/error.hpp"
#include "docflow/pipeline_stage.hpp"
#include "docflow/stage_registry.hpp"

namespace {

docflow::PipelineStageDescriptor stage(docflow::StageKind kind, const std::string& name) {
    docflow::PipelineStageDescriptor descriptor;
    descriptor.kind = kind;
    descriptor.name = name;
    descriptor.description = name + " stage";
    descriptor.process = docflow::inline_process(
        [name](docflow::PipelineWork&, const docflow::StageConfig&) { return name; });
    return descriptor;
}

} // namespace

TEST(StageRegistryTest, ResolveReturnsRegisteredStage) {
    docflow::StageRegistry registry;
    registry.register_stage(stage(docflow::StageKind::Loader, "Default"));

    auto handle = registry.resolve(docflow::StageKind::Loader, "Default");
    ASSERT_NE(handle, nullptr);
    EXPECT_EQ(handle->name, "Default");

    docflow::PipelineWork work;
    std::string summary;
    handle->process(work, {}, [&summary](std::string result, std::exception_ptr error) {
        EXPECT_FALSE(error);
        summary = std::move(result);
    });
    EXPECT_EQ(summary, "Default");
}

TEST(StageRegistryTest, InlineProcessCompletesWithThrownError) {
    auto process = docflow::inline_process([](docflow::PipelineWork& work, const docflow::StageConfig&) -> std::string {
        throw docflow::LoadError("unreadable", work.file_id);
    });

    docflow::PipelineWork work;
    work.file_id = "f1";
    int calls = 0;
    std::exception_ptr error;
    process(work, {}, [&](std::string, std::exception_ptr failure) {
        ++calls;
        error = failure;
    });

    EXPECT_EQ(calls, 1);
    ASSERT_TRUE(error);
    EXPECT_THROW(std::rethrow_exception(error), docflow::LoadError);
}

TEST(StageRegistryTest, DuplicateRegistrationIsFatal) {
    docflow::StageRegistry registry;
    registry.register_stage(stage(docflow::StageKind::Splitter, "Token"));

    EXPECT_THROW(registry.register_stage(stage(docflow::StageKind::Splitter, "Token")),
                 docflow::DuplicateStageError);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(StageRegistryTest, SameNameUnderDifferentKindsIsAllowed) {
    docflow::StageRegistry registry;
    registry.register_stage(stage(docflow::StageKind::Loader, "Default"));
    registry.register_stage(stage(docflow::StageKind::Sink, "Default"));

    EXPECT_TRUE(registry.contains(docflow::StageKind::Loader, "Default"));
    EXPECT_TRUE(registry.contains(docflow::StageKind::Sink, "Default"));
    EXPECT_FALSE(registry.contains(docflow::StageKind::Splitter, "Default"));
}

TEST(StageRegistryTest, UnknownStageThrows) {
    docflow::StageRegistry registry;
    try {
        registry.resolve(docflow::StageKind::Vectorizer, "Missing");
        FAIL() << "resolve succeeded for an unregistered stage";
    } catch (const docflow::UnknownStageError& e) {
        EXPECT_EQ(e.code(), docflow::ErrorCode::UNKNOWN_STAGE);
    }
}

TEST(StageRegistryTest, ListAvailableIsSortedPerKind) {
    docflow::StageRegistry registry;
    registry.register_stage(stage(docflow::StageKind::Splitter, "Token"));
    registry.register_stage(stage(docflow::StageKind::Splitter, "Sentence"));
    registry.register_stage(stage(docflow::StageKind::Loader, "Default"));

    auto splitters = registry.list_available(docflow::StageKind::Splitter);
    ASSERT_EQ(splitters.size(), 2u);
    EXPECT_EQ(splitters[0]->name, "Sentence");
    EXPECT_EQ(splitters[1]->name, "Token");
    EXPECT_TRUE(registry.list_available(docflow::StageKind::Sink).empty());
}

TEST(StageRegistryTest, IncompleteDescriptorIsRejected) {
    docflow::StageRegistry registry;
    auto unnamed = stage(docflow::StageKind::Loader, "");
    EXPECT_THROW(registry.register_stage(unnamed), docflow::InvalidArgumentError);

    auto no_process = stage(docflow::StageKind::Loader, "Broken");
    no_process.process = nullptr;
    EXPECT_THROW(registry.register_stage(no_process), docflow::InvalidArgumentError);
}
