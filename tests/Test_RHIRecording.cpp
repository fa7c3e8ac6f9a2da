#include <gtest/gtest.h>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <glm/glm.hpp>

import Core;
import RHI;

using Kind = RHI::RecordedCall::Kind;

namespace
{
    RHI::PassDescriptor MakeResolvedDescriptor()
    {
        RHI::PassDescriptor descriptor;
        descriptor.ColorAttachments.push_back({.Attachment = RHI::TextureId{0, 1}});
        descriptor.DepthStencilAttachment = RHI::DepthStencilAttachmentDescriptor{.Attachment = RHI::TextureId{1, 1}};
        return descriptor;
    }
}

TEST(RHI_Recording, EmptyPassIsBeginEnd)
{
    RHI::RecordingRenderContext context;
    RHI::RenderResourceBindings bindings;

    auto result = context.BeginPass(MakeResolvedDescriptor(), bindings,
                                    [](RHI::IRenderPass&) { return Core::Ok(); });

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(context.GetCalls().size(), 2u);
    EXPECT_EQ(context.GetCalls()[0].Type, Kind::BeginPass);
    EXPECT_EQ(context.GetCalls()[1].Type, Kind::EndPass);
    EXPECT_FALSE(context.IsPassOpen());
}

TEST(RHI_Recording, BeginPassCapturesTargets)
{
    RHI::RecordingRenderContext context;
    RHI::RenderResourceBindings bindings;
    bindings.Set("Camera", RHI::BufferId{9, 1});

    ASSERT_TRUE(context.BeginPass(MakeResolvedDescriptor(), bindings,
                                  [](RHI::IRenderPass&) { return Core::Ok(); }).has_value());

    const RHI::RecordedCall& begin = context.GetCalls().front();
    ASSERT_EQ(begin.ColorTargets.size(), 1u);
    EXPECT_EQ(begin.ColorTargets[0], (RHI::TextureId{0, 1}));
    ASSERT_TRUE(begin.DepthTarget.has_value());
    EXPECT_EQ(*begin.DepthTarget, (RHI::TextureId{1, 1}));
    EXPECT_EQ(begin.BindingCount, 1u);
}

TEST(RHI_Recording, RecordsCallsInOrder)
{
    RHI::RecordingRenderContext context;
    RHI::RenderResourceBindings bindings;

    auto result = context.BeginPass(MakeResolvedDescriptor(), bindings, [](RHI::IRenderPass& pass)
    {
        pass.SetPipeline(RHI::PipelineHandle{0, 1});
        pass.SetVertexBuffer(1, RHI::BufferId{4, 1}, 64);
        pass.SetIndexBuffer(RHI::BufferId{5, 1}, 0);
        pass.DrawIndexed({0, 6}, -2, {0, 3});
        return Core::Ok();
    });
    ASSERT_TRUE(result.has_value());

    auto calls = context.GetCalls();
    ASSERT_EQ(calls.size(), 6u);
    EXPECT_EQ(calls[1].Type, Kind::SetPipeline);
    EXPECT_EQ(calls[2].Type, Kind::SetVertexBuffer);
    EXPECT_EQ(calls[2].Slot, 1u);
    EXPECT_EQ(calls[2].Offset, 64u);
    EXPECT_EQ(calls[3].Type, Kind::SetIndexBuffer);
    EXPECT_EQ(calls[4].Type, Kind::DrawIndexed);
    EXPECT_EQ(calls[4].Indices, (RHI::Range{0, 6}));
    EXPECT_EQ(calls[4].BaseVertex, -2);
    EXPECT_EQ(calls[4].Instances, (RHI::Range{0, 3}));
    EXPECT_EQ(calls[5].Type, Kind::EndPass);
}

TEST(RHI_Recording, DynamicOffsets_AbsentVersusEmpty)
{
    RHI::RecordingRenderContext context;
    RHI::RenderResourceBindings bindings;
    const std::vector<uint32_t> offsets{256, 512};

    ASSERT_TRUE(context.BeginPass(MakeResolvedDescriptor(), bindings, [&](RHI::IRenderPass& pass)
    {
        pass.SetBindGroup(0, RHI::BindGroupLayoutId{0, 1}, RHI::BindGroupId{0, 1}, std::nullopt);
        pass.SetBindGroup(1, RHI::BindGroupLayoutId{1, 1}, RHI::BindGroupId{1, 1}, std::span<const uint32_t>{});
        pass.SetBindGroup(2, RHI::BindGroupLayoutId{2, 1}, RHI::BindGroupId{2, 1}, std::span<const uint32_t>(offsets));
        return Core::Ok();
    }).has_value());

    auto bindGroups = context.Filter(Kind::SetBindGroup);
    ASSERT_EQ(bindGroups.size(), 3u);
    EXPECT_FALSE(bindGroups[0].DynamicOffsets.has_value());
    ASSERT_TRUE(bindGroups[1].DynamicOffsets.has_value());
    EXPECT_TRUE(bindGroups[1].DynamicOffsets->empty());
    ASSERT_TRUE(bindGroups[2].DynamicOffsets.has_value());
    EXPECT_EQ(*bindGroups[2].DynamicOffsets, offsets);
    EXPECT_EQ(bindGroups[2].Layout, (RHI::BindGroupLayoutId{2, 1}));
}

TEST(RHI_Recording, PassClosedWhenRecordFails)
{
    RHI::RecordingRenderContext context;
    RHI::RenderResourceBindings bindings;

    auto result = context.BeginPass(MakeResolvedDescriptor(), bindings, [](RHI::IRenderPass& pass)
    {
        pass.SetPipeline(RHI::PipelineHandle{0, 1});
        return Core::Err(Core::ErrorCode::InvalidState);
    });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::InvalidState);
    ASSERT_FALSE(context.GetCalls().empty());
    EXPECT_EQ(context.GetCalls().back().Type, Kind::EndPass);
    EXPECT_EQ(context.Count(Kind::BeginPass), context.Count(Kind::EndPass));
    EXPECT_FALSE(context.IsPassOpen());
}

TEST(RHI_Recording, RejectsUnresolvedDescriptor)
{
    RHI::RecordingRenderContext context;
    RHI::RenderResourceBindings bindings;

    RHI::PassDescriptor descriptor;
    descriptor.ColorAttachments.push_back({.Attachment = RHI::AttachmentInput{"color"}});

    bool recorded = false;
    auto result = context.BeginPass(descriptor, bindings, [&](RHI::IRenderPass&)
    {
        recorded = true;
        return Core::Ok();
    });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::InvalidState);
    EXPECT_FALSE(recorded);
    EXPECT_TRUE(context.GetCalls().empty());
}

TEST(RHI_Recording, RejectsNestedPass)
{
    RHI::RecordingRenderContext context;
    RHI::RenderResourceBindings bindings;
    const RHI::PassDescriptor descriptor = MakeResolvedDescriptor();

    std::optional<Core::ErrorCode> nestedError;
    auto result = context.BeginPass(descriptor, bindings, [&](RHI::IRenderPass&)
    {
        auto nested = context.BeginPass(descriptor, bindings, [](RHI::IRenderPass&) { return Core::Ok(); });
        if (!nested)
            nestedError = nested.error();
        return Core::Ok();
    });

    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(nestedError.has_value());
    EXPECT_EQ(*nestedError, Core::ErrorCode::InvalidState);
    EXPECT_EQ(context.Count(Kind::BeginPass), 1u);
    EXPECT_EQ(context.Count(Kind::EndPass), 1u);
}

TEST(RHI_Recording, ResetClearsCalls)
{
    RHI::RecordingRenderContext context;
    RHI::RenderResourceBindings bindings;

    ASSERT_TRUE(context.BeginPass(MakeResolvedDescriptor(), bindings,
                                  [](RHI::IRenderPass&) { return Core::Ok(); }).has_value());
    context.Reset();

    EXPECT_TRUE(context.GetCalls().empty());
}

TEST(RHI_Recording, Describe)
{
    RHI::RecordedCall draw{.Type = Kind::DrawIndexed, .Indices = {0, 36}, .Instances = {0, 1}};
    EXPECT_EQ(RHI::Describe(draw), "DrawIndexed indices=[0,36) baseVertex=0 instances=[0,1)");

    RHI::RecordedCall pipeline{.Type = Kind::SetPipeline, .Pipeline = RHI::PipelineHandle{2, 1}};
    EXPECT_EQ(RHI::Describe(pipeline), "SetPipeline 2:1");

    EXPECT_EQ(RHI::CallKindToString(Kind::EndPass), "EndPass");
}
