#include <gtest/gtest.h>
#include <algorithm>
#include <array>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <entt/entity/registry.hpp>

import Core;
import ECS;
import RHI;
import Graphics;

using namespace Graphics;

inline bool IsSame(std::optional<entt::entity> a, entt::entity b) { return a.has_value() && *a == b; }

// -----------------------------------------------------------------------------
// ResourceSlots
// -----------------------------------------------------------------------------

namespace
{
    const std::array<ResourceSlotInfo, 2> kInputs{{
        {.Name = "color", .ResourceType = RHI::RenderResourceType::Texture},
        {.Name = "depth", .ResourceType = RHI::RenderResourceType::Texture},
    }};
}

TEST(ResourceSlots, MirrorsDeclaredInfos)
{
    ResourceSlots slots(kInputs);
    ASSERT_EQ(slots.Size(), 2u);
    EXPECT_EQ(slots.Get(0u)->Info.Name, "color");
    EXPECT_EQ(slots.Get(1u)->Info.Name, "depth");
    EXPECT_FALSE(slots.Get(0u)->Resource.has_value());
    EXPECT_EQ(slots.Get(2u), nullptr);
}

TEST(ResourceSlots, SetByIndexAndName)
{
    ResourceSlots slots(kInputs);
    ASSERT_TRUE(slots.Set(0u, RHI::TextureId{4, 1}).has_value());
    ASSERT_TRUE(slots.Set("depth", RHI::TextureId{5, 1}).has_value());

    EXPECT_EQ(RHI::GetTexture(*slots.Get("color")->Resource), std::optional<RHI::TextureId>(RHI::TextureId{4, 1}));
    EXPECT_EQ(RHI::GetTexture(*slots.Get(1u)->Resource), std::optional<RHI::TextureId>(RHI::TextureId{5, 1}));
    EXPECT_EQ(slots.FindIndex("depth"), std::optional<uint32_t>(1u));
}

TEST(ResourceSlots, SetErrors)
{
    ResourceSlots slots(kInputs);

    auto outOfRange = slots.Set(7u, RHI::TextureId{0, 1});
    ASSERT_FALSE(outOfRange.has_value());
    EXPECT_EQ(outOfRange.error(), Core::ErrorCode::OutOfRange);

    auto unknown = slots.Set("normals", RHI::TextureId{0, 1});
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error(), Core::ErrorCode::ResourceNotFound);
}

// -----------------------------------------------------------------------------
// ActiveCameras
// -----------------------------------------------------------------------------

TEST(ActiveCameras, AddRegistersUnbound)
{
    ActiveCameras cameras;
    cameras.Add("Camera3d");

    EXPECT_TRUE(cameras.IsRegistered("Camera3d"));
    EXPECT_FALSE(cameras.Get("Camera3d").has_value());
    EXPECT_FALSE(cameras.IsRegistered("Camera2d"));
    EXPECT_FALSE(cameras.Get("Camera2d").has_value());
}

TEST(ActiveCameras, SetAndReset)
{
    entt::registry registry;
    const entt::entity camera = registry.create();

    ActiveCameras cameras;
    cameras.Set("Camera3d", camera);
    EXPECT_TRUE(IsSame(cameras.Get("Camera3d"), camera));

    // Add keeps an existing binding.
    cameras.Add("Camera3d");
    EXPECT_TRUE(IsSame(cameras.Get("Camera3d"), camera));

    cameras.Reset("Camera3d");
    EXPECT_TRUE(cameras.IsRegistered("Camera3d"));
    EXPECT_FALSE(cameras.Get("Camera3d").has_value());
}

TEST(ActiveCameras, GetNames)
{
    ActiveCameras cameras;
    cameras.Add("Camera3d");
    cameras.Add("Camera2d");

    auto names = cameras.GetNames();
    std::ranges::sort(names);
    EXPECT_EQ(names, (std::vector<std::string>{"Camera2d", "Camera3d"}));
}

TEST(ActiveCameras, UpdateBindsMatchingCamera)
{
    entt::registry registry;
    const entt::entity other = registry.create();
    registry.emplace<ECS::Camera::Component>(other, "Camera2d");
    const entt::entity main = registry.create();
    registry.emplace<ECS::Camera::Component>(main, "Camera3d");
    const entt::entity unnamed = registry.create();
    registry.emplace<ECS::Camera::Component>(unnamed);

    ActiveCameras cameras;
    cameras.Add("Camera3d");
    UpdateActiveCameras(registry, cameras);

    EXPECT_TRUE(IsSame(cameras.Get("Camera3d"), main));
    EXPECT_FALSE(cameras.IsRegistered("Camera2d")); // only registered names are bound
}

TEST(ActiveCameras, UpdateUnbindsDestroyedCamera)
{
    entt::registry registry;
    const entt::entity camera = registry.create();
    registry.emplace<ECS::Camera::Component>(camera, "Camera3d");

    ActiveCameras cameras;
    cameras.Add("Camera3d");
    UpdateActiveCameras(registry, cameras);
    ASSERT_TRUE(IsSame(cameras.Get("Camera3d"), camera));

    registry.destroy(camera);
    UpdateActiveCameras(registry, cameras);
    EXPECT_TRUE(cameras.IsRegistered("Camera3d"));
    EXPECT_FALSE(cameras.Get("Camera3d").has_value());
}

TEST(ActiveCameras, UpdateRebindsRenamedCamera)
{
    entt::registry registry;
    const entt::entity first = registry.create();
    registry.emplace<ECS::Camera::Component>(first, "Camera3d");

    ActiveCameras cameras;
    cameras.Add("Camera3d");
    UpdateActiveCameras(registry, cameras);
    ASSERT_TRUE(IsSame(cameras.Get("Camera3d"), first));

    registry.get<ECS::Camera::Component>(first).Name = "Preview";
    const entt::entity second = registry.create();
    registry.emplace<ECS::Camera::Component>(second, "Camera3d");

    UpdateActiveCameras(registry, cameras);
    EXPECT_TRUE(IsSame(cameras.Get("Camera3d"), second));
}

TEST(ActiveCameras, UpdateKeepsValidBinding)
{
    entt::registry registry;
    const entt::entity a = registry.create();
    registry.emplace<ECS::Camera::Component>(a, "Camera3d");
    const entt::entity b = registry.create();
    registry.emplace<ECS::Camera::Component>(b, "Camera3d");

    ActiveCameras cameras;
    cameras.Set("Camera3d", b);
    UpdateActiveCameras(registry, cameras);

    EXPECT_TRUE(IsSame(cameras.Get("Camera3d"), b));
}

// -----------------------------------------------------------------------------
// Draw component
// -----------------------------------------------------------------------------

TEST(DrawComponent, HelpersAppendInOrder)
{
    ECS::Draw::Component draw;
    EXPECT_TRUE(draw.IsVisible);

    draw.SetPipeline(RHI::PipelineHandle{0, 1});
    draw.SetBindGroup(0, RHI::BindGroupId{0, 1}, std::vector<uint32_t>{128});
    draw.SetVertexBuffer(0, RHI::BufferId{0, 1});
    draw.SetIndexBuffer(RHI::BufferId{1, 1}, 16);
    draw.DrawIndexed({0, 36});

    ASSERT_EQ(draw.RenderCommands.size(), 5u);
    EXPECT_EQ(CommandName(draw.RenderCommands[0]), "SetPipeline");
    EXPECT_EQ(CommandName(draw.RenderCommands[1]), "SetBindGroup");
    EXPECT_EQ(CommandName(draw.RenderCommands[2]), "SetVertexBuffer");
    EXPECT_EQ(CommandName(draw.RenderCommands[3]), "SetIndexBuffer");
    EXPECT_EQ(CommandName(draw.RenderCommands[4]), "DrawIndexed");

    const auto& bindGroup = std::get<Commands::SetBindGroup>(draw.RenderCommands[1]);
    ASSERT_TRUE(bindGroup.DynamicUniformIndices.has_value());
    EXPECT_EQ(bindGroup.DynamicUniformIndices->front(), 128u);

    EXPECT_EQ(std::get<Commands::SetIndexBuffer>(draw.RenderCommands[3]).Offset, 16u);

    const auto& drawIndexed = std::get<Commands::DrawIndexed>(draw.RenderCommands[4]);
    EXPECT_EQ(drawIndexed.Indices, (RHI::Range{0, 36}));
    EXPECT_EQ(drawIndexed.Instances, (RHI::Range{0, 1}));
    EXPECT_EQ(drawIndexed.BaseVertex, 0);

    draw.Clear();
    EXPECT_TRUE(draw.RenderCommands.empty());
}

TEST(PipelineLayout, GetBindGroupByIndex)
{
    PipelineLayout layout;
    layout.BindGroups.push_back({.Index = 0, .Id = RHI::BindGroupLayoutId{7, 1}});
    layout.BindGroups.push_back({.Index = 1, .Id = RHI::BindGroupLayoutId{8, 1}});

    ASSERT_NE(layout.GetBindGroup(1), nullptr);
    EXPECT_EQ(layout.GetBindGroup(1)->Id, (RHI::BindGroupLayoutId{8, 1}));
    EXPECT_EQ(layout.GetBindGroup(2), nullptr);
}
