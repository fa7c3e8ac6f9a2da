#include <cstdint>
#include <memory>
#include <vector>

#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>

import Core;
import ECS;
import RHI;
import Graphics;

using namespace Core;

// Headless sandbox: builds a tiny scene, runs the main pass against the
// recording backend for a few frames and prints what the backend saw.
namespace
{
    constexpr uint32_t kFrameCount = 2;

    Graphics::PipelineDescriptor MakeLitPipeline()
    {
        Graphics::PipelineLayout layout;
        layout.BindGroups.push_back({.Index = 0, .Id = RHI::BindGroupLayoutId{0, 1},
                                     .Bindings = {{.Name = "Camera", .Index = 0, .Type = Graphics::BindingType::UniformBuffer}}});
        layout.BindGroups.push_back({.Index = 1, .Id = RHI::BindGroupLayoutId{1, 1},
                                     .Bindings = {{.Name = "Object", .Index = 0, .Type = Graphics::BindingType::UniformBuffer,
                                                   .HasDynamicOffset = true}}});
        layout.VertexBuffers.push_back({.Name = "Position", .Stride = sizeof(glm::vec3)});
        layout.VertexBuffers.push_back({.Name = "Normal", .Stride = sizeof(glm::vec3)});

        return {.Name = "Lit", .Layout = std::move(layout)};
    }

    void PopulateScene(ECS::Scene& scene, RHI::PipelineHandle lit)
    {
        auto& registry = scene.GetRegistry();

        std::vector<ECS::VisibleEntities::VisibleEntity> visible;
        for (uint32_t i = 0; i < 3; ++i)
        {
            entt::entity cube = scene.CreateEntity("Cube");
            auto& draw = registry.emplace<ECS::Draw::Component>(cube);
            draw.SetPipeline(lit);
            draw.SetBindGroup(0, RHI::BindGroupId{0, 1});
            draw.SetBindGroup(1, RHI::BindGroupId{1, 1}, std::vector<uint32_t>{i * 256u});
            draw.SetVertexBuffer(0, RHI::BufferId{0, 1});
            draw.SetVertexBuffer(1, RHI::BufferId{1, 1});
            draw.SetIndexBuffer(RHI::BufferId{2, 1});
            draw.DrawIndexed({0, 36});
            visible.push_back({.Entity = cube, .Order = static_cast<float>(i)});
        }

        // Forgot its normals: the draw is dropped, the frame still renders.
        entt::entity broken = scene.CreateEntity("BrokenCube");
        auto& brokenDraw = registry.emplace<ECS::Draw::Component>(broken);
        brokenDraw.SetPipeline(lit);
        brokenDraw.SetBindGroup(0, RHI::BindGroupId{0, 1});
        brokenDraw.SetBindGroup(1, RHI::BindGroupId{1, 1}, std::vector<uint32_t>{0u});
        brokenDraw.SetVertexBuffer(0, RHI::BufferId{0, 1});
        brokenDraw.SetIndexBuffer(RHI::BufferId{2, 1});
        brokenDraw.DrawIndexed({0, 36});
        visible.push_back({.Entity = broken, .Order = 3.0f});

        entt::entity camera = scene.CreateEntity("Main Camera");
        registry.emplace<ECS::Camera::Component>(camera, "Camera3d");
        registry.emplace<ECS::VisibleEntities::Component>(camera, std::move(visible));
    }
}

int main()
{
    Log::Info("Sandbox Started!");

    Graphics::PipelineStore pipelines;
    const RHI::PipelineHandle lit = pipelines.Add(std::make_unique<Graphics::PipelineDescriptor>(MakeLitPipeline()));

    ECS::Scene scene;
    PopulateScene(scene, lit);

    Graphics::ActiveCameras activeCameras;
    activeCameras.Add("Camera3d");
    activeCameras.Add("Camera2d");

    RHI::RenderResourceBindings bindings;
    bindings.Set("CameraViewProj", RHI::BufferId{10, 1});

    RHI::PassDescriptor descriptor;
    descriptor.ColorAttachments.push_back({.Attachment = RHI::AttachmentInput{"color"},
                                           .Ops = {.Load = RHI::LoadOp::Clear, .ClearValue = glm::vec4(0.1f, 0.1f, 0.1f, 1.0f)}});
    descriptor.DepthStencilAttachment = RHI::DepthStencilAttachmentDescriptor{.Attachment = RHI::AttachmentInput{"depth"}};

    Graphics::Passes::MainPassNode mainPass(std::move(descriptor));
    mainPass.AddCamera("Camera3d");
    mainPass.AddCamera("Camera2d"); // No 2D camera in this scene: skipped.

    RHI::RecordingRenderContext backend;

    for (uint32_t frame = 0; frame < kFrameCount; ++frame)
    {
        Graphics::UpdateActiveCameras(scene.GetRegistry(), activeCameras);

        // The swapchain would normally supply these; rotate textures per frame.
        Graphics::ResourceSlots input(mainPass.Input());
        Graphics::ResourceSlots output;
        if (!input.Set("color", RHI::TextureId{frame % 2, 1}) || !input.Set("depth", RHI::TextureId{2, 1}))
            return 1;

        const Graphics::RenderResources resources{.Cameras = activeCameras, .Pipelines = pipelines, .Bindings = bindings};

        backend.Reset();
        if (auto result = mainPass.Update(scene.GetRegistry(), resources, backend, input, output); !result)
        {
            Log::Error("Sandbox: frame {} failed: {}", frame, result.error());
            return 1;
        }

        for (const auto& call : backend.GetCalls())
            Log::Info("  {}", RHI::Describe(call));

        const auto& stats = mainPass.GetLastFrameStats();
        Log::Info("Frame {}: passes={} entities={} skipped={} commands={} draws={} dropped={}",
                  frame, stats.PassesBegun, stats.EntitiesDrawn, stats.EntitiesSkipped,
                  stats.CommandsReplayed, stats.DrawsIssued, stats.DrawsDropped);

        pipelines.ProcessDeletions(frame);
    }

    return 0;
}
