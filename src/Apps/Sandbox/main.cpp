#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <glm/gtc/quaternion.hpp>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>
#include <entt/entity/registry.hpp>
#include <entt/signal/dispatcher.hpp>

import Core;
import ECS;
import Geometry;
import Graphics;
import Runtime.Intersector;
import Runtime.RaySelector;
import Runtime.Selection;

using namespace Core;
using namespace Runtime;

namespace
{
    // Unit cube centered on the origin, 12 triangles.
    std::shared_ptr<const ECS::Components::Collider::CollisionMesh> MakeCubeMesh()
    {
        std::vector<glm::vec3> p = {
            {-0.5f, -0.5f, -0.5f}, {0.5f, -0.5f, -0.5f}, {0.5f, 0.5f, -0.5f}, {-0.5f, 0.5f, -0.5f},
            {-0.5f, -0.5f,  0.5f}, {0.5f, -0.5f,  0.5f}, {0.5f, 0.5f,  0.5f}, {-0.5f, 0.5f,  0.5f},
        };
        std::vector<uint32_t> i = {
            0, 2, 1, 0, 3, 2, // -Z
            4, 5, 6, 4, 6, 7, // +Z
            0, 1, 5, 0, 5, 4, // -Y
            3, 7, 6, 3, 6, 2, // +Y
            0, 4, 7, 0, 7, 3, // -X
            1, 2, 6, 1, 6, 5, // +X
        };
        return ECS::Components::Collider::MakeCollisionMesh(std::move(p), std::move(i));
    }

    struct SelectionLogger
    {
        void OnSelected(const Events::ObjectSelected& e)
        {
            Log::Info("[event] select   entity {}", static_cast<uint32_t>(e.Object));
        }

        void OnDeselected(const Events::ObjectDeselected& e)
        {
            Log::Info("[event] deselect entity {}", static_cast<uint32_t>(e.Object));
        }
    };
}

// --- The Application Class ---
// Headless driver: no window or GPU, the frame loop sweeps a controller ray
// across the scene and then replays the same sweep with a mouse pointer.
class SandboxApp
{
public:
    SandboxApp()
        : m_Intersector(m_Scene)
    {
    }

    void OnStart()
    {
        Log::Info("Sandbox Started!");

        auto& reg = m_Scene.GetRegistry();

        m_Cube = m_Scene.CreateEntity("Cube");
        reg.get<ECS::Components::Transform::Component>(m_Cube).Position = {-1.5f, 0.0f, -4.0f};
        reg.emplace<ECS::Components::Collider::Mesh>(m_Cube, MakeCubeMesh());

        m_Ball = m_Scene.CreateEntity("Ball");
        reg.get<ECS::Components::Transform::Component>(m_Ball).Position = {1.5f, 0.0f, -4.0f};
        reg.emplace<ECS::Components::Collider::Sphere>(m_Ball, Geometry::Sphere{{0.0f, 0.0f, 0.0f}, 0.5f});

        // Collider-less group, only hit through its child. Attached before the
        // group is placed so the panel keeps a zero local offset.
        m_Group = m_Scene.CreateEntity("Group");
        const entt::entity panel = m_Scene.CreateEntity("Group.Panel");
        reg.emplace<ECS::Components::Collider::Box>(panel,
            Geometry::AABB{{-0.5f, -0.25f, -0.05f}, {0.5f, 0.25f, 0.05f}});
        ECS::Components::Hierarchy::Attach(reg, panel, m_Group);
        reg.get<ECS::Components::Transform::Component>(m_Group).Position = {0.0f, 1.5f, -4.0f};

        m_Camera.Position = {0.0f, 0.0f, 0.0f};
        Graphics::OnResize(m_Camera, kViewportWidth, kViewportHeight);

        m_Selector = std::make_unique<RaySelector>(m_Scene, m_Intersector);
        m_Selector->GetEvents().sink<Events::ObjectSelected>().connect<&SelectionLogger::OnSelected>(m_Logger);
        m_Selector->GetEvents().sink<Events::ObjectDeselected>().connect<&SelectionLogger::OnDeselected>(m_Logger);

        Selection::HandlerSet cubeHandlers;
        cubeHandlers.OnSelect = [](entt::entity) { Log::Info("Cube: hovered"); };
        cubeHandlers.OnDeselect = [](entt::entity) { Log::Info("Cube: left"); };
        cubeHandlers.OnAction = [](entt::entity) { Log::Info("Cube: activated"); };

        if (auto r = m_Selector->Add(m_Cube, std::move(cubeHandlers)); !r)
            Log::Error("Failed to register Cube: {}", ErrorCodeToString(r.error()));
        if (auto r = m_Selector->Add(m_Ball); !r)
            Log::Error("Failed to register Ball: {}", ErrorCodeToString(r.error()));
        if (auto r = m_Selector->Add(m_Group); !r)
            Log::Error("Failed to register Group: {}", ErrorCodeToString(r.error()));
    }

    void OnUpdate(uint32_t frame)
    {
        if (frame < kSweepFrames)
        {
            // Controller yaw from +45 to -45 degrees, then a pitch up to find the panel.
            const float t = static_cast<float>(frame) / static_cast<float>(kSweepFrames - 1);
            const float yaw = glm::mix(glm::quarter_pi<float>(), -glm::quarter_pi<float>(), t);
            const float pitch = (frame % 10 == 5) ? glm::radians(20.0f) : 0.0f;
            m_Selector->SetPosition(glm::vec3(0.0f));
            m_Selector->SetOrientation(glm::angleAxis(yaw, glm::vec3(0, 1, 0)) *
                                       glm::angleAxis(pitch, glm::vec3(1, 0, 0)));
        }
        else
        {
            const float t = static_cast<float>(frame - kSweepFrames) / static_cast<float>(kSweepFrames - 1);
            const glm::vec2 viewport(static_cast<float>(kViewportWidth), static_cast<float>(kViewportHeight));
            m_Selector->SetPointerPixel({viewport.x * t, viewport.y * 0.5f}, viewport, m_Camera);
        }

        if (auto r = m_Selector->Update(); !r)
            Log::Error("Selection update failed: {}", ErrorCodeToString(r.error()));

        if (m_Selector->GetSelectedObject() == m_Cube)
            m_Selector->TriggerAction(m_Cube);

        ECS::Systems::Transform::OnUpdate(m_Scene.GetRegistry());

        const auto& placement = m_Selector->GetVisuals().GetPlacement();
        Log::Debug("frame {:3} mode={} reticle=({:.2f}, {:.2f}, {:.2f}) d={:.2f}",
                   frame, m_Selector->GetRayMode() == RayMode::Pose ? "pose" : "pointer",
                   placement.ReticlePosition.x, placement.ReticlePosition.y, placement.ReticlePosition.z,
                   m_Selector->GetReticleDistance());
    }

    void OnShutdown()
    {
        m_Selector->Remove(m_Cube);
        m_Selector->Remove(m_Ball);
        m_Selector->Remove(m_Group);
        m_Selector.reset();
        Log::Info("Sandbox finished.");
    }

    void Run()
    {
        OnStart();
        for (uint32_t frame = 0; frame < 2 * kSweepFrames; ++frame)
            OnUpdate(frame);
        OnShutdown();
    }

private:
    static constexpr uint32_t kSweepFrames = 60;
    static constexpr uint32_t kViewportWidth = 1600;
    static constexpr uint32_t kViewportHeight = 900;

    ECS::Scene m_Scene;
    Intersection::SceneIntersector m_Intersector;
    std::unique_ptr<RaySelector> m_Selector;
    SelectionLogger m_Logger;
    Graphics::CameraComponent m_Camera;

    entt::entity m_Cube = entt::null;
    entt::entity m_Ball = entt::null;
    entt::entity m_Group = entt::null;
};

int main()
{
    SandboxApp app;
    app.Run();
    return 0;
}
