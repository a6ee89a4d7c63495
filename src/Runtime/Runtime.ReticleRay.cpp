module;

#include <cmath>
#include <cstdint>
#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/gtc/quaternion.hpp>
#include <entt/entity/registry.hpp>

module Runtime.ReticleRay;

import Core;
import ECS;
import Geometry;

namespace Runtime
{
    namespace
    {
        using namespace ECS::Components;

        entt::entity CreatePrimitive(ECS::Scene& scene, const char* name, Visual::Shape kind,
                                     float radius, uint32_t segments, const glm::vec4& color)
        {
            const entt::entity e = scene.CreateEntity(name);
            auto& primitive = scene.GetRegistry().emplace<Visual::Primitive>(e);
            primitive.Kind = kind;
            primitive.Radius = radius;
            primitive.Height = 1.0f;
            primitive.Segments = segments;
            primitive.Color = color;
            return e;
        }
    }

    glm::quat RotationFromUp(const glm::vec3& direction)
    {
        // Near +Y and near -Y are handled explicitly; the generic axis
        // (dir.z, 0, -dir.x) degenerates there.
        if (direction.y > 0.99999f)
            return glm::quat(1.0f, 0.0f, 0.0f, 0.0f);
        if (direction.y < -0.99999f)
            return glm::angleAxis(glm::pi<float>(), glm::vec3(1.0f, 0.0f, 0.0f));

        const glm::vec3 axis = glm::normalize(glm::vec3(direction.z, 0.0f, -direction.x));
        const float angle = std::acos(glm::clamp(direction.y, -1.0f, 1.0f));
        return glm::angleAxis(angle, axis);
    }

    ReticlePlacement ComputePlacement(const Geometry::Ray& ray, float distance)
    {
        const glm::vec3 delta = ray.Direction * distance;

        ReticlePlacement p;
        p.ReticlePosition = ray.Origin + delta;
        p.BeamLength = glm::length(delta);
        p.BeamRotation = RotationFromUp(ray.Direction);
        p.BeamPosition = ray.Origin + delta * 0.5f;
        return p;
    }

    ReticleRay::ReticleRay(ECS::Scene& scene)
        : ReticleRay(scene, Config{})
    {
    }

    ReticleRay::ReticleRay(ECS::Scene& scene, const Config& cfg)
        : m_Scene(scene), m_Config(cfg)
    {
        auto& reg = m_Scene.GetRegistry();

        m_Root = m_Scene.CreateEntity("ReticleRay");

        m_Reticle = m_Scene.CreateEntity("Reticle");
        const entt::entity inner = CreatePrimitive(m_Scene, "Reticle.Inner", Visual::Shape::Sphere,
                                                   m_Config.InnerRadius, m_Config.Segments, m_Config.InnerColor);
        const entt::entity outer = CreatePrimitive(m_Scene, "Reticle.Outer", Visual::Shape::Sphere,
                                                   m_Config.OuterRadius, m_Config.Segments, m_Config.OuterColor);
        Hierarchy::Attach(reg, inner, m_Reticle);
        Hierarchy::Attach(reg, outer, m_Reticle);

        m_Beam = CreatePrimitive(m_Scene, "Beam", Visual::Shape::Cylinder,
                                 m_Config.RayRadius, m_Config.Segments, m_Config.RayColor);

        Hierarchy::Attach(reg, m_Reticle, m_Root);
        Hierarchy::Attach(reg, m_Beam, m_Root);
    }

    ReticleRay::~ReticleRay()
    {
        // The host may have destroyed the visuals along with its own subtree.
        if (m_Scene.IsValid(m_Root))
            m_Scene.DestroyEntity(m_Root);
    }

    void ReticleRay::Place(const Geometry::Ray& ray, float distance)
    {
        m_Placement = ComputePlacement(ray, distance);

        auto& reg = m_Scene.GetRegistry();
        if (reg.valid(m_Reticle))
        {
            auto& t = reg.get<Transform::Component>(m_Reticle);
            t.Position = m_Placement.ReticlePosition;
            reg.emplace_or_replace<Transform::IsDirtyTag>(m_Reticle);
        }

        if (reg.valid(m_Beam))
        {
            auto& t = reg.get<Transform::Component>(m_Beam);
            t.Position = m_Placement.BeamPosition;
            t.Rotation = m_Placement.BeamRotation;
            t.Scale = glm::vec3(1.0f, m_Placement.BeamLength, 1.0f);
            reg.emplace_or_replace<Transform::IsDirtyTag>(m_Beam);
        }
    }

    void ReticleRay::SetReticleVisible(bool visible)
    {
        SetHidden(m_Reticle, !visible);
    }

    void ReticleRay::SetBeamVisible(bool visible)
    {
        SetHidden(m_Beam, !visible);
    }

    bool ReticleRay::IsReticleVisible() const
    {
        return Visual::IsVisible(m_Scene.GetRegistry(), m_Reticle);
    }

    bool ReticleRay::IsBeamVisible() const
    {
        return Visual::IsVisible(m_Scene.GetRegistry(), m_Beam);
    }

    void ReticleRay::SetHidden(entt::entity entity, bool hidden)
    {
        auto& reg = m_Scene.GetRegistry();
        if (!reg.valid(entity))
        {
            Core::Log::Warn("ReticleRay: visual entity {} no longer exists", static_cast<uint32_t>(entity));
            return;
        }

        if (hidden)
            reg.emplace_or_replace<Visual::HiddenTag>(entity);
        else
            reg.remove<Visual::HiddenTag>(entity);
    }
}
