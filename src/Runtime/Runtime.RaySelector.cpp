module;

#include <cstdint>
#include <optional>
#include <utility>
#include <glm/glm.hpp>
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/gtc/quaternion.hpp>
#include <entt/entity/entity.hpp>
#include <entt/signal/dispatcher.hpp>

module Runtime.RaySelector;

import Core;
import ECS;
import Geometry;
import Graphics;
import Runtime.Intersector;
import Runtime.RayState;
import Runtime.ReticleRay;
import Runtime.Selection;

namespace Runtime
{
    RaySelector::RaySelector(ECS::Scene& scene, const Intersection::IIntersector& intersector)
        : RaySelector(scene, intersector, Config{})
    {
    }

    RaySelector::RaySelector(ECS::Scene& scene, const Intersection::IIntersector& intersector, const Config& cfg)
        : m_Config(cfg),
          m_Intersector(intersector),
          m_Visuals(scene, cfg.Visuals),
          m_ReticleDistance(cfg.DefaultReticleDistance)
    {
        if (!(m_Config.DefaultReticleDistance >= 0.0f))
        {
            Core::Log::Warn("RaySelector: default reticle distance {} is invalid, using 3",
                            m_Config.DefaultReticleDistance);
            m_Config.DefaultReticleDistance = 3.0f;
            m_ReticleDistance = 3.0f;
        }

        m_Visuals.SetReticleVisible(m_Config.ReticleVisible);
        m_Visuals.SetBeamVisible(m_Config.RayVisible);
        RefreshPlacement();
    }

    Core::Result RaySelector::Add(entt::entity object, Selection::HandlerSet handlers)
    {
        if (object == entt::null)
        {
            Core::Log::Error("RaySelector::Add -- cannot register a null entity");
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        if (!m_Registry.Add(object, std::move(handlers)))
            Core::Log::Debug("RaySelector::Add -- entity {} re-registered, handlers replaced",
                             static_cast<uint32_t>(object));
        return Core::Ok();
    }

    void RaySelector::Remove(entt::entity object)
    {
        if (m_Registry.Remove(object) == Selection::Transition::Deselected)
            NotifyDeselected(object);
    }

    Core::Result RaySelector::Update()
    {
        std::optional<Core::ErrorCode> firstError;

        // Snapshot: handlers may add or remove objects while we iterate.
        for (const entt::entity object : m_Registry.Objects())
        {
            if (!m_Registry.Contains(object)) continue;

            // Re-read per object: a handler may move the ray mid-cycle.
            const Geometry::Ray ray = m_RayState.GetRay();
            const auto hits = m_Intersector.Intersect(ray, object, m_Config.Recursive);
            if (!hits)
            {
                Core::Log::Warn("RaySelector::Update -- intersection query for entity {} failed: {}",
                                static_cast<uint32_t>(object), Core::ErrorCodeToString(hits.error()));
                if (!firstError) firstError = hits.error();
                continue;
            }

            const bool isIntersected = !hits->empty();
            switch (m_Registry.Apply(object, isIntersected))
            {
            case Selection::Transition::Selected:
                // OnSelect may have removed the object; Remove already broadcast its deselect.
                if (m_Registry.IsSelected(object))
                    m_Dispatcher.trigger(Events::ObjectSelected{object});
                break;
            case Selection::Transition::Deselected:
                NotifyDeselected(object);
                break;
            case Selection::Transition::None:
                break;
            }

            // Last intersected object processed wins the reticle. A hit measured
            // along a ray that a handler has since replaced is not placed.
            const Geometry::Ray& current = m_RayState.GetRay();
            const bool rayUnchanged = current.Origin == ray.Origin && current.Direction == ray.Direction;
            if (isIntersected && rayUnchanged && m_Registry.Contains(object))
                MoveReticle(hits->front().Distance);
        }

        if (firstError)
            return Core::Err(*firstError);
        return Core::Ok();
    }

    void RaySelector::SetPosition(const glm::vec3& position)
    {
        m_RayState.SetPosition(position);
        RefreshPlacement();
    }

    void RaySelector::SetOrientation(const glm::quat& orientation)
    {
        m_RayState.SetOrientation(orientation);
        RefreshPlacement();
    }

    void RaySelector::SetPointer(const glm::vec2& ndc, const Graphics::CameraComponent& camera)
    {
        m_RayState.SetPointer(ndc, camera);
        RefreshPlacement();
    }

    void RaySelector::SetPointerPixel(const glm::vec2& pixel, const glm::vec2& viewportSize,
                                      const Graphics::CameraComponent& camera)
    {
        SetPointer(Graphics::PixelToNDC(pixel, viewportSize), camera);
    }

    entt::entity RaySelector::GetSelectedObject() const
    {
        const auto selected = m_Registry.SelectedObjects();
        if (selected.empty())
            return entt::null;

        if (selected.size() > 1)
            Core::Log::Warn("RaySelector: {} objects selected, returning only one of them", selected.size());

        return selected.back();
    }

    void RaySelector::SetReticleVisibility(bool isVisible)
    {
        m_Visuals.SetReticleVisible(isVisible);
    }

    void RaySelector::SetRayVisibility(bool isVisible)
    {
        m_Visuals.SetBeamVisible(isVisible);
    }

    void RaySelector::SetActive(bool isActive)
    {
        m_IsActive = isActive;
    }

    bool RaySelector::TriggerAction(entt::entity object)
    {
        return m_Registry.InvokeAction(object);
    }

    void RaySelector::MoveReticle(float distance)
    {
        m_ReticleDistance = distance;
        RefreshPlacement();
    }

    void RaySelector::RefreshPlacement()
    {
        m_Visuals.Place(m_RayState.GetRay(), m_ReticleDistance);
    }

    void RaySelector::NotifyDeselected(entt::entity object)
    {
        ResetReticle();
        m_Dispatcher.trigger(Events::ObjectDeselected{object});
    }
}
