module;
#include <cstddef>
#include <vector>
#include <glm/glm.hpp>
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/gtc/quaternion.hpp>
#include <entt/entity/entity.hpp>
#include <entt/signal/dispatcher.hpp>

export module Runtime.RaySelector;

import Core;
import ECS;
import Geometry;
import Graphics;
import Runtime.Intersector;
import Runtime.RayState;
import Runtime.ReticleRay;
import Runtime.Selection;

export namespace Runtime
{
    namespace Events
    {
        struct ObjectSelected
        {
            entt::entity Object = entt::null;
        };

        struct ObjectDeselected
        {
            entt::entity Object = entt::null;
        };
    }

    // Ray input selection from the frame of reference of an arbitrary pose.
    //
    // The ray comes from a controller pose (SetPosition/SetOrientation) or from
    // a 2D pointer through a camera (SetPointer). Each Update() hit-tests every
    // registered object, fires per-object handlers and broadcasts
    // Events::ObjectSelected / Events::ObjectDeselected through GetEvents().
    // The per-object handler always runs before the broadcast.
    //
    // Contract:
    //  - Call Update() once per frame; all transitions of the cycle are settled
    //    when it returns.
    //  - Not thread-safe; use from the thread that owns the scene.
    class RaySelector
    {
    public:
        struct Config
        {
            // Reticle distance when nothing is focused.
            float DefaultReticleDistance = 3.0f;

            // Hit-test descendants of registered objects as part of the object.
            bool Recursive = true;

            bool ReticleVisible = true;
            bool RayVisible = true;

            ReticleRay::Config Visuals{};
        };

        RaySelector(ECS::Scene& scene, const Intersection::IIntersector& intersector);
        RaySelector(ECS::Scene& scene, const Intersection::IIntersector& intersector, const Config& cfg);

        RaySelector(const RaySelector&) = delete;
        RaySelector& operator=(const RaySelector&) = delete;

        // --- Registry ---

        // Registers 'object' for interaction. Re-adding replaces its handlers
        // and keeps its selection state.
        [[nodiscard]] Core::Result Add(entt::entity object, Selection::HandlerSet handlers = {});

        // Unregisters 'object', deselecting it first if needed. No-op if unknown.
        void Remove(entt::entity object);

        [[nodiscard]] bool IsRegistered(entt::entity object) const { return m_Registry.Contains(object); }
        [[nodiscard]] size_t GetRegisteredCount() const { return m_Registry.Count(); }

        // --- Per-frame ---

        // Runs one selection cycle. Objects whose query failed keep their state;
        // the first failure is returned after every other object was processed.
        Core::Result Update();

        // --- Ray configuration (last call wins) ---

        void SetPosition(const glm::vec3& position);
        void SetOrientation(const glm::quat& orientation);
        void SetPointer(const glm::vec2& ndc, const Graphics::CameraComponent& camera);
        void SetPointerPixel(const glm::vec2& pixel, const glm::vec2& viewportSize,
                             const Graphics::CameraComponent& camera);

        [[nodiscard]] const glm::vec3& GetOrigin() const { return m_RayState.GetOrigin(); }
        [[nodiscard]] const glm::vec3& GetDirection() const { return m_RayState.GetDirection(); }
        [[nodiscard]] const Geometry::Ray& GetRay() const { return m_RayState.GetRay(); }
        [[nodiscard]] RayMode GetRayMode() const { return m_RayState.GetMode(); }

        // --- Queries ---

        // Root of the owned reticle/beam visuals, to be attached into the host scene.
        [[nodiscard]] entt::entity GetReticleRayMesh() const { return m_Visuals.GetRoot(); }
        [[nodiscard]] const ReticleRay& GetVisuals() const { return m_Visuals; }

        // One representative selected object, or entt::null. Warns when the
        // answer is ambiguous; use GetSelectedObjects() for the full set.
        [[nodiscard]] entt::entity GetSelectedObject() const;
        [[nodiscard]] std::vector<entt::entity> GetSelectedObjects() const { return m_Registry.SelectedObjects(); }
        [[nodiscard]] bool IsSelected(entt::entity object) const { return m_Registry.IsSelected(object); }
        [[nodiscard]] bool IsSelectionAmbiguous() const { return m_Registry.SelectedCount() > 1; }

        [[nodiscard]] float GetReticleDistance() const { return m_ReticleDistance; }

        // --- Visuals ---

        void SetReticleVisibility(bool isVisible);
        void SetRayVisibility(bool isVisible);

        // Reserved for pressed/active feedback; has no visual effect yet.
        void SetActive(bool isActive);
        [[nodiscard]] bool IsActive() const { return m_IsActive; }

        // --- Notifications ---

        // Invokes the OnAction handler of 'object'. Called by input code once it
        // detects an activation gesture. Returns false if nothing was invoked.
        bool TriggerAction(entt::entity object);

        // Broadcast channel: GetEvents().sink<Events::ObjectSelected>().connect<...>().
        [[nodiscard]] entt::dispatcher& GetEvents() { return m_Dispatcher; }

        [[nodiscard]] const Config& GetConfig() const { return m_Config; }

    private:
        // Focus the reticle at 'distance' along the ray.
        void MoveReticle(float distance);
        void ResetReticle() { MoveReticle(m_Config.DefaultReticleDistance); }
        void RefreshPlacement();

        void NotifyDeselected(entt::entity object);

        Config m_Config;
        const Intersection::IIntersector& m_Intersector;

        Selection::InteractionRegistry m_Registry;
        RayState m_RayState;
        ReticleRay m_Visuals;
        entt::dispatcher m_Dispatcher;

        float m_ReticleDistance = 3.0f;
        bool m_IsActive = false;
    };
}
