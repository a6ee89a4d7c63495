module;
#include <cstdint>
#include <glm/glm.hpp>
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/gtc/quaternion.hpp>

export module Runtime.RayState;

import Geometry;
import Graphics;

export namespace Runtime
{
    // Which setter currently drives the ray.
    enum class RayMode : uint8_t
    {
        Pose = 0,    // SetPosition / SetOrientation (controller or head pose)
        Pointer = 1, // SetPointer (2D pointer un-projected through a camera)
    };

    // Canonical "into the screen" forward axis rotated by pose orientations.
    [[nodiscard]] inline glm::vec3 LocalForward() { return {0.0f, 0.0f, -1.0f}; }

    // Helper: build a world ray from a normalized pixel coordinate in NDC (-1..1) using camera matrices.
    [[nodiscard]] Geometry::Ray RayFromNDC(const Graphics::CameraComponent& camera, const glm::vec2& ndc);

    // Origin and direction of the picking ray.
    // Every setter recomputes both fields, so the ray is never half-updated;
    // the last setter invoked is authoritative.
    class RayState
    {
    public:
        void SetPosition(const glm::vec3& position);
        void SetOrientation(const glm::quat& orientation);
        void SetPointer(const glm::vec2& ndc, const Graphics::CameraComponent& camera);

        [[nodiscard]] const Geometry::Ray& GetRay() const { return m_Ray; }
        [[nodiscard]] const glm::vec3& GetOrigin() const { return m_Ray.Origin; }
        [[nodiscard]] const glm::vec3& GetDirection() const { return m_Ray.Direction; }
        [[nodiscard]] RayMode GetMode() const { return m_Mode; }

        [[nodiscard]] const glm::vec3& GetPosePosition() const { return m_PosePosition; }
        [[nodiscard]] const glm::quat& GetPoseOrientation() const { return m_PoseOrientation; }
        [[nodiscard]] const glm::vec2& GetPointerNDC() const { return m_PointerNDC; }

    private:
        void ApplyPose();

        Geometry::Ray m_Ray{};
        RayMode m_Mode = RayMode::Pose;

        glm::vec3 m_PosePosition{0.0f};
        glm::quat m_PoseOrientation{1.0f, 0.0f, 0.0f, 0.0f};
        glm::vec2 m_PointerNDC{0.0f};
    };
}
