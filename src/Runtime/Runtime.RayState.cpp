module;

#include <glm/glm.hpp>
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/gtx/quaternion.hpp>

module Runtime.RayState;

import Geometry;
import Graphics;

namespace Runtime
{
    Geometry::Ray RayFromNDC(const Graphics::CameraComponent& camera, const glm::vec2& ndc)
    {
        // Invert clip -> world for near/far points.
        const glm::mat4 invViewProj = glm::inverse(camera.ProjectionMatrix * camera.ViewMatrix);

        const glm::vec4 pNear = invViewProj * glm::vec4(ndc.x, ndc.y, 0.0f, 1.0f);
        const glm::vec4 pFar  = invViewProj * glm::vec4(ndc.x, ndc.y, 1.0f, 1.0f);

        const glm::vec3 nearW = glm::vec3(pNear) / pNear.w;
        const glm::vec3 farW  = glm::vec3(pFar) / pFar.w;

        Geometry::Ray ray;
        ray.Origin = nearW;
        ray.Direction = farW - nearW;
        return Geometry::Validation::Sanitize(ray);
    }

    void RayState::SetPosition(const glm::vec3& position)
    {
        m_PosePosition = position;
        ApplyPose();
    }

    void RayState::SetOrientation(const glm::quat& orientation)
    {
        m_PoseOrientation = glm::normalize(orientation);
        ApplyPose();
    }

    void RayState::SetPointer(const glm::vec2& ndc, const Graphics::CameraComponent& camera)
    {
        m_PointerNDC = ndc;
        m_Mode = RayMode::Pointer;
        m_Ray = RayFromNDC(camera, ndc);
    }

    void RayState::ApplyPose()
    {
        m_Mode = RayMode::Pose;

        Geometry::Ray ray;
        ray.Origin = m_PosePosition;
        ray.Direction = glm::rotate(m_PoseOrientation, LocalForward());
        m_Ray = Geometry::Validation::Sanitize(ray);
    }
}
