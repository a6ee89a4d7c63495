module;

#include <cstdint>
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/gtx/quaternion.hpp>

module Graphics:Camera.Impl;

import :Camera;

namespace Graphics
{
    void UpdateMatrices(CameraComponent& camera)
    {
        // View
        glm::mat4 rotate = glm::toMat4(glm::conjugate(camera.Orientation));
        glm::mat4 translate = glm::translate(glm::mat4(1.0f), -camera.Position);
        camera.ViewMatrix = rotate * translate;

        // Projection (Vulkan: Y flipped, Depth 0..1)
        camera.ProjectionMatrix = glm::perspectiveRH_ZO(glm::radians(camera.Fov), camera.AspectRatio,
                                                        camera.Near, camera.Far);
        camera.ProjectionMatrix[1][1] *= -1;
    }

    void OnResize(CameraComponent& camera, uint32_t width, uint32_t height)
    {
        if (height > 0) camera.AspectRatio = static_cast<float>(width) / static_cast<float>(height);
        UpdateMatrices(camera);
    }

    void LookAt(CameraComponent& camera, const glm::vec3& target, const glm::vec3& up)
    {
        const glm::vec3 toTarget = target - camera.Position;
        if (glm::dot(toTarget, toTarget) < 1e-12f) return;

        camera.Orientation = glm::quatLookAt(glm::normalize(toTarget), up);
        UpdateMatrices(camera);
    }

    glm::vec2 PixelToNDC(const glm::vec2& pixel, const glm::vec2& viewportSize)
    {
        if (viewportSize.x <= 0.0f || viewportSize.y <= 0.0f)
            return glm::vec2(0.0f);

        const float nx = (2.0f * (pixel.x / viewportSize.x)) - 1.0f;
        const float ny = (2.0f * (pixel.y / viewportSize.y)) - 1.0f;
        return {nx, ny};
    }
}
