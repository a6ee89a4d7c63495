module;

#include <cstdint>
#include <glm/glm.hpp>
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/gtx/quaternion.hpp>

export module Graphics:Camera;

export namespace Graphics
{
    // --- Pure Data Class ---
    struct CameraComponent
    {
        glm::vec3 Position{0.0f, 0.0f, 4.0f};
        glm::quat Orientation{1.0f, 0.0f, 0.0f, 0.0f}; // Identity looks down -Z

        float Fov = 45.0f; // Vertical, degrees
        float AspectRatio = 1.77f;
        float Near = 0.1f;
        float Far = 1000.0f;

        glm::mat4 ViewMatrix{1.0f};
        glm::mat4 ProjectionMatrix{1.0f};

        [[nodiscard]] glm::vec3 GetForward() const
        {
            return glm::rotate(Orientation, glm::vec3(0.0f, 0.0f, -1.0f));
        }

        [[nodiscard]] glm::vec3 GetRight() const
        {
            return glm::rotate(Orientation, glm::vec3(1.0f, 0.0f, 0.0f));
        }

        [[nodiscard]] glm::vec3 GetUp() const
        {
            return glm::rotate(Orientation, glm::vec3(0.0f, 1.0f, 0.0f));
        }
    };

    // Rebuilds View and Projection from Position/Orientation/Fov/AspectRatio.
    // Projection follows Vulkan conventions: Y flipped, depth 0..1.
    void UpdateMatrices(CameraComponent& camera);

    void OnResize(CameraComponent& camera, uint32_t width, uint32_t height);

    // Orients the camera so that its forward axis points at 'target'.
    void LookAt(CameraComponent& camera, const glm::vec3& target, const glm::vec3& up = {0.0f, 1.0f, 0.0f});

    // Window pixel (top-left origin) -> NDC in [-1, 1], +Y down to match the flipped projection.
    [[nodiscard]] glm::vec2 PixelToNDC(const glm::vec2& pixel, const glm::vec2& viewportSize);
}
