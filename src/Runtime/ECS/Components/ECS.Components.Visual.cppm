module;
#include <cstdint>
#include <glm/glm.hpp>
#include <entt/entity/registry.hpp>

export module ECS:Components.Visual;

import :Components.Hierarchy;

// Render-facing description of procedural primitives. Unit-sized shapes are
// scaled by the entity's transform; a renderer draws them as-is.
export namespace ECS::Components::Visual
{
    enum class Shape : uint8_t
    {
        Sphere = 0,
        Cylinder = 1, // Height along local +Y, centered on the origin.
    };

    struct Primitive
    {
        Shape Kind = Shape::Sphere;
        float Radius = 0.5f;
        float Height = 1.0f;
        uint32_t Segments = 32;
        glm::vec4 Color{1.0f}; // Alpha is opacity.
    };

    // Hides the entity and its whole subtree.
    struct HiddenTag {};

    [[nodiscard]] inline bool IsVisible(const entt::registry& registry, entt::entity entity)
    {
        for (entt::entity current = entity; current != entt::null; current = Hierarchy::GetParent(registry, current))
        {
            if (!registry.valid(current)) return false;
            if (registry.all_of<HiddenTag>(current)) return false;
        }
        return true;
    }
}
