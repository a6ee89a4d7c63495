module;
#include <glm/glm.hpp>
#include <entt/fwd.hpp>

export module ECS:Systems.Transform;

export namespace ECS::Systems::Transform
{
    // Propagates dirty local transforms into WorldMatrix, parents before children.
    void OnUpdate(entt::registry& registry);

    // Composes the parent chain on demand; does not read or write WorldMatrix.
    [[nodiscard]] glm::mat4 ComputeWorldMatrix(const entt::registry& registry, entt::entity entity);
}
