module;
#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>

module ECS:Systems.Transform.Impl;
import :Systems.Transform;
import :Components.Transform;
import :Components.Hierarchy;

namespace ECS::Systems::Transform::Detail
{
    void UpdateHierarchy(entt::registry& reg, entt::entity entity,
                         const glm::mat4& parentMatrix, bool parentDirty)
    {
        auto* local = reg.try_get<Components::Transform::Component>(entity);
        auto* world = reg.try_get<Components::Transform::WorldMatrix>(entity);
        if (!local || !world) return;

        // A moved parent moves us in world space even if our local is unchanged.
        const bool isDirty = parentDirty || reg.all_of<Components::Transform::IsDirtyTag>(entity);
        if (isDirty)
        {
            world->Matrix = parentMatrix * Components::Transform::GetMatrix(*local);
            reg.emplace_or_replace<Components::Transform::WorldUpdatedTag>(entity);
            reg.remove<Components::Transform::IsDirtyTag>(entity);
        }

        const glm::mat4 matrix = world->Matrix;
        Components::Hierarchy::ForEachChild(reg, entity, [&](entt::entity child)
        {
            UpdateHierarchy(reg, child, matrix, isDirty);
        });
    }
}

namespace ECS::Systems::Transform
{
    void OnUpdate(entt::registry& registry)
    {
        auto view = registry.view<Components::Transform::Component, Components::Hierarchy::Component>();

        for (auto [entity, transform, hierarchy] : view.each())
        {
            if (hierarchy.Parent == entt::null)
                Detail::UpdateHierarchy(registry, entity, glm::mat4(1.0f), false);
        }
    }

    glm::mat4 ComputeWorldMatrix(const entt::registry& registry, entt::entity entity)
    {
        glm::mat4 world(1.0f);
        for (entt::entity current = entity; current != entt::null && registry.valid(current);
             current = Components::Hierarchy::GetParent(registry, current))
        {
            if (const auto* local = registry.try_get<Components::Transform::Component>(current))
                world = Components::Transform::GetMatrix(*local) * world;
        }
        return world;
    }
}
