module;

#include <cstdint>
#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/gtx/matrix_decompose.hpp>

module ECS:Components.Hierarchy.Impl;
import :Components.Hierarchy;
import :Components.Transform;
import :Systems.Transform;
import Core;

namespace ECS::Components::Hierarchy::Detail
{
    using namespace ECS::Components::Hierarchy;

    // True if 'entity' appears on the parent chain starting at 'start'.
    bool IsOnParentChain(const entt::registry& registry, entt::entity entity, entt::entity start)
    {
        for (entt::entity current = start; current != entt::null && registry.valid(current);)
        {
            if (current == entity) return true;

            const auto* comp = registry.try_get<Component>(current);
            if (!comp) break;
            current = comp->Parent;
        }
        return false;
    }

    void Link(entt::registry& registry, entt::entity child, Component& childComp,
              entt::entity parent, Component& parentComp)
    {
        childComp.Parent = parent;
        childComp.PrevSibling = entt::null;
        childComp.NextSibling = parentComp.FirstChild;

        if (parentComp.FirstChild != entt::null)
            registry.get<Component>(parentComp.FirstChild).PrevSibling = child;

        parentComp.FirstChild = child;
        ++parentComp.ChildCount;
    }

    void Unlink(entt::registry& registry, Component& childComp)
    {
        auto& parentComp = registry.get<Component>(childComp.Parent);

        if (childComp.PrevSibling != entt::null)
            registry.get<Component>(childComp.PrevSibling).NextSibling = childComp.NextSibling;
        else
            parentComp.FirstChild = childComp.NextSibling;

        if (childComp.NextSibling != entt::null)
            registry.get<Component>(childComp.NextSibling).PrevSibling = childComp.PrevSibling;

        --parentComp.ChildCount;

        childComp.Parent = entt::null;
        childComp.NextSibling = entt::null;
        childComp.PrevSibling = entt::null;
    }

    // Local = inverse(ParentWorld) * ChildWorld, so the child stays put in world space.
    void RebaseLocalTransform(entt::registry& registry, entt::entity child,
                              const glm::mat4& childWorld, entt::entity newParent)
    {
        auto& local = registry.get<Transform::Component>(child);
        const glm::mat4 parentWorld = Systems::Transform::ComputeWorldMatrix(registry, newParent);

        glm::vec3 skew;
        glm::vec4 perspective;
        const bool ok = glm::decompose(glm::inverse(parentWorld) * childWorld,
                                       local.Scale, local.Rotation, local.Position, skew, perspective);

        const bool hasNaN = glm::any(glm::isnan(local.Position)) ||
                            glm::any(glm::isnan(local.Scale)) ||
                            glm::any(glm::isnan(glm::vec4(local.Rotation.x, local.Rotation.y,
                                                          local.Rotation.z, local.Rotation.w)));
        if (!ok || hasNaN)
        {
            Core::Log::Warn("Hierarchy::Attach -- singular parent matrix, resetting local transform of entity {}",
                            static_cast<uint32_t>(child));
            local = Transform::Component{};
        }

        registry.emplace_or_replace<Transform::IsDirtyTag>(child);
    }
}

namespace ECS::Components::Hierarchy
{
    void Attach(entt::registry& registry, entt::entity child, entt::entity newParent)
    {
        if (!registry.valid(child) || child == newParent) return;

        if (newParent == entt::null)
        {
            Detach(registry, child);
            return;
        }

        if (!registry.valid(newParent))
        {
            Core::Log::Warn("Hierarchy::Attach -- parent {} is not a valid entity", static_cast<uint32_t>(newParent));
            return;
        }

        if (Detail::IsOnParentChain(registry, child, newParent))
        {
            Core::Log::Warn("Hierarchy::Attach -- cycle detected: cannot attach entity {} to its own descendant {}",
                            static_cast<uint32_t>(child), static_cast<uint32_t>(newParent));
            return;
        }

        auto& childComp = registry.get_or_emplace<Component>(child);
        if (childComp.Parent == newParent) return;

        // Composed from local transforms; WorldMatrix may not be ticked yet.
        const bool rebase = registry.all_of<Transform::Component>(child);
        const glm::mat4 childWorld = rebase ? Systems::Transform::ComputeWorldMatrix(registry, child)
                                            : glm::mat4(1.0f);

        if (childComp.Parent != entt::null)
            Detail::Unlink(registry, childComp);

        if (rebase)
            Detail::RebaseLocalTransform(registry, child, childWorld, newParent);

        // get_or_emplace may relocate storage; re-fetch the child afterwards.
        auto& parentComp = registry.get_or_emplace<Component>(newParent);
        Detail::Link(registry, child, registry.get<Component>(child), newParent, parentComp);
    }

    void Detach(entt::registry& registry, entt::entity child)
    {
        if (!registry.valid(child)) return;

        auto* childComp = registry.try_get<Component>(child);
        if (childComp && childComp->Parent != entt::null)
            Detail::Unlink(registry, *childComp);
    }

    entt::entity GetParent(const entt::registry& registry, entt::entity entity)
    {
        if (!registry.valid(entity)) return entt::null;
        const auto* comp = registry.try_get<Component>(entity);
        return comp ? comp->Parent : entt::null;
    }
}
