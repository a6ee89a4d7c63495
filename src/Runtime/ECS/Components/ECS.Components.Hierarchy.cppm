module;
#include <cstdint>
#include <entt/entity/registry.hpp>

export module ECS:Components.Hierarchy;

export namespace ECS::Components::Hierarchy
{
    // Intrusive doubly linked child list. New children are inserted at the head.
    struct Component
    {
        entt::entity Parent = entt::null;
        entt::entity FirstChild = entt::null;
        entt::entity NextSibling = entt::null;
        entt::entity PrevSibling = entt::null;
        uint32_t ChildCount = 0;
    };

    // Re-parents 'child' under 'newParent'. A null parent detaches.
    // The child keeps its world placement: its local transform is rebased onto the new parent.
    void Attach(entt::registry& registry, entt::entity child, entt::entity newParent);
    void Detach(entt::registry& registry, entt::entity child);

    [[nodiscard]] entt::entity GetParent(const entt::registry& registry, entt::entity entity);

    template<typename Fn>
    void ForEachChild(const entt::registry& registry, entt::entity parent, Fn&& fn)
    {
        const auto* comp = registry.try_get<Component>(parent);
        if (!comp) return;

        entt::entity child = comp->FirstChild;
        while (child != entt::null)
        {
            // Fetch the sibling before invoking; the callback may not re-link.
            const entt::entity next = registry.get<Component>(child).NextSibling;
            fn(child);
            child = next;
        }
    }
}
