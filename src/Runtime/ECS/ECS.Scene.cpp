module;
#include <string>
#include <vector>
#include <entt/entity/registry.hpp>

module ECS:Scene.Impl;
import :Scene;
import :Components;

namespace ECS
{
    entt::entity Scene::CreateEntity(const std::string& name)
    {
        entt::entity e = m_Registry.create();
        m_Registry.emplace<Components::NameTag::Component>(e, name);
        m_Registry.emplace<Components::Transform::Component>(e);
        m_Registry.emplace<Components::Transform::WorldMatrix>(e);
        m_Registry.emplace<Components::Hierarchy::Component>(e);
        return e;
    }

    void Scene::DestroyEntity(entt::entity entity)
    {
        if (!m_Registry.valid(entity)) return;

        Components::Hierarchy::Detach(m_Registry, entity);

        // Collect first; destroying while walking would break the sibling links.
        std::vector<entt::entity> subtree{entity};
        for (size_t i = 0; i < subtree.size(); ++i)
        {
            Components::Hierarchy::ForEachChild(m_Registry, subtree[i],
                [&](entt::entity child) { subtree.push_back(child); });
        }

        for (auto it = subtree.rbegin(); it != subtree.rend(); ++it)
            m_Registry.destroy(*it);
    }
}
