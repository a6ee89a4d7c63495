module;
#include <string>
#include <entt/entity/registry.hpp>

export module ECS:Scene;

export namespace ECS
{
    class Scene
    {
    public:
        Scene() = default;
        ~Scene() = default;

        Scene(const Scene&) = delete;
        Scene& operator=(const Scene&) = delete;

        // Every entity starts with NameTag, Transform, WorldMatrix and Hierarchy.
        entt::entity CreateEntity(const std::string& name);

        // Destroys the entity and its whole subtree, unlinking it from its parent.
        void DestroyEntity(entt::entity entity);

        [[nodiscard]] bool IsValid(entt::entity entity) const { return m_Registry.valid(entity); }

        entt::registry& GetRegistry() { return m_Registry; }
        [[nodiscard]] const entt::registry& GetRegistry() const { return m_Registry; }

    private:
        entt::registry m_Registry;
    };
}
