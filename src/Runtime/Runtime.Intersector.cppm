module;
#include <limits>
#include <vector>
#include <glm/glm.hpp>
#include <entt/entity/entity.hpp>

export module Runtime.Intersector;

import Core;
import ECS;
import Geometry;

export namespace Runtime::Intersection
{
    struct Hit
    {
        entt::entity Entity = entt::null;            // The entity whose collider was hit (may be a descendant).
        float Distance = std::numeric_limits<float>::infinity(); // World units along the query ray.
        glm::vec3 Point{0.0f};
    };

    // Ray/geometry query capability consumed by the selector.
    class IIntersector
    {
    public:
        virtual ~IIntersector() = default;

        // Hits of 'ray' against 'object' (and its descendants when 'recursive'),
        // sorted by ascending distance. An empty list means "no hit"; an error
        // means the query could not be answered.
        [[nodiscard]] virtual Core::Expected<std::vector<Hit>>
        Intersect(const Geometry::Ray& ray, entt::entity object, bool recursive) const = 0;
    };

    // CPU intersector over ECS::Components::Collider shapes.
    // Colliders live in the entity's local space; world placement is composed
    // from the Hierarchy on every query so results never lag a stale WorldMatrix.
    class SceneIntersector final : public IIntersector
    {
    public:
        struct Config
        {
            float Near = 0.0f;
            float Far = std::numeric_limits<float>::infinity();
        };

        explicit SceneIntersector(const ECS::Scene& scene);
        SceneIntersector(const ECS::Scene& scene, const Config& cfg);

        [[nodiscard]] Core::Expected<std::vector<Hit>>
        Intersect(const Geometry::Ray& ray, entt::entity object, bool recursive) const override;

        [[nodiscard]] const Config& GetConfig() const { return m_Config; }

    private:
        void CollectHits(const Geometry::Ray& worldRay, entt::entity entity, bool recursive,
                         std::vector<Hit>& out) const;

        const ECS::Scene& m_Scene;
        Config m_Config;
    };
}
