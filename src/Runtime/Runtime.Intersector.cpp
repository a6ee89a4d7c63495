module;

#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <vector>
#include <glm/glm.hpp>
#include <entt/entity/registry.hpp>

module Runtime.Intersector;

import Core;
import ECS;
import Geometry;

namespace Runtime::Intersection
{
    using namespace ECS::Components;

    namespace
    {
        [[nodiscard]] std::optional<float> NearestMeshHit(const Geometry::Ray& localRay,
                                                          const Collider::CollisionMesh& mesh,
                                                          float tMin, float tMax)
        {
            const auto& positions = mesh.Positions;
            const auto& indices = mesh.Indices;
            if (positions.empty() || indices.size() < 3) return std::nullopt;

            // Broadphase on the local bounds.
            if (!Geometry::RayAABB(localRay, mesh.LocalBounds)) return std::nullopt;

            std::optional<float> best;
            for (size_t i = 0; i + 2 < indices.size(); i += 3)
            {
                const uint32_t i0 = indices[i + 0];
                const uint32_t i1 = indices[i + 1];
                const uint32_t i2 = indices[i + 2];
                if (i0 >= positions.size() || i1 >= positions.size() || i2 >= positions.size())
                    continue;

                const float limit = best ? *best : tMax;
                const auto hit = Geometry::RayTriangle_Watertight(localRay,
                    positions[i0], positions[i1], positions[i2], tMin, limit);
                if (hit)
                    best = hit->T;
            }
            return best;
        }
    }

    SceneIntersector::SceneIntersector(const ECS::Scene& scene)
        : m_Scene(scene), m_Config{}
    {
    }

    SceneIntersector::SceneIntersector(const ECS::Scene& scene, const Config& cfg)
        : m_Scene(scene), m_Config(cfg)
    {
    }

    Core::Expected<std::vector<Hit>>
    SceneIntersector::Intersect(const Geometry::Ray& ray, entt::entity object, bool recursive) const
    {
        if (!m_Scene.IsValid(object))
            return Core::Err<std::vector<Hit>>(Core::ErrorCode::ResourceNotFound);
        if (!Geometry::Validation::IsValid(ray))
            return Core::Err<std::vector<Hit>>(Core::ErrorCode::InvalidArgument);

        // Distances are reported in units of a normalized world ray.
        const Geometry::Ray worldRay = Geometry::Validation::Sanitize(ray);

        std::vector<Hit> hits;
        CollectHits(worldRay, object, recursive, hits);

        std::sort(hits.begin(), hits.end(),
                  [](const Hit& a, const Hit& b) { return a.Distance < b.Distance; });
        return hits;
    }

    void SceneIntersector::CollectHits(const Geometry::Ray& worldRay, entt::entity entity, bool recursive,
                                       std::vector<Hit>& out) const
    {
        const auto& reg = m_Scene.GetRegistry();

        const bool hasCollider = reg.any_of<Collider::Mesh, Collider::Sphere, Collider::Box>(entity);
        if (hasCollider)
        {
            // The local ray keeps the world parametrization: t_local == t_world.
            const glm::mat4 world = ECS::Systems::Transform::ComputeWorldMatrix(reg, entity);
            const Geometry::Ray localRay = Geometry::TransformRay(glm::inverse(world), worldRay);

            std::optional<float> best;
            const auto consider = [&](std::optional<float> t)
            {
                if (!t || *t < m_Config.Near || *t > m_Config.Far) return;
                if (!best || *t < *best) best = t;
            };

            if (const auto* mesh = reg.try_get<Collider::Mesh>(entity); mesh && mesh->CollisionRef)
                consider(NearestMeshHit(localRay, *mesh->CollisionRef, m_Config.Near, m_Config.Far));
            if (const auto* sphere = reg.try_get<Collider::Sphere>(entity))
                consider(Geometry::RaySphere(localRay, sphere->Shape));
            if (const auto* box = reg.try_get<Collider::Box>(entity))
                consider(Geometry::RayAABB(localRay, box->Shape));

            if (best)
                out.push_back(Hit{entity, *best, worldRay.At(*best)});
        }

        if (!recursive) return;

        Hierarchy::ForEachChild(reg, entity, [&](entt::entity child)
        {
            CollectHits(worldRay, child, true, out);
        });
    }
}
