module;
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>
#include <glm/glm.hpp>

export module ECS:Components.Collider;

import Geometry;

// Hit-test shapes in the entity's local space. An entity may carry any
// combination; the intersector reports the nearest hit over all of them.
export namespace ECS::Components::Collider
{
    // Triangle list; shared between entities that instance the same mesh.
    struct CollisionMesh
    {
        std::vector<glm::vec3> Positions;
        std::vector<uint32_t> Indices;
        Geometry::AABB LocalBounds;
    };

    struct Mesh
    {
        std::shared_ptr<const CollisionMesh> CollisionRef;
    };

    struct Sphere
    {
        Geometry::Sphere Shape;
    };

    struct Box
    {
        Geometry::AABB Shape;
    };

    [[nodiscard]] inline std::shared_ptr<const CollisionMesh>
    MakeCollisionMesh(std::vector<glm::vec3> positions, std::vector<uint32_t> indices)
    {
        auto mesh = std::make_shared<CollisionMesh>();
        mesh->Positions = std::move(positions);
        mesh->Indices = std::move(indices);
        for (const auto& p : mesh->Positions)
            mesh->LocalBounds.Expand(p);
        return mesh;
    }
}
