#pragma once

// =============================================================================
// Shared collision mesh builders for intersection test suites.
//
// Usage: #include "TestMeshBuilders.h" AFTER `import ECS;` in each test file.
// All functions are inline to avoid ODR issues across translation units.
// =============================================================================

#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

// Unit square in the XY plane centered on the origin, facing +Z.
//   v0=(-.5,-.5,0)  v1=(.5,-.5,0)  v2=(.5,.5,0)  v3=(-.5,.5,0)
//   Face 0: v0-v1-v2,  Face 1: v0-v2-v3
inline std::shared_ptr<const ECS::Components::Collider::CollisionMesh> MakeUnitQuadXY()
{
    std::vector<glm::vec3> positions = {
        {-0.5f, -0.5f, 0.0f}, {0.5f, -0.5f, 0.0f}, {0.5f, 0.5f, 0.0f}, {-0.5f, 0.5f, 0.0f},
    };
    std::vector<uint32_t> indices = {0, 1, 2, 0, 2, 3};
    return ECS::Components::Collider::MakeCollisionMesh(std::move(positions), std::move(indices));
}

// Closed unit cube centered on the origin: 8 vertices, 12 triangles, outward winding.
inline std::shared_ptr<const ECS::Components::Collider::CollisionMesh> MakeUnitCube()
{
    std::vector<glm::vec3> positions = {
        {-0.5f, -0.5f, -0.5f}, {0.5f, -0.5f, -0.5f}, {0.5f, 0.5f, -0.5f}, {-0.5f, 0.5f, -0.5f},
        {-0.5f, -0.5f,  0.5f}, {0.5f, -0.5f,  0.5f}, {0.5f, 0.5f,  0.5f}, {-0.5f, 0.5f,  0.5f},
    };
    std::vector<uint32_t> indices = {
        0, 2, 1, 0, 3, 2, // -Z
        4, 5, 6, 4, 6, 7, // +Z
        0, 1, 5, 0, 5, 4, // -Y
        3, 7, 6, 3, 6, 2, // +Y
        0, 4, 7, 0, 7, 3, // -X
        1, 2, 6, 1, 6, 5, // +X
    };
    return ECS::Components::Collider::MakeCollisionMesh(std::move(positions), std::move(indices));
}

// Quad whose index buffer references a vertex that does not exist; the
// intersector must skip the broken triangle and still test the valid one.
inline std::shared_ptr<const ECS::Components::Collider::CollisionMesh> MakeQuadWithBrokenIndex()
{
    std::vector<glm::vec3> positions = {
        {-0.5f, -0.5f, 0.0f}, {0.5f, -0.5f, 0.0f}, {0.5f, 0.5f, 0.0f}, {-0.5f, 0.5f, 0.0f},
    };
    std::vector<uint32_t> indices = {0, 1, 99, 0, 2, 3};
    return ECS::Components::Collider::MakeCollisionMesh(std::move(positions), std::move(indices));
}
