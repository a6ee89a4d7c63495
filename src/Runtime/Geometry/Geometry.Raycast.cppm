module;
#include <cstdint>
#include <limits>
#include <optional>
#include <glm/glm.hpp>

export module Geometry:Raycast;

import :Primitives;
import :Validation;

export namespace Geometry
{
    struct RayTriangleHit
    {
        float T = std::numeric_limits<float>::infinity();
        float U = 0.0f;
        float V = 0.0f;
    };

    // Watertight ray-triangle test (WoP / Ize style).
    // Returns the closest positive hit along the ray.
    // Notes:
    // - Robust to edge hits and shared edges (reduces cracks).
    // - Handles degenerate triangles by returning nullopt.
    [[nodiscard]] std::optional<RayTriangleHit>
    RayTriangle_Watertight(const Ray& ray, const glm::vec3& a, const glm::vec3& b, const glm::vec3& c,
                           float tMin = 0.0f, float tMax = std::numeric_limits<float>::infinity());

    [[nodiscard]] inline std::optional<RayTriangleHit>
    RayTriangle_Watertight(const Ray& ray, const Triangle& tri,
                           float tMin = 0.0f, float tMax = std::numeric_limits<float>::infinity())
    {
        return RayTriangle_Watertight(ray, tri.A, tri.B, tri.C, tMin, tMax);
    }

    // Distance to the first surface crossing at t >= 0. A ray starting inside
    // the sphere reports its exit point.
    [[nodiscard]] std::optional<float> RaySphere(const Ray& ray, const Sphere& sphere);

    // Slab test. A ray starting inside the box reports t = 0.
    [[nodiscard]] std::optional<float> RayAABB(const Ray& ray, const AABB& box);

    // Moves a ray into another frame. Direction is NOT renormalized so that
    // parametric distances stay comparable across frames.
    [[nodiscard]] Ray TransformRay(const glm::mat4& m, const Ray& ray);
}
