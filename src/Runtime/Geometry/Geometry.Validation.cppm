module;
#include <glm/glm.hpp>
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/gtx/norm.hpp>

#include <cmath>
#include <limits>

export module Geometry:Validation;

import :Primitives;

export namespace Geometry::Validation
{
    constexpr float EPSILON = 1e-6f;

    // --- Vector Validation ---

    inline bool IsFinite(const glm::vec3& v)
    {
        return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
    }

    inline bool IsNormalized(const glm::vec3& v, float tolerance = 1e-4f)
    {
        float lenSq = glm::dot(v, v);
        return std::abs(lenSq - 1.0f) < tolerance;
    }

    inline bool IsZero(const glm::vec3& v, float epsilon = EPSILON)
    {
        return glm::length2(v) < epsilon * epsilon;
    }

    // --- Primitive Validation ---

    inline bool IsValid(const Ray& r)
    {
        return IsFinite(r.Origin) &&
               IsFinite(r.Direction) &&
               !IsZero(r.Direction);
    }

    inline bool IsValid(const Sphere& s)
    {
        return IsFinite(s.Center) &&
               s.Radius > 0.0f &&
               s.Radius < std::numeric_limits<float>::max();
    }

    inline bool IsValid(const AABB& box)
    {
        return IsFinite(box.Min) &&
               IsFinite(box.Max) &&
               box.IsValid();
    }

    // Non-finite origin falls back to the world origin, a zero or non-finite
    // direction to -Z (the canonical "into the screen" forward).
    inline Ray Sanitize(const Ray& r)
    {
        Ray result = r;
        if (!IsFinite(result.Origin)) result.Origin = glm::vec3(0.0f);
        if (!IsFinite(result.Direction) || IsZero(result.Direction))
            result.Direction = glm::vec3(0.0f, 0.0f, -1.0f);
        else
            result.Direction = glm::normalize(result.Direction);

        return result;
    }
}
