module;

#include <cfloat>
#include <glm/glm.hpp>

export module Geometry:Primitives;

export namespace Geometry
{
    struct Ray
    {
        glm::vec3 Origin{0.0f};
        glm::vec3 Direction{0.0f, 0.0f, -1.0f};

        [[nodiscard]] glm::vec3 At(float t) const
        {
            return Origin + Direction * t;
        }
    };

    struct Sphere
    {
        glm::vec3 Center{0.0f};
        float Radius = 0.5f;
    };

    struct Triangle
    {
        glm::vec3 A, B, C;
    };

    struct AABB
    {
        glm::vec3 Min = glm::vec3(FLT_MAX);
        glm::vec3 Max = glm::vec3(-FLT_MAX);

        [[nodiscard]] bool IsValid() const
        {
            return (Min.x <= Max.x) && (Min.y <= Max.y) && (Min.z <= Max.z);
        }

        [[nodiscard]] glm::vec3 GetCenter() const
        {
            return (Min + Max) * 0.5f;
        }

        [[nodiscard]] glm::vec3 GetExtents() const
        {
            return (Max - Min) * 0.5f;
        }

        void Expand(const glm::vec3& p)
        {
            Min = glm::min(Min, p);
            Max = glm::max(Max, p);
        }
    };
}
