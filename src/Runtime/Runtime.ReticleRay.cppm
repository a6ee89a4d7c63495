module;
#include <cstdint>
#include <glm/glm.hpp>
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/gtc/quaternion.hpp>
#include <entt/entity/entity.hpp>

export module Runtime.ReticleRay;

import ECS;
import Geometry;

export namespace Runtime
{
    // Derived placement of the cursor and beam for one (ray, distance) pair.
    struct ReticlePlacement
    {
        glm::vec3 ReticlePosition{0.0f};
        glm::vec3 BeamPosition{0.0f};                 // Midpoint between origin and reticle.
        glm::quat BeamRotation{1.0f, 0.0f, 0.0f, 0.0f}; // Maps the beam's local +Y onto the ray direction.
        float BeamLength = 0.0f;
    };

    // Rotation taking +Y onto 'direction' (unit). Anti-parallel input yields a
    // half turn about +X so the result is always well defined.
    [[nodiscard]] glm::quat RotationFromUp(const glm::vec3& direction);

    [[nodiscard]] ReticlePlacement ComputePlacement(const Geometry::Ray& ray, float distance);

    // Owns the reticle and beam entities and keeps their transforms in sync
    // with the ray. Layout under GetRoot():
    //   Root
    //    |- Reticle (group)
    //    |   |- Inner sphere
    //    |   '- Outer sphere
    //    '- Beam (unit cylinder, scaled along +Y)
    class ReticleRay
    {
    public:
        struct Config
        {
            float InnerRadius = 0.02f;
            float OuterRadius = 0.04f;
            float RayRadius = 0.02f;
            uint32_t Segments = 32;

            glm::vec4 InnerColor{1.0f, 1.0f, 1.0f, 0.9f};
            glm::vec4 OuterColor{0.2f, 0.2f, 0.2f, 0.3f};
            glm::vec4 RayColor{1.0f, 1.0f, 1.0f, 0.3f};
        };

        explicit ReticleRay(ECS::Scene& scene);
        ReticleRay(ECS::Scene& scene, const Config& cfg);
        ~ReticleRay();

        ReticleRay(const ReticleRay&) = delete;
        ReticleRay& operator=(const ReticleRay&) = delete;

        // Recomputes both visuals from scratch.
        void Place(const Geometry::Ray& ray, float distance);

        void SetReticleVisible(bool visible);
        void SetBeamVisible(bool visible);
        [[nodiscard]] bool IsReticleVisible() const;
        [[nodiscard]] bool IsBeamVisible() const;

        [[nodiscard]] entt::entity GetRoot() const { return m_Root; }
        [[nodiscard]] entt::entity GetReticle() const { return m_Reticle; }
        [[nodiscard]] entt::entity GetBeam() const { return m_Beam; }

        [[nodiscard]] const ReticlePlacement& GetPlacement() const { return m_Placement; }
        [[nodiscard]] const Config& GetConfig() const { return m_Config; }

    private:
        void SetHidden(entt::entity entity, bool hidden);

        ECS::Scene& m_Scene;
        Config m_Config;

        entt::entity m_Root = entt::null;
        entt::entity m_Reticle = entt::null;
        entt::entity m_Beam = entt::null;

        ReticlePlacement m_Placement{};
    };
}
