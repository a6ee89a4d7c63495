#include <gtest/gtest.h>
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/gtx/string_cast.hpp> // For debugging vector output

import Geometry;

using namespace Geometry;

namespace
{
    void ExpectVec3Eq(const glm::vec3& a, const glm::vec3& b, float epsilon = 0.001f)
    {
        EXPECT_NEAR(a.x, b.x, epsilon) << "Vectors differ. A=" << glm::to_string(a) << " B=" << glm::to_string(b);
        EXPECT_NEAR(a.y, b.y, epsilon);
        EXPECT_NEAR(a.z, b.z, epsilon);
    }
}

// =========================================================================
// RAY VS TRIANGLE
// =========================================================================

TEST(GeometryRaycast, Triangle_HitInterior)
{
    const Triangle tri{{-1, -1, -2}, {1, -1, -2}, {0, 1, -2}};
    const Ray r{{0, 0, 0}, {0, 0, -1}};

    auto hit = RayTriangle_Watertight(r, tri);
    ASSERT_TRUE(hit.has_value());
    EXPECT_NEAR(hit->T, 2.0f, 1e-5f);

    // Barycentrics sum to at most one inside the triangle.
    EXPECT_GE(hit->U, 0.0f);
    EXPECT_GE(hit->V, 0.0f);
    EXPECT_LE(hit->U + hit->V, 1.0f + 1e-5f);
}

TEST(GeometryRaycast, Triangle_BothWindingsHit)
{
    const Ray r{{0, 0, 0}, {0, 0, -1}};
    EXPECT_TRUE(RayTriangle_Watertight(r, {-1, -1, -2}, {1, -1, -2}, {0, 1, -2}).has_value());
    EXPECT_TRUE(RayTriangle_Watertight(r, {-1, -1, -2}, {0, 1, -2}, {1, -1, -2}).has_value());
}

TEST(GeometryRaycast, Triangle_MissOutside)
{
    const Ray r{{5, 0, 0}, {0, 0, -1}};
    EXPECT_FALSE(RayTriangle_Watertight(r, {-1, -1, -2}, {1, -1, -2}, {0, 1, -2}).has_value());
}

TEST(GeometryRaycast, Triangle_BehindOriginIgnored)
{
    const Ray r{{0, 0, 0}, {0, 0, 1}};
    EXPECT_FALSE(RayTriangle_Watertight(r, {-1, -1, -2}, {1, -1, -2}, {0, 1, -2}).has_value());
}

TEST(GeometryRaycast, Triangle_RespectsTMax)
{
    const Ray r{{0, 0, 0}, {0, 0, -1}};
    EXPECT_FALSE(RayTriangle_Watertight(r, {-1, -1, -2}, {1, -1, -2}, {0, 1, -2}, 0.0f, 1.5f).has_value());
}

TEST(GeometryRaycast, Triangle_SharedEdgeIsNotACrack)
{
    // Two triangles forming a quad; a ray through the diagonal must hit at least one.
    const Ray r{{0.5f, 0.5f, 1.0f}, {0, 0, -1}};
    const auto h0 = RayTriangle_Watertight(r, {0, 0, 0}, {1, 0, 0}, {1, 1, 0});
    const auto h1 = RayTriangle_Watertight(r, {0, 0, 0}, {1, 1, 0}, {0, 1, 0});
    EXPECT_TRUE(h0.has_value() || h1.has_value());
}

// =========================================================================
// RAY VS SPHERE
// =========================================================================

TEST(GeometryRaycast, Sphere_FrontHit)
{
    const Sphere s{{0, 0, -5}, 1.0f};
    const Ray r{{0, 0, 0}, {0, 0, -1}};

    auto t = RaySphere(r, s);
    ASSERT_TRUE(t.has_value());
    EXPECT_NEAR(*t, 4.0f, 1e-4f);
    ExpectVec3Eq(r.At(*t), {0, 0, -4});
}

TEST(GeometryRaycast, Sphere_Miss)
{
    const Sphere s{{0, 0, -5}, 1.0f};
    EXPECT_FALSE(RaySphere(Ray{{0, 2, 0}, {0, 0, -1}}, s).has_value());
    EXPECT_FALSE(RaySphere(Ray{{0, 0, 0}, {0, 0, 1}}, s).has_value());
}

TEST(GeometryRaycast, Sphere_InsideReportsExit)
{
    const Sphere s{{0, 0, 0}, 2.0f};
    auto t = RaySphere(Ray{{0, 0, 0}, {1, 0, 0}}, s);
    ASSERT_TRUE(t.has_value());
    EXPECT_NEAR(*t, 2.0f, 1e-4f);
}

TEST(GeometryRaycast, Sphere_UnnormalizedDirectionKeepsParametrization)
{
    const Sphere s{{0, 0, -5}, 1.0f};
    const Ray r{{0, 0, 0}, {0, 0, -2}};

    auto t = RaySphere(r, s);
    ASSERT_TRUE(t.has_value());
    EXPECT_NEAR(*t, 2.0f, 1e-4f);
    ExpectVec3Eq(r.At(*t), {0, 0, -4});
}

// =========================================================================
// RAY VS AABB
// =========================================================================

TEST(GeometryRaycast, AABB_FrontHit)
{
    const AABB box{{-1, -1, -1}, {1, 1, 1}};
    auto t = RayAABB(Ray{{-5, 0, 0}, {1, 0, 0}}, box);
    ASSERT_TRUE(t.has_value());
    EXPECT_NEAR(*t, 4.0f, 1e-4f);
}

TEST(GeometryRaycast, AABB_InsideReportsZero)
{
    const AABB box{{-1, -1, -1}, {1, 1, 1}};
    auto t = RayAABB(Ray{{0, 0, 0}, {1, 0, 0}}, box);
    ASSERT_TRUE(t.has_value());
    EXPECT_FLOAT_EQ(*t, 0.0f);
}

TEST(GeometryRaycast, AABB_ParallelOutsideSlabMisses)
{
    const AABB box{{-1, -1, -1}, {1, 1, 1}};
    EXPECT_FALSE(RayAABB(Ray{{-5, 2, 0}, {1, 0, 0}}, box).has_value());
    EXPECT_TRUE(RayAABB(Ray{{-5, 0.5f, 0}, {1, 0, 0}}, box).has_value());
}

TEST(GeometryRaycast, AABB_BehindMisses)
{
    const AABB box{{-1, -1, -1}, {1, 1, 1}};
    EXPECT_FALSE(RayAABB(Ray{{-5, 0, 0}, {-1, 0, 0}}, box).has_value());
}

TEST(GeometryRaycast, AABB_EmptyBoxMisses)
{
    EXPECT_FALSE(RayAABB(Ray{{0, 0, 0}, {1, 0, 0}}, AABB{}).has_value());
}

// =========================================================================
// RAY TRANSFORM
// =========================================================================

TEST(GeometryRaycast, TransformRay_TranslationAndScale)
{
    const glm::mat4 m = glm::scale(glm::translate(glm::mat4(1.0f), {1, 2, 3}), glm::vec3(2.0f));
    const Ray r = TransformRay(m, Ray{{1, 0, 0}, {0, 0, -1}});

    ExpectVec3Eq(r.Origin, {3, 2, 3});
    ExpectVec3Eq(r.Direction, {0, 0, -2}); // Not renormalized.
}

TEST(GeometryRaycast, TransformRay_PreservesHitPointAcrossFrames)
{
    // Sphere of radius 1 in a frame scaled by 2 and moved to z = -10.
    const glm::mat4 world = glm::scale(glm::translate(glm::mat4(1.0f), {0, 0, -10}), glm::vec3(2.0f));
    const Ray worldRay{{0, 0, 0}, {0, 0, -1}};
    const Ray localRay = TransformRay(glm::inverse(world), worldRay);

    auto t = RaySphere(localRay, Sphere{{0, 0, 0}, 1.0f});
    ASSERT_TRUE(t.has_value());
    EXPECT_NEAR(*t, 8.0f, 1e-3f); // World surface at z = -8.
    ExpectVec3Eq(worldRay.At(*t), {0, 0, -8});
}
