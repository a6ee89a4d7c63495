#include <gtest/gtest.h>
#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <glm/gtc/quaternion.hpp>
#include <entt/entity/registry.hpp>
#include <limits>

import Core;
import ECS;
import Geometry;
import Runtime.Intersector;

#include "TestMeshBuilders.h"

using namespace Runtime::Intersection;
using namespace ECS::Components;

namespace
{
    const Geometry::Ray kForward{{0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, -1.0f}};

    entt::entity AddSphere(ECS::Scene& scene, const glm::vec3& position, float radius)
    {
        entt::entity e = scene.CreateEntity("Sphere");
        scene.GetRegistry().get<Transform::Component>(e).Position = position;
        scene.GetRegistry().emplace<Collider::Sphere>(e, Geometry::Sphere{{0.0f, 0.0f, 0.0f}, radius});
        return e;
    }
}

TEST(RuntimeIntersector, EntityWithoutColliderHasNoHits)
{
    ECS::Scene scene;
    SceneIntersector intersector(scene);

    entt::entity e = scene.CreateEntity("Empty");
    auto hits = intersector.Intersect(kForward, e, true);

    ASSERT_TRUE(hits.has_value());
    EXPECT_TRUE(hits->empty());
}

TEST(RuntimeIntersector, SphereHitDistanceAndPoint)
{
    ECS::Scene scene;
    SceneIntersector intersector(scene);

    entt::entity ball = AddSphere(scene, {0.0f, 0.0f, -5.0f}, 1.0f);
    auto hits = intersector.Intersect(kForward, ball, false);

    ASSERT_TRUE(hits.has_value());
    ASSERT_EQ(hits->size(), 1u);
    EXPECT_TRUE((*hits)[0].Entity == ball);
    EXPECT_NEAR((*hits)[0].Distance, 4.0f, 1e-4f);
    EXPECT_NEAR((*hits)[0].Point.z, -4.0f, 1e-4f);
}

TEST(RuntimeIntersector, MeshColliderUsesWorldTransform)
{
    ECS::Scene scene;
    SceneIntersector intersector(scene);

    entt::entity quad = scene.CreateEntity("Quad");
    auto& t = scene.GetRegistry().get<Transform::Component>(quad);
    t.Position = {0.0f, 0.0f, -3.0f};
    t.Scale = glm::vec3(4.0f);
    scene.GetRegistry().emplace<Collider::Mesh>(quad, MakeUnitQuadXY());

    auto hits = intersector.Intersect(kForward, quad, false);
    ASSERT_TRUE(hits.has_value());
    ASSERT_EQ(hits->size(), 1u);
    EXPECT_NEAR((*hits)[0].Distance, 3.0f, 1e-4f);

    // Shifted sideways beyond the scaled quad.
    const Geometry::Ray offside{{3.0f, 0.0f, 0.0f}, {0.0f, 0.0f, -1.0f}};
    auto miss = intersector.Intersect(offside, quad, false);
    ASSERT_TRUE(miss.has_value());
    EXPECT_TRUE(miss->empty());
}

TEST(RuntimeIntersector, ClosedMeshReportsNearestFace)
{
    ECS::Scene scene;
    SceneIntersector intersector(scene);

    entt::entity cube = scene.CreateEntity("Cube");
    scene.GetRegistry().get<Transform::Component>(cube).Position = {0.0f, 0.0f, -5.0f};
    scene.GetRegistry().emplace<Collider::Mesh>(cube, MakeUnitCube());

    auto hits = intersector.Intersect(kForward, cube, false);
    ASSERT_TRUE(hits.has_value());
    ASSERT_EQ(hits->size(), 1u);
    EXPECT_NEAR((*hits)[0].Distance, 4.5f, 1e-4f);
}

TEST(RuntimeIntersector, RotatedBoxCollider)
{
    ECS::Scene scene;
    SceneIntersector intersector(scene);

    // Thin slab along X, rotated 90 degrees about Y so it spans Z instead.
    entt::entity slab = scene.CreateEntity("Slab");
    auto& t = scene.GetRegistry().get<Transform::Component>(slab);
    t.Position = {0.0f, 0.0f, -10.0f};
    t.Rotation = glm::angleAxis(glm::half_pi<float>(), glm::vec3(0.0f, 1.0f, 0.0f));
    scene.GetRegistry().emplace<Collider::Box>(slab, Geometry::AABB{{-2.0f, -1.0f, -0.1f}, {2.0f, 1.0f, 0.1f}});

    auto hits = intersector.Intersect(kForward, slab, false);
    ASSERT_TRUE(hits.has_value());
    ASSERT_EQ(hits->size(), 1u);
    EXPECT_NEAR((*hits)[0].Distance, 8.0f, 1e-3f);
}

TEST(RuntimeIntersector, RecursiveIncludesDescendantsSorted)
{
    ECS::Scene scene;
    SceneIntersector intersector(scene);
    auto& reg = scene.GetRegistry();

    entt::entity group = scene.CreateEntity("Group");
    entt::entity farBall = AddSphere(scene, {0.0f, 0.0f, -9.0f}, 1.0f);
    entt::entity nearBall = AddSphere(scene, {0.0f, 0.0f, -4.0f}, 1.0f);
    Hierarchy::Attach(reg, farBall, group);
    Hierarchy::Attach(reg, nearBall, group);

    auto flat = intersector.Intersect(kForward, group, false);
    ASSERT_TRUE(flat.has_value());
    EXPECT_TRUE(flat->empty());

    auto hits = intersector.Intersect(kForward, group, true);
    ASSERT_TRUE(hits.has_value());
    ASSERT_EQ(hits->size(), 2u);
    EXPECT_TRUE((*hits)[0].Entity == nearBall);
    EXPECT_TRUE((*hits)[1].Entity == farBall);
    EXPECT_LT((*hits)[0].Distance, (*hits)[1].Distance);
}

TEST(RuntimeIntersector, ChildFollowsParentTransform)
{
    ECS::Scene scene;
    SceneIntersector intersector(scene);
    auto& reg = scene.GetRegistry();

    entt::entity group = scene.CreateEntity("Group");
    entt::entity child = AddSphere(scene, {0.0f, 0.0f, 0.0f}, 0.5f);
    Hierarchy::Attach(reg, child, group);

    // Moving the parent after attachment; no transform system tick needed.
    reg.get<Transform::Component>(group).Position = {0.0f, 0.0f, -6.0f};

    auto hits = intersector.Intersect(kForward, group, true);
    ASSERT_TRUE(hits.has_value());
    ASSERT_EQ(hits->size(), 1u);
    EXPECT_NEAR((*hits)[0].Distance, 5.5f, 1e-4f);
}

TEST(RuntimeIntersector, FarClipDropsHits)
{
    ECS::Scene scene;
    SceneIntersector intersector(scene, SceneIntersector::Config{0.0f, 3.0f});

    entt::entity ball = AddSphere(scene, {0.0f, 0.0f, -5.0f}, 1.0f);
    auto hits = intersector.Intersect(kForward, ball, false);

    ASSERT_TRUE(hits.has_value());
    EXPECT_TRUE(hits->empty());
}

TEST(RuntimeIntersector, InvalidEntityIsAnError)
{
    ECS::Scene scene;
    SceneIntersector intersector(scene);

    entt::entity gone = scene.CreateEntity("Gone");
    scene.DestroyEntity(gone);

    auto hits = intersector.Intersect(kForward, gone, true);
    ASSERT_FALSE(hits.has_value());
    EXPECT_EQ(hits.error(), Core::ErrorCode::ResourceNotFound);
}

TEST(RuntimeIntersector, DegenerateRayIsAnError)
{
    ECS::Scene scene;
    SceneIntersector intersector(scene);

    entt::entity ball = AddSphere(scene, {0.0f, 0.0f, -5.0f}, 1.0f);
    const Geometry::Ray bad{{0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 0.0f}};

    auto hits = intersector.Intersect(bad, ball, true);
    ASSERT_FALSE(hits.has_value());
    EXPECT_EQ(hits.error(), Core::ErrorCode::InvalidArgument);
}

TEST(RuntimeIntersector, UnnormalizedQueryRayReportsWorldDistance)
{
    ECS::Scene scene;
    SceneIntersector intersector(scene);

    entt::entity ball = AddSphere(scene, {0.0f, 0.0f, -5.0f}, 1.0f);
    const Geometry::Ray longRay{{0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, -10.0f}};

    auto hits = intersector.Intersect(longRay, ball, false);
    ASSERT_TRUE(hits.has_value());
    ASSERT_EQ(hits->size(), 1u);
    EXPECT_NEAR((*hits)[0].Distance, 4.0f, 1e-4f);
}

TEST(RuntimeIntersector, OutOfRangeIndicesAreSkipped)
{
    ECS::Scene scene;
    SceneIntersector intersector(scene);

    entt::entity quad = scene.CreateEntity("Broken");
    scene.GetRegistry().get<Transform::Component>(quad).Position = {0.0f, 0.0f, -2.0f};
    scene.GetRegistry().emplace<Collider::Mesh>(quad, MakeQuadWithBrokenIndex());

    // Upper-left half: covered by the valid triangle only.
    const Geometry::Ray upperLeft{{-0.25f, 0.25f, 0.0f}, {0.0f, 0.0f, -1.0f}};
    auto hits = intersector.Intersect(upperLeft, quad, false);
    ASSERT_TRUE(hits.has_value());
    ASSERT_EQ(hits->size(), 1u);
    EXPECT_NEAR((*hits)[0].Distance, 2.0f, 1e-4f);

    // Lower-right half: the broken triangle would have covered it.
    const Geometry::Ray lowerRight{{0.25f, -0.25f, 0.0f}, {0.0f, 0.0f, -1.0f}};
    auto miss = intersector.Intersect(lowerRight, quad, false);
    ASSERT_TRUE(miss.has_value());
    EXPECT_TRUE(miss->empty());
}
