#include <gtest/gtest.h>
#include <glm/gtc/matrix_transform.hpp>
#include "TestScenes.hpp"
#include "../exporter/TransformRebaser.hpp"
#include "../math/Transformation.hpp"

namespace {

    Geometry expectedGeometry(const Geometry &source, const glm::mat4 &local) {
        Geometry result = source;
        Transformation transformation(local);
        result.transform(glm::mat3(Math::rotationX(-90.0f)) * transformation.getRotationMatrix() * transformation.getScaleMatrix());
        return result;
    }

}

TEST(TransformRebaserTest, FindRootsSkipsChildrenAndOtherKinds) {
    Scene scene;
    SceneObject &empty = scene.createObject("Empty", ObjectType::Empty);
    SceneObject &child = scene.createObject("Child", ObjectType::Mesh);
    scene.createObject("Curve", ObjectType::Curve);
    SceneObject &other = scene.createObject("Light", ObjectType::Other);
    scene.setParent(child, empty, false);

    std::vector<SceneObject*> roots = TransformRebaser::findRoots(scene);
    ASSERT_EQ(roots.size(), 2u);
    EXPECT_EQ(roots[0], &empty);
    EXPECT_EQ(roots[1], &other);
}

TEST(TransformRebaserTest, SingleRootKeepsItsPose) {
    Scene scene;
    glm::mat4 local = Transformation(glm::vec3(2.0f, 1.0f, 0.5f), glm::vec3(1.0f, 2.0f, 3.0f), 0.0f, 0.0f, 30.0f).getMatrix();
    SceneObject &mesh = makeMesh(scene, "Mesh", local);
    Geometry source = mesh.getGeometry()->geometry;
    std::vector<glm::vec3> before = worldPositions(mesh);

    TransformRebaser rebaser(scene, true, false);
    rebaser.rebase(TransformRebaser::findRoots(scene));

    glm::mat4 matOriginal = Math::translation(glm::vec3(1.0f, 2.0f, 3.0f));
    EXPECT_TRUE(Math::nearlyEqual(mesh.getLocalTransform(), matOriginal * Math::rotationX(90.0f)));
    EXPECT_TRUE(Math::nearlyEqual(Math::getTranslation(mesh.evaluateWorldTransform()), glm::vec3(1.0f, 2.0f, 3.0f)));
    EXPECT_TRUE(nearlyEqual(worldPositions(mesh), before));
    EXPECT_EQ(rebaser.getProcessedCount(), 1);
}

TEST(TransformRebaserTest, GeometryCarriesTheAxisCorrection) {
    Scene scene;
    glm::mat4 local = Transformation(glm::vec3(3.0f), glm::vec3(-4.0f, 0.0f, 1.0f), 45.0f, 0.0f, 0.0f).getMatrix();
    SceneObject &mesh = makeMesh(scene, "Mesh", local);
    Geometry expected = expectedGeometry(mesh.getGeometry()->geometry, local);

    TransformRebaser rebaser(scene, true, false);
    rebaser.rebase(mesh, 0);

    const Geometry &actual = mesh.getGeometry()->geometry;
    ASSERT_EQ(actual.vertices.size(), expected.vertices.size());
    for (size_t i = 0; i < actual.vertices.size(); ++i) {
        EXPECT_TRUE(Math::nearlyEqual(actual.vertices[i].position, expected.vertices[i].position));
        EXPECT_TRUE(Math::nearlyEqual(actual.vertices[i].normal, expected.vertices[i].normal));
    }
}

TEST(TransformRebaserTest, HierarchyKeepsWorldPoses) {
    Scene scene;
    SceneObject &root = scene.createObject("Root", ObjectType::Empty);
    root.setLocalTransform(Transformation(glm::vec3(2.0f), glm::vec3(5.0f, 0.0f, 1.0f), 90.0f, 0.0f, 0.0f).getMatrix());
    SceneObject &child = makeMesh(scene, "Child", Transformation(glm::vec3(1.0f, 2.0f, 1.0f), glm::vec3(0.0f, 3.0f, 0.0f), 0.0f, 20.0f, 0.0f).getMatrix());
    scene.setParent(child, root, true);
    SceneObject &grandChild = makeMesh(scene, "GrandChild", Math::translation(glm::vec3(1.0f, 1.0f, 1.0f)));
    scene.setParent(grandChild, child, false);

    std::vector<glm::vec3> childBefore = worldPositions(child);
    std::vector<glm::vec3> grandChildBefore = worldPositions(grandChild);
    glm::vec3 rootPosition = Math::getTranslation(root.evaluateWorldTransform());

    std::vector<int> depths;
    TransformRebaser rebaser(scene, true, false);
    rebaser.setCallback([&depths](SceneObject &, int depth) { depths.push_back(depth); });
    rebaser.rebase(TransformRebaser::findRoots(scene));

    EXPECT_TRUE(nearlyEqual(worldPositions(child), childBefore));
    EXPECT_TRUE(nearlyEqual(worldPositions(grandChild), grandChildBefore));
    EXPECT_TRUE(Math::nearlyEqual(Math::getTranslation(root.evaluateWorldTransform()), rootPosition));
    EXPECT_EQ(depths, std::vector<int>({ 0, 1, 2 }));
}

TEST(TransformRebaserTest, ResetParentInverseKeepsWorld) {
    Scene scene;
    SceneObject &parent = scene.createObject("Parent", ObjectType::Empty);
    parent.setLocalTransform(Math::translation(glm::vec3(2.0f, 0.0f, 0.0f)) * Math::rotationX(30.0f));
    SceneObject &child = scene.createObject("Child", ObjectType::Empty);
    child.setLocalTransform(Math::translation(glm::vec3(0.0f, 1.0f, 0.0f)));
    scene.setParent(child, parent, true);
    glm::mat4 world = child.evaluateWorldTransform();

    TransformRebaser rebaser(scene, false, false);
    rebaser.resetParentInverse(child);
    EXPECT_TRUE(Math::nearlyEqual(child.getParentInverse(), glm::mat4(1.0f)));
    EXPECT_TRUE(Math::nearlyEqual(child.evaluateWorldTransform(), world));
}

TEST(TransformRebaserTest, MoveRootsToOriginKeepsChildren) {
    Scene scene;
    SceneObject &root = scene.createObject("Root", ObjectType::Empty);
    root.setLocalTransform(Math::translation(glm::vec3(10.0f, -2.0f, 4.0f)));
    SceneObject &child = makeMesh(scene, "Child", Math::translation(glm::vec3(11.0f, -2.0f, 4.0f)));
    scene.setParent(child, root, true);
    glm::mat4 childWorld = child.evaluateWorldTransform();

    TransformRebaser rebaser(scene, false, true);
    rebaser.rebase(TransformRebaser::findRoots(scene));

    EXPECT_TRUE(Math::nearlyEqual(root.getLocalTransform(), glm::mat4(1.0f)));
    EXPECT_TRUE(Math::nearlyEqual(child.evaluateWorldTransform(), childWorld));
}

TEST(TransformRebaserTest, MoveRootsToOriginKeepsRotation) {
    Scene scene;
    SceneObject &root = makeMesh(scene, "Root", Math::translation(glm::vec3(1.0f, 2.0f, 3.0f)) * Math::rotationX(30.0f));
    TransformRebaser rebaser(scene, false, true);
    rebaser.rebase(root, 0);
    EXPECT_TRUE(Math::nearlyEqual(root.getLocalTransform(), Math::rotationX(30.0f)));
}

TEST(TransformRebaserTest, MoveRootsToOriginAfterAxisFix) {
    Scene scene;
    SceneObject &root = makeMesh(scene, "Root", Math::translation(glm::vec3(1.0f, 2.0f, 3.0f)) * glm::scale(glm::mat4(1.0f), glm::vec3(2.0f)));
    TransformRebaser rebaser(scene, true, true);
    rebaser.rebase(root, 0);
    EXPECT_TRUE(Math::nearlyEqual(root.getLocalTransform(), Math::rotationX(90.0f)));
}

TEST(TransformRebaserTest, ObjectsOutsideTheViewAreSkippedButDescended) {
    Scene scene;
    CollectionNode &excluded = scene.createCollection("Excluded", scene.getViewLayerRoot());
    excluded.setExcluded(true);
    SceneObject &root = scene.createObject("Root", ObjectType::Empty, excluded);
    root.setLocalTransform(Math::translation(glm::vec3(3.0f, 0.0f, 0.0f)));
    SceneObject &child = makeMesh(scene, "Child", Math::translation(glm::vec3(1.0f, 0.0f, 0.0f)));
    scene.setParent(child, root, false);

    std::vector<std::string> processed;
    TransformRebaser rebaser(scene, true, true);
    rebaser.setCallback([&processed](SceneObject &object, int) { processed.push_back(object.getName()); });
    rebaser.rebase(TransformRebaser::findRoots(scene));

    EXPECT_TRUE(Math::nearlyEqual(root.getLocalTransform(), Math::translation(glm::vec3(3.0f, 0.0f, 0.0f))));
    EXPECT_EQ(processed, std::vector<std::string>({ "Child" }));
    // children are never moved to the origin
    EXPECT_TRUE(Math::nearlyEqual(Math::getTranslation(child.evaluateWorldTransform()), glm::vec3(4.0f, 0.0f, 0.0f)));
}
