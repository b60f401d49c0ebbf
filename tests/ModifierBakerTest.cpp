#include <gtest/gtest.h>
#include "TestScenes.hpp"
#include "../exporter/ModifierBaker.hpp"

TEST(ModifierBakerTest, ConvertsEverythingButArmatureDeformed) {
    Scene scene;
    CollectionNode &excluded = scene.createCollection("Excluded", scene.getViewLayerRoot());
    excluded.setExcluded(true);

    SceneObject &mirrored = makeMesh(scene, "Mirrored", glm::mat4(1.0f));
    mirrored.addModifier(Modifier("Mirror", ModifierType::Mirror));
    SceneObject &skinned = makeMesh(scene, "Skinned", glm::mat4(1.0f));
    skinned.addModifier(Modifier("Armature", ModifierType::Armature));
    skinned.addModifier(Modifier("Mirror", ModifierType::Mirror));
    SceneObject &curve = scene.createObject("Curve", ObjectType::Curve);
    curve.setGeometry(makeBox(scene, "CurveData"));
    SceneObject &outside = scene.createObject("Outside", ObjectType::Curve, excluded);
    outside.setGeometry(makeBox(scene, "OutsideData"));

    ModifierBaker baker(scene);
    EXPECT_TRUE(baker.bake());

    EXPECT_TRUE(mirrored.getModifiers().empty());
    EXPECT_EQ(mirrored.getGeometry()->geometry.triangleCount(), 24u);
    EXPECT_EQ(skinned.getModifiers().size(), 2u);
    EXPECT_EQ(skinned.getGeometry()->geometry.triangleCount(), 12u);
    EXPECT_EQ(curve.getType(), ObjectType::Mesh);
    EXPECT_EQ(outside.getType(), ObjectType::Curve);
}

TEST(ModifierBakerTest, NothingConvertibleIsSkipped) {
    Scene scene;
    scene.createObject("Empty", ObjectType::Empty);
    SceneObject &skinned = makeMesh(scene, "Skinned", glm::mat4(1.0f));
    skinned.addModifier(Modifier("Armature", ModifierType::Armature));

    ModifierBaker baker(scene);
    EXPECT_FALSE(baker.bake());
    EXPECT_EQ(skinned.getModifiers().size(), 1u);
}
