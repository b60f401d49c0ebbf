#include <gtest/gtest.h>
#include "TestScenes.hpp"
#include "../exporter/GeometryOwnershipResolver.hpp"

namespace {

    std::vector<SceneObject*> makeSharers(Scene &scene, const GeometryDataPtr &data, int count) {
        std::vector<SceneObject*> result;
        for (int i = 0; i < count; ++i) {
            SceneObject &object = scene.createObject("Sharer" + std::to_string(i), ObjectType::Mesh);
            object.setGeometry(data);
            result.push_back(&object);
        }
        return result;
    }

}

TEST(GeometryOwnershipResolverTest, EveryObjectOwnsItsGeometryAfterwards) {
    Scene scene;
    GeometryDataPtr shared = makeBox(scene, "Shared");
    std::vector<SceneObject*> sharers = makeSharers(scene, shared, 3);

    StateLedger ledger;
    GeometryOwnershipResolver resolver(scene, ledger);
    EXPECT_EQ(resolver.resolve(), 2);

    for (SceneObject * object : sharers) {
        EXPECT_EQ(scene.countGeometryUsers(*object->getGeometry()), 1);
    }
    // the last sharer keeps the original block
    EXPECT_EQ(sharers[2]->getGeometry(), shared);
    EXPECT_EQ(sharers[0]->getGeometry()->name, "Shared.001");
}

TEST(GeometryOwnershipResolverTest, UnmodifiedSharersAreRestorable) {
    Scene scene;
    GeometryDataPtr shared = makeBox(scene, "Shared");
    std::vector<SceneObject*> sharers = makeSharers(scene, shared, 3);

    StateLedger ledger;
    GeometryOwnershipResolver resolver(scene, ledger);
    resolver.resolve();
    EXPECT_EQ(ledger.getSharedGeometry().size(), 2u);

    ledger.restoreSharedGeometry(scene);
    for (SceneObject * object : sharers) {
        EXPECT_EQ(object->getGeometry(), shared);
    }
}

TEST(GeometryOwnershipResolverTest, ActiveModifierKeepsCopiesApart) {
    Scene scene;
    GeometryDataPtr shared = makeBox(scene, "Shared");
    std::vector<SceneObject*> sharers = makeSharers(scene, shared, 3);
    sharers[2]->addModifier(Modifier("Mirror", ModifierType::Mirror));

    StateLedger ledger;
    GeometryOwnershipResolver resolver(scene, ledger);
    EXPECT_EQ(resolver.countActiveModifiers(*shared), 1);
    resolver.resolve();
    EXPECT_TRUE(ledger.getSharedGeometry().empty());

    ledger.restoreSharedGeometry(scene);
    EXPECT_NE(sharers[0]->getGeometry(), sharers[1]->getGeometry());
    EXPECT_NE(sharers[1]->getGeometry(), sharers[2]->getGeometry());
    EXPECT_NE(sharers[0]->getGeometry(), sharers[2]->getGeometry());
}

TEST(GeometryOwnershipResolverTest, MutedModifiersDoNotCount) {
    Scene scene;
    GeometryDataPtr shared = makeBox(scene, "Shared");
    std::vector<SceneObject*> sharers = makeSharers(scene, shared, 2);
    sharers[1]->addModifier(Modifier("Displace", ModifierType::Displace, false, 1.0f));

    StateLedger ledger;
    GeometryOwnershipResolver resolver(scene, ledger);
    EXPECT_EQ(resolver.countActiveModifiers(*shared), 0);
    resolver.resolve();
    EXPECT_EQ(ledger.getSharedGeometry().size(), 1u);
    EXPECT_EQ(ledger.getSharedGeometry().count("Sharer0"), 1u);
}

TEST(GeometryOwnershipResolverTest, NonGeometryTypesGetCopiesButAreNotRelinked) {
    Scene scene;
    GeometryDataPtr shared = makeBox(scene, "Shared");
    SceneObject &armature = scene.createObject("Armature", ObjectType::Armature);
    SceneObject &mesh = scene.createObject("Mesh", ObjectType::Mesh);
    armature.setGeometry(shared);
    mesh.setGeometry(shared);

    StateLedger ledger;
    GeometryOwnershipResolver resolver(scene, ledger);
    EXPECT_EQ(resolver.resolve(), 1);
    EXPECT_NE(armature.getGeometry(), shared);
    EXPECT_EQ(scene.countGeometryUsers(*armature.getGeometry()), 1);
    EXPECT_EQ(mesh.getGeometry(), shared);
    EXPECT_TRUE(ledger.getSharedGeometry().empty());
}
