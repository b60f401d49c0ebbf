#include <gtest/gtest.h>
#include "TestScenes.hpp"
#include "../exporter/VisibilityNormalizer.hpp"

namespace {

    struct VisibilityScene {
        Scene scene;
        CollectionNode * props;
        CollectionNode * nested;
        CollectionNode * excluded;
        CollectionNode * underExcluded;
        SceneObject * hidden;
        SceneObject * disabled;
        SceneObject * outside;

        VisibilityScene() {
            CollectionNode &root = scene.getViewLayerRoot();
            props = &scene.createCollection("Props", root);
            nested = &scene.createCollection("Nested", *props);
            excluded = &scene.createCollection("Excluded", root);
            underExcluded = &scene.createCollection("UnderExcluded", *excluded);

            props->setHideViewport(true);
            nested->getCollection()->hideViewport = true;
            excluded->setExcluded(true);
            excluded->setHideViewport(true);
            underExcluded->setHideViewport(true);
            underExcluded->getCollection()->hideViewport = true;

            hidden = &scene.createObject("Hidden", ObjectType::Mesh, *nested);
            disabled = &scene.createObject("Disabled", ObjectType::Empty, *props);
            outside = &scene.createObject("Outside", ObjectType::Mesh, *underExcluded);
            hidden->setHidden(true);
            disabled->setDisabled(true);
            outside->setHidden(true);
        }
    };

}

TEST(VisibilityNormalizerTest, MakesActiveViewVisible) {
    VisibilityScene s;
    StateLedger ledger;
    VisibilityNormalizer normalizer(ledger);

    EXPECT_EQ(normalizer.normalizeCollections(s.scene.getViewLayerRoot()), 2);
    EXPECT_EQ(normalizer.normalizeObjects(s.scene), 2);

    EXPECT_TRUE(s.scene.isVisible(*s.hidden));
    EXPECT_TRUE(s.scene.isVisible(*s.disabled));
    EXPECT_EQ(ledger.getHiddenCollections().size(), 1u);
    EXPECT_EQ(ledger.getDisabledCollections().size(), 1u);
    EXPECT_EQ(ledger.getHiddenObjects().size(), 1u);
    EXPECT_EQ(ledger.getDisabledObjects().size(), 1u);
}

TEST(VisibilityNormalizerTest, ExcludedBranchIsNeverTouched) {
    VisibilityScene s;
    StateLedger ledger;
    VisibilityNormalizer normalizer(ledger);
    normalizer.normalizeCollections(s.scene.getViewLayerRoot());
    normalizer.normalizeObjects(s.scene);

    EXPECT_TRUE(s.excluded->isExcluded());
    EXPECT_TRUE(s.excluded->isHideViewport());
    EXPECT_TRUE(s.underExcluded->isHideViewport());
    EXPECT_TRUE(s.underExcluded->getCollection()->hideViewport);
    EXPECT_TRUE(s.outside->isHidden());
    EXPECT_FALSE(s.scene.isVisible(*s.outside));
}

TEST(VisibilityNormalizerTest, RestoreReturnsToTheOriginalState) {
    VisibilityScene s;
    std::string before = SceneSnapshot::serialize(s.scene);

    StateLedger ledger;
    VisibilityNormalizer normalizer(ledger);
    normalizer.normalizeCollections(s.scene.getViewLayerRoot());
    normalizer.normalizeObjects(s.scene);
    ASSERT_NE(SceneSnapshot::serialize(s.scene), before);

    ledger.restoreVisibility();
    EXPECT_EQ(SceneSnapshot::serialize(s.scene), before);
    EXPECT_TRUE(ledger.empty());
}

TEST(VisibilityNormalizerTest, VisibleSceneRecordsNothing) {
    Scene scene;
    scene.createCollection("Props", scene.getViewLayerRoot());
    scene.createObject("A", ObjectType::Mesh);
    StateLedger ledger;
    VisibilityNormalizer normalizer(ledger);
    EXPECT_EQ(normalizer.normalizeCollections(scene.getViewLayerRoot()), 0);
    EXPECT_EQ(normalizer.normalizeObjects(scene), 0);
    EXPECT_TRUE(ledger.empty());
}
