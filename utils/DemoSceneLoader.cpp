#include "DemoSceneLoader.hpp"
#include "../math/BoxGeometry.hpp"
#include "../math/Math.hpp"
#include "../math/Transformation.hpp"
#include <chrono>
#include <iostream>

void DemoSceneLoader::loadScene(Scene &scene) {
    auto startTime = std::chrono::steady_clock::now();
    CollectionNode &root = scene.getViewLayerRoot();

    CollectionNode &characters = scene.createCollection("Characters", root);
    CollectionNode &props = scene.createCollection("Props", root);
    CollectionNode &background = scene.createCollection("Background", props);
    CollectionNode &reference = scene.createCollection("Reference", root);
    background.setHideViewport(true);
    reference.setExcluded(true);

    {
        std::cout << "\tcharacter rig" << std::endl;
        SceneObject &rig = scene.createObject("Rig", ObjectType::Empty, characters);
        rig.setLocalTransform(Transformation(glm::vec3(1.0f), glm::vec3(4.0f, 0.0f, 2.0f), 45.0f, 0.0f, 0.0f).getMatrix());

        SceneObject &armature = scene.createObject("Skeleton", ObjectType::Armature, characters);
        scene.setParent(armature, rig, false);

        SceneObject &body = scene.createObject("Body", ObjectType::Mesh, characters);
        body.setGeometry(scene.createGeometry("BodyMesh", BoxGeometry(glm::vec3(-0.5f, -0.25f, 0.0f), glm::vec3(0.5f, 0.25f, 1.8f))));
        body.setLocalTransform(Transformation(glm::vec3(1.0f, 1.0f, 1.2f), glm::vec3(0.0f, 0.0f, 0.1f), 0.0f, 0.0f, 0.0f).getMatrix());
        body.addModifier(Modifier("Armature", ModifierType::Armature));
        scene.setParent(body, armature, true);
    }

    {
        std::cout << "\tprops" << std::endl;
        GeometryDataPtr crate = scene.createGeometry("CrateMesh", BoxGeometry(glm::vec3(-0.5f), glm::vec3(0.5f)));
        SceneObject &crateA = scene.createObject("CrateA", ObjectType::Mesh, props);
        crateA.setGeometry(crate);
        crateA.setLocalTransform(Transformation(glm::vec3(2.0f), glm::vec3(-3.0f, 1.0f, 1.0f), 30.0f, 0.0f, 0.0f).getMatrix());

        SceneObject &crateB = scene.createObject("CrateB", ObjectType::Mesh, props);
        crateB.setGeometry(crate);
        crateB.setLocalTransform(Transformation(glm::vec3(1.0f), glm::vec3(-5.0f, 2.0f, 0.5f), 0.0f, 0.0f, 15.0f).getMatrix());

        SceneObject &pillar = scene.createObject("Pillar", ObjectType::Mesh, props);
        pillar.setGeometry(scene.createGeometry("PillarMesh", BoxGeometry(glm::vec3(0.2f, -0.2f, 0.0f), glm::vec3(0.6f, 0.2f, 3.0f))));
        pillar.setLocalTransform(Math::translation(glm::vec3(0.0f, 6.0f, 0.0f)));
        pillar.addModifier(Modifier("Mirror", ModifierType::Mirror));

        SceneObject &path = scene.createObject("Path", ObjectType::Curve, props);
        path.setGeometry(scene.createGeometry("PathCurve", BoxGeometry(glm::vec3(0.0f, -0.05f, -0.05f), glm::vec3(8.0f, 0.05f, 0.05f))));
        path.setLocalTransform(Math::translation(glm::vec3(-4.0f, -4.0f, 0.0f)));

        SceneObject &rock = scene.createObject("Rock", ObjectType::Mesh, background);
        rock.setGeometry(scene.createGeometry("RockMesh", BoxGeometry(glm::vec3(-1.0f), glm::vec3(1.0f))));
        rock.setLocalTransform(Math::translation(glm::vec3(10.0f, 10.0f, 0.0f)));
        rock.addModifier(Modifier("Displace", ModifierType::Displace, true, 0.1f));

        SceneObject &lamp = scene.createObject("Lamp", ObjectType::Other, props);
        lamp.setLocalTransform(Math::translation(glm::vec3(0.0f, 0.0f, 5.0f)));
        lamp.setHidden(true);
    }

    {
        std::cout << "\treference" << std::endl;
        SceneObject &blueprint = scene.createObject("Blueprint", ObjectType::Mesh, reference);
        blueprint.setGeometry(scene.createGeometry("BlueprintMesh", BoxGeometry(glm::vec3(-5.0f, -5.0f, 0.0f), glm::vec3(5.0f, 5.0f, 0.01f))));
    }

    scene.updateTransforms();
    for (SceneObject * object : scene.getObjects()) {
        if (scene.isVisible(*object) && isExportable(object->getType())) {
            scene.select(*object);
        }
    }
    scene.setActiveCollection(props);

    for (SceneObject * object : scene.getObjects()) {
        std::cout << "\t\t" << object->getName() << " " << toString(object->getType());
        for (const Modifier &modifier : object->getModifiers()) {
            std::cout << " +" << toString(modifier.type);
        }
        std::cout << std::endl;
    }

    auto endTime = std::chrono::steady_clock::now();
    double elapsed = std::chrono::duration<double>(endTime - startTime).count();
    std::cout << "DemoSceneLoader::loadScene Ok! " << std::to_string(elapsed) << "s" << std::endl;
}
