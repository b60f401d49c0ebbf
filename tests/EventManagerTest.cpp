#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>
#include "../events/EventManager.hpp"
#include "../events/ExportEvents.hpp"

namespace {

    class RecordingHandler : public IEventHandler {
    public:
        std::vector<std::string> names;

        void onEvent(const EventPtr &event) override {
            names.push_back(event->name());
        }
    };

    class ThrowingHandler : public IEventHandler {
    public:
        void onEvent(const EventPtr &) override {
            throw std::runtime_error("handler failure");
        }
    };

    class UnsubscribingHandler : public IEventHandler {
    public:
        EventManager * manager = NULL;
        IEventHandler * victim = NULL;

        void onEvent(const EventPtr &) override {
            manager->unsubscribe(victim);
        }
    };

    class QueueingHandler : public IEventHandler {
    public:
        EventManager * manager = NULL;
        int seen = 0;

        void onEvent(const EventPtr &event) override {
            ++seen;
            if (event->name() == "ExportStartedEvent") {
                manager->queue(make_event<ExportFinishedEvent>(ExportResult::saved({ "a.fbx" })));
            }
        }
    };

}

TEST(EventManagerTest, PublishReachesEverySubscriberOnce) {
    EventManager manager;
    RecordingHandler first;
    RecordingHandler second;
    manager.subscribe(&first);
    manager.subscribe(&first);
    manager.subscribe(&second);
    EXPECT_EQ(manager.getHandlerCount(), 2u);

    manager.publish(make_event<ExportStartedEvent>("out.fbx"));
    EXPECT_EQ(first.names, std::vector<std::string>({ "ExportStartedEvent" }));
    EXPECT_EQ(second.names.size(), 1u);

    manager.unsubscribe(&first);
    manager.publish(make_event<ObjectRebasedEvent>("Cube", 0, glm::mat4(1.0f)));
    EXPECT_EQ(first.names.size(), 1u);
    EXPECT_EQ(second.names.size(), 2u);
}

TEST(EventManagerTest, ThrowingHandlerDoesNotStopDispatch) {
    EventManager manager;
    ThrowingHandler thrower;
    RecordingHandler recorder;
    manager.subscribe(&thrower);
    manager.subscribe(&recorder);
    EXPECT_NO_THROW(manager.publish(make_event<ExportStartedEvent>("out.fbx")));
    EXPECT_EQ(recorder.names.size(), 1u);
}

TEST(EventManagerTest, HandlerUnsubscribedDuringDispatchIsSkipped) {
    EventManager manager;
    UnsubscribingHandler unsubscriber;
    RecordingHandler recorder;
    unsubscriber.manager = &manager;
    unsubscriber.victim = &recorder;
    manager.subscribe(&unsubscriber);
    manager.subscribe(&recorder);

    manager.publish(make_event<ExportStartedEvent>("out.fbx"));
    EXPECT_TRUE(recorder.names.empty());
    EXPECT_EQ(manager.getHandlerCount(), 1u);
}

TEST(EventManagerTest, QueuedEventsAreProcessedInOrder) {
    EventManager manager;
    RecordingHandler recorder;
    QueueingHandler queueing;
    queueing.manager = &manager;
    manager.subscribe(&recorder);
    manager.subscribe(&queueing);

    manager.queue(make_event<ExportStartedEvent>("out.fbx"));
    manager.queue(make_event<ObjectRebasedEvent>("Cube", 1, glm::mat4(1.0f)));
    EXPECT_TRUE(recorder.names.empty());
    EXPECT_EQ(manager.getQueuedCount(), 2u);

    manager.processQueued();
    EXPECT_EQ(recorder.names, std::vector<std::string>({ "ExportStartedEvent", "ObjectRebasedEvent", "ExportFinishedEvent" }));
    EXPECT_EQ(queueing.seen, 3);
    EXPECT_EQ(manager.getQueuedCount(), 0u);
}

TEST(EventManagerTest, EventsDescribeThemselves) {
    ObjectRebasedEvent rebased("Cube", 2, glm::mat4(1.0f));
    EXPECT_EQ(rebased.describe(), "    rebased 'Cube' depth=2");
    ExportFinishedEvent failed(ExportResult::notSaved("disk full"));
    EXPECT_EQ(failed.describe(), "File not saved: disk full");
}
