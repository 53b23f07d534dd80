#include <gtest/gtest.h>
#include "../headers/autopoCore.h"
#include <thread>

using namespace autopo;

class ObjectStoreTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryObjectStore> store;

    void SetUp() override {
        store = std::make_shared<MemoryObjectStore>();
    }

    void TearDown() override {
        store.reset();
    }
};

TEST_F(ObjectStoreTest, CreateAndGet) {
    ASSERT_EQ(store->create(ObjectDocument("a", AttributeMap{{"n", Value(1)}})), StoreStatus::Ok);
    std::optional<ObjectDocument> document = store->get("a");
    ASSERT_TRUE(document.has_value());
    ASSERT_EQ(document->getId(), "a");
    ASSERT_EQ(document->getAttribute("n")->asLong(), 1);
    ASSERT_FALSE(document->isDirty());
}

TEST_F(ObjectStoreTest, GetMissingIsEmpty) {
    ASSERT_FALSE(store->get("missing").has_value());
}

TEST_F(ObjectStoreTest, DuplicateCreateConflicts) {
    ASSERT_EQ(store->create(ObjectDocument("a")), StoreStatus::Ok);
    ASSERT_EQ(store->create(ObjectDocument("a")), StoreStatus::Conflict);
}

TEST_F(ObjectStoreTest, MergeUpdateKeepsOtherAttributes) {
    store->create(ObjectDocument("a", AttributeMap{{"x", Value(1)}, {"y", Value(2)}}));
    DocumentPatch patch;
    patch.attributes = AttributeMap{{"y", Value(3)}};
    ASSERT_EQ(store->update("a", patch, true), StoreStatus::Ok);

    const ObjectDocument document = *store->get("a");
    ASSERT_EQ(document.getAttribute("x")->asLong(), 1);
    ASSERT_EQ(document.getAttribute("y")->asLong(), 3);
}

TEST_F(ObjectStoreTest, ReplaceUpdateDropsOmittedAttributes) {
    store->create(ObjectDocument("a", AttributeMap{{"x", Value(1)}, {"y", Value(2)}}));
    DocumentPatch patch;
    patch.attributes = AttributeMap{{"y", Value(3)}};
    ASSERT_EQ(store->update("a", patch, false), StoreStatus::Ok);

    const ObjectDocument document = *store->get("a");
    ASSERT_FALSE(document.hasAttribute("x"));
    ASSERT_EQ(document.getAttributes(), (AttributeMap{{"y", Value(3)}}));
}

TEST_F(ObjectStoreTest, MethodsAlwaysMerge) {
    store->create(ObjectDocument("a", AttributeMap(), MethodMap{{"one", "def one(self) { return 1; }"}}));
    DocumentPatch patch;
    patch.methods["two"] = "def two(self) { return 2; }";
    ASSERT_EQ(store->update("a", patch, false), StoreStatus::Ok);

    const ObjectDocument document = *store->get("a");
    ASSERT_TRUE(document.hasMethod("one"));
    ASSERT_TRUE(document.hasMethod("two"));
}

TEST_F(ObjectStoreTest, UpdateMissingIsNotFound) {
    DocumentPatch patch;
    patch.attributes = AttributeMap();
    ASSERT_EQ(store->update("ghost", patch), StoreStatus::NotFound);
}

TEST_F(ObjectStoreTest, LinksNeedBothEndpoints) {
    store->create(ObjectDocument("a"));
    ASSERT_EQ(store->link(AUTOPO_PROTOTYPE_LINKS, "a", "ghost"), StoreStatus::NotFound);
    store->create(ObjectDocument("b"));
    ASSERT_EQ(store->link(AUTOPO_PROTOTYPE_LINKS, "a", "b"), StoreStatus::Ok);
    ASSERT_EQ(store->link(AUTOPO_PROTOTYPE_LINKS, "a", "b"), StoreStatus::Conflict);
    ASSERT_EQ(store->getLinks(AUTOPO_PROTOTYPE_LINKS, "a"), std::vector<std::string>{"b"});
    ASSERT_TRUE(store->getLinks("OtherEdges", "a").empty());
}

TEST_F(ObjectStoreTest, TraversalOrdersByDepthThenLinkOrder) {
    for (const char* id : {"a", "b", "c", "d"})
        store->create(ObjectDocument(id));
    store->link(AUTOPO_PROTOTYPE_LINKS, "a", "c");
    store->link(AUTOPO_PROTOTYPE_LINKS, "a", "b");
    store->link(AUTOPO_PROTOTYPE_LINKS, "b", "d");

    const std::vector<TraversalMatch> matches = store->graphTraverse("a", AUTOPO_PROTOTYPE_LINKS, 10, nullptr);
    ASSERT_EQ(matches.size(), 4u);
    ASSERT_EQ(matches[0].objectId, "a");
    ASSERT_EQ(matches[0].depth, 0);
    ASSERT_EQ(matches[1].objectId, "c");
    ASSERT_EQ(matches[2].objectId, "b");
    ASSERT_EQ(matches[3].objectId, "d");
    ASSERT_EQ(matches[3].depth, 2);
}

TEST_F(ObjectStoreTest, TraversalRespectsDepthAndLimit) {
    store->create(ObjectDocument("a"));
    store->create(ObjectDocument("b"));
    store->create(ObjectDocument("c"));
    store->link(AUTOPO_PROTOTYPE_LINKS, "a", "b");
    store->link(AUTOPO_PROTOTYPE_LINKS, "b", "c");

    ASSERT_EQ(store->graphTraverse("a", AUTOPO_PROTOTYPE_LINKS, 1, nullptr).size(), 2u);
    ASSERT_EQ(store->graphTraverse("a", AUTOPO_PROTOTYPE_LINKS, 0, nullptr).size(), 1u);
    ASSERT_EQ(store->graphTraverse("a", AUTOPO_PROTOTYPE_LINKS, 10, nullptr, 1).size(), 1u);
    ASSERT_TRUE(store->graphTraverse("ghost", AUTOPO_PROTOTYPE_LINKS, 10, nullptr).empty());
}

TEST_F(ObjectStoreTest, TraversalTerminatesOnCycles) {
    store->create(ObjectDocument("a"));
    store->create(ObjectDocument("b"));
    store->link(AUTOPO_PROTOTYPE_LINKS, "a", "b");
    store->link(AUTOPO_PROTOTYPE_LINKS, "b", "a");

    const std::vector<TraversalMatch> matches = store->graphTraverse("a", AUTOPO_PROTOTYPE_LINKS, 100, nullptr);
    ASSERT_EQ(matches.size(), 2u);
}

TEST_F(ObjectStoreTest, SeedIsIdempotent) {
    seedPrimordialObjects(*store);
    seedPrimordialObjects(*store);
    ASSERT_EQ(store->getSize(), 2u);
    ASSERT_TRUE(store->get(AUTOPO_NIL_OBJECT)->getMethods().empty());
    ASSERT_EQ(store->getLinks(AUTOPO_PROTOTYPE_LINKS, AUTOPO_SYSTEM_OBJECT),
              std::vector<std::string>{AUTOPO_NIL_OBJECT});
}

TEST_F(ObjectStoreTest, LockTimeoutIsTransportError) {
    auto slow = std::make_shared<MemoryObjectStore>(std::chrono::milliseconds(50));
    slow->create(ObjectDocument("a"));

    std::atomic<bool> holding{false};
    std::atomic<bool> release{false};
    std::thread holder([&]() {
        // A traversal predicate runs under the read lock; block inside it.
        slow->graphTraverse("a", AUTOPO_PROTOTYPE_LINKS, 0, [&](const ObjectDocument&) {
            holding = true;
            while (!release)
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            return false;
        });
    });
    while (!holding)
        std::this_thread::sleep_for(std::chrono::milliseconds(1));

    try {
        slow->create(ObjectDocument("b"));
        release = true;
        holder.join();
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        release = true;
        holder.join();
        ASSERT_EQ(e.getComponent(), "store");
    }
}
