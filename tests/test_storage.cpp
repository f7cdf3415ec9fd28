#include <gtest/gtest.h>
#include "graph/adjacency_index.hpp"
#include "graph/entity_store.hpp"
#include "graph/errors.hpp"
#include "graph/node.hpp"
#include "graph/uid_allocator.hpp"

#include <string>
#include <vector>

using namespace graphine;

// ─── UidAllocator ──────────────────────────────────────────────

TEST(UidAllocatorTest, FreshUidsFollowCount) {
    UidAllocator uids;
    EXPECT_EQ(uids.nextNodeUid(0), 1);
    EXPECT_EQ(uids.nextNodeUid(1), 2);
    EXPECT_EQ(uids.nextEdgeUid(0), -1);
    EXPECT_EQ(uids.nextEdgeUid(1), -2);
}

TEST(UidAllocatorTest, ReleasedUidsAreReusedLastInFirstOut) {
    UidAllocator uids;
    uids.release(2);
    uids.release(5);
    uids.release(-3);
    EXPECT_EQ(uids.freeNodeCount(), 2);
    EXPECT_EQ(uids.freeEdgeCount(), 1);

    EXPECT_EQ(uids.nextNodeUid(10), 5);
    EXPECT_EQ(uids.nextNodeUid(10), 2);
    EXPECT_EQ(uids.nextNodeUid(10), 11);
    EXPECT_EQ(uids.nextEdgeUid(10), -3);
    EXPECT_EQ(uids.nextEdgeUid(10), -11);
}

TEST(UidAllocatorTest, ZeroIsNotAnIdentifier) {
    UidAllocator uids;
    EXPECT_THROW(uids.release(0), UnknownIdentifier);
    EXPECT_FALSE(isNodeUid(0));
    EXPECT_FALSE(isEdgeUid(0));
}

// ─── EntityStore ───────────────────────────────────────────────

namespace {

Node city(const std::string& name) {
    static auto schema = Schema::forNodes({"city"});
    return Node(schema, {{"city", name}});
}

} // namespace

TEST(EntityStoreTest, InsertGetErase) {
    EntityStore<Node> store;
    store.insert(1, city("Austin"));
    ASSERT_EQ(store.size(), 1);
    EXPECT_TRUE(store.contains(1));
    EXPECT_EQ(store.get(1)["city"], Value("Austin"));

    Node removed = store.erase(1);
    EXPECT_EQ(removed["city"], Value("Austin"));
    EXPECT_TRUE(store.empty());
    EXPECT_EQ(store.find(1), nullptr);
}

TEST(EntityStoreTest, MissingUidThrows) {
    EntityStore<Node> store;
    EXPECT_THROW(store.get(7), UnknownIdentifier);
    EXPECT_THROW(store.erase(7), UnknownIdentifier);
}

TEST(EntityStoreTest, IteratesInInsertionOrder) {
    EntityStore<Node> store;
    store.insert(3, city("C"));
    store.insert(1, city("A"));
    store.insert(2, city("B"));
    store.insert(1, city("A2"));  // overwrite keeps position

    EXPECT_EQ(store.uids(), (std::vector<Uid>{3, 1, 2}));
    EXPECT_EQ(store.get(1)["city"], Value("A2"));

    store.erase(3);
    store.insert(3, city("C2"));
    EXPECT_EQ(store.uids(), (std::vector<Uid>{1, 2, 3}));
}

TEST(EntityStoreTest, CopyIsIndependent) {
    EntityStore<Node> store;
    store.insert(1, city("A"));
    store.insert(2, city("B"));

    EntityStore<Node> copy = store;
    copy.erase(1);
    copy.insert(2, city("B2"));

    EXPECT_EQ(store.size(), 2);
    EXPECT_EQ(store.get(2)["city"], Value("B"));
    EXPECT_EQ(copy.uids(), (std::vector<Uid>{2}));
    EXPECT_EQ(copy.get(2)["city"], Value("B2"));
}

// ─── AdjacencyIndex ────────────────────────────────────────────

TEST(AdjacencyIndexTest, UnseenNodeIsEmpty) {
    AdjacencyIndex adj;
    EXPECT_TRUE(adj.outgoing(42).empty());
    EXPECT_FALSE(adj.hasEntry(42));
}

TEST(AdjacencyIndexTest, AddRelocateRemove) {
    AdjacencyIndex adj;
    adj.onEdgeAdded(-1, 1);
    adj.onEdgeAdded(-2, 1);
    adj.onEdgeAdded(-3, 2);
    EXPECT_EQ(adj.outgoing(1), (AdjacencyIndex::EdgeSet{-1, -2}));

    adj.onEdgeRelocated(-2, 1, 2);
    EXPECT_EQ(adj.outgoing(1), (AdjacencyIndex::EdgeSet{-1}));
    EXPECT_EQ(adj.outgoing(2), (AdjacencyIndex::EdgeSet{-2, -3}));

    adj.onEdgeRelocated(-2, 2, 2);
    EXPECT_EQ(adj.outgoing(2).size(), 2);

    adj.onEdgeRemoved(-1, 1);
    EXPECT_TRUE(adj.outgoing(1).empty());
    EXPECT_FALSE(adj.hasEntry(1));
}

TEST(AdjacencyIndexTest, EdgesEnumerateByIssueOrder) {
    AdjacencyIndex adj;
    adj.onEdgeAdded(-7, 1);
    adj.onEdgeAdded(-1, 1);
    adj.onEdgeAdded(-5, 1);
    std::vector<Uid> order(adj.outgoing(1).begin(), adj.outgoing(1).end());
    EXPECT_EQ(order, (std::vector<Uid>{-1, -5, -7}));
}

TEST(AdjacencyIndexTest, NodeRemovalDropsEntryOnly) {
    AdjacencyIndex adj;
    adj.onEdgeAdded(-1, 1);
    adj.onEdgeAdded(-2, 2);

    auto dropped = adj.onNodeRemoved(1);
    EXPECT_EQ(dropped, (AdjacencyIndex::EdgeSet{-1}));
    EXPECT_FALSE(adj.hasEntry(1));
    EXPECT_EQ(adj.outgoing(2), (AdjacencyIndex::EdgeSet{-2}));

    // removing an edge whose start entry is gone is a no-op
    adj.onEdgeRemoved(-1, 1);
    EXPECT_EQ(adj.entryCount(), 1);
    EXPECT_TRUE(adj.onNodeRemoved(99).empty());
}
