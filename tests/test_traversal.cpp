#include <gtest/gtest.h>
#include "graph/graph.hpp"
#include "graph/errors.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <vector>

using namespace graphine;

namespace {

// A→B, B→D, B→F, F→E, A→C, C→G, A→E
class TraversalTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : {"A", "B", "C", "D", "E", "F", "G"}) {
            nodes[name] = g.addNode({{"name", name}});
        }
        g.addEdge(nodes["A"], nodes["B"]);
        g.addEdge(nodes["B"], nodes["D"]);
        g.addEdge(nodes["B"], nodes["F"]);
        g.addEdge(nodes["F"], nodes["E"]);
        g.addEdge(nodes["A"], nodes["C"]);
        g.addEdge(nodes["C"], nodes["G"]);
        g.addEdge(nodes["A"], nodes["E"]);
    }

    std::string nameOf(Uid uid) const { return g.getNode(uid)["name"].asString(); }

    std::vector<std::string> names(Traversal traversal) const {
        std::vector<std::string> out;
        for (Uid uid : traversal) {
            out.push_back(nameOf(uid));
        }
        return out;
    }

    std::map<std::string, size_t> positions(Traversal traversal) const {
        std::map<std::string, size_t> out;
        size_t pos = 0;
        for (Uid uid : traversal) {
            out[nameOf(uid)] = pos++;
        }
        return out;
    }

    Graph g{{"name"}, {}};
    std::map<std::string, Uid> nodes;
};

} // namespace

TEST_F(TraversalTest, DepthFirstOrdering) {
    auto pos = positions(g.depthFirst(nodes["A"]));
    ASSERT_EQ(pos.size(), 7);
    EXPECT_LT(pos["A"], pos["B"]);
    EXPECT_LT(pos["A"], pos["C"]);
    EXPECT_LT(pos["A"], pos["E"]);
    EXPECT_LT(pos["B"], pos["D"]);
    EXPECT_LT(pos["B"], pos["F"]);
    EXPECT_LT(pos["C"], pos["G"]);
    EXPECT_GT(pos["F"], std::min(pos["B"], pos["E"]));
}

TEST_F(TraversalTest, DepthFirstExactSequence) {
    // the stack pops the last discovered neighbor first
    EXPECT_EQ(names(g.depthFirst(nodes["A"])),
              (std::vector<std::string>{"A", "E", "C", "G", "B", "F", "D"}));
}

TEST_F(TraversalTest, BreadthFirstOrdering) {
    auto pos = positions(g.breadthFirst(nodes["A"]));
    ASSERT_EQ(pos.size(), 7);
    EXPECT_LT(pos["A"], std::min({pos["B"], pos["C"], pos["E"]}));
    EXPECT_LT(std::max({pos["B"], pos["C"], pos["E"]}),
              std::min({pos["D"], pos["F"], pos["G"]}));
    EXPECT_EQ(names(g.breadthFirst(nodes["A"])),
              (std::vector<std::string>{"A", "B", "C", "E", "D", "F", "G"}));
}

TEST_F(TraversalTest, BothWalksVisitEachNodeOnce) {
    std::vector<std::string> dfs = names(g.depthFirst(nodes["A"]));
    std::vector<std::string> bfs = names(g.breadthFirst(nodes["A"]));
    EXPECT_EQ(std::set<std::string>(dfs.begin(), dfs.end()).size(), dfs.size());
    EXPECT_EQ(std::set<std::string>(dfs.begin(), dfs.end()),
              std::set<std::string>(bfs.begin(), bfs.end()));
    EXPECT_NE(dfs, bfs);
}

TEST_F(TraversalTest, OnlyReachableNodes) {
    EXPECT_EQ(names(g.depthFirst(nodes["B"])), (std::vector<std::string>{"B", "F", "E", "D"}));
    EXPECT_EQ(names(g.breadthFirst(nodes["G"])), (std::vector<std::string>{"G"}));
}

TEST_F(TraversalTest, CyclesTerminate) {
    g.addEdge(nodes["G"], nodes["A"]);
    g.addEdge(nodes["E"], nodes["E"]);
    EXPECT_EQ(names(g.breadthFirst(nodes["C"])),
              (std::vector<std::string>{"C", "G", "A", "B", "E", "D", "F"}));
    EXPECT_EQ(names(g.depthFirst(nodes["C"])).size(), 7);
}

TEST_F(TraversalTest, LazyAndStoppable) {
    Traversal walk = g.breadthFirst(nodes["A"]);
    EXPECT_EQ(walk.next(), nodes["A"]);
    // A is not expanded until the next pull
    EXPECT_EQ(walk.frontierSize(), 0);
    EXPECT_EQ(walk.next(), nodes["B"]);
    EXPECT_EQ(walk.frontierSize(), 2);
    EXPECT_EQ(walk.visitedCount(), 2);
    // abandoning the walk leaves the graph untouched
    EXPECT_EQ(g.nodeCount(), 7);
    EXPECT_EQ(g.edgeCount(), 7);
}

TEST_F(TraversalTest, ExhaustedWalkStaysExhausted) {
    Traversal walk = g.depthFirst(nodes["D"]);
    EXPECT_EQ(walk.next(), nodes["D"]);
    EXPECT_EQ(walk.next(), std::nullopt);
    EXPECT_EQ(walk.next(), std::nullopt);
}

TEST_F(TraversalTest, CustomSelector) {
    // always take the highest-numbered pending node
    Selector highest = [](Frontier& frontier) {
        auto it = std::max_element(frontier.begin(), frontier.end());
        Uid uid = *it;
        frontier.erase(it);
        return uid;
    };
    EXPECT_EQ(names(g.traverse(nodes["A"], highest)),
              (std::vector<std::string>{"A", "E", "C", "G", "B", "F", "D"}));
}

TEST_F(TraversalTest, DanglingEdgeEndIsYielded) {
    Uid ghost = g.addNode({{"name", "ghost"}});
    g.addEdge(nodes["G"], ghost);
    g.removeNode(ghost);
    std::vector<Uid> seen;
    for (Uid uid : g.breadthFirst(nodes["C"])) seen.push_back(uid);
    EXPECT_EQ(seen, (std::vector<Uid>{nodes["C"], nodes["G"], ghost}));
}

TEST_F(TraversalTest, UnknownRootThrows) {
    EXPECT_THROW(g.depthFirst(99), UnknownIdentifier);
    EXPECT_THROW(g.breadthFirst(-1), UnknownIdentifier);
}
