/**
 * @file test_postgres_graph_store.cpp
 * @brief PostgresGraphStore against a live server
 *
 * Set ARBOR_TEST_CONNINFO (e.g. "host=localhost dbname=arbor_test user=postgres")
 * to run these; they are skipped otherwise.
 */

#include <gtest/gtest.h>
#include <database/bulk_copy.hpp>
#include <database/connection_pool.hpp>
#include <database/postgres_connection.hpp>
#include <decomposition/decomposition_pipeline.hpp>
#include <service/tree_fragment_service.hpp>
#include <store/postgres_graph_store.hpp>
#include <cstdlib>
#include <map>
#include <memory>
#include <set>
#include <utility>
#include <vector>

using namespace Arbor;

namespace {

StoreConfig test_tables() {
    StoreConfig tables;
    tables.node_table = "arbor_test_nodes";
    tables.edge_table = "arbor_test_citations";
    tables.tree_edge_table = "arbor_test_tree_edges";
    tables.extra_edge_table = "arbor_test_extra_edges";
    return tables;
}

} // namespace

class PostgresGraphStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* conninfo = std::getenv("ARBOR_TEST_CONNINFO");
        if (!conninfo || !*conninfo) {
            GTEST_SKIP() << "ARBOR_TEST_CONNINFO not set - skipping PostgreSQL integration test";
        }
        conninfo_ = conninfo;

        try {
            db_ = std::make_unique<PostgresConnection>(conninfo_);
        } catch (const std::runtime_error& e) {
            GTEST_SKIP() << "Database not available: " << e.what();
        }

        drop_tables();
        store_ = std::make_unique<PostgresGraphStore>(conninfo_, 2, test_tables());
        store_->ensure_input_schema();
        seed();
    }

    void TearDown() override {
        store_.reset();
        if (db_) drop_tables();
    }

    void drop_tables() {
        const auto t = test_tables();
        for (const auto& name : {t.node_table, t.edge_table, t.tree_edge_table, t.extra_edge_table}) {
            db_->execute("DROP TABLE IF EXISTS " + PostgresConnection::quote_identifier(name));
        }
    }

    // Triangle 1 -> 2 -> 3 -> 1 with 4 -> 1 and 1 -> 5; node 3 has no year
    void seed() {
        const auto t = test_tables();
        BulkCopy copy(*db_);
        copy.begin_table(t.node_table, {"id", "x", "y", "cluster_id", "degree", "year"});
        copy.add_row({"1", "1.0", "0.0", "0", "10", "2010"});
        copy.add_row({"2", "2.0", "0.5", "0", "8", "2005"});
        copy.add_row({"3", "3.0", "0.0", "1", "6", ""});
        copy.add_row({"4", "4.0", "1.0", "", "4", "2020"});
        copy.add_row({"5", "5.0", "2.0", "1", "2", "1990"});
        copy.flush();

        copy.begin_table(t.edge_table, {"src", "dst"});
        for (auto [src, dst] : std::vector<std::pair<int, int>>{{1, 2}, {2, 3}, {3, 1}, {4, 1}, {1, 5}}) {
            copy.add_row({std::to_string(src), std::to_string(dst)});
        }
        copy.flush();
    }

    std::string conninfo_;
    std::unique_ptr<PostgresConnection> db_;
    std::unique_ptr<PostgresGraphStore> store_;
};

TEST_F(PostgresGraphStoreTest, LoadsNodesWithNullsMapped) {
    auto nodes = store_->load_nodes();
    ASSERT_EQ(nodes.size(), 5u);

    EXPECT_EQ(nodes[0].id, 1);
    EXPECT_DOUBLE_EQ(nodes[0].position.x(), 1.0);
    EXPECT_EQ(nodes[0].year.value_or(0), 2010);
    EXPECT_FALSE(nodes[2].year.has_value());
    EXPECT_EQ(nodes[3].cluster_id, -1);
    EXPECT_EQ(nodes[0].topo_level, 0);

    EXPECT_EQ(store_->load_edges().size(), 5u);
}

TEST_F(PostgresGraphStoreTest, PipelinePersistsAndServes) {
    DecompositionReport report = DecompositionPipeline(*store_, DecompositionConfig{}).run();
    ASSERT_TRUE(report.persisted);
    EXPECT_EQ(report.tree_edges, 4u);
    EXPECT_EQ(report.extra_edges, 1u);

    std::vector<NodeId> all = {1, 2, 3, 4, 5};
    EXPECT_EQ(store_->tree_edges_touching(all).size(), 4u);

    auto extra = store_->extra_edges_touching(all, 10);
    ASSERT_EQ(extra.size(), 1u);
    EXPECT_EQ(extra[0].edge_type, "feedback");
    const std::set<NodeId> triangle = {1, 2, 3};
    EXPECT_TRUE(triangle.count(extra[0].src));
    EXPECT_TRUE(triangle.count(extra[0].dst));

    // Levels written back to the node table
    std::map<NodeId, int32_t> level;
    for (const auto& n : store_->load_nodes()) level[n.id] = n.topo_level;
    for (const auto& e : store_->tree_edges_touching(all)) {
        EXPECT_GT(level[e.dst], level[e.src]);
    }

    QueryStats stats;
    ServiceConfig config;
    config.viewport_margin = 0.0;
    TreeFragmentService service(*store_, NodeCatalog::load(*store_), config, stats);

    ViewportQuery q;
    q.box = ViewBox(Eigen::Vector2d(0.5, -0.5), Eigen::Vector2d(2.5, 0.75));
    Fragment f = service.get_viewport_fragment(q);
    ASSERT_EQ(f.nodes.size(), 2u);
    EXPECT_EQ(f.nodes[0].id, 1);
}

TEST_F(PostgresGraphStoreTest, ReplaceDecompositionIsWholesale) {
    store_->replace_decomposition({{1, 2}, {2, 3}}, {{3, 1, 16, "feedback"}});
    store_->replace_decomposition({{4, 1}}, {});

    std::vector<NodeId> ids = {1, 2, 3, 4};
    EXPECT_EQ(store_->tree_edges_touching(ids), (std::vector<CitationEdge>{{4, 1}}));
    EXPECT_TRUE(store_->extra_edges_touching(ids, 10).empty());
}

TEST_F(PostgresGraphStoreTest, ExtraEdgesOrderedAndCapped) {
    store_->replace_decomposition({}, {{3, 1, 16, "feedback"}, {2, 3, 14, "feedback"}, {1, 5, 16, "feedback"}});

    std::vector<NodeId> ids = {1, 3};
    auto capped = store_->extra_edges_touching(ids, 2);
    ASSERT_EQ(capped.size(), 2u);
    EXPECT_EQ(capped[0].edge(), (CitationEdge{1, 5}));
    EXPECT_EQ(capped[1].edge(), (CitationEdge{3, 1}));
}

TEST_F(PostgresGraphStoreTest, IdListsAreBoundNotInterpolated) {
    store_->replace_decomposition({{1, 2}}, {});
    std::vector<NodeId> ids = {1, -1};
    EXPECT_EQ(store_->tree_edges_touching(ids).size(), 1u);
    EXPECT_TRUE(store_->tree_edges_touching(std::vector<NodeId>{}).empty());
}

TEST_F(PostgresGraphStoreTest, NodesAtLevelWithoutLevelColumn) {
    auto level0 = store_->nodes_at_level(0, 2);
    ASSERT_EQ(level0.size(), 2u);
    EXPECT_EQ(level0[0].id, 1);       // Highest degree
    EXPECT_TRUE(store_->nodes_at_level(1, 10).empty());

    store_->write_levels({{2, 1}, {3, 1}});
    EXPECT_EQ(store_->nodes_at_level(1, 10).size(), 2u);
    EXPECT_EQ(store_->nodes_at_level(0, 10).size(), 3u);
}

TEST(PostgresConnectionTest, QuotesAndRendersArrays) {
    EXPECT_EQ(PostgresConnection::quote_identifier("nodes"), "\"nodes\"");
    EXPECT_EQ(PostgresConnection::quote_identifier("graph.nodes"), "\"graph\".\"nodes\"");

    std::vector<int64_t> ids = {3, -7, 42};
    EXPECT_EQ(PostgresConnection::array_literal(ids), "{3,-7,42}");
    EXPECT_EQ(PostgresConnection::array_literal(std::vector<int64_t>{}), "{}");
}
