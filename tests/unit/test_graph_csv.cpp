/**
 * @file test_graph_csv.cpp
 * @brief Unit tests for the CSV import path
 */

#include <gtest/gtest.h>
#include <store/graph_csv.hpp>
#include <utils/errors.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace Arbor;

TEST(GraphCsvTest, ParsesNodesWithHeaderAndOptionalColumns) {
    std::istringstream in(
        "id,x,y,cluster_id,degree,year\n"
        "1,0.5,-2.25,3,12,1999\n"
        "\n"
        "# comment\n"
        "2,1,1,,,\n"
        "3,4e-1,7,0,1\n");

    auto nodes = GraphCsv::parse_nodes(in);
    ASSERT_EQ(nodes.size(), 3u);

    EXPECT_EQ(nodes[0].id, 1);
    EXPECT_DOUBLE_EQ(nodes[0].position.x(), 0.5);
    EXPECT_DOUBLE_EQ(nodes[0].position.y(), -2.25);
    EXPECT_EQ(nodes[0].cluster_id, 3);
    EXPECT_EQ(nodes[0].degree, 12);
    EXPECT_EQ(nodes[0].year.value_or(0), 1999);

    EXPECT_EQ(nodes[1].cluster_id, -1);
    EXPECT_EQ(nodes[1].degree, 0);
    EXPECT_FALSE(nodes[1].year.has_value());

    EXPECT_DOUBLE_EQ(nodes[2].position.x(), 0.4);
    EXPECT_FALSE(nodes[2].year.has_value());
}

TEST(GraphCsvTest, HeaderIsOptional) {
    std::istringstream in("10,20\r\n20,30\r\n");
    auto edges = GraphCsv::parse_edges(in);
    EXPECT_EQ(edges, (std::vector<CitationEdge>{{10, 20}, {20, 30}}));
}

TEST(GraphCsvTest, ReportsFileAndLine) {
    std::istringstream in("src,dst\n1,2\n3,oops\n");
    try {
        GraphCsv::parse_edges(in, "edges.csv");
        FAIL() << "expected a data integrity error";
    } catch (const DataIntegrityError& e) {
        EXPECT_NE(std::string(e.what()).find("edges.csv:3"), std::string::npos) << e.what();
    }
}

TEST(GraphCsvTest, RejectsMalformedRows) {
    std::istringstream wrong_arity("1,2,3\n");
    EXPECT_THROW(GraphCsv::parse_edges(wrong_arity), DataIntegrityError);

    std::istringstream short_node("1,0,0\n");
    EXPECT_THROW(GraphCsv::parse_nodes(short_node), DataIntegrityError);

    std::istringstream bad_coord("1,abc,0,1,1\n");
    EXPECT_THROW(GraphCsv::parse_nodes(bad_coord), DataIntegrityError);

    // Only the first row may be a header
    std::istringstream late_header("1,2\nsrc,dst\n");
    EXPECT_THROW(GraphCsv::parse_edges(late_header), DataIntegrityError);
}

TEST(GraphCsvTest, RejectsNonFiniteCoordinates) {
    for (const char* row : {"2,nan,1,0,1\n", "2,1,inf,0,1\n", "2,-INF,1,0,1\n", "2,1,NaN,0,1\n"}) {
        std::istringstream in(std::string("id,x,y,cluster_id,degree\n1,0,0,0,1\n") + row);
        try {
            GraphCsv::parse_nodes(in, "nodes.csv");
            FAIL() << "accepted " << row;
        } catch (const DataIntegrityError& e) {
            EXPECT_NE(std::string(e.what()).find("nodes.csv:3"), std::string::npos) << e.what();
        }
    }
}

TEST(GraphCsvTest, LoadsIntoMemoryStore) {
    const auto dir = std::filesystem::temp_directory_path();
    const auto nodes_path = dir / "arbor_csv_nodes.csv";
    const auto edges_path = dir / "arbor_csv_edges.csv";
    {
        std::ofstream(nodes_path) << "id,x,y,cluster_id,degree\n1,0,0,0,1\n2,1,1,0,2\n";
        std::ofstream(edges_path) << "src,dst\n2,1\n";
    }

    auto store = GraphCsv::load(nodes_path.string(), edges_path.string());
    std::filesystem::remove(nodes_path);
    std::filesystem::remove(edges_path);

    EXPECT_EQ(store->load_nodes().size(), 2u);
    EXPECT_EQ(store->load_edges(), (std::vector<CitationEdge>{{2, 1}}));
    EXPECT_THROW(GraphCsv::read_nodes("/nonexistent/nodes.csv"), std::runtime_error);
}
