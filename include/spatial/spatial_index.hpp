/**
 * @file spatial_index.hpp
 * @brief Static 2D point index (Boost.Geometry R-tree) for viewport lookups
 */

#pragma once

#include <export.hpp>
#include <Eigen/Core>
#include <Eigen/Geometry>
#include <boost/geometry.hpp>
#include <boost/geometry/index/rtree.hpp>
#include <cstdint>
#include <utility>
#include <vector>

namespace Arbor {

namespace bg = boost::geometry;
namespace bgi = boost::geometry::index;

/**
 * @brief Bulk-loaded R-tree over 2D points
 *
 * build() hands the whole entry range to the rtree's packing constructor.
 * Read-only afterwards, so concurrent queries need no locking.
 */
class ARBOR_API SpatialIndex {
public:
    using BoundingBox = Eigen::AlignedBox2d;
    using Point = bg::model::point<double, 2, bg::cs::cartesian>;
    using Box = bg::model::box<Point>;
    using Value = std::pair<Point, uint32_t>;
    using Tree = bgi::rtree<Value, bgi::quadratic<16>>;

    struct Entry {
        Eigen::Vector2d point;
        uint32_t value;          // Caller-defined payload, usually a catalog position
    };

    /**
     * @brief Replace the contents with the given entries
     *
     * @throws DataIntegrityError when a point has a NaN or infinite coordinate;
     *         the previous contents are kept in that case
     */
    void build(const std::vector<Entry>& entries);

    /**
     * @brief Values of all entries whose point lies inside box (edges inclusive)
     *
     * Order is unspecified.
     */
    std::vector<uint32_t> query(const BoundingBox& box) const;

    size_t count(const BoundingBox& box) const;

    size_t size() const { return tree_.size(); }
    bool empty() const { return tree_.empty(); }

    // Box around every entry; empty box when the index is empty
    const BoundingBox& bounds() const { return bounds_; }

private:
    static Box to_box(const BoundingBox& box);

    Tree tree_;
    BoundingBox bounds_;
};

} // namespace Arbor
