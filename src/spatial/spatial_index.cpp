#include <spatial/spatial_index.hpp>
#include <utils/errors.hpp>
#include <algorithm>
#include <iterator>
#include <string>

namespace Arbor {

SpatialIndex::Box SpatialIndex::to_box(const BoundingBox& box) {
    return Box(Point(box.min().x(), box.min().y()), Point(box.max().x(), box.max().y()));
}

void SpatialIndex::build(const std::vector<Entry>& entries) {
    const long long n = static_cast<long long>(entries.size());
    std::vector<Value> values(entries.size());

    // No exception may leave the parallel region; remember the first bad entry instead
    long long bad = n;
    #pragma omp parallel for schedule(static) reduction(min:bad)
    for (long long i = 0; i < n; ++i) {
        const Eigen::Vector2d& p = entries[i].point;
        if (!p.allFinite()) {
            bad = std::min(bad, i);
            continue;
        }
        values[i] = Value(Point(p.x(), p.y()), entries[i].value);
    }

    if (bad < n) {
        throw DataIntegrityError("SpatialIndex: entry " + std::to_string(entries[bad].value) +
                                 " has a non-finite coordinate");
    }

    BoundingBox bounds;
    for (const auto& e : entries) {
        bounds.extend(e.point);
    }

    Tree packed(values.begin(), values.end());
    tree_.swap(packed);
    bounds_ = bounds;
}

std::vector<uint32_t> SpatialIndex::query(const BoundingBox& box) const {
    std::vector<uint32_t> out;
    if (tree_.empty() || box.isEmpty()) return out;

    std::vector<Value> hits;
    tree_.query(bgi::intersects(to_box(box)), std::back_inserter(hits));

    out.reserve(hits.size());
    for (const auto& [point, value] : hits) {
        out.push_back(value);
    }
    return out;
}

size_t SpatialIndex::count(const BoundingBox& box) const {
    return query(box).size();
}

} // namespace Arbor
