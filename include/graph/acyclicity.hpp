#pragma once

#include <export.hpp>
#include <graph/types.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace Arbor {

/**
 * @brief Kahn topological sort over nodes [0, n)
 *
 * Ties are broken by smallest node index, so the order is deterministic.
 * @return the order, or nullopt when the edges contain a cycle
 */
ARBOR_API std::optional<std::vector<uint32_t>> topological_order(size_t n, std::span<const IndexedEdge> edges);

ARBOR_API bool is_acyclic(size_t n, std::span<const IndexedEdge> edges);

} // namespace Arbor
