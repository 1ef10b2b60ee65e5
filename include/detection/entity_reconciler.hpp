#pragma once

#include "core/types.hpp"

#include <vector>

namespace piiredact {

/**
 * @brief Merges entity lists from any number of detectors
 *
 * Output is sorted ascending by start and pairwise non-overlapping.
 *
 * Overlap resolution is first-detected-overlap, not a transitive interval
 * merge: a candidate is compared only against the first accepted entity it
 * overlaps (in accepted-list order). Strictly higher confidence replaces
 * that entity; ties keep the already-accepted one. For chains of three or
 * more mutually overlapping spans the cluster-wide maximum is therefore not
 * guaranteed to survive.
 */
class EntityReconciler {
public:
    /// Half-open interval intersection
    [[nodiscard]] static bool overlaps(const Entity& a, const Entity& b) {
        return a.start < b.end && a.end > b.start;
    }

    [[nodiscard]] static std::vector<Entity> reconcile(std::vector<Entity> entities);

    [[nodiscard]] static std::vector<Entity> reconcile(
        const std::vector<std::vector<Entity>>& entity_lists);
};

} // namespace piiredact
