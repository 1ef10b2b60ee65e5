#include "detection/entity_reconciler.hpp"

#include <algorithm>

namespace piiredact {

namespace {

bool by_start(const Entity& a, const Entity& b) {
    return a.start < b.start;
}

} // anonymous namespace

std::vector<Entity> EntityReconciler::reconcile(std::vector<Entity> entities) {
    std::vector<Entity> accepted;
    if (entities.empty()) {
        return accepted;
    }

    // Stable: equal starts keep detector/pattern order
    std::stable_sort(entities.begin(), entities.end(), by_start);
    accepted.reserve(entities.size());

    for (auto& candidate : entities) {
        bool overlapped = false;
        for (auto& existing : accepted) {
            if (!overlaps(candidate, existing)) continue;

            // Only the first overlapping accepted entity is considered
            if (candidate.confidence > existing.confidence) {
                existing = std::move(candidate);
            }
            overlapped = true;
            break;
        }

        if (!overlapped) {
            accepted.push_back(std::move(candidate));
        }
    }

    // In-place replacement can move a later start into an earlier slot
    std::stable_sort(accepted.begin(), accepted.end(), by_start);
    return accepted;
}

std::vector<Entity> EntityReconciler::reconcile(
    const std::vector<std::vector<Entity>>& entity_lists) {

    size_t total = 0;
    for (const auto& list : entity_lists) {
        total += list.size();
    }

    std::vector<Entity> all;
    all.reserve(total);
    for (const auto& list : entity_lists) {
        all.insert(all.end(), list.begin(), list.end());
    }
    return reconcile(std::move(all));
}

} // namespace piiredact
