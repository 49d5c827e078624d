/// @file price_locator.cpp
/// @brief Candidate selection over a DOM subtree
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "price_locator.h"
#include "amount_scanner.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace repricer_cpp {

namespace {

// Pre-order, so a container is always visited before its children.
void collectElements(dom::NodeView node, std::vector<dom::NodeView>& out) {
    for (auto child : node.child_elements()) {
        out.push_back(child);
        collectElements(child, out);
    }
}

} // namespace

std::vector<PriceCandidate> locatePrices(dom::NodeView root, std::optional<std::size_t> limit) {
    std::vector<PriceCandidate> results;
    if (!root) return results;

    std::vector<dom::NodeView> elements;
    collectElements(root, elements);

    dom::NodeView lastNode;
    std::size_t lastCount = 0;
    bool skipSubtree = false;

    for (auto node : elements) {
        std::size_t count = countAmounts(node.text_content());
        if (count == 0) continue;

        if (skipSubtree && node.is_descendant_of(lastNode)) {
            continue;
        }
        skipSubtree = false;

        if (lastNode && node.parent() == lastNode) {
            if (lastCount == count) {
                results.pop_back();
            } else if (lastCount > count) {
                skipSubtree = true;
                continue;
            }
        }

        results.push_back(PriceCandidate{node, count});
        lastNode = node;
        lastCount = count;
    }

    if (limit && results.size() > *limit) {
        results.resize(*limit);
    }
    return results;
}

std::vector<dom::NodeView> findPriceNodes(dom::NodeView root, std::optional<std::size_t> limit) {
    std::vector<dom::NodeView> nodes;
    for (auto const& candidate : locatePrices(root, limit)) {
        nodes.push_back(candidate.node);
    }
    return nodes;
}

} // namespace repricer_cpp
