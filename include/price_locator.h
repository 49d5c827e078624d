/// @file price_locator.h
/// @brief Locating the elements that contain prices
///
/// The locator walks a DOM subtree and selects the most specific elements
/// holding price amounts, so that every amount is rewritten exactly once.
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef REPRICER_CPP_PRICE_LOCATOR_H
#define REPRICER_CPP_PRICE_LOCATOR_H

#include "dom_adapter.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace repricer_cpp {

/// @struct PriceCandidate
/// @brief An element selected as the container of one or more amounts
struct PriceCandidate {
    dom::NodeView node;        ///< The containing element
    std::size_t amounts = 0;   ///< Amounts found in its visible text
};

/// @brief Select the price-containing elements below a root
///
/// Descendant elements of `root` (not `root` itself) are visited in
/// pre-order and their visible text is tested with countAmounts(). When a
/// matching element is a child of the previously accepted one:
///
/// - equal amount counts: the child is more specific, so the parent is
///   dropped and the child kept;
/// - a larger parent count: the parent is authoritative, so the child and
///   every other element of the parent's subtree are skipped.
///
/// Otherwise the element is accepted as a new candidate.
///
/// The result is a snapshot: it is computed completely before the caller
/// mutates anything.
///
/// @param[in] root The subtree to search
/// @param[in] limit Maximum number of candidates returned (all when empty)
/// @return Candidates in document order
std::vector<PriceCandidate> locatePrices(dom::NodeView root,
                                         std::optional<std::size_t> limit = std::nullopt);

/// @brief Convenience wrapper over locatePrices() returning only the nodes
/// @param[in] root The subtree to search
/// @param[in] limit Maximum number of nodes returned (all when empty)
/// @return Price-containing elements in document order
std::vector<dom::NodeView> findPriceNodes(dom::NodeView root,
                                          std::optional<std::size_t> limit = std::nullopt);

} // namespace repricer_cpp

#endif // REPRICER_CPP_PRICE_LOCATOR_H
