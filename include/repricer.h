/// @file repricer.h
/// @brief Adjust price figures inside HTML without disturbing its structure
///
/// repricer_cpp finds monetary amounts ("$1,234.56") in an HTML tree,
/// changes each one by a fixed delta or a percentage, and writes the new
/// digits back into the element's markup. Amounts whose digits are split
/// across inline elements ("$1<b>2</b>3.00") are handled, and every byte of
/// markup outside the digit runs is preserved.
///
/// @par Adjusting an HTML string
/// @code{.cpp}
/// AdjustOptions options;
/// options.fragment = true;
/// adjustHtml("<p>$10.00</p>", Adjustment::absolute(-2.46), options);
/// // Result: "<p>$7.54</p>"
/// @endcode
///
/// @par Adjusting a parsed document
/// @code{.cpp}
/// dom::Document doc = dom::Document::parse(html);
/// AdjustOptions options;
/// options.limit = 2;
/// AdjustReport report = adjust(*Adjustment::parse("-14%"), doc.root(), options);
/// @endcode
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef REPRICER_CPP_REPRICER_H
#define REPRICER_CPP_REPRICER_H

#include "adjustment.h"
#include "dom_adapter.h"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace repricer_cpp {

/// @struct AdjustOptions
/// @brief Configuration of one adjustment pass
struct AdjustOptions {
    /// @brief Maximum number of price-containing elements to rewrite
    ///
    /// Elements are counted in document order; std::nullopt rewrites all.
    std::optional<std::size_t> limit;

    /// @brief Serialize only the body's inner markup in adjustHtml()
    ///
    /// When false, adjustHtml() returns the whole serialized document.
    bool fragment = false;

    /// @brief Receives a message whenever an element's rewrite is abandoned
    ///
    /// The element keeps its original markup in that case. The default
    /// handler ignores the message.
    ///
    /// @param[in] node The element that was left unchanged
    /// @param[in] message What went wrong
    std::function<void(dom::NodeView, std::string const&)> diagnosticHandler;
};

/// @struct AdjustReport
/// @brief What one adjustment pass did
struct AdjustReport {
    std::size_t candidates = 0;       ///< Elements selected by the locator (after the limit)
    std::size_t nodesRewritten = 0;   ///< Elements whose markup was replaced
    std::size_t amountsAdjusted = 0;  ///< Amounts rewritten across all elements
    std::size_t nodesAborted = 0;     ///< Elements left unchanged because of an error
};

/// @enum NodeOutcome
/// @brief Result of adjusting a single element
enum class NodeOutcome {
    Rewritten,  ///< At least one amount was adjusted and the markup replaced
    NoAmounts,  ///< No marker in the markup is followed by an amount
    Aborted     ///< An amount could not be adjusted; markup left unchanged
};

/// @brief Adjust every amount inside one element
///
/// Reads the element's inner markup, rewrites the amounts right to left on a
/// working copy and writes the copy back once. Nothing is written when an
/// amount fails to parse or format.
///
/// @param[in] adjustment The adjustment to apply
/// @param[in] node The element to rewrite
/// @param[in] options Options (only the diagnostic handler is used)
/// @param[out] amounts Number of amounts rewritten, if not null
/// @return What happened to the element
NodeOutcome adjustNode(Adjustment const& adjustment,
                       dom::NodeView node,
                       AdjustOptions const& options = {},
                       std::size_t* amounts = nullptr);

/// @brief Adjust the prices below a DOM node
///
/// Locates the price-containing elements of `root` first, then rewrites
/// them last to first so that no edit invalidates an element not yet
/// visited.
///
/// @param[in] adjustment The adjustment to apply to every amount
/// @param[in] root The subtree to search
/// @param[in] options Limit and diagnostics
/// @return Counters describing the pass
AdjustReport adjust(Adjustment const& adjustment,
                    dom::NodeView root,
                    AdjustOptions const& options = {});

/// @brief Adjust the prices of an HTML string
///
/// Parses `html`, adjusts the prices below its body and serializes the
/// result.
///
/// @param[in] html The HTML to process
/// @param[in] adjustment The adjustment to apply
/// @param[in] options Limit, output mode and diagnostics
/// @param[out] report Counters describing the pass, if not null
/// @return The adjusted HTML (empty if `html` cannot be parsed)
std::string adjustHtml(std::string const& html,
                       Adjustment const& adjustment,
                       AdjustOptions const& options = {},
                       AdjustReport* report = nullptr);

} // namespace repricer_cpp

#endif // REPRICER_CPP_REPRICER_H
