/// @file repricer.cpp
/// @brief The locate, extract, adjust and splice pipeline
///
/// This file ties the scanners, the adjuster and the splicer together over
/// DOM elements. The candidate list is always frozen before the first
/// element is rewritten, and edits run right to left at both levels
/// (elements, then amounts inside an element) so that recorded positions
/// stay valid.
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "repricer.h"
#include "amount_scanner.h"
#include "markup_splicer.h"
#include "price_locator.h"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace repricer_cpp {

namespace {

void reportDiagnostic(AdjustOptions const& options, dom::NodeView node, std::string const& message) {
    if (options.diagnosticHandler) {
        options.diagnosticHandler(node, message);
    }
}

} // namespace

NodeOutcome adjustNode(Adjustment const& adjustment,
                       dom::NodeView node,
                       AdjustOptions const& options,
                       std::size_t* amounts) {
    if (amounts) *amounts = 0;
    if (!node || !node.is_element()) return NodeOutcome::NoAmounts;

    std::string const original = node.inner_html();
    std::vector<std::size_t> const markers = findMarkers(original);

    std::string working = original;
    std::size_t rewritten = 0;

    // Right to left: a splice only moves characters after its first offset,
    // which lie beyond every marker still to be processed.
    for (auto it = markers.rbegin(); it != markers.rend(); ++it) {
        AmountToken token = captureAmount(working, *it);
        if (!isAmountRun(token)) continue;

        if (!token.value) {
            reportDiagnostic(options, node, "unparseable amount '" + token.characters + "'");
            return NodeOutcome::Aborted;
        }

        std::optional<std::string> formatted = applyAdjustment(*token.value, adjustment);
        if (!formatted) {
            reportDiagnostic(options, node, "adjusted amount for '" + token.characters + "' is not finite");
            return NodeOutcome::Aborted;
        }

        working = spliceAmount(working, token.offsets, *formatted);
        ++rewritten;
    }

    if (rewritten == 0) return NodeOutcome::NoAmounts;

    if (!node.set_inner_html(working)) {
        reportDiagnostic(options, node, "parser rejected the rewritten markup");
        return NodeOutcome::Aborted;
    }

    if (amounts) *amounts = rewritten;
    return NodeOutcome::Rewritten;
}

AdjustReport adjust(Adjustment const& adjustment, dom::NodeView root, AdjustOptions const& options) {
    AdjustReport report;

    // Snapshot first; rewriting replaces child nodes, so the tree must not be
    // walked again once mutation has started.
    std::vector<dom::NodeView> const nodes = findPriceNodes(root, options.limit);
    report.candidates = nodes.size();

    for (auto it = nodes.rbegin(); it != nodes.rend(); ++it) {
        std::size_t amounts = 0;
        switch (adjustNode(adjustment, *it, options, &amounts)) {
            case NodeOutcome::Rewritten:
                ++report.nodesRewritten;
                report.amountsAdjusted += amounts;
                break;
            case NodeOutcome::Aborted:
                ++report.nodesAborted;
                break;
            case NodeOutcome::NoAmounts:
                break;
        }
    }
    return report;
}

std::string adjustHtml(std::string const& html,
                       Adjustment const& adjustment,
                       AdjustOptions const& options,
                       AdjustReport* report) {
    dom::Document document = dom::Document::parse(html);
    if (!document) return {};

    dom::NodeView root = document.root();
    AdjustReport result = adjust(adjustment, root, options);
    if (report) *report = result;

    if (options.fragment) {
        return root.inner_html();
    }
    return document.serialize();
}

} // namespace repricer_cpp
