/// @file dom_adapter.h
/// @brief The DOM operations the price pipeline relies on
///
/// The locator only walks elements and reads their text; the rewriter reads
/// an element's serialized children and writes a modified copy back. The
/// concepts below name exactly that surface, and `dom::NodeView` /
/// `dom::Document` alias the libxml2 types that provide it.
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef REPRICER_CPP_DOM_ADAPTER_H
#define REPRICER_CPP_DOM_ADAPTER_H

#include "libxml2_adapter.h"

#include <concepts>
#include <string>
#include <vector>

namespace repricer_cpp::dom {

/// @brief A non-owning element handle whose markup can be read and replaced
template<typename T>
concept MarkupNode = requires(T const& node, T& target, std::string const& markup) {
    { T{} };
    { static_cast<bool>(node) } -> std::same_as<bool>;
    { node == node } -> std::same_as<bool>;

    { node.is_element() } -> std::same_as<bool>;
    { node.parent() } -> std::same_as<T>;
    { node.child_elements() } -> std::same_as<std::vector<T>>;
    { node.is_descendant_of(node) } -> std::same_as<bool>;
    { node.tag_name() } -> std::same_as<std::string>;
    { node.text_content() } -> std::same_as<std::string>;

    { node.inner_html() } -> std::same_as<std::string>;
    { target.set_inner_html(markup) } -> std::same_as<bool>;
};

/// @brief An owning, move-only parsed document
template<typename D, typename NodeT>
concept MarkupDocument = std::movable<D> && !std::copy_constructible<D> &&
    requires(D const& doc, std::string const& html) {
        { D::parse(html) } -> std::same_as<D>;
        { static_cast<bool>(doc) } -> std::same_as<bool>;
        { doc.root() } -> std::same_as<NodeT>;
        { doc.serialize() } -> std::same_as<std::string>;
    };

using NodeView = libxml2::NodeView;
using Document = libxml2::Document;

static_assert(MarkupNode<NodeView>, "NodeView must satisfy MarkupNode");
static_assert(MarkupDocument<Document, NodeView>, "Document must satisfy MarkupDocument");

} // namespace repricer_cpp::dom

#endif // REPRICER_CPP_DOM_ADAPTER_H
