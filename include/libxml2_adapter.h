/// @file libxml2_adapter.h
/// @brief Element views and documents over libxml2's HTML parser
///
/// Inner markup is dumped without formatting, so offsets computed on it stay
/// valid when the modified string is written back with set_inner_html().
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef REPRICER_CPP_LIBXML2_ADAPTER_H
#define REPRICER_CPP_LIBXML2_ADAPTER_H

#include <libxml/HTMLparser.h>
#include <libxml/tree.h>

#include <memory>
#include <string>
#include <vector>

namespace repricer_cpp::libxml2 {

/// @brief Non-owning view of a node in a libxml2 tree
class NodeView {
public:
    NodeView() = default;
    explicit NodeView(xmlNodePtr node) : node_(node) {}

    xmlNodePtr get() const { return node_; }
    explicit operator bool() const { return node_ != nullptr; }
    bool operator==(NodeView const& other) const = default;

    bool is_element() const;
    NodeView parent() const;

    /// @brief Element children in document order (text and comments skipped)
    std::vector<NodeView> child_elements() const;

    /// @brief True if `ancestor` is a proper ancestor of this node
    bool is_descendant_of(NodeView const& ancestor) const;

    /// @brief Lowercase element name, empty for non-elements
    std::string tag_name() const;

    /// @brief Concatenated text of all descendant text nodes
    std::string text_content() const;

    /// @brief Serialized children, byte-stable across set_inner_html()
    std::string inner_html() const;

    /// @brief Replace the children with the parsed `markup`
    /// @return false if the markup could not be parsed; the children are
    ///         left untouched in that case
    bool set_inner_html(std::string const& markup);

private:
    xmlNodePtr node_ = nullptr;
};

/// @brief Owns a parsed HTML document
class Document {
public:
    Document() = default;

    /// @brief Tolerant parse (errors recovered, no network access)
    /// @return An empty Document if libxml2 produced no tree
    static Document parse(std::string const& html);

    explicit operator bool() const { return doc_ != nullptr; }

    /// @brief The <body> element, or the document element when there is none
    NodeView root() const;

    /// @brief The whole document as HTML
    std::string serialize() const;

private:
    struct DocFree {
        void operator()(xmlDocPtr doc) const { xmlFreeDoc(doc); }
    };

    explicit Document(xmlDocPtr doc) : doc_(doc) {}
    std::unique_ptr<xmlDoc, DocFree> doc_;
};

} // namespace repricer_cpp::libxml2

#endif // REPRICER_CPP_LIBXML2_ADAPTER_H
