/// @file libxml2_adapter.cpp
/// @brief libxml2 implementation of the markup node and document
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#include "libxml2_adapter.h"

#include <libxml/HTMLtree.h>
#include <libxml/parser.h>
#include <libxml/xmlIO.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace repricer_cpp::libxml2 {

namespace {

constexpr int kParseOptions = HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET;

struct XmlCharFree {
    void operator()(xmlChar* p) const { xmlFree(p); }
};
using XmlString = std::unique_ptr<xmlChar, XmlCharFree>;

struct OutputBufferClose {
    void operator()(xmlOutputBufferPtr out) const { xmlOutputBufferClose(out); }
};

bool isAsciiLetter(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

// libxml2 treats "< 5" in text as a broken tag. A '<' that cannot open a
// tag, end tag, comment or declaration is written as "&lt;" before parsing.
std::string escapeStrayAngleBrackets(std::string_view html) {
    std::string out;
    out.reserve(html.size());
    for (std::size_t i = 0; i < html.size(); ++i) {
        if (html[i] != '<') {
            out.push_back(html[i]);
            continue;
        }
        char next = i + 1 < html.size() ? html[i + 1] : '\0';
        bool opensMarkup = isAsciiLetter(next) || next == '/' || next == '!' || next == '?';
        out += opensMarkup ? "<" : "&lt;";
    }
    return out;
}

xmlDocPtr readHtml(std::string const& html) {
    xmlInitParser();
    std::string sanitized = escapeStrayAngleBrackets(html);
    return htmlReadMemory(sanitized.data(), static_cast<int>(sanitized.size()), nullptr, "UTF-8", kParseOptions);
}

bool hasName(xmlNodePtr node, char const* name) {
    return node && node->type == XML_ELEMENT_NODE && node->name &&
           xmlStrcasecmp(node->name, reinterpret_cast<xmlChar const*>(name)) == 0;
}

// First element called `name` in pre-order, starting at `node` and its siblings.
xmlNodePtr findFirst(xmlNodePtr node, char const* name) {
    for (; node; node = node->next) {
        if (hasName(node, name)) return node;
        if (xmlNodePtr found = findFirst(node->children, name)) return found;
    }
    return nullptr;
}

} // namespace

bool NodeView::is_element() const {
    return node_ && node_->type == XML_ELEMENT_NODE;
}

NodeView NodeView::parent() const {
    return node_ ? NodeView(node_->parent) : NodeView{};
}

std::vector<NodeView> NodeView::child_elements() const {
    std::vector<NodeView> elements;
    if (!node_) return elements;
    for (xmlNodePtr child = node_->children; child; child = child->next) {
        if (child->type == XML_ELEMENT_NODE) {
            elements.emplace_back(child);
        }
    }
    return elements;
}

bool NodeView::is_descendant_of(NodeView const& ancestor) const {
    if (!node_ || !ancestor) return false;
    for (xmlNodePtr p = node_->parent; p; p = p->parent) {
        if (p == ancestor.node_) return true;
    }
    return false;
}

std::string NodeView::tag_name() const {
    if (!is_element() || !node_->name) return {};
    std::string name(reinterpret_cast<char const*>(node_->name));
    for (char& c : name) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return name;
}

std::string NodeView::text_content() const {
    if (!node_) return {};
    // Comments are not part of an element's content.
    XmlString content(xmlNodeGetContent(node_));
    return content ? std::string(reinterpret_cast<char const*>(content.get())) : std::string{};
}

std::string NodeView::inner_html() const {
    if (!node_ || !node_->doc) return {};

    std::unique_ptr<xmlOutputBuffer, OutputBufferClose> out(xmlAllocOutputBuffer(nullptr));
    if (!out) return {};

    // format = 0: no indentation or newlines may be added.
    for (xmlNodePtr child = node_->children; child; child = child->next) {
        htmlNodeDumpFormatOutput(out.get(), node_->doc, child, nullptr, 0);
    }
    xmlOutputBufferFlush(out.get());

    xmlChar const* content = xmlOutputBufferGetContent(out.get());
    if (!content) return {};
    return std::string(reinterpret_cast<char const*>(content), xmlOutputBufferGetSize(out.get()));
}

bool NodeView::set_inner_html(std::string const& markup) {
    if (!is_element() || !node_->doc) return false;

    // xmlParseInNodeContext() wraps HTML text in implied <p> elements, so the
    // markup is parsed inside a wrapper of the same tag in a scratch document
    // and the wrapper's children are copied over.
    std::string tag = tag_name();
    std::unique_ptr<xmlDoc, void (*)(xmlDocPtr)> scratch(
        readHtml("<" + tag + ">" + markup + "</" + tag + ">"), xmlFreeDoc);
    if (!scratch) return false;

    xmlNodePtr wrapper = findFirst(xmlDocGetRootElement(scratch.get()), tag.c_str());
    if (!wrapper) return false;

    xmlNodePtr copied = nullptr;
    if (wrapper->children) {
        copied = xmlDocCopyNodeList(node_->doc, wrapper->children);
        if (!copied) return false;
    }

    while (xmlNodePtr child = node_->children) {
        xmlUnlinkNode(child);
        xmlFreeNode(child);
    }
    if (copied) {
        xmlAddChildList(node_, copied);
    }
    return true;
}

Document Document::parse(std::string const& html) {
    return Document(readHtml(html));
}

NodeView Document::root() const {
    if (!doc_) return {};
    xmlNodePtr element = xmlDocGetRootElement(doc_.get());
    if (xmlNodePtr body = findFirst(element, "body")) {
        return NodeView(body);
    }
    return NodeView(element);
}

std::string Document::serialize() const {
    if (!doc_) return {};
    xmlChar* raw = nullptr;
    int size = 0;
    htmlDocDumpMemoryFormat(doc_.get(), &raw, &size, 0);
    XmlString memory(raw);
    if (!memory || size < 0) return {};
    return std::string(reinterpret_cast<char const*>(memory.get()), static_cast<std::size_t>(size));
}

} // namespace repricer_cpp::libxml2
