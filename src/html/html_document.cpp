/**
 * @file html_document.cpp
 * @brief Flattens a gumbo parse tree into an immutable Document
 */

#include "html_document.h"
#include <gumbo.h>
#include <algorithm>
#include <cctype>

namespace html {

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

/// Tag name for an element, falling back to the source text for unknown tags.
static std::string tag_name(const GumboElement& el) {
    if (el.tag != GUMBO_TAG_UNKNOWN) {
        return gumbo_normalized_tagname(el.tag);
    }
    if (el.original_tag.data == nullptr || el.original_tag.length == 0) {
        return "";
    }
    GumboStringPiece piece = el.original_tag;
    gumbo_tag_from_original_text(&piece);
    return lowercase(std::string(piece.data, piece.length));
}

/// Copy one gumbo node and its subtree, returning the new node index.
static int copy_node(const GumboNode* gnode, int parent, const std::string& source, std::vector<Node>& nodes) {
    Node node;
    node.parent = parent;

    const GumboVector* children = nullptr;
    switch (gnode->type) {
        case GUMBO_NODE_DOCUMENT:
            node.type = Node::Type::DOCUMENT;
            children = &gnode->v.document.children;
            break;
        case GUMBO_NODE_ELEMENT:
        case GUMBO_NODE_TEMPLATE: {
            const GumboElement& el = gnode->v.element;
            node.type = Node::Type::ELEMENT;
            node.tag = tag_name(el);
            for (unsigned int i = 0; i < el.attributes.length; ++i) {
                auto* a = static_cast<const GumboAttribute*>(el.attributes.data[i]);
                node.attributes.emplace_back(lowercase(a->name), a->value ? a->value : "");
            }
            if (el.original_tag.data != nullptr && el.original_tag.length > 0) {
                size_t begin = el.start_pos.offset;
                size_t end = begin + el.original_tag.length;
                if (el.original_end_tag.data != nullptr && el.original_end_tag.length > 0) {
                    end = el.end_pos.offset + el.original_end_tag.length;
                }
                if (begin < source.size() && end <= source.size() && end > begin) {
                    node.source_begin = begin;
                    node.source_end = end;
                    node.start_tag_end = std::min(begin + el.original_tag.length, end);
                }
            }
            children = &el.children;
            break;
        }
        case GUMBO_NODE_TEXT:
        case GUMBO_NODE_CDATA:
        case GUMBO_NODE_WHITESPACE:
            node.type = Node::Type::TEXT;
            node.text = gnode->v.text.text ? gnode->v.text.text : "";
            break;
        default:
            // Comments carry nothing the rules look at
            return -1;
    }

    int index = static_cast<int>(nodes.size());
    nodes.push_back(std::move(node));

    if (children) {
        for (unsigned int i = 0; i < children->length; ++i) {
            int child = copy_node(static_cast<const GumboNode*>(children->data[i]), index, source, nodes);
            if (child >= 0) {
                nodes[static_cast<size_t>(index)].children.push_back(child);
            }
        }
    }
    return index;
}

Document Document::parse(const std::string& source) {
    Document doc;
    doc.source_ = source;

    GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions,
                                                   doc.source_.data(), doc.source_.size());
    if (!output) {
        Node root;
        root.type = Node::Type::DOCUMENT;
        doc.nodes_.push_back(root);
        return doc;
    }

    const GumboDocument& gdoc = output->document->v.document;
    doc.doctype_.present = gdoc.has_doctype;
    if (gdoc.has_doctype) {
        doc.doctype_.name = gdoc.name ? gdoc.name : "";
        doc.doctype_.public_id = gdoc.public_identifier ? gdoc.public_identifier : "";
        doc.doctype_.system_id = gdoc.system_identifier ? gdoc.system_identifier : "";
    }

    copy_node(output->document, -1, doc.source_, doc.nodes_);
    gumbo_destroy_output(&kGumboDefaultOptions, output);
    return doc;
}

std::vector<int> Document::elements(const std::string& tag) const {
    // Nodes are stored in pre-order, which is document order
    std::vector<int> out;
    for (size_t i = 0; i < nodes_.size(); ++i) {
        const Node& n = nodes_[i];
        if (n.type == Node::Type::ELEMENT && (tag.empty() || n.tag == tag)) {
            out.push_back(static_cast<int>(i));
        }
    }
    return out;
}

std::optional<std::string> Document::attr(int index, const std::string& name) const {
    for (const auto& [key, value] : node(index).attributes) {
        if (key == name) return value;
    }
    return std::nullopt;
}

static bool is_html_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

std::optional<std::string> Document::raw_attr(int index, const std::string& name) const {
    const Node& n = node(index);
    if (n.start_tag_end <= n.source_begin) return std::nullopt;
    const std::string tag = source_.substr(n.source_begin, n.start_tag_end - n.source_begin);

    // Skip "<tagname"
    size_t i = 1;
    while (i < tag.size() && !is_html_space(tag[i]) && tag[i] != '>' && tag[i] != '/') i++;

    while (i < tag.size()) {
        while (i < tag.size() && (is_html_space(tag[i]) || tag[i] == '/')) i++;
        if (i >= tag.size() || tag[i] == '>') break;

        size_t name_begin = i;
        while (i < tag.size() && !is_html_space(tag[i]) && tag[i] != '=' && tag[i] != '>' && tag[i] != '/') i++;
        if (i == name_begin) {
            i++;
            continue;
        }
        std::string attr_name = lowercase(tag.substr(name_begin, i - name_begin));

        std::string value;
        size_t j = i;
        while (j < tag.size() && is_html_space(tag[j])) j++;
        if (j < tag.size() && tag[j] == '=') {
            j++;
            while (j < tag.size() && is_html_space(tag[j])) j++;
            if (j < tag.size() && (tag[j] == '"' || tag[j] == '\'')) {
                char quote = tag[j++];
                size_t end = tag.find(quote, j);
                if (end == std::string::npos) end = tag.size();
                value = tag.substr(j, end - j);
                i = end + 1;
            } else {
                size_t begin = j;
                while (j < tag.size() && !is_html_space(tag[j]) && tag[j] != '>') j++;
                value = tag.substr(begin, j - begin);
                i = j;
            }
        }

        // Duplicates are dropped by the parser, the first one wins
        if (attr_name == name) return value;
    }
    return std::nullopt;
}

std::string Document::data(int index) const {
    std::string out;
    for (int child : node(index).children) {
        const Node& c = node(child);
        if (c.type == Node::Type::TEXT) out += c.text;
    }
    return out;
}

std::string Document::outer_source(int index) const {
    const Node& n = node(index);
    if (n.source_end <= n.source_begin) return "";
    return source_.substr(n.source_begin, n.source_end - n.source_begin);
}

bool Document::has_ancestors(int index, const std::vector<std::string>& chain) const {
    int current = node(index).parent;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        if (current < 0) return false;
        const Node& p = node(current);
        if (p.type != Node::Type::ELEMENT || p.tag != *it) return false;
        current = p.parent;
    }
    return true;
}

} // namespace html
