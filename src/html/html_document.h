#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Immutable HTML document built from a gumbo parse tree.
// The gumbo output is copied into a flat vector of nodes and released right
// away, so a Document can be shared freely and outlives the parser.

namespace html {

struct Node {
    enum class Type {
        DOCUMENT,
        ELEMENT,
        TEXT
    };

    Type type = Type::ELEMENT;
    int parent = -1;
    std::vector<int> children;
    std::string tag;  // lowercase, empty for non-elements
    std::vector<std::pair<std::string, std::string>> attributes;
    std::string text;  // TEXT nodes only

    // Byte range of the element markup in the source; empty when the parser
    // inserted the element without any tag in the source
    size_t source_begin = 0;
    size_t source_end = 0;
    size_t start_tag_end = 0;  // one past the '>' of the start tag
};

struct Doctype {
    bool present = false;
    std::string name;
    std::string public_id;
    std::string system_id;
};

class Document {
public:
    /**
     * @brief Parse HTML text
     * @param source Document markup; HTML parsing never fails, so neither does this
     * @return Parsed document, node 0 is the document root
     */
    static Document parse(const std::string& source);

    const std::vector<Node>& nodes() const { return nodes_; }
    const Node& node(int index) const { return nodes_.at(static_cast<size_t>(index)); }
    const Doctype& doctype() const { return doctype_; }
    const std::string& source() const { return source_; }

    /**
     * @brief Find elements by tag name in document order
     * @param tag Lowercase tag name, or empty for every element
     * @return Node indices
     */
    std::vector<int> elements(const std::string& tag) const;

    /**
     * @brief Get an attribute of an element
     * @param index Element index
     * @param name Lowercase attribute name
     * @return Attribute value, or nullopt if the element does not carry it
     */
    std::optional<std::string> attr(int index, const std::string& name) const;

    /**
     * @brief Get an attribute value exactly as written in the start tag
     *
     * Character references are left as they are, so the result is always a
     * substring of source().
     *
     * @return Raw value, empty for a bare attribute, or nullopt if the start
     *         tag is not in the source or does not carry the attribute
     */
    std::optional<std::string> raw_attr(int index, const std::string& name) const;

    /**
     * @brief Concatenated text of the direct text children (e.g. a <style> body)
     */
    std::string data(int index) const;

    /**
     * @brief Literal markup of an element as it appears in the source
     *
     * Spans from the start tag to the end of the end tag. Elements without an
     * explicit end tag yield only their start tag.
     */
    std::string outer_source(int index) const;

    /**
     * @brief Check the parent chain of a node
     * @param index Node to check
     * @param chain Expected ancestors, outermost first: {"html", "head"} matches html > head > node
     * @return true if the direct ancestors match the chain
     */
    bool has_ancestors(int index, const std::vector<std::string>& chain) const;

private:
    std::string source_;
    std::vector<Node> nodes_;
    Doctype doctype_;
};

} // namespace html
