#include "document.hpp"
#include <algorithm>
#include <gumbo.h>
#include <sstream>
#include <unordered_set>

#include "../utils/text/string_utils.hpp"

namespace Ar5iv {
namespace Dom {

namespace {

constexpr const char* DOCUMENT_TAG = "#document";

const std::unordered_set<std::string>& void_elements() {
    static const std::unordered_set<std::string> tags = {"area",
                                                         "base",
                                                         "br",
                                                         "col",
                                                         "embed",
                                                         "hr",
                                                         "img",
                                                         "input",
                                                         "link",
                                                         "meta",
                                                         "param",
                                                         "source",
                                                         "track",
                                                         "wbr"};
    return tags;
}

const std::unordered_set<std::string>& raw_text_elements() {
    static const std::unordered_set<std::string> tags = {
        "script", "style", "xmp", "iframe", "noembed", "noframes", "plaintext"};
    return tags;
}

std::string escape_html(const std::string& input, bool attribute) {
    std::string output;
    output.reserve(input.size());
    for (char c : input) {
        switch (c) {
            case '&':
                output += "&amp;";
                break;
            case '<':
                output += "&lt;";
                break;
            case '>':
                output += "&gt;";
                break;
            case '"':
                output += attribute ? "&quot;" : "\"";
                break;
            default:
                output.push_back(c);
                break;
        }
    }
    return output;
}

std::string tag_name(const GumboElement& element) {
    if (element.tag != GUMBO_TAG_UNKNOWN)
        return gumbo_normalized_tagname(element.tag);

    // Unknown to gumbo (MathML annotation, custom elements): recover it from the source text.
    GumboStringPiece piece = element.original_tag;
    gumbo_tag_from_original_text(&piece);
    if (piece.data == nullptr || piece.length == 0)
        return "";
    return Utils::Text::to_lower(std::string(piece.data, piece.length));
}

std::unique_ptr<Node> convert(const GumboNode* source) {
    switch (source->type) {
        case GUMBO_NODE_TEXT:
        case GUMBO_NODE_WHITESPACE:
        case GUMBO_NODE_CDATA:
            return Node::make_text(source->v.text.text);
        case GUMBO_NODE_ELEMENT:
        case GUMBO_NODE_TEMPLATE: {
            const GumboElement& element = source->v.element;
            auto                node    = Node::make_element(tag_name(element));

            for (unsigned int i = 0; i < element.attributes.length; ++i) {
                auto* attr = static_cast<const GumboAttribute*>(element.attributes.data[i]);
                node->set_attribute(attr->name, attr->value);
            }
            for (unsigned int i = 0; i < element.children.length; ++i) {
                auto child = convert(static_cast<const GumboNode*>(element.children.data[i]));
                if (child)
                    node->append_child(std::move(child));
            }
            return node;
        }
        default:
            return nullptr;
    }
}

void serialize_node(const Node& node, std::string& output, bool raw_text) {
    if (node.is_text()) {
        output += raw_text ? node.content() : escape_html(node.content(), false);
        return;
    }

    const std::string& tag = node.tag();
    output += "<";
    output += tag;
    for (const auto& attr : node.attributes()) {
        output += " ";
        output += attr.name;
        output += "=\"";
        output += escape_html(attr.value, true);
        output += "\"";
    }
    output += ">";

    if (void_elements().count(tag))
        return;

    bool raw = raw_text_elements().count(tag) > 0;
    for (const auto& child : node.children())
        serialize_node(*child, output, raw);

    output += "</";
    output += tag;
    output += ">";
}

template <typename NodeT, typename Out>
void collect(NodeT& node, const NodePredicate& pred, Traversal mode, Out& out) {
    for (const auto& child : node.children()) {
        bool matched = pred(*child);
        if (matched)
            out.push_back(child.get());
        if (!matched || mode == Traversal::All)
            collect<NodeT>(*child, pred, mode, out);
    }
}

}  // namespace

Node::Node(NodeType type, std::string value) : type_(type) {
    if (type_ == NodeType::Text)
        content_ = std::move(value);
    else
        tag_ = std::move(value);
}

std::unique_ptr<Node> Node::make_text(std::string content) {
    return std::unique_ptr<Node>(new Node(NodeType::Text, std::move(content)));
}

std::unique_ptr<Node> Node::make_element(std::string tag) {
    return std::unique_ptr<Node>(new Node(NodeType::Element, std::move(tag)));
}

const std::string* Node::attribute(const std::string& name) const {
    for (const auto& attr : attributes_) {
        if (attr.name == name)
            return &attr.value;
    }
    return nullptr;
}

void Node::set_attribute(const std::string& name, const std::string& value) {
    for (auto& attr : attributes_) {
        if (attr.name == name) {
            attr.value = value;
            return;
        }
    }
    attributes_.push_back({name, value});
}

bool Node::has_class(const std::string& name) const {
    const std::string* classes = attribute("class");
    if (!classes)
        return false;

    std::istringstream stream(*classes);
    std::string        token;
    while (stream >> token) {
        if (token == name)
            return true;
    }
    return false;
}

Node* Node::append_child(std::unique_ptr<Node> child) {
    child->parent_ = this;
    children_.push_back(std::move(child));
    return children_.back().get();
}

std::vector<std::unique_ptr<Node>>::iterator Node::position_in_parent() {
    auto& siblings = parent_->children_;
    return std::find_if(siblings.begin(), siblings.end(), [this](const std::unique_ptr<Node>& n) {
        return n.get() == this;
    });
}

std::unique_ptr<Node> Node::replace_with(std::unique_ptr<Node> replacement) {
    if (!parent_)
        return nullptr;

    auto it              = position_in_parent();
    replacement->parent_ = parent_;
    std::unique_ptr<Node> self = std::move(*it);
    *it                        = std::move(replacement);
    parent_                    = nullptr;
    return self;
}

std::unique_ptr<Node> Node::detach() {
    if (!parent_)
        return nullptr;

    auto                  it   = position_in_parent();
    std::unique_ptr<Node> self = std::move(*it);
    parent_->children_.erase(it);
    parent_ = nullptr;
    return self;
}

std::string Node::text_content() const {
    if (is_text())
        return content_;

    std::string text;
    for (const auto& child : children_)
        text += child->text_content();
    return text;
}

Document::Document() : root_(Node::make_element(DOCUMENT_TAG)) {
}

Document Document::parse(const std::string& html) {
    Document document;

    GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size());
    const GumboDocument& source = output->document->v.document;
    document.has_doctype_       = source.has_doctype;
    if (source.name)
        document.doctype_name_ = source.name;

    for (unsigned int i = 0; i < source.children.length; ++i) {
        auto child = convert(static_cast<const GumboNode*>(source.children.data[i]));
        if (child)
            document.root_->append_child(std::move(child));
    }
    gumbo_destroy_output(&kGumboDefaultOptions, output);

    return document;
}

std::vector<Node*> Document::find_all(const NodePredicate& pred, Traversal mode) {
    std::vector<Node*> matches;
    collect<Node>(*root_, pred, mode, matches);
    return matches;
}

std::vector<const Node*> Document::find_all(const NodePredicate& pred, Traversal mode) const {
    std::vector<const Node*> matches;
    collect<const Node>(*root_, pred, mode, matches);
    return matches;
}

std::string Document::serialize() const {
    std::string output;
    if (has_doctype_)
        output += "<!DOCTYPE " + (doctype_name_.empty() ? std::string("html") : doctype_name_) + ">";

    for (const auto& child : root_->children())
        serialize_node(*child, output, false);
    return output;
}

}  // namespace Dom
}  // namespace Ar5iv
