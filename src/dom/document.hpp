#pragma once
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace Ar5iv {
namespace Dom {

// Comments and doctypes never become nodes; whitespace and CDATA are text.
enum class NodeType { Text, Element };

struct Attribute {
    std::string name;
    std::string value;
};

class Node {
public:
    static std::unique_ptr<Node> make_text(std::string content);
    static std::unique_ptr<Node> make_element(std::string tag);

    Node(const Node&)            = delete;
    Node& operator=(const Node&) = delete;

    bool is_text() const {
        return type_ == NodeType::Text;
    }
    bool is_element() const {
        return type_ == NodeType::Element;
    }
    bool is_element(const std::string& tag) const {
        return type_ == NodeType::Element && tag_ == tag;
    }

    const std::string& tag() const {
        return tag_;
    }
    const std::string& content() const {
        return content_;
    }

    const std::vector<Attribute>& attributes() const {
        return attributes_;
    }
    const std::string* attribute(const std::string& name) const;
    void               set_attribute(const std::string& name, const std::string& value);
    bool               has_class(const std::string& name) const;

    Node* parent() const {
        return parent_;
    }
    const std::vector<std::unique_ptr<Node>>& children() const {
        return children_;
    }
    Node* append_child(std::unique_ptr<Node> child);

    // Both hand back ownership of this node, or return null when it has no parent.
    std::unique_ptr<Node> replace_with(std::unique_ptr<Node> replacement);
    std::unique_ptr<Node> detach();

    // Concatenated text of all descendant text nodes.
    std::string text_content() const;

private:
    Node(NodeType type, std::string value);

    NodeType                           type_;
    std::string                        tag_;
    std::string                        content_;
    std::vector<Attribute>             attributes_;
    std::vector<std::unique_ptr<Node>> children_;
    Node*                              parent_ = nullptr;

    std::vector<std::unique_ptr<Node>>::iterator position_in_parent();
};

using NodePredicate = std::function<bool(const Node&)>;

enum class Traversal {
    All,        // every match, nested ones included
    Outermost,  // matches are not descended into
};

class Document {
public:
    Document();
    Document(Document&&) noexcept            = default;
    Document& operator=(Document&&) noexcept = default;

    static Document parse(const std::string& html);

    // Synthetic "#document" element owning the top-level nodes.
    Node& root() {
        return *root_;
    }
    const Node& root() const {
        return *root_;
    }

    // Pre-order matches in document order.
    std::vector<Node*>       find_all(const NodePredicate& pred,
                                      Traversal            mode = Traversal::All);
    std::vector<const Node*> find_all(const NodePredicate& pred,
                                      Traversal            mode = Traversal::All) const;

    std::string serialize() const;

private:
    std::unique_ptr<Node> root_;
    bool                  has_doctype_ = false;
    std::string           doctype_name_;
};

}  // namespace Dom
}  // namespace Ar5iv
