#include "boshpp/xml/xml_element.hpp"

#include <stdexcept>

namespace boshpp {

namespace {

void append_attrs(std::string& out, const XmlAttributes& attrs) {
    for (const auto& [key, value] : attrs) {
        out += ' ';
        out += key;
        out += "=\"";
        out += escape_xml(value);
        out += '"';
    }
}

void append_element(std::string& out, const XmlElement& element) {
    out += '<';
    out += element.name;
    append_attrs(out, element.attrs);

    if (element.children.empty()) {
        out += "/>";
        return;
    }

    out += '>';
    for (const auto& child : element.children) {
        if (child.is_element()) {
            append_element(out, child.element());
        } else {
            out += escape_xml(child.cdata().content);
        }
    }
    out += "</";
    out += element.name;
    out += '>';
}

}  // namespace

std::optional<std::string> find_attr(const XmlAttributes& attrs, std::string_view name) {
    for (const auto& [key, value] : attrs) {
        if (key == name) {
            return value;
        }
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// XmlElement
// ─────────────────────────────────────────────────────────────────────────────

XmlElement::XmlElement(std::string element_name, XmlAttributes attributes)
    : name(std::move(element_name))
    , attrs(std::move(attributes))
{}

XmlElement::XmlElement(
    std::string element_name,
    XmlAttributes attributes,
    std::vector<XmlNode> child_nodes
)
    : name(std::move(element_name))
    , attrs(std::move(attributes))
    , children(std::move(child_nodes))
{}

std::optional<std::string> XmlElement::attr(std::string_view key) const {
    return find_attr(attrs, key);
}

XmlElement& XmlElement::set_attr(std::string key, std::string value) {
    for (auto& attribute : attrs) {
        if (attribute.first == key) {
            attribute.second = std::move(value);
            return *this;
        }
    }
    attrs.emplace_back(std::move(key), std::move(value));
    return *this;
}

XmlElement& XmlElement::append_child(XmlElement child) {
    children.emplace_back(std::move(child));
    return *this;
}

XmlElement& XmlElement::append_cdata(std::string text) {
    children.emplace_back(XmlCData{std::move(text)});
    return *this;
}

std::vector<XmlElement> XmlElement::child_elements() const {
    std::vector<XmlElement> result;
    for (const auto& child : children) {
        if (child.is_element()) {
            result.push_back(child.element());
        }
    }
    return result;
}

const XmlElement* XmlElement::find_child(std::string_view child_name) const {
    for (const auto& child : children) {
        if (child.is_element() && child.element().name == child_name) {
            return &child.element();
        }
    }
    return nullptr;
}

std::string XmlElement::text() const {
    std::string result;
    for (const auto& child : children) {
        if (child.is_cdata()) {
            result += child.cdata().content;
        }
    }
    return result;
}

bool XmlElement::operator==(const XmlElement& other) const {
    return name == other.name && attrs == other.attrs && children == other.children;
}

// ─────────────────────────────────────────────────────────────────────────────
// XmlNode
// ─────────────────────────────────────────────────────────────────────────────

XmlNode::XmlNode(XmlElement element)
    : value_(std::move(element))
{}

XmlNode::XmlNode(XmlCData cdata)
    : value_(std::move(cdata))
{}

bool XmlNode::is_element() const noexcept {
    return std::holds_alternative<XmlElement>(value_);
}

bool XmlNode::is_cdata() const noexcept {
    return std::holds_alternative<XmlCData>(value_);
}

const XmlElement& XmlNode::element() const {
    const auto* element = std::get_if<XmlElement>(&value_);
    if (element == nullptr) {
        throw std::logic_error("XmlNode does not hold an element");
    }
    return *element;
}

const XmlCData& XmlNode::cdata() const {
    const auto* cdata = std::get_if<XmlCData>(&value_);
    if (cdata == nullptr) {
        throw std::logic_error("XmlNode does not hold character data");
    }
    return *cdata;
}

bool XmlNode::operator==(const XmlNode& other) const {
    return value_ == other.value_;
}

// ─────────────────────────────────────────────────────────────────────────────
// Serialization
// ─────────────────────────────────────────────────────────────────────────────

std::string escape_xml(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (const char c : raw) {
        switch (c) {
            case '&':  out += "&amp;";  break;
            case '<':  out += "&lt;";   break;
            case '>':  out += "&gt;";   break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:   out += c;        break;
        }
    }
    return out;
}

std::string to_string(const XmlElement& element) {
    std::string out;
    append_element(out, element);
    return out;
}

std::string to_string(const StreamStart& start) {
    std::string out = "<" + start.name;
    append_attrs(out, start.attrs);
    out += '>';
    return out;
}

std::string to_string(const StreamEnd& end) {
    return "</" + end.name + ">";
}

std::string to_string(const StreamItem& item) {
    return std::visit([](const auto& value) { return to_string(value); }, item);
}

}  // namespace boshpp
