#include "boshpp/xml/xml_stream_parser.hpp"

#include <rapidxml.hpp>

namespace boshpp {

namespace {

// Entity translation on, whitespace-only text between elements dropped by
// rapidxml itself. No declaration/comment/PI nodes are created. Closing tags
// must name the element they close.
constexpr int kParseFlags = rapidxml::parse_default | rapidxml::parse_validate_closing_tags;

XmlElement convert_element(const rapidxml::xml_node<char>& node) {
    XmlElement element(std::string(node.name(), node.name_size()));

    for (const auto* attr = node.first_attribute(); attr != nullptr; attr = attr->next_attribute()) {
        element.attrs.emplace_back(
            std::string(attr->name(), attr->name_size()),
            std::string(attr->value(), attr->value_size())
        );
    }

    for (const auto* child = node.first_node(); child != nullptr; child = child->next_sibling()) {
        switch (child->type()) {
            case rapidxml::node_element:
                element.append_child(convert_element(*child));
                break;
            case rapidxml::node_data:
            case rapidxml::node_cdata:
                element.append_cdata(std::string(child->value(), child->value_size()));
                break;
            default:
                break;
        }
    }
    return element;
}

}  // namespace

XmlStreamParser::XmlStreamParser()
    : document_(std::make_unique<rapidxml::xml_document<char>>())
{}

XmlStreamParser::~XmlStreamParser() = default;

XmlStreamParser::XmlStreamParser(XmlStreamParser&&) noexcept = default;
XmlStreamParser& XmlStreamParser::operator=(XmlStreamParser&&) noexcept = default;

XmlResult<XmlElement> XmlStreamParser::parse(std::string_view data) {
    buffer_.assign(data.begin(), data.end());
    buffer_.push_back('\0');

    try {
        document_->clear();
        document_->parse<kParseFlags>(buffer_.data());
    } catch (const rapidxml::parse_error& e) {
        const auto* where = e.where<char>();
        std::optional<std::size_t> offset;
        if (where != nullptr) {
            offset = static_cast<std::size_t>(where - buffer_.data());
        }
        document_->clear();
        return tl::unexpected(XmlError::malformed(e.what(), offset));
    }

    const rapidxml::xml_node<char>* root = document_->first_node();
    while (root != nullptr && root->type() != rapidxml::node_element) {
        root = root->next_sibling();
    }
    if (root == nullptr) {
        document_->clear();
        return tl::unexpected(XmlError::no_root_element());
    }

    for (const auto* next = root->next_sibling(); next != nullptr; next = next->next_sibling()) {
        if (next->type() == rapidxml::node_element) {
            document_->clear();
            return tl::unexpected(XmlError::malformed("Content after the root element"));
        }
    }

    // Copy out before the document (and its pointers into buffer_) goes away
    XmlElement result = convert_element(*root);
    document_->clear();
    ++documents_parsed_;
    return result;
}

void XmlStreamParser::reset() {
    document_ = std::make_unique<rapidxml::xml_document<char>>();
    buffer_.clear();
    buffer_.shrink_to_fit();
    documents_parsed_ = 0;
}

}  // namespace boshpp
