#pragma once

#include "boshpp/xml/xml_element.hpp"

#include <tl/expected.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rapidxml {
template <class Ch> class xml_document;
}  // namespace rapidxml

namespace boshpp {

// ─────────────────────────────────────────────────────────────────────────────
// XML Parse Error
// ─────────────────────────────────────────────────────────────────────────────

struct XmlError {
    enum class Code {
        Malformed,   // Not well-formed XML
        NoRootElement  // Input held no element at all (e.g. empty reply)
    };

    Code code;
    std::string message;
    std::optional<std::size_t> offset;  // Byte offset of the failure, if known

    static XmlError malformed(std::string msg, std::optional<std::size_t> at = std::nullopt) {
        return {Code::Malformed, std::move(msg), at};
    }

    static XmlError no_root_element() {
        return {Code::NoRootElement, "Document contains no root element", std::nullopt};
    }
};

template <typename T>
using XmlResult = tl::expected<T, XmlError>;

// ─────────────────────────────────────────────────────────────────────────────
// XmlStreamParser
// ─────────────────────────────────────────────────────────────────────────────
// Parses one complete document per call into an XmlElement tree, using
// rapidxml underneath. Every HTTP reply of a BOSH session is exactly one
// <body> document, so a document parser is enough here.
//
// Lifetime mirrors a classic stream-parser handle: construction allocates
// it, reset() throws away the underlying document and allocates a fresh one,
// destruction frees it. Not thread-safe; a session owns exactly one.

class XmlStreamParser {
public:
    XmlStreamParser();
    ~XmlStreamParser();

    XmlStreamParser(const XmlStreamParser&) = delete;
    XmlStreamParser& operator=(const XmlStreamParser&) = delete;
    XmlStreamParser(XmlStreamParser&&) noexcept;
    XmlStreamParser& operator=(XmlStreamParser&&) noexcept;

    /// Parse a full document and return its root element.
    [[nodiscard]] XmlResult<XmlElement> parse(std::string_view data);

    /// Discard the underlying document and start over with a fresh one.
    void reset();

    /// Number of documents successfully parsed since construction or reset.
    [[nodiscard]] std::size_t documents_parsed() const noexcept {
        return documents_parsed_;
    }

private:
    std::unique_ptr<rapidxml::xml_document<char>> document_;
    std::vector<char> buffer_;  // rapidxml parses in place; must be writable
    std::size_t documents_parsed_{0};
};

}  // namespace boshpp
