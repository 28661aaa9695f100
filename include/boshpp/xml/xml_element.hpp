#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// XML Element Model
// ═══════════════════════════════════════════════════════════════════════════
// The tree exchanged between the session, the BOSH wrapper and the owner.
//
// Attributes keep insertion order so that serialized bodies are stable and
// match what the server logs show. Names are kept verbatim, prefixes
// included ("xmpp:version", "stream:features"); no namespace resolution is
// done.
//
// A stream item is what an XMPP client reads from or writes to its stream:
// the opening <stream:stream ...> tag, the closing </stream:stream> tag, or
// a complete stanza element in between.

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace boshpp {

using XmlAttribute = std::pair<std::string, std::string>;
using XmlAttributes = std::vector<XmlAttribute>;

/// Look up an attribute value by exact name.
[[nodiscard]] std::optional<std::string> find_attr(
    const XmlAttributes& attrs,
    std::string_view name
);

/// Character data (text or CDATA section, already entity-decoded).
struct XmlCData {
    std::string content;

    bool operator==(const XmlCData&) const = default;
};

class XmlNode;

struct XmlElement {
    std::string name;
    XmlAttributes attrs;
    std::vector<XmlNode> children;

    XmlElement() = default;
    explicit XmlElement(std::string element_name, XmlAttributes attributes = {});
    XmlElement(std::string element_name, XmlAttributes attributes, std::vector<XmlNode> child_nodes);

    [[nodiscard]] std::optional<std::string> attr(std::string_view key) const;

    /// Replace the value if the attribute exists, append it otherwise.
    XmlElement& set_attr(std::string key, std::string value);

    XmlElement& append_child(XmlElement child);
    XmlElement& append_cdata(std::string text);

    /// Element children only, in document order.
    [[nodiscard]] std::vector<XmlElement> child_elements() const;

    /// First element child with the given name, or nullptr.
    [[nodiscard]] const XmlElement* find_child(std::string_view child_name) const;

    /// Concatenated character data of the direct children.
    [[nodiscard]] std::string text() const;

    bool operator==(const XmlElement& other) const;
};

class XmlNode {
public:
    XmlNode(XmlElement element);  // NOLINT(google-explicit-constructor)
    XmlNode(XmlCData cdata);      // NOLINT(google-explicit-constructor)

    [[nodiscard]] bool is_element() const noexcept;
    [[nodiscard]] bool is_cdata() const noexcept;

    [[nodiscard]] const XmlElement& element() const;
    [[nodiscard]] const XmlCData& cdata() const;

    bool operator==(const XmlNode& other) const;

private:
    std::variant<XmlElement, XmlCData> value_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Stream Items
// ─────────────────────────────────────────────────────────────────────────────

/// Opening tag of an XML stream. Serialized without a closing tag.
struct StreamStart {
    std::string name{"stream:stream"};
    XmlAttributes attrs;

    [[nodiscard]] std::optional<std::string> attr(std::string_view key) const {
        return find_attr(attrs, key);
    }

    bool operator==(const StreamStart&) const = default;
};

/// Closing tag of an XML stream.
struct StreamEnd {
    std::string name{"stream:stream"};

    bool operator==(const StreamEnd&) const = default;
};

using StreamItem = std::variant<StreamStart, StreamEnd, XmlElement>;

[[nodiscard]] inline bool is_stream_start(const StreamItem& item) noexcept {
    return std::holds_alternative<StreamStart>(item);
}

[[nodiscard]] inline bool is_stream_end(const StreamItem& item) noexcept {
    return std::holds_alternative<StreamEnd>(item);
}

[[nodiscard]] inline bool is_stanza(const StreamItem& item) noexcept {
    return std::holds_alternative<XmlElement>(item);
}

// ─────────────────────────────────────────────────────────────────────────────
// Serialization
// ─────────────────────────────────────────────────────────────────────────────

/// Escape &, <, >, " and ' for use in attribute values and character data.
[[nodiscard]] std::string escape_xml(std::string_view raw);

/// <name a="v"/> when childless, <name a="v">...</name> otherwise.
[[nodiscard]] std::string to_string(const XmlElement& element);

/// <stream:stream a="v"> (open tag only)
[[nodiscard]] std::string to_string(const StreamStart& start);

/// </stream:stream>
[[nodiscard]] std::string to_string(const StreamEnd& end);

[[nodiscard]] std::string to_string(const StreamItem& item);

}  // namespace boshpp
