#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// BOSH Body Wrapping
// ═══════════════════════════════════════════════════════════════════════════
// Pure translation between stream items and the <body> elements carried by
// each HTTP request/response (XEP-0124 / XEP-0206).
//
// Outgoing:
//   StreamStart  -> session creation body (or restart, once sid is bound)
//   StreamEnd    -> termination body with <presence type="unavailable"/>
//   XmlElement   -> empty body with the element as its single child
//
// Incoming:
//   <body type="terminate">        -> StreamEnd, then children
//   <body xmpp:version="1.0" ...>  -> StreamStart, then children
//   <body>                         -> children

#include "boshpp/bosh/bosh_error.hpp"
#include "boshpp/xml/xml_element.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace boshpp {

using Rid = std::uint64_t;
using Sid = std::optional<std::string>;

/// Unsigned decimal, no padding.
[[nodiscard]] std::string pack_rid(Rid rid);

// ─────────────────────────────────────────────────────────────────────────────
// Body Constructors
// ─────────────────────────────────────────────────────────────────────────────

/// <body rid=".." xmlns="http://jabber.org/protocol/httpbind" [sid=".."] extra.../>
[[nodiscard]] XmlElement empty_body(Rid rid, const Sid& sid, const XmlAttributes& extra_attrs = {});

/// Session creation with version "1.0", lang "en" and no sid.
[[nodiscard]] XmlElement session_creation_body(Rid rid, const std::string& to);

/// Session creation, or stream restart when sid is bound (adds xmpp:restart).
[[nodiscard]] XmlElement session_creation_body(
    const std::string& version,
    const std::string& lang,
    Rid rid,
    const std::string& to,
    const Sid& sid
);

/// <body ... type="terminate"><presence type="unavailable"/></body>
[[nodiscard]] XmlElement session_termination_body(Rid rid, const Sid& sid);

// ─────────────────────────────────────────────────────────────────────────────
// Wrap / Unwrap
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] XmlElement wrap_item(const StreamItem& item, Rid rid, const Sid& sid);

enum class BodyKind {
    Normal,
    StreamStart,
    StreamEnd
};

struct BodyClass {
    BodyKind kind{BodyKind::Normal};
    std::string version;  // Only set for StreamStart
};

/// type="terminate" wins over xmpp:version.
[[nodiscard]] BodyClass classify_body(const XmlElement& body);

/// Stream items carried by a reply body, in document order.
[[nodiscard]] BoshResult<std::vector<StreamItem>> unwrap_body(const XmlElement& body);

}  // namespace boshpp
