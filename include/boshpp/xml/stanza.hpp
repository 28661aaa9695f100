#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Stanza Builders
// ─────────────────────────────────────────────────────────────────────────────
// Small constructors for the stream items a BOSH client sends most often.
//
//   transport.send(stanza::stream_start("example.com"));
//   transport.send(stanza::presence());
//   transport.send(stanza::chat_message("bob@example.com", "hi"));
//   transport.send(stanza::stream_end());

#include "boshpp/xml/xml_element.hpp"

#include <string>

namespace boshpp::stanza {

/// <stream:stream to=".." version="1.0" xml:lang="en" xmlns="jabber:client"
///  xmlns:stream="http://etherx.jabber.org/streams">
[[nodiscard]] StreamStart stream_start(const std::string& to);

[[nodiscard]] StreamEnd stream_end();

/// <presence/>
[[nodiscard]] XmlElement presence();

/// <presence type=".."/>
[[nodiscard]] XmlElement presence(const std::string& type);

/// <message type="chat" to=".."><body>text</body></message>
[[nodiscard]] XmlElement chat_message(const std::string& to, const std::string& text);

}  // namespace boshpp::stanza
