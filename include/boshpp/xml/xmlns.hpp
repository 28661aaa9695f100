#pragma once

#include <string_view>

namespace boshpp::xmlns {

inline constexpr std::string_view kHttpBind = "http://jabber.org/protocol/httpbind";
inline constexpr std::string_view kBosh = "urn:xmpp:xbosh";
inline constexpr std::string_view kJabberClient = "jabber:client";
inline constexpr std::string_view kStreams = "http://etherx.jabber.org/streams";

}  // namespace boshpp::xmlns
