#include "boshpp/xml/stanza.hpp"
#include "boshpp/xml/xmlns.hpp"

namespace boshpp::stanza {

StreamStart stream_start(const std::string& to) {
    StreamStart start;
    start.attrs = {
        {"to", to},
        {"version", "1.0"},
        {"xml:lang", "en"},
        {"xmlns", std::string(xmlns::kJabberClient)},
        {"xmlns:stream", std::string(xmlns::kStreams)}
    };
    return start;
}

StreamEnd stream_end() {
    return StreamEnd{};
}

XmlElement presence() {
    return XmlElement("presence");
}

XmlElement presence(const std::string& type) {
    return XmlElement("presence", {{"type", type}});
}

XmlElement chat_message(const std::string& to, const std::string& text) {
    XmlElement body("body");
    body.append_cdata(text);

    XmlElement message("message", {{"type", "chat"}, {"to", to}});
    message.append_child(std::move(body));
    return message;
}

}  // namespace boshpp::stanza
