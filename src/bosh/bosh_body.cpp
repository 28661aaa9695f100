#include "boshpp/bosh/bosh_body.hpp"
#include "boshpp/xml/stanza.hpp"
#include "boshpp/xml/xmlns.hpp"

#include <type_traits>
#include <variant>

namespace boshpp {

namespace {

constexpr const char* kDefaultVersion = "1.0";
constexpr const char* kDefaultLang = "en";
constexpr const char* kDefaultTo = "localhost";
constexpr const char* kBodyContentType = "text/xml; charset=utf-8";

XmlAttributes common_attrs(Rid rid, const Sid& sid) {
    XmlAttributes attrs{
        {"rid", pack_rid(rid)},
        {"xmlns", std::string(xmlns::kHttpBind)}
    };
    if (sid.has_value()) {
        attrs.emplace_back("sid", *sid);
    }
    return attrs;
}

}  // namespace

std::string pack_rid(Rid rid) {
    return std::to_string(rid);
}

XmlElement empty_body(Rid rid, const Sid& sid, const XmlAttributes& extra_attrs) {
    XmlAttributes attrs = common_attrs(rid, sid);
    attrs.insert(attrs.end(), extra_attrs.begin(), extra_attrs.end());
    return XmlElement("body", std::move(attrs));
}

XmlElement session_creation_body(Rid rid, const std::string& to) {
    return session_creation_body(kDefaultVersion, kDefaultLang, rid, to, std::nullopt);
}

XmlElement session_creation_body(
    const std::string& version,
    const std::string& lang,
    Rid rid,
    const std::string& to,
    const Sid& sid
) {
    XmlAttributes extra{
        {"content", kBodyContentType},
        {"xmlns:xmpp", std::string(xmlns::kBosh)},
        {"xmpp:version", version},
        {"hold", "1"},
        {"wait", "60"},
        {"xml:lang", lang},
        {"to", to}
    };
    if (sid.has_value()) {
        extra.emplace_back("xmpp:restart", "true");
    }
    return empty_body(rid, sid, extra);
}

XmlElement session_termination_body(Rid rid, const Sid& sid) {
    XmlElement body = empty_body(rid, sid, {{"type", "terminate"}});
    body.append_child(stanza::presence("unavailable"));
    return body;
}

XmlElement wrap_item(const StreamItem& item, Rid rid, const Sid& sid) {
    return std::visit([rid, &sid](const auto& value) -> XmlElement {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, StreamStart>) {
            return session_creation_body(
                value.attr("version").value_or(kDefaultVersion),
                value.attr("xml:lang").value_or(kDefaultLang),
                rid,
                value.attr("to").value_or(kDefaultTo),
                sid
            );
        } else if constexpr (std::is_same_v<T, StreamEnd>) {
            return session_termination_body(rid, sid);
        } else {
            XmlElement body = empty_body(rid, sid);
            body.append_child(value);
            return body;
        }
    }, item);
}

BodyClass classify_body(const XmlElement& body) {
    const auto type = body.attr("type");
    if (type.has_value() && *type == "terminate") {
        return {BodyKind::StreamEnd, {}};
    }
    auto version = body.attr("xmpp:version");
    if (version.has_value()) {
        return {BodyKind::StreamStart, std::move(*version)};
    }
    return {BodyKind::Normal, {}};
}

BoshResult<std::vector<StreamItem>> unwrap_body(const XmlElement& body) {
    if (body.name != "body") {
        return tl::unexpected(BoshError::protocol_error(
            "Expected <body> reply, got <" + body.name + ">"));
    }

    std::vector<StreamItem> items;
    const BodyClass body_class = classify_body(body);

    switch (body_class.kind) {
        case BodyKind::StreamStart: {
            StreamStart start;
            const auto from = body.attr("from");
            if (from.has_value()) {
                start.attrs.emplace_back("from", *from);
            }
            start.attrs.emplace_back("version", body_class.version);
            start.attrs.emplace_back("xml:lang", "en");
            start.attrs.emplace_back("xmlns", std::string(xmlns::kJabberClient));
            start.attrs.emplace_back("xmlns:stream", std::string(xmlns::kStreams));
            items.emplace_back(std::move(start));
            break;
        }
        case BodyKind::StreamEnd:
            items.emplace_back(stanza::stream_end());
            break;
        case BodyKind::Normal:
            break;
    }

    for (const auto& child : body.children) {
        if (child.is_element()) {
            items.emplace_back(child.element());
        }
    }
    return items;
}

}  // namespace boshpp
