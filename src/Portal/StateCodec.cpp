/**
 * @file StateCodec.cpp
 * @brief XML encoding and decoding of portal documents
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 */

#include <Tether/Portal/StateCodec.hpp>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <charconv>
#include <sstream>

namespace Tether::Portal {

using boost::property_tree::ptree;

namespace {

constexpr const char* kStateRoot = "state";
constexpr const char* kLoginRoot = "login";
constexpr const char* kResponseRoot = "response";
constexpr const char* kConfigRoot = "config";

template<typename T>
std::optional<T> parseInteger(const std::string& text) {
    T value{};
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return value;
}

/// Field order is fixed so the encoding is deterministic
void putStateFields(ptree& node, const StateDocument& document) {
    node.put("client-id", document.clientId);
    node.put("ticket", document.ticket);
    node.put("user-ip", document.userIp);
    node.put("ac-ip", document.acIp);
    node.put("area", document.area);
    node.put("school-id", document.schoolId);
    node.put("domain", document.domain);
    node.put("host-name", document.hostname);
    node.put("mac-address", document.macAddress);
    node.put("algo-id", document.algoId);
    node.put("timestamp", std::to_string(document.timestampMs));
}

ByteBuffer writeTree(const ptree& tree) {
    std::ostringstream out;
    boost::property_tree::write_xml(out, tree);
    const std::string text = out.str();
    return ByteBuffer(text.begin(), text.end());
}

/// Parse XML; nullopt when the bytes are not well-formed
std::optional<ptree> readTree(ByteSpan bytes) {
    std::istringstream in(toString(bytes));
    ptree tree;
    try {
        boost::property_tree::read_xml(in, tree, boost::property_tree::xml_parser::trim_whitespace);
    } catch (const boost::property_tree::xml_parser_error&) {
        return std::nullopt;
    }
    return tree;
}

bool readField(const ptree& node, const char* name, std::string& out) {
    auto child = node.get_child_optional(name);
    if (!child) {
        return false;
    }
    out = child->data();
    return true;
}

void readOptionalField(const ptree& node, const char* name, std::string& out) {
    if (auto child = node.get_child_optional(name)) {
        out = child->data();
    }
}

bool isMarkupNode(const std::string& name) {
    return name == "<xmlattr>" || name == "<xmlcomment>";
}

} // namespace

StateDocument buildStateDocument(const SessionIdentity& identity, WallClock::time_point now) {
    StateDocument document;
    document.clientId = identity.clientId;
    document.ticket = identity.ticket;
    document.userIp = identity.userIp;
    document.acIp = identity.acIp;
    document.area = identity.area;
    document.schoolId = identity.schoolId;
    document.domain = identity.domain;
    document.hostname = identity.hostname;
    document.macAddress = identity.macAddress;
    document.algoId = identity.algoId;
    document.timestampMs = std::chrono::duration_cast<Milliseconds>(now.time_since_epoch()).count();
    return document;
}

StateDocument buildStateDocument(const Session& session) {
    return buildStateDocument(session.identity);
}

ByteBuffer serialize(const StateDocument& document) {
    ptree tree;
    ptree& state = tree.add_child(kStateRoot, ptree());
    putStateFields(state, document);
    return writeTree(tree);
}

Result<StateDocument> deserialize(ByteSpan bytes) {
    auto tree = readTree(bytes);
    if (!tree) {
        return ErrorCode::MalformedResponse;
    }

    auto state = tree->get_child_optional(kStateRoot);
    if (!state) {
        return ErrorCode::MalformedResponse;
    }

    StateDocument document;
    std::string timestamp;
    bool complete =
        readField(*state, "client-id", document.clientId) &&
        readField(*state, "ticket", document.ticket) &&
        readField(*state, "user-ip", document.userIp) &&
        readField(*state, "ac-ip", document.acIp) &&
        readField(*state, "area", document.area) &&
        readField(*state, "school-id", document.schoolId) &&
        readField(*state, "domain", document.domain) &&
        readField(*state, "host-name", document.hostname) &&
        readField(*state, "mac-address", document.macAddress) &&
        readField(*state, "algo-id", document.algoId) &&
        readField(*state, "timestamp", timestamp);
    if (!complete) {
        return ErrorCode::MalformedResponse;
    }

    auto millis = parseInteger<int64_t>(timestamp);
    if (!millis) {
        return ErrorCode::MalformedResponse;
    }
    document.timestampMs = *millis;

    return document;
}

ByteBuffer buildLoginDocument(const StateDocument& document,
                              const std::string& username,
                              const std::string& password) {
    ptree tree;
    ptree& login = tree.add_child(kLoginRoot, ptree());
    putStateFields(login, document);
    login.put("username", username);
    login.put("password", password);
    return writeTree(tree);
}

Result<StateResponse> parseResponse(ByteSpan bytes) {
    auto tree = readTree(bytes);
    if (!tree) {
        return ErrorCode::MalformedResponse;
    }

    auto node = tree->get_child_optional(kResponseRoot);
    if (!node) {
        return ErrorCode::MalformedResponse;
    }

    StateResponse response;

    std::string result;
    if (!readField(*node, "result", result)) {
        return ErrorCode::MalformedResponse;
    }
    auto resultCode = parseInteger<int>(result);
    if (!resultCode) {
        return ErrorCode::MalformedResponse;
    }
    response.result = *resultCode;

    std::string interval;
    if (readField(*node, "interval", interval)) {
        auto seconds = parseInteger<int64_t>(interval);
        if (!seconds) {
            return ErrorCode::MalformedResponse;
        }
        response.interval = Seconds(*seconds);
    }

    readOptionalField(*node, "message", response.message);
    readOptionalField(*node, "ticket", response.ticket);
    readOptionalField(*node, "algo-id", response.algoId);
    readOptionalField(*node, "keep-url", response.keepUrl);
    readOptionalField(*node, "term-url", response.termUrl);

    static const char* const kTyped[] = {
        "result", "interval", "message", "ticket", "algo-id", "keep-url", "term-url"
    };
    for (const auto& [name, child] : *node) {
        if (isMarkupNode(name)) {
            continue;
        }
        bool typed = false;
        for (const char* known : kTyped) {
            if (name == known) {
                typed = true;
                break;
            }
        }
        if (!typed) {
            response.fields[name] = child.data();
        }
    }

    return response;
}

Result<Seconds> requireInterval(const StateResponse& response) {
    if (!response.interval || *response.interval <= Seconds::zero() ||
        *response.interval > kMaxHeartbeatInterval) {
        return ErrorCode::MalformedResponse;
    }
    return *response.interval;
}

Result<PortalConfig> parsePortalConfig(ByteSpan bytes) {
    auto tree = readTree(bytes);
    if (!tree) {
        return ErrorCode::MalformedResponse;
    }

    auto node = tree->get_child_optional(kConfigRoot);
    if (!node) {
        return ErrorCode::MalformedResponse;
    }

    PortalConfig config;
    if (!readField(*node, "ticket-url", config.ticketUrl) || config.ticketUrl.empty() ||
        !readField(*node, "auth-url", config.authUrl) || config.authUrl.empty()) {
        return ErrorCode::MalformedResponse;
    }

    std::string value;
    if (readField(*node, "domain", value)) config.domain = value;
    if (readField(*node, "area", value)) config.area = value;
    if (readField(*node, "school-id", value)) config.schoolId = value;

    return config;
}

} // namespace Tether::Portal
