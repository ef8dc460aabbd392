// src/messaging/mcp_message.cpp
#include "trade_guard/messaging/mcp_message.hpp"
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include "trade_guard/core/time_utils.hpp"

namespace trade_guard {

namespace {

/**
 * @brief Parse "YYYY-MM-DDTHH:MM:SS[.mmm]Z" as UTC
 */
std::optional<Timestamp> parse_iso8601(const std::string& text) {
    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::nullopt;
    }
    int millis = 0;
    if (in.peek() == '.') {
        in.get();
        std::string digits;
        while (std::isdigit(in.peek()) && digits.size() < 9) {
            digits.push_back(static_cast<char>(in.get()));
        }
        while (digits.size() < 3) {
            digits.push_back('0');
        }
        millis = std::stoi(digits.substr(0, 3));
    }
    time_t seconds = timegm(&tm);
    return std::chrono::system_clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
}

}  // namespace

std::string message_type_to_string(McpMessageType type) {
    switch (type) {
        case McpMessageType::OBSERVATION:
            return "observation";
        case McpMessageType::PROPOSAL:
            return "proposal";
        case McpMessageType::CRITIQUE:
            return "critique";
        case McpMessageType::QUERY:
            return "query";
        case McpMessageType::RESPONSE:
            return "response";
        case McpMessageType::VOTE:
            return "vote";
        case McpMessageType::CONSENSUS:
            return "consensus";
        case McpMessageType::EXECUTION:
            return "execution";
        case McpMessageType::HEARTBEAT:
            return "heartbeat";
    }
    return "unknown";
}

std::optional<McpMessageType> message_type_from_string(const std::string& s) {
    static const std::pair<const char*, McpMessageType> table[] = {
        {"observation", McpMessageType::OBSERVATION}, {"proposal", McpMessageType::PROPOSAL},
        {"critique", McpMessageType::CRITIQUE},       {"query", McpMessageType::QUERY},
        {"response", McpMessageType::RESPONSE},       {"vote", McpMessageType::VOTE},
        {"consensus", McpMessageType::CONSENSUS},     {"execution", McpMessageType::EXECUTION},
        {"heartbeat", McpMessageType::HEARTBEAT}};
    for (const auto& [name, type] : table) {
        if (s == name)
            return type;
    }
    return std::nullopt;
}

std::string role_to_string(McpRole role) {
    switch (role) {
        case McpRole::AGENT:
            return "agent";
        case McpRole::COORDINATOR:
            return "coordinator";
        case McpRole::OBSERVER:
            return "observer";
    }
    return "unknown";
}

std::optional<McpRole> role_from_string(const std::string& s) {
    if (s == "agent")
        return McpRole::AGENT;
    if (s == "coordinator")
        return McpRole::COORDINATOR;
    if (s == "observer")
        return McpRole::OBSERVER;
    return std::nullopt;
}

nlohmann::json McpMessage::to_envelope() const {
    nlohmann::json message;
    message["session_id"] = session_id;
    message["sender_id"] = sender_id;
    message["sender_role"] = role_to_string(sender_role);
    message["message_type"] = message_type_to_string(message_type);
    message["payload"] = payload;
    message["timestamp"] = core::to_iso8601(timestamp);

    nlohmann::json envelope;
    envelope["message"] = message;
    envelope["schema_version"] = MCP_SCHEMA_VERSION;
    return envelope;
}

Result<McpMessage> McpMessage::from_json(const nlohmann::json& j,
                                         const std::string& default_session) {
    if (!j.is_object()) {
        return make_error<McpMessage>(ErrorCode::INVALID_ARGUMENT, "Message must be an object",
                                      "McpMessage");
    }
    const nlohmann::json& body = j.contains("message") ? j.at("message") : j;
    if (!body.is_object()) {
        return make_error<McpMessage>(ErrorCode::INVALID_ARGUMENT, "message must be an object",
                                      "McpMessage");
    }

    McpMessage msg;
    msg.session_id = body.contains("session_id") && body.at("session_id").is_string()
                         ? body.at("session_id").get<std::string>()
                         : default_session;

    if (!body.contains("sender_id") || !body.at("sender_id").is_string() ||
        body.at("sender_id").get<std::string>().empty()) {
        return make_error<McpMessage>(ErrorCode::INVALID_ARGUMENT, "sender_id is required",
                                      "McpMessage");
    }
    msg.sender_id = body.at("sender_id").get<std::string>();

    if (body.contains("sender_role")) {
        auto role = body.at("sender_role").is_string()
                        ? role_from_string(body.at("sender_role").get<std::string>())
                        : std::nullopt;
        if (!role) {
            return make_error<McpMessage>(ErrorCode::INVALID_ARGUMENT, "Unknown sender_role",
                                          "McpMessage");
        }
        msg.sender_role = *role;
    }

    if (!body.contains("message_type") || !body.at("message_type").is_string()) {
        return make_error<McpMessage>(ErrorCode::INVALID_ARGUMENT, "message_type is required",
                                      "McpMessage");
    }
    auto type = message_type_from_string(body.at("message_type").get<std::string>());
    if (!type) {
        return make_error<McpMessage>(ErrorCode::INVALID_ARGUMENT,
                                      "Unknown message_type: " +
                                          body.at("message_type").get<std::string>(),
                                      "McpMessage");
    }
    msg.message_type = *type;

    if (body.contains("payload")) {
        if (!body.at("payload").is_object()) {
            return make_error<McpMessage>(ErrorCode::INVALID_ARGUMENT,
                                          "payload must be an object", "McpMessage");
        }
        msg.payload = body.at("payload");
    }

    msg.timestamp = std::chrono::system_clock::now();
    if (body.contains("timestamp") && body.at("timestamp").is_string()) {
        auto parsed = parse_iso8601(body.at("timestamp").get<std::string>());
        if (parsed)
            msg.timestamp = *parsed;
    }
    return msg;
}

nlohmann::json ProposalPayload::to_json() const {
    nlohmann::json j;
    if (!proposal_id.empty())
        j["proposal_id"] = proposal_id;
    j["symbol"] = symbol;
    j["side"] = side_to_string(side);
    j["notional"] = notional;
    j["confidence"] = confidence;
    j["rationale"] = rationale;
    j["constraints"] = constraints;
    return j;
}

Result<ProposalPayload> ProposalPayload::from_json(const nlohmann::json& j) {
    ProposalPayload p;
    try {
        p.proposal_id = j.value("proposal_id", "");
        p.symbol = j.at("symbol").get<std::string>();
        p.side = side_from_string(j.at("side").get<std::string>());
        p.notional = j.at("notional").get<double>();
        p.confidence = j.value("confidence", 0.0);
        p.rationale = j.value("rationale", "");
        if (j.contains("constraints") &&
            (j.at("constraints").is_array() || j.at("constraints").is_object()))
            p.constraints = j.at("constraints");
    } catch (const nlohmann::json::exception& e) {
        return make_error<ProposalPayload>(ErrorCode::INVALID_ARGUMENT,
                                           "Malformed proposal: " + std::string(e.what()),
                                           "McpMessage");
    }
    if (p.symbol.empty() || p.side == Side::NONE || p.notional <= 0.0) {
        return make_error<ProposalPayload>(ErrorCode::INVALID_ARGUMENT,
                                           "Proposal needs symbol, side and positive notional",
                                           "McpMessage");
    }
    return p;
}

nlohmann::json VotePayload::to_json() const {
    nlohmann::json j;
    j["proposal_id"] = proposal_id;
    j["approve"] = approve;
    j["confidence"] = confidence;
    j["rationale"] = rationale;
    return j;
}

Result<VotePayload> VotePayload::from_json(const nlohmann::json& j) {
    VotePayload v;
    try {
        v.proposal_id = j.at("proposal_id").get<std::string>();
        v.approve = j.at("approve").get<bool>();
        v.confidence = j.value("confidence", 0.0);
        v.rationale = j.value("rationale", "");
    } catch (const nlohmann::json::exception& e) {
        return make_error<VotePayload>(ErrorCode::INVALID_ARGUMENT,
                                       "Malformed vote: " + std::string(e.what()), "McpMessage");
    }
    return v;
}

}  // namespace trade_guard
