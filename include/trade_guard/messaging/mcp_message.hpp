// include/trade_guard/messaging/mcp_message.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "trade_guard/core/error.hpp"
#include "trade_guard/core/types.hpp"

namespace trade_guard {

constexpr const char* MCP_SCHEMA_VERSION = "1.0.0";

enum class McpMessageType {
    OBSERVATION,
    PROPOSAL,
    CRITIQUE,
    QUERY,
    RESPONSE,
    VOTE,
    CONSENSUS,
    EXECUTION,
    HEARTBEAT
};

enum class McpRole { AGENT, COORDINATOR, OBSERVER };

std::string message_type_to_string(McpMessageType type);
std::optional<McpMessageType> message_type_from_string(const std::string& s);
std::string role_to_string(McpRole role);
std::optional<McpRole> role_from_string(const std::string& s);

/**
 * @brief One coordination message inside a session
 */
struct McpMessage {
    std::string session_id;
    std::string sender_id;
    McpRole sender_role{McpRole::AGENT};
    McpMessageType message_type{McpMessageType::OBSERVATION};
    nlohmann::json payload = nlohmann::json::object();
    Timestamp timestamp;

    /**
     * @brief Wrap in {"message": {...}, "schema_version": "1.0.0"}
     */
    nlohmann::json to_envelope() const;

    /**
     * @brief Parse an envelope or a bare message object
     *
     * A missing session_id is filled from default_session. A missing
     * timestamp becomes now.
     */
    static Result<McpMessage> from_json(const nlohmann::json& j,
                                        const std::string& default_session = "");
};

/**
 * @brief Trade idea carried in a PROPOSAL payload
 */
struct ProposalPayload {
    std::string proposal_id;
    std::string symbol;
    Side side{Side::BUY};
    double notional{0.0};
    double confidence{0.0};
    std::string rationale;
    nlohmann::json constraints = nlohmann::json::array();  // list of strings or an object

    nlohmann::json to_json() const;
    static Result<ProposalPayload> from_json(const nlohmann::json& j);
};

/**
 * @brief Ballot carried in a VOTE payload
 */
struct VotePayload {
    std::string proposal_id;
    bool approve{false};
    double confidence{0.0};
    std::string rationale;

    nlohmann::json to_json() const;
    static Result<VotePayload> from_json(const nlohmann::json& j);
};

}  // namespace trade_guard
