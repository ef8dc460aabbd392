// include/trade_guard/consensus/consensus_engine.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "trade_guard/core/clock.hpp"
#include "trade_guard/core/config_base.hpp"
#include "trade_guard/core/error.hpp"
#include "trade_guard/messaging/mcp_message.hpp"

namespace trade_guard {

struct ConsensusConfig : public ConfigBase {
    int min_votes{3};
    double threshold{0.67};
    double timeout_seconds{30.0};
    double sweep_interval_seconds{5.0};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    std::vector<std::string> validate() const override;
};

struct Vote {
    bool approve{false};
    double confidence{0.0};
    Timestamp cast_at;
};

struct Proposal {
    std::string proposal_id;
    std::string proposer_id;
    ProposalPayload payload;
    std::map<std::string, Vote> votes;
    double threshold{0.67};
    int min_votes{3};
    std::chrono::milliseconds timeout{30000};
    Timestamp created_at;

    nlohmann::json to_json() const;
};

struct ConsensusResult {
    std::string proposal_id;
    std::string proposer_id;
    ProposalPayload payload;
    bool approved{false};
    double consensus_score{0.0};  // approvals / votes
    std::vector<std::string> participants;
    std::string notes;
    bool timed_out{false};
    Timestamp resolved_at;

    nlohmann::json to_json() const;
};

/**
 * @brief Proposals, votes and their resolution
 *
 * A proposal resolves approved as soon as it has min_votes votes with an
 * approval rate at or above threshold. Once the timeout has elapsed it
 * resolves on the next vote, poll or sweep with whatever votes it has,
 * approved only under the same rule. Each proposal resolves once and is
 * then forgotten.
 */
class ConsensusEngine {
public:
    using ResolutionListener = std::function<void(const ConsensusResult&)>;

    explicit ConsensusEngine(ConsensusConfig config = ConsensusConfig(),
                             std::shared_ptr<Clock> clock = system_clock());
    ~ConsensusEngine();

    ConsensusEngine(const ConsensusEngine&) = delete;
    ConsensusEngine& operator=(const ConsensusEngine&) = delete;

    /**
     * @brief Open a proposal with the configured threshold, quorum and timeout
     * @return INVALID_ARGUMENT if the id is empty or already pending
     */
    Result<void> register_proposal(const std::string& proposal_id, const ProposalPayload& payload,
                                   const std::string& proposer_id);

    /**
     * @brief Record a vote, replacing any earlier vote by the same agent
     * @return The resolution if this vote resolved the proposal. Unknown
     *         proposals and votes by the proposer are ignored.
     */
    std::optional<ConsensusResult> cast_vote(const std::string& proposal_id,
                                             const std::string& agent_id, bool approve,
                                             double confidence);

    /**
     * @brief Resolve the proposal if its timeout has elapsed
     */
    std::optional<ConsensusResult> poll(const std::string& proposal_id);

    /**
     * @brief Resolve and drop every proposal past its timeout
     */
    std::vector<ConsensusResult> cleanup_expired();

    /**
     * @brief Receives every resolution once, outside the engine lock
     */
    void on_resolution(ResolutionListener listener);

    std::optional<nlohmann::json> get_proposal_state(const std::string& proposal_id) const;
    size_t pending_count() const;

    /**
     * @brief Run cleanup_expired every sweep_interval_seconds on a background thread
     */
    Result<void> start();
    void stop();

    const ConsensusConfig& config() const {
        return config_;
    }

private:
    std::optional<ConsensusResult> try_resolve_locked(
        std::unordered_map<std::string, Proposal>::iterator it, Timestamp now);
    void notify(const std::vector<ConsensusResult>& results);
    void run_sweeper();

    ConsensusConfig config_;
    std::shared_ptr<Clock> clock_;
    std::unordered_map<std::string, Proposal> proposals_;
    std::vector<ResolutionListener> listeners_;
    mutable std::mutex mutex_;

    std::thread sweeper_;
    std::atomic<bool> running_{false};
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    bool stop_requested_{false};
};

}  // namespace trade_guard
