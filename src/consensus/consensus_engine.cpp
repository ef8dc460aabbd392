// src/consensus/consensus_engine.cpp
#include "trade_guard/consensus/consensus_engine.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>
#include "trade_guard/core/logger.hpp"
#include "trade_guard/core/time_utils.hpp"

namespace trade_guard {

namespace {

// Approval rates are compared at whole-percent resolution, so 2 of 3 meets 0.67
constexpr double kRateTolerance = 0.005;

std::string approval(double rate) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(1) << rate * 100.0 << "% approval";
    return os.str();
}

std::string describe(size_t votes, double rate) {
    return std::to_string(votes) + " votes, " + approval(rate);
}

}  // namespace

nlohmann::json ConsensusConfig::to_json() const {
    nlohmann::json j;
    j["min_votes"] = min_votes;
    j["threshold"] = threshold;
    j["timeout_seconds"] = timeout_seconds;
    j["sweep_interval_seconds"] = sweep_interval_seconds;
    return j;
}

void ConsensusConfig::from_json(const nlohmann::json& j) {
    if (j.contains("min_votes"))
        min_votes = j.at("min_votes").get<int>();
    if (j.contains("threshold"))
        threshold = j.at("threshold").get<double>();
    if (j.contains("timeout_seconds"))
        timeout_seconds = j.at("timeout_seconds").get<double>();
    if (j.contains("sweep_interval_seconds"))
        sweep_interval_seconds = j.at("sweep_interval_seconds").get<double>();
}

std::vector<std::string> ConsensusConfig::validate() const {
    std::vector<std::string> problems;
    if (min_votes <= 0)
        problems.push_back("min_votes must be positive");
    if (threshold <= 0.0 || threshold > 1.0)
        problems.push_back("threshold must be in (0, 1]");
    if (timeout_seconds <= 0.0)
        problems.push_back("timeout_seconds must be positive");
    if (sweep_interval_seconds <= 0.0)
        problems.push_back("sweep_interval_seconds must be positive");
    return problems;
}

nlohmann::json Proposal::to_json() const {
    nlohmann::json j;
    j["proposal_id"] = proposal_id;
    j["proposer_id"] = proposer_id;
    j["payload"] = payload.to_json();
    j["threshold"] = threshold;
    j["min_votes"] = min_votes;
    j["timeout_seconds"] = timeout.count() / 1000.0;
    j["created_at"] = core::to_iso8601(created_at);

    nlohmann::json votes_json = nlohmann::json::object();
    for (const auto& [agent, vote] : votes) {
        votes_json[agent] = {{"approve", vote.approve},
                             {"confidence", vote.confidence},
                             {"timestamp", core::to_iso8601(vote.cast_at)}};
    }
    j["votes"] = votes_json;
    return j;
}

nlohmann::json ConsensusResult::to_json() const {
    nlohmann::json j;
    j["proposal_id"] = proposal_id;
    j["proposer_id"] = proposer_id;
    j["payload"] = payload.to_json();
    j["approved"] = approved;
    j["consensus_score"] = consensus_score;
    j["participants"] = participants;
    j["notes"] = notes;
    j["timed_out"] = timed_out;
    j["resolved_at"] = core::to_iso8601(resolved_at);
    return j;
}

ConsensusEngine::ConsensusEngine(ConsensusConfig config, std::shared_ptr<Clock> clock)
    : config_(std::move(config)), clock_(std::move(clock)) {
    Logger::register_component("ConsensusEngine");
}

ConsensusEngine::~ConsensusEngine() {
    stop();
}

Result<void> ConsensusEngine::register_proposal(const std::string& proposal_id,
                                                const ProposalPayload& payload,
                                                const std::string& proposer_id) {
    if (proposal_id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Proposal id cannot be empty",
                                "ConsensusEngine");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (proposals_.count(proposal_id)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Proposal already pending: " + proposal_id, "ConsensusEngine");
    }

    Proposal proposal;
    proposal.proposal_id = proposal_id;
    proposal.proposer_id = proposer_id;
    proposal.payload = payload;
    proposal.payload.proposal_id = proposal_id;
    proposal.threshold = config_.threshold;
    proposal.min_votes = config_.min_votes;
    proposal.timeout = std::chrono::milliseconds(
        static_cast<int64_t>(std::llround(config_.timeout_seconds * 1000.0)));
    proposal.created_at = clock_->now();
    proposals_.emplace(proposal_id, std::move(proposal));

    INFO("Proposal " << proposal_id << " from " << proposer_id << ": "
                     << side_to_string(payload.side) << " " << payload.symbol << " notional "
                     << payload.notional);
    return Result<void>();
}

std::optional<ConsensusResult> ConsensusEngine::try_resolve_locked(
    std::unordered_map<std::string, Proposal>::iterator it, Timestamp now) {
    const Proposal& proposal = it->second;

    size_t total = proposal.votes.size();
    size_t approvals = 0;
    for (const auto& [_, vote] : proposal.votes) {
        if (vote.approve)
            ++approvals;
    }
    double rate = total > 0 ? static_cast<double>(approvals) / total : 0.0;
    bool quorum = total >= static_cast<size_t>(proposal.min_votes);
    bool passes = quorum && rate + kRateTolerance >= proposal.threshold;
    bool expired = now - proposal.created_at >= proposal.timeout;

    if (!passes && !expired) {
        return std::nullopt;
    }

    ConsensusResult result;
    result.proposal_id = proposal.proposal_id;
    result.proposer_id = proposal.proposer_id;
    result.payload = proposal.payload;
    result.approved = passes;
    result.consensus_score = rate;
    result.timed_out = expired;
    result.resolved_at = now;
    for (const auto& [agent, _] : proposal.votes) {
        result.participants.push_back(agent);
    }

    if (!expired) {
        result.notes =
            "Consensus reached with " + std::to_string(total) + " votes (" + approval(rate) + ")";
    } else if (passes) {
        result.notes = "Consensus reached after timeout (" + describe(total, rate) + ")";
    } else {
        result.notes = "Consensus not reached after timeout (" + describe(total, rate) + ")";
    }

    proposals_.erase(it);
    return result;
}

std::optional<ConsensusResult> ConsensusEngine::cast_vote(const std::string& proposal_id,
                                                          const std::string& agent_id,
                                                          bool approve, double confidence) {
    std::optional<ConsensusResult> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = proposals_.find(proposal_id);
        if (it == proposals_.end()) {
            DEBUG("Vote from " << agent_id << " for unknown proposal " << proposal_id);
            return std::nullopt;
        }
        if (agent_id == it->second.proposer_id) {
            DEBUG("Ignoring self-vote by " << agent_id << " on " << proposal_id);
            return std::nullopt;
        }

        auto now = clock_->now();
        it->second.votes[agent_id] = Vote{approve, confidence, now};
        result = try_resolve_locked(it, now);
    }

    if (result) {
        INFO("Proposal " << proposal_id << (result->approved ? " approved: " : " rejected: ")
                         << result->notes);
        notify({*result});
    }
    return result;
}

std::optional<ConsensusResult> ConsensusEngine::poll(const std::string& proposal_id) {
    std::optional<ConsensusResult> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = proposals_.find(proposal_id);
        if (it == proposals_.end()) {
            return std::nullopt;
        }
        auto now = clock_->now();
        if (now - it->second.created_at < it->second.timeout) {
            return std::nullopt;
        }
        result = try_resolve_locked(it, now);
    }

    if (result) {
        INFO("Proposal " << proposal_id << " expired: " << result->notes);
        notify({*result});
    }
    return result;
}

std::vector<ConsensusResult> ConsensusEngine::cleanup_expired() {
    std::vector<ConsensusResult> results;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_->now();
        for (auto it = proposals_.begin(); it != proposals_.end();) {
            auto next = std::next(it);
            if (now - it->second.created_at >= it->second.timeout) {
                auto resolved = try_resolve_locked(it, now);
                if (resolved) {
                    results.push_back(std::move(*resolved));
                }
            }
            it = next;
        }
    }

    for (const auto& result : results) {
        INFO("Proposal " << result.proposal_id << " expired: " << result.notes);
    }
    if (!results.empty()) {
        notify(results);
    }
    return results;
}

void ConsensusEngine::on_resolution(ResolutionListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

void ConsensusEngine::notify(const std::vector<ConsensusResult>& results) {
    std::vector<ResolutionListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners = listeners_;
    }
    for (const auto& result : results) {
        for (const auto& listener : listeners) {
            try {
                listener(result);
            } catch (const std::exception& e) {
                ERROR("Resolution listener failed for " << result.proposal_id << ": "
                                                        << e.what());
            }
        }
    }
}

std::optional<nlohmann::json> ConsensusEngine::get_proposal_state(
    const std::string& proposal_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = proposals_.find(proposal_id);
    if (it == proposals_.end()) {
        return std::nullopt;
    }
    return it->second.to_json();
}

size_t ConsensusEngine::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proposals_.size();
}

Result<void> ConsensusEngine::start() {
    if (running_.exchange(true)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Consensus sweeper already running",
                                "ConsensusEngine");
    }
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_ = false;
    }
    sweeper_ = std::thread(&ConsensusEngine::run_sweeper, this);
    return Result<void>();
}

void ConsensusEngine::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();
    if (sweeper_.joinable()) {
        sweeper_.join();
    }
}

void ConsensusEngine::run_sweeper() {
    Logger::register_component("ConsensusEngine");
    auto interval = std::chrono::milliseconds(
        static_cast<int64_t>(std::llround(config_.sweep_interval_seconds * 1000.0)));
    while (true) {
        {
            std::unique_lock<std::mutex> lock(stop_mutex_);
            if (stop_cv_.wait_for(lock, interval, [this] { return stop_requested_; })) {
                return;
            }
        }
        cleanup_expired();
    }
}

}  // namespace trade_guard
