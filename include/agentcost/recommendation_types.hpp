#pragma once

#include "agentcost/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace agentcost {

enum class RecommendationStatus {
    Pending,
    Implemented,
    Dismissed,
    Expired
};

std::string to_string(RecommendationStatus status);
std::optional<RecommendationStatus> parse_recommendation_status(const std::string& value);

struct Recommendation {
    std::string id;
    std::string project_id;
    std::string type;                       // SuggestionType string
    std::string title;
    std::string description;
    std::optional<std::string> agent_name;
    std::optional<std::string> model;
    std::optional<std::string> alternative_model;
    double estimated_monthly_savings = 0.0;
    double estimated_savings_percent = 0.0;
    nlohmann::json metrics_snapshot = nlohmann::json::object();
    RecommendationStatus status = RecommendationStatus::Pending;
    TimePoint created_at;
    TimePoint expires_at;
    std::optional<TimePoint> implemented_at;
    std::optional<TimePoint> dismissed_at;
    std::optional<std::string> dismiss_feedback;
    std::optional<double> actual_monthly_savings;

    // Pending and not yet past expires_at
    bool is_actionable(TimePoint now) const {
        return status == RecommendationStatus::Pending && expires_at > now;
    }

    nlohmann::json to_json() const;
};

// Dedup key: one live pending row per (project, type, agent, model)
struct RecommendationKey {
    std::string project_id;
    std::string type;
    std::optional<std::string> agent_name;
    std::optional<std::string> model;

    bool matches(const Recommendation& rec) const {
        return rec.project_id == project_id && rec.type == type &&
               rec.agent_name == agent_name && rec.model == model;
    }
};

enum class ActionStatus {
    Ok,
    NotFound,      // No row with this id in the project
    Unavailable    // Row exists but is already actioned or expired
};

std::string to_string(ActionStatus status);

struct ActionResult {
    ActionStatus status = ActionStatus::NotFound;
    std::optional<Recommendation> recommendation;

    bool ok() const { return status == ActionStatus::Ok; }
};

struct RecommendationEffectiveness {
    int64_t total = 0;
    int64_t pending = 0;
    int64_t implemented = 0;
    int64_t dismissed = 0;
    int64_t expired = 0;
    double implementation_rate = 0.0;   // percent of actioned
    double dismissal_rate = 0.0;        // percent of actioned
    double total_estimated_savings = 0.0;
    double total_actual_savings = 0.0;
    int64_t measured_count = 0;         // implemented rows with an actual figure
    std::optional<double> savings_accuracy;
    std::map<std::string, int64_t> by_type;

    nlohmann::json to_json() const;
};

} // namespace agentcost
