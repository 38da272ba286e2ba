#include "agentcost/recommendation_types.hpp"
#include "agentcost/rounding.hpp"

namespace agentcost {

std::string to_string(RecommendationStatus status) {
    switch (status) {
        case RecommendationStatus::Pending: return "pending";
        case RecommendationStatus::Implemented: return "implemented";
        case RecommendationStatus::Dismissed: return "dismissed";
        case RecommendationStatus::Expired: return "expired";
    }
    return "pending";
}

std::optional<RecommendationStatus> parse_recommendation_status(const std::string& value) {
    if (value == "pending") return RecommendationStatus::Pending;
    if (value == "implemented") return RecommendationStatus::Implemented;
    if (value == "dismissed") return RecommendationStatus::Dismissed;
    if (value == "expired") return RecommendationStatus::Expired;
    return std::nullopt;
}

std::string to_string(ActionStatus status) {
    switch (status) {
        case ActionStatus::Ok: return "ok";
        case ActionStatus::NotFound: return "not_found";
        case ActionStatus::Unavailable: return "unavailable";
    }
    return "not_found";
}

template <typename T>
static nlohmann::json nullable(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

static nlohmann::json nullable_time(const std::optional<TimePoint>& value) {
    return value ? nlohmann::json(to_iso8601(*value)) : nlohmann::json(nullptr);
}

nlohmann::json Recommendation::to_json() const {
    return {
        {"id", id},
        {"project_id", project_id},
        {"recommendation_type", type},
        {"title", title},
        {"description", description},
        {"agent_name", nullable(agent_name)},
        {"model", nullable(model)},
        {"alternative_model", nullable(alternative_model)},
        {"estimated_monthly_savings", round_money(estimated_monthly_savings)},
        {"estimated_savings_percent", round_percent(estimated_savings_percent)},
        {"metrics_snapshot", metrics_snapshot},
        {"status", to_string(status)},
        {"created_at", to_iso8601(created_at)},
        {"expires_at", to_iso8601(expires_at)},
        {"implemented_at", nullable_time(implemented_at)},
        {"dismissed_at", nullable_time(dismissed_at)},
        {"dismiss_feedback", nullable(dismiss_feedback)},
        {"actual_monthly_savings", nullable(actual_monthly_savings)}
    };
}

nlohmann::json RecommendationEffectiveness::to_json() const {
    return {
        {"total", total},
        {"pending", pending},
        {"implemented", implemented},
        {"dismissed", dismissed},
        {"expired", expired},
        {"implementation_rate", round_percent(implementation_rate)},
        {"dismissal_rate", round_percent(dismissal_rate)},
        {"total_estimated_savings", round_money(total_estimated_savings)},
        {"total_actual_savings", round_money(total_actual_savings)},
        {"measured_count", measured_count},
        {"savings_accuracy", savings_accuracy ? nlohmann::json(round_to(*savings_accuracy, 2))
                                              : nlohmann::json(nullptr)},
        {"by_type", by_type}
    };
}

} // namespace agentcost
