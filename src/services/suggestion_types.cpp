#include "agentcost/suggestion_types.hpp"
#include <type_traits>

namespace agentcost {

std::string to_string(SuggestionType type) {
    switch (type) {
        case SuggestionType::ModelDowngrade: return "model_downgrade";
        case SuggestionType::Caching: return "caching";
        case SuggestionType::PromptOptimization: return "prompt_optimization";
        case SuggestionType::ErrorReduction: return "error_reduction";
        case SuggestionType::AnomalyAlert: return "anomaly_alert";
    }
    return "unknown";
}

std::string to_string(Priority priority) {
    switch (priority) {
        case Priority::High: return "high";
        case Priority::Medium: return "medium";
        case Priority::Low: return "low";
    }
    return "low";
}

std::optional<SuggestionType> parse_suggestion_type(const std::string& value) {
    if (value == "model_downgrade") return SuggestionType::ModelDowngrade;
    if (value == "caching") return SuggestionType::Caching;
    if (value == "prompt_optimization") return SuggestionType::PromptOptimization;
    if (value == "error_reduction") return SuggestionType::ErrorReduction;
    if (value == "anomaly_alert") return SuggestionType::AnomalyAlert;
    return std::nullopt;
}

std::optional<Priority> parse_priority(const std::string& value) {
    if (value == "high") return Priority::High;
    if (value == "medium") return Priority::Medium;
    if (value == "low") return Priority::Low;
    return std::nullopt;
}

static nlohmann::json optional_to_json(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json metrics_to_json(const SuggestionMetrics& metrics) {
    return std::visit([](const auto& m) -> nlohmann::json {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ModelDowngradeMetrics>) {
            return {
                {"current_calls", m.current_calls},
                {"current_monthly_cost", m.current_monthly_cost},
                {"avg_output_tokens", m.avg_output_tokens},
                {"avg_input_tokens", m.avg_input_tokens},
                {"savings_percentage", m.savings_percentage},
                {"quality_impact", m.quality_impact},
                {"source", m.source},
                {"confidence_score", m.confidence_score},
                {"times_implemented", m.times_implemented},
                {"savings_accuracy", m.savings_accuracy ? nlohmann::json(*m.savings_accuracy) : nlohmann::json(nullptr)}
            };
        } else if constexpr (std::is_same_v<T, CachingMetrics>) {
            return {
                {"unique_patterns", m.unique_patterns},
                {"total_calls", m.total_calls},
                {"duplicate_calls", m.duplicate_calls},
                {"duplicate_rate", m.duplicate_rate}
            };
        } else if constexpr (std::is_same_v<T, AnomalyMetrics>) {
            return {
                {"metric_name", m.metric_name},
                {"current_value", m.current_value},
                {"baseline_mean", m.baseline_mean},
                {"baseline_stddev", m.baseline_stddev},
                {"z_score", m.z_score}
            };
        } else if constexpr (std::is_same_v<T, ErrorReductionMetrics>) {
            return {
                {"total_calls", m.total_calls},
                {"error_count", m.error_count},
                {"error_rate", m.error_rate},
                {"baseline_error_rate", m.baseline_error_rate},
                {"wasted_cost", m.wasted_cost}
            };
        } else {
            static_assert(std::is_same_v<T, LatencyMetrics>, "unhandled metrics type");
            return {
                {"avg_latency_ms", m.avg_latency_ms},
                {"baseline_latency_ms", m.baseline_latency_ms},
                {"z_score", m.z_score},
                {"avg_input_tokens", m.avg_input_tokens}
            };
        }
    }, metrics);
}

nlohmann::json Suggestion::to_json() const {
    return {
        {"type", to_string(type)},
        {"title", title},
        {"description", description},
        {"agent_name", optional_to_json(agent_name)},
        {"model", optional_to_json(model)},
        {"alternative_model", optional_to_json(alternative_model)},
        {"estimated_savings_monthly", estimated_savings_monthly},
        {"estimated_savings_percent", estimated_savings_percent},
        {"priority", to_string(priority)},
        {"action_items", action_items},
        {"metrics", metrics_to_json(metrics)}
    };
}

} // namespace agentcost
