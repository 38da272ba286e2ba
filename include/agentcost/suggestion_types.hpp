#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace agentcost {

enum class SuggestionType {
    ModelDowngrade,
    Caching,
    PromptOptimization,
    ErrorReduction,
    AnomalyAlert
};

enum class Priority {
    High,
    Medium,
    Low
};

std::string to_string(SuggestionType type);
std::string to_string(Priority priority);
std::optional<SuggestionType> parse_suggestion_type(const std::string& value);
std::optional<Priority> parse_priority(const std::string& value);

// ============================================================================
// Per-type metric payloads
// ============================================================================

struct ModelDowngradeMetrics {
    int64_t current_calls = 0;
    double current_monthly_cost = 0.0;
    double avg_output_tokens = 0.0;
    double avg_input_tokens = 0.0;
    double savings_percentage = 0.0;
    std::string quality_impact;             // "minimal", "moderate", "significant"
    std::string source;                     // "learned" or "dynamic"
    double confidence_score = 0.0;
    int64_t times_implemented = 0;
    std::optional<double> savings_accuracy;
};

struct CachingMetrics {
    int64_t unique_patterns = 0;
    int64_t total_calls = 0;
    int64_t duplicate_calls = 0;
    double duplicate_rate = 0.0;
};

struct AnomalyMetrics {
    std::string metric_name;
    double current_value = 0.0;
    double baseline_mean = 0.0;
    double baseline_stddev = 0.0;
    double z_score = 0.0;
};

struct ErrorReductionMetrics {
    int64_t total_calls = 0;
    int64_t error_count = 0;
    double error_rate = 0.0;                // percent
    double baseline_error_rate = 0.0;       // percent
    double wasted_cost = 0.0;
};

struct LatencyMetrics {
    double avg_latency_ms = 0.0;
    double baseline_latency_ms = 0.0;
    double z_score = 0.0;
    double avg_input_tokens = 0.0;
};

using SuggestionMetrics = std::variant<ModelDowngradeMetrics,
                                       CachingMetrics,
                                       AnomalyMetrics,
                                       ErrorReductionMetrics,
                                       LatencyMetrics>;

nlohmann::json metrics_to_json(const SuggestionMetrics& metrics);

struct Suggestion {
    SuggestionType type = SuggestionType::ModelDowngrade;
    std::string title;
    std::string description;
    std::optional<std::string> agent_name;
    std::optional<std::string> model;
    std::optional<std::string> alternative_model;
    double estimated_savings_monthly = 0.0;
    double estimated_savings_percent = 0.0;
    Priority priority = Priority::Low;
    std::vector<std::string> action_items;
    SuggestionMetrics metrics;

    nlohmann::json to_json() const;
};

} // namespace agentcost
