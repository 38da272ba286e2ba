#pragma once

#include "agentcost/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentcost {

// ============================================================================
// Usage and statistics types
// Events are owned by the ingestion pipeline; everything here reads them.
// ============================================================================

struct Event {
    std::string id;
    std::string project_id;
    std::string agent_name;
    std::string model;
    int64_t input_tokens = 0;
    int64_t output_tokens = 0;
    double cost = 0.0;
    double latency_ms = 0.0;
    TimePoint timestamp;
    bool success = true;
    std::optional<std::string> input_hash; // Fingerprint of the normalized request
};

struct Baseline {
    std::string project_id;
    std::string agent_name;
    std::string model;

    double avg_cost_per_call = 0.0;
    double stddev_cost_per_call = 0.0;
    double avg_input_tokens = 0.0;
    double stddev_input_tokens = 0.0;
    double avg_output_tokens = 0.0;
    double stddev_output_tokens = 0.0;
    double avg_latency_ms = 0.0;
    double stddev_latency_ms = 0.0;
    double avg_daily_calls = 0.0;
    double avg_error_rate = 0.0;

    int64_t sample_count = 0;
    TimePoint last_calculated_at;

    nlohmann::json to_json() const;
};

struct BaselineRefreshResult {
    std::string project_id;
    int days = 0;
    int baselines_computed = 0;
    int groups_skipped = 0;       // Groups under the minimum sample count
    int64_t events_analyzed = 0;
    TimePoint computed_at;

    nlohmann::json to_json() const;
};

struct Anomaly {
    std::string metric_name;      // "cost_per_call", "latency_ms", "error_rate"
    std::string agent_name;
    std::string model;
    double current_value = 0.0;
    double baseline_mean = 0.0;
    double baseline_stddev = 0.0;
    double z_score = 0.0;
    std::string severity = "low"; // "high", "medium", "low"
    bool is_anomaly = false;
    int64_t recent_calls = 0;

    nlohmann::json to_json() const;
};

struct CachingOpportunity {
    std::string agent_name;
    int64_t unique_patterns = 0;
    int64_t total_calls = 0;
    int64_t duplicate_calls = 0;
    double duplicate_rate = 0.0;  // Percent of all agent calls
    double estimated_monthly_savings = 0.0;

    nlohmann::json to_json() const;
};

// Window-wide totals for one project
struct UsageOverview {
    int64_t total_calls = 0;
    int64_t error_count = 0;
    double total_cost = 0.0;
};

} // namespace agentcost
