#include "agentcost/usage_types.hpp"
#include "agentcost/rounding.hpp"

namespace agentcost {

nlohmann::json Baseline::to_json() const {
    return {
        {"agent_name", agent_name},
        {"model", model},
        {"avg_cost_per_call", round_to(avg_cost_per_call, 6)},
        {"stddev_cost_per_call", round_to(stddev_cost_per_call, 6)},
        {"avg_input_tokens", round_to(avg_input_tokens, 1)},
        {"stddev_input_tokens", round_to(stddev_input_tokens, 1)},
        {"avg_output_tokens", round_to(avg_output_tokens, 1)},
        {"stddev_output_tokens", round_to(stddev_output_tokens, 1)},
        {"avg_latency_ms", round_to(avg_latency_ms, 1)},
        {"stddev_latency_ms", round_to(stddev_latency_ms, 1)},
        {"avg_daily_calls", round_to(avg_daily_calls, 1)},
        {"avg_error_rate", round_to(avg_error_rate, 4)},
        {"sample_count", sample_count},
        {"last_calculated_at", to_iso8601(last_calculated_at)}
    };
}

nlohmann::json BaselineRefreshResult::to_json() const {
    return {
        {"project_id", project_id},
        {"days", days},
        {"baselines_computed", baselines_computed},
        {"groups_skipped", groups_skipped},
        {"events_analyzed", events_analyzed},
        {"computed_at", to_iso8601(computed_at)}
    };
}

nlohmann::json Anomaly::to_json() const {
    return {
        {"metric_name", metric_name},
        {"agent_name", agent_name},
        {"model", model},
        {"current_value", round_to(current_value, 4)},
        {"baseline_mean", round_to(baseline_mean, 4)},
        {"baseline_stddev", round_to(baseline_stddev, 4)},
        {"z_score", round_to(z_score, 2)},
        {"severity", severity},
        {"is_anomaly", is_anomaly},
        {"recent_calls", recent_calls}
    };
}

nlohmann::json CachingOpportunity::to_json() const {
    return {
        {"agent_name", agent_name},
        {"unique_patterns", unique_patterns},
        {"total_calls", total_calls},
        {"duplicate_calls", duplicate_calls},
        {"duplicate_rate", round_percent(duplicate_rate)},
        {"estimated_monthly_savings", round_money(estimated_monthly_savings)}
    };
}

} // namespace agentcost
