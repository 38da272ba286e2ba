#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace agentcost {

// Remediation steps attached to each suggestion. Pure threshold rules over the
// computed figures; nothing here is executed.

std::vector<std::string> build_model_switch_actions(const std::string& agent,
                                                    const std::string& current_model,
                                                    const std::string& alternative_model,
                                                    double monthly_savings,
                                                    const std::string& quality_impact,
                                                    int64_t calls);

std::vector<std::string> build_caching_actions(const std::string& agent,
                                               double duplicate_rate,
                                               int64_t unique_patterns,
                                               int64_t duplicate_calls);

// metric_kind is "cost", "latency" or "error"
std::vector<std::string> build_anomaly_actions(const std::string& metric_kind,
                                               const std::string& context,
                                               double z_score,
                                               double current_value,
                                               double baseline_mean);

std::vector<std::string> build_error_actions(const std::string& agent,
                                             const std::string& model,
                                             double error_rate,
                                             double baseline_error_rate,
                                             int64_t error_count,
                                             double monthly_wasted);

std::vector<std::string> build_latency_actions(const std::string& agent,
                                               const std::string& model,
                                               double avg_latency,
                                               double baseline_latency,
                                               double avg_input_tokens,
                                               double z_score);

} // namespace agentcost
