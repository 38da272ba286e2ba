#include "agentcost/action_items.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace agentcost {

namespace {

// 12345 -> "12,345"
std::string with_thousands(int64_t value) {
    std::string digits = std::to_string(value < 0 ? -value : value);
    std::string out;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) out.insert(out.begin(), ',');
        out.insert(out.begin(), *it);
        ++count;
    }
    if (value < 0) out.insert(out.begin(), '-');
    return out;
}

} // namespace

std::vector<std::string> build_model_switch_actions(const std::string& agent,
                                                    const std::string& current_model,
                                                    const std::string& alternative_model,
                                                    double monthly_savings,
                                                    const std::string& quality_impact,
                                                    int64_t calls) {
    std::vector<std::string> actions;

    if (quality_impact == "minimal") {
        actions.push_back(fmt::format(
            "Run A/B test: route 10% of {} traffic to {} and compare output quality scores",
            agent, alternative_model));
    } else if (quality_impact == "moderate") {
        actions.push_back(fmt::format(
            "Evaluate {} on your {} test suite - expect some quality differences",
            alternative_model, agent));
    } else {
        actions.push_back(fmt::format(
            "Thoroughly test {} - significant capability differences expected vs {}",
            alternative_model, current_model));
    }

    if (calls > 1000) {
        actions.push_back(fmt::format(
            "With {} calls/period, implement gradual rollout: 10% → 25% → 50% → 100% over 2 weeks",
            with_thousands(calls)));
    } else {
        actions.push_back(fmt::format("Switch {} configuration from {} to {}",
                                      agent, current_model, alternative_model));
    }

    actions.push_back(fmt::format(
        "Monitor {} error rates and user feedback for 48 hours after switch", agent));

    if (monthly_savings > 100.0) {
        actions.push_back(fmt::format(
            "Expected savings: ${:.2f}/month - prioritize this migration", monthly_savings));
    }

    return actions;
}

std::vector<std::string> build_caching_actions(const std::string& agent,
                                               double duplicate_rate,
                                               int64_t unique_patterns,
                                               int64_t duplicate_calls) {
    std::vector<std::string> actions;

    int64_t cache_size = std::min<int64_t>(unique_patterns * 2, 10000);
    actions.push_back(fmt::format(
        "Implement cache with size {} entries - you have {} unique query patterns",
        with_thousands(cache_size), with_thousands(unique_patterns)));

    if (duplicate_rate > 50.0) {
        actions.push_back(fmt::format(
            "High duplicate rate ({:.0f}%) - use aggressive caching with 1-hour TTL", duplicate_rate));
    } else if (duplicate_rate > 20.0) {
        actions.push_back(fmt::format(
            "Moderate duplicates ({:.0f}%) - use 30-minute TTL with LRU eviction", duplicate_rate));
    } else {
        actions.push_back(fmt::format("Use 15-minute TTL for {} cache", agent));
    }

    if (duplicate_calls > 100) {
        actions.push_back(fmt::format(
            "Add semantic similarity matching - {} duplicate calls may have slight variations",
            with_thousands(duplicate_calls)));
    }

    actions.push_back(fmt::format("Log cache hits/misses for {} to measure effectiveness", agent));
    return actions;
}

std::vector<std::string> build_anomaly_actions(const std::string& metric_kind,
                                               const std::string& context,
                                               double z_score,
                                               double current_value,
                                               double baseline_mean) {
    std::vector<std::string> actions;

    double deviation_pct = baseline_mean != 0.0
        ? std::fabs((current_value - baseline_mean) / baseline_mean * 100.0)
        : 0.0;

    if (metric_kind == "cost") {
        if (z_score > 0) {
            actions.push_back(fmt::format(
                "Cost increased {:.0f}% for {} - check for prompt length changes or model switches",
                deviation_pct, context));
            actions.push_back(fmt::format("Compare recent {} token counts to baseline", context));
        } else {
            actions.push_back(fmt::format(
                "Cost decreased {:.0f}% for {} - verify functionality is not degraded",
                deviation_pct, context));
        }
    } else if (metric_kind == "latency") {
        if (z_score > 0) {
            actions.push_back(fmt::format(
                "Latency increased {:.0f}% for {} - check provider status page for incidents",
                deviation_pct, context));
            actions.push_back("Review recent prompt changes that may have increased token count");
        } else {
            actions.push_back(fmt::format("Latency improved for {} - no action needed", context));
        }
    } else if (metric_kind == "error") {
        actions.push_back(fmt::format(
            "Error rate at {:.1f}% for {} - check API logs for specific error types",
            current_value * 100.0, context));
        actions.push_back(fmt::format("Verify input validation is working for {}", context));
    }

    if (std::fabs(z_score) > 3.0) {
        actions.push_back(fmt::format(
            "Urgent: {:.1f}σ deviation requires immediate investigation", std::fabs(z_score)));
    }

    return actions;
}

std::vector<std::string> build_error_actions(const std::string& agent,
                                             const std::string& model,
                                             double error_rate,
                                             double baseline_error_rate,
                                             int64_t error_count,
                                             double monthly_wasted) {
    std::vector<std::string> actions;

    double error_increase = baseline_error_rate > 0.0
        ? (error_rate - baseline_error_rate) / baseline_error_rate * 100.0
        : 0.0;

    if (error_rate > 0.10) {
        actions.push_back(fmt::format(
            "Critical: {:.1f}% error rate on {} - query last {} failed requests for common patterns",
            error_rate * 100.0, agent, error_count));
    } else {
        actions.push_back(fmt::format(
            "Error rate {:.0f}% above baseline - review {} error logs from past 24 hours",
            error_increase, agent));
    }

    if (error_count > 50) {
        actions.push_back(fmt::format(
            "Implement retry with exponential backoff for {} - {} failures may be transient",
            model, error_count));
    }

    if (monthly_wasted > 10.0) {
        actions.push_back(fmt::format(
            "Add pre-call validation for {} - ${:.2f}/month wasted on failed requests",
            agent, monthly_wasted));
    }

    actions.push_back(fmt::format("Consider adding fallback model for {} when {} fails", agent, model));
    return actions;
}

std::vector<std::string> build_latency_actions(const std::string& agent,
                                               const std::string& model,
                                               double avg_latency,
                                               double baseline_latency,
                                               double avg_input_tokens,
                                               double z_score) {
    std::vector<std::string> actions;

    double latency_increase = avg_latency - baseline_latency;

    if (avg_input_tokens > 2000.0) {
        actions.push_back(fmt::format(
            "Reduce prompt size for {} - currently {:.0f} tokens, aim for <2000 tokens",
            agent, avg_input_tokens));
    }

    if (latency_increase > 1000.0) {
        actions.push_back(fmt::format(
            "Latency increased by {:.0f}ms - check if {} is experiencing provider-side delays",
            latency_increase, model));
    }

    if (z_score > 3.0) {
        actions.push_back(fmt::format(
            "Severe latency issue ({:.1f}σ) - consider switching to faster model variant or enabling streaming for {}",
            z_score, agent));
    } else {
        actions.push_back(fmt::format("Enable response streaming for {} to improve perceived latency", agent));
    }

    actions.push_back(fmt::format("Profile {} prompt construction to identify bottlenecks", agent));
    return actions;
}

} // namespace agentcost
