#include "agentcost/anomaly_detector.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <cmath>
#include <map>

namespace agentcost {

AnomalyDetector::AnomalyDetector(std::shared_ptr<EventAggregator> aggregator,
                                 std::shared_ptr<BaselineStore> baseline_store,
                                 AnomalyConfig config,
                                 Clock clock)
    : aggregator_(std::move(aggregator)),
      baseline_store_(std::move(baseline_store)),
      config_(config),
      clock_(std::move(clock)) {
}

std::string AnomalyDetector::severity_for_z(double z_score, const AnomalyConfig& config) {
    double magnitude = std::fabs(z_score);
    if (magnitude > config.high_severity_z) return "high";
    if (magnitude >= config.z_threshold) return "medium";
    return "low";
}

std::vector<Anomaly> AnomalyDetector::evaluate(const Baseline& baseline,
                                               const UsageGroupStats& recent,
                                               const AnomalyConfig& config) {
    std::vector<Anomaly> anomalies;

    auto z_metric = [&](const std::string& name, double current, double mean, double stddev) {
        // z is undefined without spread
        if (stddev <= 0.0) return;

        Anomaly a;
        a.metric_name = name;
        a.agent_name = baseline.agent_name;
        a.model = baseline.model;
        a.current_value = current;
        a.baseline_mean = mean;
        a.baseline_stddev = stddev;
        a.z_score = (current - mean) / stddev;
        a.is_anomaly = std::fabs(a.z_score) >= config.z_threshold;
        a.severity = severity_for_z(a.z_score, config);
        a.recent_calls = recent.call_count;
        anomalies.push_back(std::move(a));
    };

    z_metric("cost_per_call", recent.cost.mean, baseline.avg_cost_per_call, baseline.stddev_cost_per_call);
    z_metric("latency_ms", recent.latency_ms.mean, baseline.avg_latency_ms, baseline.stddev_latency_ms);

    // Error rate is a ratio test against the baseline rate
    Anomaly err;
    err.metric_name = "error_rate";
    err.agent_name = baseline.agent_name;
    err.model = baseline.model;
    err.current_value = recent.error_rate();
    err.baseline_mean = baseline.avg_error_rate;
    err.recent_calls = recent.call_count;
    err.is_anomaly = err.current_value > baseline.avg_error_rate * config.error_rate_ratio;
    if (err.is_anomaly) {
        bool doubled = baseline.avg_error_rate <= 0.0 ||
                       err.current_value > baseline.avg_error_rate * config.error_rate_high_ratio;
        err.severity = doubled ? "high" : "medium";
    }
    anomalies.push_back(std::move(err));

    return anomalies;
}

std::vector<Anomaly> AnomalyDetector::detect_anomalies(const std::string& project_id, int recent_hours) {
    std::vector<Anomaly> anomalies;
    if (recent_hours <= 0) return anomalies;

    auto baselines = baseline_store_->list_baselines(project_id);
    if (baselines.empty()) {
        spdlog::debug("No baselines for project {}, anomaly detection skipped", project_id);
        return anomalies;
    }

    TimePoint now = clock_();
    TimePoint from = now - std::chrono::hours(recent_hours);

    std::map<std::pair<std::string, std::string>, UsageGroupStats> recent;
    for (auto& group : aggregator_->group_by_agent_model(project_id, from, now)) {
        recent[{group.agent_name, group.model}] = std::move(group);
    }

    for (const auto& baseline : baselines) {
        auto it = recent.find({baseline.agent_name, baseline.model});
        if (it == recent.end()) continue;

        auto evaluated = evaluate(baseline, it->second, config_);
        anomalies.insert(anomalies.end(), evaluated.begin(), evaluated.end());
    }

    size_t flagged = 0;
    for (const auto& a : anomalies) {
        if (a.is_anomaly) ++flagged;
    }
    spdlog::debug("Anomaly detection for {}: {} metrics evaluated, {} flagged", project_id, anomalies.size(), flagged);
    return anomalies;
}

} // namespace agentcost
