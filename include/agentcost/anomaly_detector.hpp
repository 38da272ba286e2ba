#pragma once

#include "agentcost/config.hpp"
#include "agentcost/event_aggregator.hpp"
#include <memory>

namespace agentcost {

class AnomalyDetector {
private:
    std::shared_ptr<EventAggregator> aggregator_;
    std::shared_ptr<BaselineStore> baseline_store_;
    AnomalyConfig config_;
    Clock clock_;

public:
    AnomalyDetector(std::shared_ptr<EventAggregator> aggregator,
                    std::shared_ptr<BaselineStore> baseline_store,
                    AnomalyConfig config = AnomalyConfig{},
                    Clock clock = system_now);

    // Every evaluated metric for every baseline with recent traffic; callers
    // filter on is_anomaly.
    std::vector<Anomaly> detect_anomalies(const std::string& project_id, int recent_hours);

    std::vector<Anomaly> detect_anomalies(const std::string& project_id) {
        return detect_anomalies(project_id, config_.recent_hours);
    }

    // Compares one recent group against its baseline
    static std::vector<Anomaly> evaluate(const Baseline& baseline,
                                         const UsageGroupStats& recent,
                                         const AnomalyConfig& config);

    static std::string severity_for_z(double z_score, const AnomalyConfig& config);
};

} // namespace agentcost
