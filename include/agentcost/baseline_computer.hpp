#pragma once

#include "agentcost/config.hpp"
#include "agentcost/event_aggregator.hpp"
#include <memory>

namespace agentcost {

class BaselineComputer {
private:
    std::shared_ptr<EventAggregator> aggregator_;
    std::shared_ptr<BaselineStore> baseline_store_;
    BaselineConfig config_;
    Clock clock_;

public:
    BaselineComputer(std::shared_ptr<EventAggregator> aggregator,
                     std::shared_ptr<BaselineStore> baseline_store,
                     BaselineConfig config = BaselineConfig{},
                     Clock clock = system_now);

    // Recomputes every (agent, model) group with enough samples in [now-days, now]
    // and upserts them in one write. Groups below min_samples are skipped.
    BaselineRefreshResult compute_baselines(const std::string& project_id, int days);

    // Bootstrap only: computes when the project has no baselines yet.
    // Returns true when a computation ran.
    bool ensure_baselines_exist(const std::string& project_id, int days);

    bool has_baselines(const std::string& project_id);

    std::optional<Baseline> get_baseline(const std::string& project_id,
                                         const std::string& agent_name,
                                         const std::string& model);

    std::vector<Baseline> list_baselines(const std::string& project_id,
                                         const std::optional<std::string>& agent_name = std::nullopt,
                                         const std::optional<std::string>& model = std::nullopt);

    static Baseline baseline_from_group(const UsageGroupStats& group, TimePoint computed_at);
};

} // namespace agentcost
