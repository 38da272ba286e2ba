#include "agentcost/baseline_computer.hpp"
#include <spdlog/spdlog.h>

namespace agentcost {

BaselineComputer::BaselineComputer(std::shared_ptr<EventAggregator> aggregator,
                                   std::shared_ptr<BaselineStore> baseline_store,
                                   BaselineConfig config,
                                   Clock clock)
    : aggregator_(std::move(aggregator)),
      baseline_store_(std::move(baseline_store)),
      config_(config),
      clock_(std::move(clock)) {
}

Baseline BaselineComputer::baseline_from_group(const UsageGroupStats& group, TimePoint computed_at) {
    Baseline b;
    b.agent_name = group.agent_name;
    b.model = group.model;
    b.avg_cost_per_call = group.cost.mean;
    b.stddev_cost_per_call = group.cost.stddev;
    b.avg_input_tokens = group.input_tokens.mean;
    b.stddev_input_tokens = group.input_tokens.stddev;
    b.avg_output_tokens = group.output_tokens.mean;
    b.stddev_output_tokens = group.output_tokens.stddev;
    b.avg_latency_ms = group.latency_ms.mean;
    b.stddev_latency_ms = group.latency_ms.stddev;
    b.avg_daily_calls = group.avg_daily_calls;
    b.avg_error_rate = group.error_rate();
    b.sample_count = group.call_count;
    b.last_calculated_at = computed_at;
    return b;
}

BaselineRefreshResult BaselineComputer::compute_baselines(const std::string& project_id, int days) {
    BaselineRefreshResult result;
    result.project_id = project_id;
    result.days = days;
    result.computed_at = clock_();

    if (days <= 0) {
        spdlog::debug("Skipping baseline computation for {}: empty window", project_id);
        return result;
    }

    auto events = aggregator_->fetch(project_id, days_before(result.computed_at, days), result.computed_at);
    result.events_analyzed = static_cast<int64_t>(events.size());

    std::vector<Baseline> baselines;
    for (const auto& group : EventAggregator::group_by_agent_model(events)) {
        if (group.call_count < config_.min_samples) {
            spdlog::debug("Baseline skipped for {}/{}/{}: {} calls < {}",
                          project_id, group.agent_name, group.model, group.call_count, config_.min_samples);
            result.groups_skipped++;
            continue;
        }
        Baseline b = baseline_from_group(group, result.computed_at);
        b.project_id = project_id;
        baselines.push_back(std::move(b));
    }

    baseline_store_->upsert_baselines(project_id, baselines);
    result.baselines_computed = static_cast<int>(baselines.size());

    spdlog::info("Computed {} baselines for project {} over {} days ({} events, {} groups skipped)",
                 result.baselines_computed, project_id, days, result.events_analyzed, result.groups_skipped);
    return result;
}

bool BaselineComputer::ensure_baselines_exist(const std::string& project_id, int days) {
    if (baseline_store_->has_baselines(project_id)) return false;
    compute_baselines(project_id, days);
    return true;
}

bool BaselineComputer::has_baselines(const std::string& project_id) {
    return baseline_store_->has_baselines(project_id);
}

std::optional<Baseline> BaselineComputer::get_baseline(const std::string& project_id,
                                                       const std::string& agent_name,
                                                       const std::string& model) {
    return baseline_store_->get_baseline(project_id, agent_name, model);
}

std::vector<Baseline> BaselineComputer::list_baselines(const std::string& project_id,
                                                       const std::optional<std::string>& agent_name,
                                                       const std::optional<std::string>& model) {
    return baseline_store_->list_baselines(project_id, agent_name, model);
}

} // namespace agentcost
