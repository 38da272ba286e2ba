#include "agentcost/pattern_analyzer.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace agentcost {

PatternAnalyzer::PatternAnalyzer(std::shared_ptr<EventAggregator> aggregator,
                                 PatternConfig config,
                                 Clock clock)
    : aggregator_(std::move(aggregator)),
      config_(config),
      clock_(std::move(clock)) {
}

std::vector<CachingOpportunity> PatternAnalyzer::analyze_caching_opportunities(const std::string& project_id,
                                                                               int min_occurrences,
                                                                               double min_savings,
                                                                               int days) {
    if (days <= 0) return {};

    TimePoint now = clock_();
    auto events = aggregator_->fetch(project_id, days_before(now, days), now);
    auto opportunities = analyze(events, min_occurrences, min_savings, days);

    spdlog::debug("Caching analysis for {}: {} opportunities over {} events", project_id, opportunities.size(), events.size());
    return opportunities;
}

std::vector<CachingOpportunity> PatternAnalyzer::analyze(const std::vector<Event>& events,
                                                         int min_occurrences,
                                                         double min_savings,
                                                         int days) {
    std::vector<CachingOpportunity> opportunities;
    if (days <= 0) return opportunities;

    // A pattern needs at least one repeat to be a duplicate
    int threshold = std::max(2, min_occurrences);

    auto agent_calls = EventAggregator::calls_by_agent(events);
    std::map<std::string, CachingOpportunity> by_agent;
    std::map<std::string, double> duplicate_cost;

    for (const auto& group : EventAggregator::group_by_input_hash(events)) {
        if (group.occurrences < threshold) continue;

        auto& opp = by_agent[group.agent_name];
        opp.agent_name = group.agent_name;
        opp.unique_patterns++;
        opp.duplicate_calls += group.occurrences - 1;
        duplicate_cost[group.agent_name] += group.duplicate_cost();
    }

    double month_scale = 30.0 / static_cast<double>(days);

    for (auto& entry : by_agent) {
        CachingOpportunity opp = entry.second;
        opp.total_calls = agent_calls[entry.first];
        opp.duplicate_rate = opp.total_calls > 0
            ? static_cast<double>(opp.duplicate_calls) / static_cast<double>(opp.total_calls) * 100.0
            : 0.0;
        opp.estimated_monthly_savings = duplicate_cost[entry.first] * month_scale;

        if (opp.estimated_monthly_savings < min_savings) continue;
        opportunities.push_back(std::move(opp));
    }

    std::stable_sort(opportunities.begin(), opportunities.end(),
                     [](const CachingOpportunity& a, const CachingOpportunity& b) {
                         return a.estimated_monthly_savings > b.estimated_monthly_savings;
                     });
    return opportunities;
}

} // namespace agentcost
