#pragma once

#include "agentcost/config.hpp"
#include "agentcost/event_aggregator.hpp"
#include <memory>

namespace agentcost {

// Finds repeated request fingerprints per agent and prices the repeats
class PatternAnalyzer {
private:
    std::shared_ptr<EventAggregator> aggregator_;
    PatternConfig config_;
    Clock clock_;

public:
    PatternAnalyzer(std::shared_ptr<EventAggregator> aggregator,
                    PatternConfig config = PatternConfig{},
                    Clock clock = system_now);

    std::vector<CachingOpportunity> analyze_caching_opportunities(const std::string& project_id,
                                                                  int min_occurrences,
                                                                  double min_savings,
                                                                  int days);

    std::vector<CachingOpportunity> analyze_caching_opportunities(const std::string& project_id) {
        return analyze_caching_opportunities(project_id, config_.min_occurrences,
                                             config_.min_savings, config_.window_days);
    }

    // Over an already fetched window of `days` days
    static std::vector<CachingOpportunity> analyze(const std::vector<Event>& events,
                                                   int min_occurrences,
                                                   double min_savings,
                                                   int days);
};

} // namespace agentcost
