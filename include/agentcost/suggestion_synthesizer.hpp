#pragma once

#include "agentcost/anomaly_detector.hpp"
#include "agentcost/baseline_computer.hpp"
#include "agentcost/config.hpp"
#include "agentcost/event_aggregator.hpp"
#include "agentcost/pattern_analyzer.hpp"
#include "agentcost/pricing_catalog.hpp"
#include "agentcost/recommendation_tracker.hpp"
#include "agentcost/suggestion_types.hpp"
#include <map>
#include <memory>

namespace agentcost {

struct TypeBreakdown {
    int64_t count = 0;
    double savings = 0.0;
};

struct OptimizationSummary {
    double total_potential_savings_monthly = 0.0;
    double total_potential_savings_percent = 0.0;
    double current_monthly_spend = 0.0;
    int64_t suggestion_count = 0;
    int64_t high_priority_count = 0;
    std::map<std::string, TypeBreakdown> by_type;
    RecommendationEffectiveness effectiveness;
    std::vector<Suggestion> suggestions;          // Top N by savings

    bool has_data = false;
    bool has_baselines = false;
    int64_t event_count = 0;
    // "no_data", "insufficient_data", "no_baselines" or "optimized"; unset
    // whenever there are suggestions
    std::optional<std::string> empty_reason;

    nlohmann::json to_json() const;
};

// Runs the five analyzers over one window and merges them into a single list
// sorted by estimated monthly savings. Read-only: nothing is persisted here.
class SuggestionSynthesizer {
private:
    std::shared_ptr<EventAggregator> aggregator_;
    std::shared_ptr<BaselineComputer> baselines_;
    std::shared_ptr<AnomalyDetector> anomaly_detector_;
    std::shared_ptr<PricingCatalog> pricing_;
    std::shared_ptr<RecommendationTracker> tracker_;
    OptimizerConfig config_;
    Clock clock_;

    struct Synthesis {
        std::vector<Suggestion> suggestions;
        UsageOverview overview;
    };

    Synthesis synthesize(const std::string& project_id, int days, bool include_low_priority);

public:
    SuggestionSynthesizer(std::shared_ptr<EventAggregator> aggregator,
                          std::shared_ptr<BaselineComputer> baselines,
                          std::shared_ptr<AnomalyDetector> anomaly_detector,
                          std::shared_ptr<PricingCatalog> pricing,
                          std::shared_ptr<RecommendationTracker> tracker,
                          OptimizerConfig config = OptimizerConfig{},
                          Clock clock = system_now);

    std::vector<Suggestion> generate_suggestions(const std::string& project_id,
                                                 int days,
                                                 bool include_low_priority = true);

    OptimizationSummary get_summary(const std::string& project_id, int days);

    // Individual analyzers over an already grouped window of `days` days
    std::vector<Suggestion> analyze_model_usage(const std::vector<UsageGroupStats>& groups, int days);
    std::vector<Suggestion> analyze_caching(const std::vector<Event>& events, int days);
    std::vector<Suggestion> analyze_anomalies(const std::string& project_id);
    std::vector<Suggestion> analyze_error_patterns(const std::string& project_id,
                                                   const std::vector<UsageGroupStats>& groups,
                                                   int days);
    std::vector<Suggestion> analyze_latency(const std::string& project_id,
                                            const std::vector<UsageGroupStats>& groups);

    static Priority priority_for_savings(double monthly_savings, const SuggestionConfig& config);

    // Drops low priority entries when asked, then sorts by savings descending
    // keeping the relative order of ties.
    static std::vector<Suggestion> finalize(std::vector<Suggestion> suggestions, bool include_low_priority);
};

} // namespace agentcost
