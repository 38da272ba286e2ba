#pragma once

#include "agentcost/anomaly_detector.hpp"
#include "agentcost/baseline_computer.hpp"
#include "agentcost/config.hpp"
#include "agentcost/event_aggregator.hpp"
#include "agentcost/pattern_analyzer.hpp"
#include "agentcost/pricing_catalog.hpp"
#include "agentcost/recommendation_tracker.hpp"
#include "agentcost/suggestion_synthesizer.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace agentcost {

// Entry point for the API layer. Wires the analyzers over one set of stores
// and returns JSON payloads. Out-of-range windows are clamped, not rejected.
class OptimizationService {
private:
    OptimizerConfig config_;
    std::shared_ptr<EventAggregator> aggregator_;
    std::shared_ptr<BaselineComputer> baselines_;
    std::shared_ptr<AnomalyDetector> anomaly_detector_;
    std::shared_ptr<PatternAnalyzer> pattern_analyzer_;
    std::shared_ptr<RecommendationTracker> tracker_;
    std::shared_ptr<SuggestionSynthesizer> synthesizer_;

    static nlohmann::json action_to_json(const ActionResult& result);

public:
    static constexpr int kMinDays = 1;
    static constexpr int kMinBaselineDays = 7;
    static constexpr int kMaxDays = 90;
    static constexpr int kMinOccurrences = 2;

    OptimizationService(std::shared_ptr<EventStore> event_store,
                        std::shared_ptr<BaselineStore> baseline_store,
                        std::shared_ptr<RecommendationStore> recommendation_store,
                        std::shared_ptr<PricingCatalog> pricing,
                        OptimizerConfig config = OptimizerConfig{},
                        Clock clock = system_now);

    // Suggestions sorted by savings. Read-only unless persist=true, which also
    // records the top ones as recommendations.
    nlohmann::json get_suggestions(const std::string& project_id,
                                   int days = 30,
                                   bool include_low_priority = true,
                                   bool persist = false);

    nlohmann::json get_summary(const std::string& project_id, int days = 30);

    nlohmann::json compute_baselines(const std::string& project_id, int days = 30);

    nlohmann::json get_baselines(const std::string& project_id,
                                 const std::optional<std::string>& agent_name = std::nullopt,
                                 const std::optional<std::string>& model = std::nullopt);

    nlohmann::json get_caching_opportunities(const std::string& project_id, int min_occurrences = 5);

    nlohmann::json detect_anomalies(const std::string& project_id, bool only_anomalies = true);

    nlohmann::json list_pending_recommendations(const std::string& project_id);
    nlohmann::json implement_recommendation(const std::string& recommendation_id, const std::string& project_id);
    nlohmann::json dismiss_recommendation(const std::string& recommendation_id,
                                          const std::string& project_id,
                                          const std::optional<std::string>& feedback = std::nullopt);
    nlohmann::json record_actual_savings(const std::string& recommendation_id,
                                         const std::string& project_id,
                                         double actual_monthly_savings);
    nlohmann::json get_recommendation_effectiveness(const std::string& project_id);

    static int clamp_days(int days, int min_days, int max_days);
};

} // namespace agentcost
