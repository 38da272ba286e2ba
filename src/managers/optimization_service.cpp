#include "agentcost/optimization_service.hpp"
#include "agentcost/rounding.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace agentcost {

OptimizationService::OptimizationService(std::shared_ptr<EventStore> event_store,
                                         std::shared_ptr<BaselineStore> baseline_store,
                                         std::shared_ptr<RecommendationStore> recommendation_store,
                                         std::shared_ptr<PricingCatalog> pricing,
                                         OptimizerConfig config,
                                         Clock clock)
    : config_(config) {
    aggregator_ = std::make_shared<EventAggregator>(std::move(event_store));
    baselines_ = std::make_shared<BaselineComputer>(aggregator_, baseline_store, config_.baseline, clock);
    anomaly_detector_ = std::make_shared<AnomalyDetector>(aggregator_, baseline_store, config_.anomaly, clock);
    pattern_analyzer_ = std::make_shared<PatternAnalyzer>(aggregator_, config_.pattern, clock);
    tracker_ = std::make_shared<RecommendationTracker>(std::move(recommendation_store), pricing,
                                                       config_.recommendation, clock);
    synthesizer_ = std::make_shared<SuggestionSynthesizer>(aggregator_, baselines_, anomaly_detector_,
                                                           std::move(pricing), tracker_, config_, clock);
}

int OptimizationService::clamp_days(int days, int min_days, int max_days) {
    return std::max(min_days, std::min(days, max_days));
}

nlohmann::json OptimizationService::action_to_json(const ActionResult& result) {
    nlohmann::json response = {
        {"success", result.ok()},
        {"status", to_string(result.status)}
    };
    if (result.recommendation) {
        response["recommendation"] = result.recommendation->to_json();
    }
    if (result.status == ActionStatus::NotFound) {
        response["error"] = "Recommendation not found";
    } else if (result.status == ActionStatus::Unavailable) {
        response["error"] = "Recommendation is no longer pending";
    }
    return response;
}

nlohmann::json OptimizationService::get_suggestions(const std::string& project_id,
                                                    int days,
                                                    bool include_low_priority,
                                                    bool persist) {
    days = clamp_days(days, kMinDays, kMaxDays);
    auto suggestions = synthesizer_->generate_suggestions(project_id, days, include_low_priority);

    if (persist) {
        size_t limit = std::min(suggestions.size(),
                                static_cast<size_t>(std::max(0, config_.recommendation.max_persisted)));
        int created = 0;
        for (size_t i = 0; i < limit; ++i) {
            if (tracker_->create_recommendation(project_id, suggestions[i])) ++created;
        }
        if (created > 0) {
            spdlog::info("Persisted {} new recommendations for project {}", created, project_id);
        }
    }

    nlohmann::json response = nlohmann::json::array();
    for (const auto& s : suggestions) {
        response.push_back(s.to_json());
    }
    return response;
}

nlohmann::json OptimizationService::get_summary(const std::string& project_id, int days) {
    days = clamp_days(days, kMinDays, kMaxDays);
    return synthesizer_->get_summary(project_id, days).to_json();
}

nlohmann::json OptimizationService::compute_baselines(const std::string& project_id, int days) {
    days = clamp_days(days, kMinBaselineDays, kMaxDays);
    return baselines_->compute_baselines(project_id, days).to_json();
}

nlohmann::json OptimizationService::get_baselines(const std::string& project_id,
                                                  const std::optional<std::string>& agent_name,
                                                  const std::optional<std::string>& model) {
    nlohmann::json response = nlohmann::json::array();
    for (const auto& b : baselines_->list_baselines(project_id, agent_name, model)) {
        response.push_back(b.to_json());
    }
    return response;
}

nlohmann::json OptimizationService::get_caching_opportunities(const std::string& project_id, int min_occurrences) {
    min_occurrences = std::max(kMinOccurrences, min_occurrences);

    auto opportunities = pattern_analyzer_->analyze_caching_opportunities(
        project_id, min_occurrences, config_.pattern.min_savings, config_.pattern.window_days);

    double total = 0.0;
    nlohmann::json items = nlohmann::json::array();
    for (const auto& opp : opportunities) {
        total += opp.estimated_monthly_savings;
        items.push_back(opp.to_json());
    }

    return {
        {"opportunities", items},
        {"total_potential_monthly_savings", round_money(total)}
    };
}

nlohmann::json OptimizationService::detect_anomalies(const std::string& project_id, bool only_anomalies) {
    nlohmann::json response = nlohmann::json::array();
    for (const auto& a : anomaly_detector_->detect_anomalies(project_id)) {
        if (only_anomalies && !a.is_anomaly) continue;
        response.push_back(a.to_json());
    }
    return response;
}

nlohmann::json OptimizationService::list_pending_recommendations(const std::string& project_id) {
    nlohmann::json response = nlohmann::json::array();
    for (const auto& rec : tracker_->get_pending_recommendations(project_id)) {
        response.push_back(rec.to_json());
    }
    return response;
}

nlohmann::json OptimizationService::implement_recommendation(const std::string& recommendation_id,
                                                             const std::string& project_id) {
    return action_to_json(tracker_->mark_implemented(recommendation_id, project_id));
}

nlohmann::json OptimizationService::dismiss_recommendation(const std::string& recommendation_id,
                                                           const std::string& project_id,
                                                           const std::optional<std::string>& feedback) {
    return action_to_json(tracker_->mark_dismissed(recommendation_id, project_id, feedback));
}

nlohmann::json OptimizationService::record_actual_savings(const std::string& recommendation_id,
                                                          const std::string& project_id,
                                                          double actual_monthly_savings) {
    return action_to_json(tracker_->record_actual_savings(recommendation_id, project_id, actual_monthly_savings));
}

nlohmann::json OptimizationService::get_recommendation_effectiveness(const std::string& project_id) {
    return tracker_->get_recommendation_effectiveness(project_id).to_json();
}

} // namespace agentcost
