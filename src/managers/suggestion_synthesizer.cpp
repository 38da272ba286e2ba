#include "agentcost/suggestion_synthesizer.hpp"
#include "agentcost/action_items.hpp"
#include "agentcost/rounding.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iterator>

namespace agentcost {

nlohmann::json OptimizationSummary::to_json() const {
    nlohmann::json types = nlohmann::json::object();
    for (const auto& entry : by_type) {
        types[entry.first] = {
            {"count", entry.second.count},
            {"savings", round_money(entry.second.savings)}
        };
    }

    nlohmann::json top = nlohmann::json::array();
    for (const auto& s : suggestions) {
        top.push_back(s.to_json());
    }

    return {
        {"total_potential_savings_monthly", round_money(total_potential_savings_monthly)},
        {"total_potential_savings_percent", round_percent(total_potential_savings_percent)},
        {"current_monthly_spend", round_money(current_monthly_spend)},
        {"suggestion_count", suggestion_count},
        {"high_priority_count", high_priority_count},
        {"by_type", types},
        {"effectiveness", effectiveness.to_json()},
        {"suggestions", top},
        {"has_data", has_data},
        {"has_baselines", has_baselines},
        {"event_count", event_count},
        {"empty_reason", empty_reason ? nlohmann::json(*empty_reason) : nlohmann::json(nullptr)}
    };
}

SuggestionSynthesizer::SuggestionSynthesizer(std::shared_ptr<EventAggregator> aggregator,
                                             std::shared_ptr<BaselineComputer> baselines,
                                             std::shared_ptr<AnomalyDetector> anomaly_detector,
                                             std::shared_ptr<PricingCatalog> pricing,
                                             std::shared_ptr<RecommendationTracker> tracker,
                                             OptimizerConfig config,
                                             Clock clock)
    : aggregator_(std::move(aggregator)),
      baselines_(std::move(baselines)),
      anomaly_detector_(std::move(anomaly_detector)),
      pricing_(std::move(pricing)),
      tracker_(std::move(tracker)),
      config_(config),
      clock_(std::move(clock)) {
}

Priority SuggestionSynthesizer::priority_for_savings(double monthly_savings, const SuggestionConfig& config) {
    if (monthly_savings >= config.high_priority_savings) return Priority::High;
    if (monthly_savings >= config.medium_priority_savings) return Priority::Medium;
    return Priority::Low;
}

std::vector<Suggestion> SuggestionSynthesizer::finalize(std::vector<Suggestion> suggestions, bool include_low_priority) {
    if (!include_low_priority) {
        suggestions.erase(std::remove_if(suggestions.begin(), suggestions.end(),
                                         [](const Suggestion& s) { return s.priority == Priority::Low; }),
                          suggestions.end());
    }
    std::stable_sort(suggestions.begin(), suggestions.end(), [](const Suggestion& a, const Suggestion& b) {
        return a.estimated_savings_monthly > b.estimated_savings_monthly;
    });
    return suggestions;
}

// ----------------------------------------------------------------------------
// Model downgrade
// ----------------------------------------------------------------------------

std::vector<Suggestion> SuggestionSynthesizer::analyze_model_usage(const std::vector<UsageGroupStats>& groups, int days) {
    std::vector<Suggestion> suggestions;
    if (days <= 0 || !pricing_) return suggestions;

    const auto& cfg = config_.suggestion;

    for (const auto& group : groups) {
        if (group.call_count < cfg.min_calls || group.total_cost < cfg.min_group_cost) continue;

        std::vector<ModelAlternative> alternatives;
        try {
            alternatives = pricing_->discover_alternatives(group.model,
                                                           static_cast<int64_t>(group.input_tokens.mean),
                                                           static_cast<int64_t>(group.output_tokens.mean),
                                                           cfg.max_alternatives);
        } catch (const std::exception& e) {
            spdlog::warn("Pricing lookup failed for {} ({}): {}", group.model, group.agent_name, e.what());
            continue;
        }

        // First alternative with positive savings over this window's token volume
        const ModelAlternative* chosen = nullptr;
        double period_savings = 0.0;
        for (const auto& alt : alternatives) {
            double savings = static_cast<double>(group.total_input_tokens) / 1000.0 * alt.savings.input_per_1k +
                             static_cast<double>(group.total_output_tokens) / 1000.0 * alt.savings.output_per_1k;
            if (savings > 0.0) {
                chosen = &alt;
                period_savings = savings;
                break;
            }
        }
        if (!chosen) continue;

        double monthly_savings = period_savings * 30.0 / days;
        if (monthly_savings < cfg.min_actionable_savings) {
            spdlog::debug("Downgrade {} -> {} for {} below floor: ${:.2f}/month",
                          group.model, chosen->model, group.agent_name, monthly_savings);
            continue;
        }

        double monthly_cost = group.total_cost * 30.0 / days;
        double savings_percent = monthly_cost > 0.0 ? monthly_savings / monthly_cost * 100.0 : 0.0;

        ModelDowngradeMetrics metrics;
        metrics.current_calls = group.call_count;
        metrics.current_monthly_cost = round_money(monthly_cost);
        metrics.avg_output_tokens = round_to(group.output_tokens.mean, 1);
        metrics.avg_input_tokens = round_to(group.input_tokens.mean, 1);
        metrics.savings_percentage = chosen->savings.percentage;
        metrics.quality_impact = chosen->quality_impact;
        metrics.source = chosen->source;
        metrics.confidence_score = chosen->confidence_score;
        metrics.times_implemented = chosen->times_implemented;
        metrics.savings_accuracy = chosen->savings_accuracy;

        Suggestion s;
        s.type = SuggestionType::ModelDowngrade;
        s.title = fmt::format("Consider {} for {}", chosen->model, group.agent_name);
        s.description = fmt::format(
            "Agent '{}' uses {} with average output of {:.0f} tokens. Switching to {} could reduce costs.",
            group.agent_name, group.model, group.output_tokens.mean, chosen->model);
        s.agent_name = group.agent_name;
        s.model = group.model;
        s.alternative_model = chosen->model;
        s.estimated_savings_monthly = round_money(monthly_savings);
        s.estimated_savings_percent = round_percent(savings_percent);
        s.priority = priority_for_savings(monthly_savings, cfg);
        s.action_items = build_model_switch_actions(group.agent_name, group.model, chosen->model,
                                                    monthly_savings, chosen->quality_impact, group.call_count);
        s.metrics = metrics;
        suggestions.push_back(std::move(s));
    }

    return suggestions;
}

// ----------------------------------------------------------------------------
// Caching
// ----------------------------------------------------------------------------

std::vector<Suggestion> SuggestionSynthesizer::analyze_caching(const std::vector<Event>& events, int days) {
    std::vector<Suggestion> suggestions;
    const auto& cfg = config_.suggestion;

    for (const auto& opp : PatternAnalyzer::analyze(events, config_.pattern.min_occurrences,
                                                    config_.pattern.min_savings, days)) {
        CachingMetrics metrics;
        metrics.unique_patterns = opp.unique_patterns;
        metrics.total_calls = opp.total_calls;
        metrics.duplicate_calls = opp.duplicate_calls;
        metrics.duplicate_rate = round_percent(opp.duplicate_rate);

        Suggestion s;
        s.type = SuggestionType::Caching;
        s.title = fmt::format("Add caching for {}", opp.agent_name);
        s.description = fmt::format(
            "Agent '{}' has {:.1f}% duplicate queries. Implementing response caching could save "
            "approximately ${:.2f}/month based on observed patterns.",
            opp.agent_name, opp.duplicate_rate, opp.estimated_monthly_savings);
        s.agent_name = opp.agent_name;
        s.estimated_savings_monthly = round_money(opp.estimated_monthly_savings);
        s.estimated_savings_percent = round_percent(opp.duplicate_rate);
        s.priority = priority_for_savings(opp.estimated_monthly_savings, cfg);
        s.action_items = build_caching_actions(opp.agent_name, opp.duplicate_rate,
                                               opp.unique_patterns, opp.duplicate_calls);
        s.metrics = metrics;
        suggestions.push_back(std::move(s));
    }

    return suggestions;
}

// ----------------------------------------------------------------------------
// Anomaly alerts
// ----------------------------------------------------------------------------

std::vector<Suggestion> SuggestionSynthesizer::analyze_anomalies(const std::string& project_id) {
    std::vector<Suggestion> suggestions;
    if (!anomaly_detector_) return suggestions;

    for (const auto& anomaly : anomaly_detector_->detect_anomalies(project_id, config_.anomaly.recent_hours)) {
        if (!anomaly.is_anomaly) continue;

        std::string context = fmt::format("{} ({})", anomaly.agent_name, anomaly.model);
        std::string direction = anomaly.z_score > 0 ? "higher" : "lower";
        std::string kind;
        std::string description;

        if (anomaly.metric_name == "cost_per_call") {
            kind = "cost";
            description = fmt::format(
                "Cost per call is {:.1f} standard deviations {} than normal for {}. Current: ${:.4f}, Baseline: ${:.4f}",
                std::fabs(anomaly.z_score), direction, context, anomaly.current_value, anomaly.baseline_mean);
        } else if (anomaly.metric_name == "latency_ms") {
            kind = "latency";
            description = fmt::format(
                "Latency is {:.1f} standard deviations {} than normal for {}. Current: {:.0f}ms, Baseline: {:.0f}ms",
                std::fabs(anomaly.z_score), direction, context, anomaly.current_value, anomaly.baseline_mean);
        } else if (anomaly.metric_name == "error_rate") {
            kind = "error";
            description = fmt::format(
                "Error rate is elevated for {}. Current: {:.1f}%, Baseline: {:.1f}%",
                context, anomaly.current_value * 100.0, anomaly.baseline_mean * 100.0);
        } else {
            continue;
        }

        AnomalyMetrics metrics;
        metrics.metric_name = anomaly.metric_name;
        metrics.current_value = round_to(anomaly.current_value, 4);
        metrics.baseline_mean = round_to(anomaly.baseline_mean, 4);
        metrics.baseline_stddev = round_to(anomaly.baseline_stddev, 4);
        metrics.z_score = round_to(anomaly.z_score, 2);

        Suggestion s;
        s.type = SuggestionType::AnomalyAlert;
        s.title = fmt::format("Anomaly detected: {} for {}", kind, context);
        s.description = description;
        s.agent_name = anomaly.agent_name;
        s.model = anomaly.model;
        s.priority = parse_priority(anomaly.severity).value_or(Priority::Medium);
        s.action_items = build_anomaly_actions(kind, context, anomaly.z_score,
                                               anomaly.current_value, anomaly.baseline_mean);
        s.metrics = metrics;
        suggestions.push_back(std::move(s));
    }

    return suggestions;
}

// ----------------------------------------------------------------------------
// Error reduction
// ----------------------------------------------------------------------------

std::vector<Suggestion> SuggestionSynthesizer::analyze_error_patterns(const std::string& project_id,
                                                                      const std::vector<UsageGroupStats>& groups,
                                                                      int days) {
    std::vector<Suggestion> suggestions;
    if (days <= 0) return suggestions;

    const auto& cfg = config_.suggestion;

    for (const auto& group : groups) {
        if (group.call_count < cfg.min_calls || group.error_count < cfg.min_error_count) continue;

        double error_rate = group.error_rate();
        auto baseline = baselines_ ? baselines_->get_baseline(project_id, group.agent_name, group.model)
                                   : std::nullopt;
        double baseline_error_rate = baseline ? baseline->avg_error_rate : cfg.default_error_rate;

        if (error_rate <= baseline_error_rate * cfg.error_rate_multiplier) continue;

        double monthly_wasted = group.failed_cost * 30.0 / days;
        if (monthly_wasted < cfg.min_monthly_waste) continue;

        ErrorReductionMetrics metrics;
        metrics.total_calls = group.call_count;
        metrics.error_count = group.error_count;
        metrics.error_rate = round_to(error_rate * 100.0, 2);
        metrics.baseline_error_rate = round_to(baseline_error_rate * 100.0, 2);
        metrics.wasted_cost = round_to(group.failed_cost, 4);

        Suggestion s;
        s.type = SuggestionType::ErrorReduction;
        s.title = fmt::format("Reduce errors in {}", group.agent_name);
        s.description = fmt::format(
            "Agent '{}' using {} has {:.1f}% error rate (baseline: {:.1f}%), wasting ${:.2f}/month on failed calls.",
            group.agent_name, group.model, error_rate * 100.0, baseline_error_rate * 100.0, monthly_wasted);
        s.agent_name = group.agent_name;
        s.model = group.model;
        s.estimated_savings_monthly = round_money(monthly_wasted);
        s.estimated_savings_percent = round_percent(error_rate * 100.0);
        s.priority = priority_for_savings(monthly_wasted, cfg);
        s.action_items = build_error_actions(group.agent_name, group.model, error_rate,
                                             baseline_error_rate, group.error_count, monthly_wasted);
        s.metrics = metrics;
        suggestions.push_back(std::move(s));
    }

    return suggestions;
}

// ----------------------------------------------------------------------------
// Latency
// ----------------------------------------------------------------------------

std::vector<Suggestion> SuggestionSynthesizer::analyze_latency(const std::string& project_id,
                                                               const std::vector<UsageGroupStats>& groups) {
    std::vector<Suggestion> suggestions;
    if (!baselines_) return suggestions;

    const auto& cfg = config_.suggestion;

    for (const auto& group : groups) {
        if (group.call_count < cfg.min_calls) continue;

        auto baseline = baselines_->get_baseline(project_id, group.agent_name, group.model);
        if (!baseline || baseline->stddev_latency_ms <= 0.0) continue;

        double avg_latency = group.latency_ms.mean;
        double z_score = (avg_latency - baseline->avg_latency_ms) / baseline->stddev_latency_ms;
        if (z_score < cfg.latency_z_threshold) continue;

        LatencyMetrics metrics;
        metrics.avg_latency_ms = round_to(avg_latency, 0);
        metrics.baseline_latency_ms = round_to(baseline->avg_latency_ms, 0);
        metrics.z_score = round_to(z_score, 2);
        metrics.avg_input_tokens = round_to(group.input_tokens.mean, 0);

        Suggestion s;
        s.type = SuggestionType::PromptOptimization;
        s.title = fmt::format("Optimize prompts for {}", group.agent_name);
        s.description = fmt::format(
            "Agent '{}' has elevated latency ({:.0f}ms vs {:.0f}ms baseline) with {:.0f} average input tokens. "
            "Consider shortening prompts or using streaming.",
            group.agent_name, avg_latency, baseline->avg_latency_ms, group.input_tokens.mean);
        s.agent_name = group.agent_name;
        s.model = group.model;
        s.priority = z_score > cfg.latency_high_z ? Priority::High : Priority::Medium;
        s.action_items = build_latency_actions(group.agent_name, group.model, avg_latency,
                                               baseline->avg_latency_ms, group.input_tokens.mean, z_score);
        s.metrics = metrics;
        suggestions.push_back(std::move(s));
    }

    return suggestions;
}

// ----------------------------------------------------------------------------
// Assembly
// ----------------------------------------------------------------------------

SuggestionSynthesizer::Synthesis SuggestionSynthesizer::synthesize(const std::string& project_id,
                                                                   int days,
                                                                   bool include_low_priority) {
    Synthesis synthesis;
    if (days <= 0) return synthesis;

    // Anomaly and latency analysis need baselines; bootstrap them once
    if (baselines_) {
        baselines_->ensure_baselines_exist(project_id, days);
    }

    TimePoint now = clock_();
    auto events = aggregator_->fetch(project_id, days_before(now, days), now);
    auto groups = EventAggregator::group_by_agent_model(events);
    synthesis.overview = EventAggregator::overview(events);

    std::vector<Suggestion> all;
    auto append = [&all](std::vector<Suggestion> part) {
        all.insert(all.end(), std::make_move_iterator(part.begin()), std::make_move_iterator(part.end()));
    };

    append(analyze_model_usage(groups, days));
    append(analyze_caching(events, days));
    append(analyze_anomalies(project_id));
    append(analyze_error_patterns(project_id, groups, days));
    append(analyze_latency(project_id, groups));

    synthesis.suggestions = finalize(std::move(all), include_low_priority);

    spdlog::debug("Generated {} suggestions for project {} over {} days ({} events)",
                  synthesis.suggestions.size(), project_id, days, events.size());
    return synthesis;
}

std::vector<Suggestion> SuggestionSynthesizer::generate_suggestions(const std::string& project_id,
                                                                    int days,
                                                                    bool include_low_priority) {
    return synthesize(project_id, days, include_low_priority).suggestions;
}

OptimizationSummary SuggestionSynthesizer::get_summary(const std::string& project_id, int days) {
    OptimizationSummary summary;
    auto synthesis = synthesize(project_id, days, true);
    const auto& suggestions = synthesis.suggestions;

    for (const auto& s : suggestions) {
        summary.total_potential_savings_monthly += s.estimated_savings_monthly;
        if (s.priority == Priority::High) summary.high_priority_count++;
        auto& breakdown = summary.by_type[to_string(s.type)];
        breakdown.count++;
        breakdown.savings += s.estimated_savings_monthly;
    }

    if (days > 0) {
        summary.current_monthly_spend = synthesis.overview.total_cost * 30.0 / days;
    }
    if (summary.current_monthly_spend > 0.0) {
        summary.total_potential_savings_percent =
            summary.total_potential_savings_monthly / summary.current_monthly_spend * 100.0;
    }

    summary.suggestion_count = static_cast<int64_t>(suggestions.size());
    if (tracker_) {
        summary.effectiveness = tracker_->get_recommendation_effectiveness(project_id);
    }

    size_t top_n = static_cast<size_t>(std::max(0, config_.suggestion.summary_top_n));
    summary.suggestions.assign(suggestions.begin(),
                               suggestions.begin() + static_cast<std::ptrdiff_t>(std::min(top_n, suggestions.size())));

    summary.event_count = synthesis.overview.total_calls;
    summary.has_data = summary.event_count > 0;
    summary.has_baselines = baselines_ && baselines_->has_baselines(project_id);

    if (suggestions.empty()) {
        if (!summary.has_data) {
            summary.empty_reason = "no_data";
        } else if (!summary.has_baselines && summary.event_count < config_.baseline.min_samples) {
            summary.empty_reason = "insufficient_data";
        } else if (!summary.has_baselines) {
            summary.empty_reason = "no_baselines";
        } else {
            summary.empty_reason = "optimized";
        }
    }

    return summary;
}

} // namespace agentcost
