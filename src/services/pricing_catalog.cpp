#include "agentcost/pricing_catalog.hpp"
#include "agentcost/rounding.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace agentcost {

nlohmann::json ModelAlternative::to_json() const {
    return {
        {"model", model},
        {"savings", {
            {"input_per_1k", savings.input_per_1k},
            {"output_per_1k", savings.output_per_1k},
            {"percentage", savings.percentage}
        }},
        {"quality_impact", quality_impact},
        {"source", source},
        {"confidence_score", confidence_score},
        {"times_implemented", times_implemented},
        {"savings_accuracy", savings_accuracy ? nlohmann::json(*savings_accuracy) : nlohmann::json(nullptr)}
    };
}

std::string quality_impact_for_tiers(int current_tier, int alternative_tier) {
    int drop = alternative_tier - current_tier;
    if (drop <= 0) return "minimal";
    if (drop == 1) return "moderate";
    return "significant";
}

double confidence_for(const std::string& quality_impact, const LearnedOutcome* outcome) {
    if (outcome && outcome->times_implemented > 0) {
        double base = std::min(0.95, 0.6 + 0.05 * static_cast<double>(outcome->times_implemented));
        auto accuracy = outcome->accuracy();
        if (accuracy && *accuracy > 0.0) {
            // Over- and under-estimates are penalised alike
            double closeness = *accuracy > 1.0 ? 1.0 / *accuracy : *accuracy;
            return round_to(base * closeness, 2);
        }
        return round_to(base, 2);
    }

    if (quality_impact == "minimal") return 0.5;
    if (quality_impact == "moderate") return 0.4;
    return 0.3;
}

std::vector<ModelAlternative> rank_alternatives(const std::vector<ModelPrice>& prices,
                                                const LearnedOutcomes& learned,
                                                const std::string& model,
                                                int64_t avg_input_tokens,
                                                int64_t avg_output_tokens,
                                                int max_results) {
    std::vector<ModelAlternative> alternatives;
    if (max_results <= 0) return alternatives;

    auto current = std::find_if(prices.begin(), prices.end(),
                                [&model](const ModelPrice& p) { return p.model == model; });
    if (current == prices.end()) {
        spdlog::debug("No pricing known for model '{}'", model);
        return alternatives;
    }

    double in_k = static_cast<double>(avg_input_tokens) / 1000.0;
    double out_k = static_cast<double>(avg_output_tokens) / 1000.0;
    double current_call_cost = in_k * current->input_per_1k + out_k * current->output_per_1k;

    for (const auto& candidate : prices) {
        if (candidate.model == model) continue;

        double candidate_call_cost = in_k * candidate.input_per_1k + out_k * candidate.output_per_1k;
        if (candidate_call_cost >= current_call_cost) continue;

        ModelAlternative alt;
        alt.model = candidate.model;
        alt.savings.input_per_1k = current->input_per_1k - candidate.input_per_1k;
        alt.savings.output_per_1k = current->output_per_1k - candidate.output_per_1k;
        alt.savings.percentage = current_call_cost > 0.0
            ? round_percent((current_call_cost - candidate_call_cost) / current_call_cost * 100.0)
            : 0.0;
        alt.quality_impact = quality_impact_for_tiers(current->tier, candidate.tier);

        auto it = learned.find({model, candidate.model});
        const LearnedOutcome* outcome = it != learned.end() ? &it->second : nullptr;
        alt.source = (outcome && outcome->times_implemented > 0) ? "learned" : "dynamic";
        alt.confidence_score = confidence_for(alt.quality_impact, outcome);
        alt.times_implemented = outcome ? outcome->times_implemented : 0;
        alt.savings_accuracy = outcome ? outcome->accuracy() : std::nullopt;

        alternatives.push_back(std::move(alt));
    }

    std::stable_sort(alternatives.begin(), alternatives.end(),
                     [](const ModelAlternative& a, const ModelAlternative& b) {
                         return a.savings.percentage > b.savings.percentage;
                     });

    if (alternatives.size() > static_cast<size_t>(max_results)) {
        alternatives.resize(static_cast<size_t>(max_results));
    }
    return alternatives;
}

PriceTableCatalog::PriceTableCatalog(std::vector<ModelPrice> prices)
    : prices_(std::move(prices)) {
}

void PriceTableCatalog::set_price(const ModelPrice& price) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& existing : prices_) {
        if (existing.model == price.model) {
            existing = price;
            return;
        }
    }
    prices_.push_back(price);
}

std::vector<ModelAlternative> PriceTableCatalog::discover_alternatives(const std::string& model,
                                                                       int64_t avg_input_tokens,
                                                                       int64_t avg_output_tokens,
                                                                       int max_results) {
    std::lock_guard<std::mutex> lock(mutex_);
    return rank_alternatives(prices_, learned_outcomes(), model, avg_input_tokens, avg_output_tokens, max_results);
}

LearnedOutcomes PriceTableCatalog::learned_outcomes() const {
    LearnedOutcomes learned;
    for (const auto& entry : measurements_) {
        const auto& measured = entry.second;
        auto& outcome = learned[{measured.model, measured.alternative_model}];
        outcome.times_implemented++;
        outcome.measured_count++;
        outcome.total_estimated += measured.estimated_monthly_savings;
        outcome.total_actual += measured.actual_monthly_savings;
    }
    return learned;
}

void PriceTableCatalog::record_outcome(const std::string& recommendation_id,
                                       const std::string& model,
                                       const std::string& alternative_model,
                                       double estimated_monthly_savings,
                                       double actual_monthly_savings) {
    std::lock_guard<std::mutex> lock(mutex_);
    measurements_[recommendation_id] = MeasuredSwitch{
        model, alternative_model, estimated_monthly_savings, actual_monthly_savings
    };
}

} // namespace agentcost
