#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace agentcost {

// Price deltas are current minus alternative, in $ per 1k tokens.
struct AlternativeSavings {
    double input_per_1k = 0.0;
    double output_per_1k = 0.0;
    double percentage = 0.0;   // Per-call cost reduction for the given token profile
};

struct ModelAlternative {
    std::string model;
    AlternativeSavings savings;
    std::string quality_impact;   // "minimal", "moderate", "significant"
    std::string source;           // "learned" once implementations were measured, else "dynamic"
    double confidence_score = 0.0;
    int64_t times_implemented = 0;
    std::optional<double> savings_accuracy;

    nlohmann::json to_json() const;
};

struct ModelPrice {
    std::string model;
    std::string provider;
    double input_per_1k = 0.0;
    double output_per_1k = 0.0;
    int tier = 1;                 // 1 = flagship, larger = smaller/cheaper class
};

// Measured results of switching model -> alternative
struct LearnedOutcome {
    int64_t times_implemented = 0;
    int64_t measured_count = 0;
    double total_estimated = 0.0;
    double total_actual = 0.0;

    std::optional<double> accuracy() const {
        if (measured_count == 0 || total_estimated <= 0.0) return std::nullopt;
        return total_actual / total_estimated;
    }
};

using LearnedOutcomes = std::map<std::pair<std::string, std::string>, LearnedOutcome>;

class PricingCatalog {
public:
    virtual ~PricingCatalog() = default;

    // Cheaper alternatives for the token profile, best savings first.
    virtual std::vector<ModelAlternative> discover_alternatives(const std::string& model,
                                                                int64_t avg_input_tokens,
                                                                int64_t avg_output_tokens,
                                                                int max_results) = 0;

    // Feedback from a measured implementation. A later call for the same
    // recommendation replaces its earlier figure.
    virtual void record_outcome(const std::string& recommendation_id,
                                const std::string& model,
                                const std::string& alternative_model,
                                double estimated_monthly_savings,
                                double actual_monthly_savings) = 0;
};

std::string quality_impact_for_tiers(int current_tier, int alternative_tier);

double confidence_for(const std::string& quality_impact, const LearnedOutcome* outcome);

// Shared ranking used by every catalog implementation.
std::vector<ModelAlternative> rank_alternatives(const std::vector<ModelPrice>& prices,
                                                const LearnedOutcomes& learned,
                                                const std::string& model,
                                                int64_t avg_input_tokens,
                                                int64_t avg_output_tokens,
                                                int max_results);

// In-memory price table.
class PriceTableCatalog : public PricingCatalog {
private:
    struct MeasuredSwitch {
        std::string model;
        std::string alternative_model;
        double estimated_monthly_savings = 0.0;
        double actual_monthly_savings = 0.0;
    };

    std::vector<ModelPrice> prices_;
    std::map<std::string, MeasuredSwitch> measurements_;   // By recommendation id
    mutable std::mutex mutex_;

    LearnedOutcomes learned_outcomes() const;

public:
    PriceTableCatalog() = default;
    explicit PriceTableCatalog(std::vector<ModelPrice> prices);

    void set_price(const ModelPrice& price);

    std::vector<ModelAlternative> discover_alternatives(const std::string& model,
                                                        int64_t avg_input_tokens,
                                                        int64_t avg_output_tokens,
                                                        int max_results) override;

    void record_outcome(const std::string& recommendation_id,
                        const std::string& model,
                        const std::string& alternative_model,
                        double estimated_monthly_savings,
                        double actual_monthly_savings) override;
};

} // namespace agentcost
