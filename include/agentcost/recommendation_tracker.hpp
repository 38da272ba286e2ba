#pragma once

#include "agentcost/config.hpp"
#include "agentcost/pricing_catalog.hpp"
#include "agentcost/stores.hpp"
#include "agentcost/suggestion_types.hpp"
#include <memory>

namespace agentcost {

// Lifecycle of persisted recommendations:
//   pending -> implemented | dismissed | expired
// Expiry is lazy: a pending row past expires_at is treated as expired on read
// and flipped when its key is next written.
class RecommendationTracker {
private:
    std::shared_ptr<RecommendationStore> store_;
    std::shared_ptr<PricingCatalog> pricing_;
    RecommendationConfig config_;
    Clock clock_;

public:
    RecommendationTracker(std::shared_ptr<RecommendationStore> store,
                          std::shared_ptr<PricingCatalog> pricing,
                          RecommendationConfig config = RecommendationConfig{},
                          Clock clock = system_now);

    // Persists the suggestion unless its key is still pending or was dismissed
    // inside the cooldown. Returns the stored row, or nullopt when skipped.
    std::optional<Recommendation> create_recommendation(const std::string& project_id,
                                                        const Suggestion& suggestion,
                                                        std::optional<int> cooldown_days = std::nullopt);

    ActionResult mark_implemented(const std::string& recommendation_id, const std::string& project_id);

    ActionResult mark_dismissed(const std::string& recommendation_id,
                                const std::string& project_id,
                                const std::optional<std::string>& feedback = std::nullopt);

    // Measured savings after implementation; model downgrades also feed the
    // pricing catalog's confidence for that model pair.
    ActionResult record_actual_savings(const std::string& recommendation_id,
                                       const std::string& project_id,
                                       double actual_monthly_savings);

    std::vector<Recommendation> get_pending_recommendations(const std::string& project_id);

    RecommendationEffectiveness get_recommendation_effectiveness(const std::string& project_id);

    const RecommendationConfig& config() const { return config_; }

    static std::string generate_uuid();
};

} // namespace agentcost
