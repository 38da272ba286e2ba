#include "agentcost/recommendation_tracker.hpp"
#include <spdlog/spdlog.h>
#include <array>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace agentcost {

RecommendationTracker::RecommendationTracker(std::shared_ptr<RecommendationStore> store,
                                             std::shared_ptr<PricingCatalog> pricing,
                                             RecommendationConfig config,
                                             Clock clock)
    : store_(std::move(store)),
      pricing_(std::move(pricing)),
      config_(config),
      clock_(std::move(clock)) {
}

// UUIDv7: 48-bit ms timestamp, 12-bit sequence, 62 random bits. Ids created in
// the same process sort by creation time.
std::string RecommendationTracker::generate_uuid() {
    static std::mutex uuid_mutex;
    static uint64_t last_ms = 0;
    static uint16_t sequence = 0;
    static std::random_device rd;
    static std::mt19937_64 gen(rd());

    std::lock_guard<std::mutex> lock(uuid_mutex);

    uint64_t current_ms = static_cast<uint64_t>(to_epoch_ms(system_now()));
    if (current_ms <= last_ms) {
        sequence++;
    } else {
        last_ms = current_ms;
        sequence = 0;
    }

    std::array<uint8_t, 16> bytes;
    for (int i = 0; i < 6; ++i) {
        bytes[i] = static_cast<uint8_t>((last_ms >> (40 - 8 * i)) & 0xFF);
    }

    uint16_t seq = sequence & 0x0FFF;
    bytes[6] = static_cast<uint8_t>(0x70 | (seq >> 8));
    bytes[7] = static_cast<uint8_t>(seq & 0xFF);

    uint64_t rand_data = gen();
    bytes[8] = static_cast<uint8_t>(0x80 | ((rand_data >> 56) & 0x3F));
    for (int i = 9; i < 16; ++i) {
        bytes[i] = static_cast<uint8_t>((rand_data >> (8 * (15 - i))) & 0xFF);
    }

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
        ss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return ss.str();
}

std::optional<Recommendation> RecommendationTracker::create_recommendation(const std::string& project_id,
                                                                           const Suggestion& suggestion,
                                                                           std::optional<int> cooldown_days) {
    if (suggestion.estimated_savings_monthly < config_.min_savings) {
        spdlog::debug("Not persisting {} suggestion for {}: ${:.2f}/month below floor",
                      to_string(suggestion.type), project_id, suggestion.estimated_savings_monthly);
        return std::nullopt;
    }

    int cooldown = cooldown_days.value_or(config_.cooldown_days);
    if (cooldown <= 0) cooldown = config_.cooldown_days;

    TimePoint now = clock_();

    Recommendation rec;
    rec.id = generate_uuid();
    rec.project_id = project_id;
    rec.type = to_string(suggestion.type);
    rec.title = suggestion.title;
    rec.description = suggestion.description;
    rec.agent_name = suggestion.agent_name;
    rec.model = suggestion.model;
    rec.alternative_model = suggestion.alternative_model;
    rec.estimated_monthly_savings = suggestion.estimated_savings_monthly;
    rec.estimated_savings_percent = suggestion.estimated_savings_percent;
    rec.metrics_snapshot = metrics_to_json(suggestion.metrics);
    rec.status = RecommendationStatus::Pending;
    rec.created_at = now;
    rec.expires_at = days_after(now, cooldown);

    auto created = store_->create_if_absent(rec, now, days_before(now, cooldown));
    if (created) {
        spdlog::info("Created {} recommendation {} for project {} (${:.2f}/month)",
                     created->type, created->id, project_id, created->estimated_monthly_savings);
    }
    return created;
}

ActionResult RecommendationTracker::mark_implemented(const std::string& recommendation_id,
                                                     const std::string& project_id) {
    auto result = store_->transition(recommendation_id, project_id, RecommendationStatus::Implemented,
                                     clock_(), std::nullopt);
    if (!result.ok()) {
        spdlog::debug("Implement {} for project {}: {}", recommendation_id, project_id, to_string(result.status));
    }
    return result;
}

ActionResult RecommendationTracker::mark_dismissed(const std::string& recommendation_id,
                                                   const std::string& project_id,
                                                   const std::optional<std::string>& feedback) {
    auto result = store_->transition(recommendation_id, project_id, RecommendationStatus::Dismissed,
                                     clock_(), feedback);
    if (!result.ok()) {
        spdlog::debug("Dismiss {} for project {}: {}", recommendation_id, project_id, to_string(result.status));
    }
    return result;
}

ActionResult RecommendationTracker::record_actual_savings(const std::string& recommendation_id,
                                                          const std::string& project_id,
                                                          double actual_monthly_savings) {
    auto result = store_->set_actual_savings(recommendation_id, project_id, actual_monthly_savings);
    if (!result.ok() || !result.recommendation) return result;

    const auto& rec = *result.recommendation;
    if (pricing_ && rec.type == to_string(SuggestionType::ModelDowngrade) &&
        rec.model && rec.alternative_model) {
        pricing_->record_outcome(rec.id, *rec.model, *rec.alternative_model,
                                 rec.estimated_monthly_savings, actual_monthly_savings);
    }

    spdlog::info("Recorded actual savings ${:.2f}/month for recommendation {} (estimated ${:.2f})",
                 actual_monthly_savings, recommendation_id, rec.estimated_monthly_savings);
    return result;
}

std::vector<Recommendation> RecommendationTracker::get_pending_recommendations(const std::string& project_id) {
    return store_->list_pending(project_id, clock_());
}

RecommendationEffectiveness RecommendationTracker::get_recommendation_effectiveness(const std::string& project_id) {
    RecommendationEffectiveness eff;
    TimePoint now = clock_();

    for (const auto& rec : store_->list_all(project_id)) {
        eff.total++;
        eff.by_type[rec.type]++;

        switch (rec.status) {
            case RecommendationStatus::Pending:
                if (rec.expires_at > now) {
                    eff.pending++;
                } else {
                    eff.expired++;
                }
                break;
            case RecommendationStatus::Implemented:
                eff.implemented++;
                if (rec.actual_monthly_savings) {
                    eff.measured_count++;
                    eff.total_estimated_savings += rec.estimated_monthly_savings;
                    eff.total_actual_savings += *rec.actual_monthly_savings;
                }
                break;
            case RecommendationStatus::Dismissed:
                eff.dismissed++;
                break;
            case RecommendationStatus::Expired:
                eff.expired++;
                break;
        }
    }

    int64_t actioned = eff.implemented + eff.dismissed;
    if (actioned > 0) {
        eff.implementation_rate = static_cast<double>(eff.implemented) / static_cast<double>(actioned) * 100.0;
        eff.dismissal_rate = static_cast<double>(eff.dismissed) / static_cast<double>(actioned) * 100.0;
    }
    if (eff.measured_count > 0 && eff.total_estimated_savings > 0.0) {
        eff.savings_accuracy = eff.total_actual_savings / eff.total_estimated_savings;
    }
    return eff;
}

} // namespace agentcost
