#pragma once

#include "agentcost/database.hpp"
#include "agentcost/pricing_catalog.hpp"
#include "agentcost/stores.hpp"
#include <memory>

namespace agentcost {

// Creates the agentcost schema, tables and indexes if missing.
bool initialize_schema(DatabasePool* pool);

class PgEventStore : public EventStore {
private:
    std::shared_ptr<DatabasePool> db_pool_;

public:
    explicit PgEventStore(std::shared_ptr<DatabasePool> db_pool);

    std::vector<Event> fetch_events(const std::string& project_id,
                                    TimePoint from,
                                    TimePoint to) override;

    // Ingestion belongs to another service; used by tooling and tests.
    void insert_event(const Event& event);
};

class PgBaselineStore : public BaselineStore {
private:
    std::shared_ptr<DatabasePool> db_pool_;

public:
    explicit PgBaselineStore(std::shared_ptr<DatabasePool> db_pool);

    void upsert_baselines(const std::string& project_id,
                          const std::vector<Baseline>& baselines) override;

    std::optional<Baseline> get_baseline(const std::string& project_id,
                                         const std::string& agent_name,
                                         const std::string& model) override;

    std::vector<Baseline> list_baselines(const std::string& project_id,
                                         const std::optional<std::string>& agent_name = std::nullopt,
                                         const std::optional<std::string>& model = std::nullopt) override;

    bool has_baselines(const std::string& project_id) override;
};

class PgRecommendationStore : public RecommendationStore {
private:
    std::shared_ptr<DatabasePool> db_pool_;

    // Tells NotFound from Unavailable after a conditional UPDATE matched nothing
    ActionStatus classify_miss(DatabaseConnection& conn,
                               const std::string& recommendation_id,
                               const std::string& project_id);

public:
    explicit PgRecommendationStore(std::shared_ptr<DatabasePool> db_pool);

    std::optional<Recommendation> create_if_absent(const Recommendation& rec,
                                                   TimePoint now,
                                                   TimePoint dismissed_since) override;

    ActionResult transition(const std::string& recommendation_id,
                            const std::string& project_id,
                            RecommendationStatus target,
                            TimePoint now,
                            const std::optional<std::string>& feedback) override;

    ActionResult set_actual_savings(const std::string& recommendation_id,
                                    const std::string& project_id,
                                    double actual_monthly_savings) override;

    std::vector<Recommendation> list_pending(const std::string& project_id,
                                             TimePoint now) override;

    std::vector<Recommendation> list_all(const std::string& project_id) override;
};

// Prices come from agentcost.model_pricing; learned outcomes are derived from
// implemented model_downgrade recommendations on every lookup.
class PgPricingCatalog : public PricingCatalog {
private:
    std::shared_ptr<DatabasePool> db_pool_;

    std::vector<ModelPrice> load_prices(DatabaseConnection& conn);
    LearnedOutcomes load_learned_outcomes(DatabaseConnection& conn);

public:
    explicit PgPricingCatalog(std::shared_ptr<DatabasePool> db_pool);

    std::vector<ModelAlternative> discover_alternatives(const std::string& model,
                                                        int64_t avg_input_tokens,
                                                        int64_t avg_output_tokens,
                                                        int max_results) override;

    void record_outcome(const std::string& recommendation_id,
                        const std::string& model,
                        const std::string& alternative_model,
                        double estimated_monthly_savings,
                        double actual_monthly_savings) override;

    void upsert_price(const ModelPrice& price);
};

} // namespace agentcost
