#pragma once

#include "agentcost/stores.hpp"
#include <map>
#include <mutex>
#include <tuple>

namespace agentcost {

// In-process stores for embedders that already hold events, and for tests.
// Each public operation runs under a single lock.

class MemoryEventStore : public EventStore {
private:
    std::vector<Event> events_;
    mutable std::mutex mutex_;

public:
    void add_event(const Event& event);
    void add_events(const std::vector<Event>& events);
    size_t size() const;

    std::vector<Event> fetch_events(const std::string& project_id,
                                    TimePoint from,
                                    TimePoint to) override;
};

class MemoryBaselineStore : public BaselineStore {
private:
    using Key = std::tuple<std::string, std::string, std::string>;
    std::map<Key, Baseline> baselines_;
    mutable std::mutex mutex_;

public:
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

class MemoryRecommendationStore : public RecommendationStore {
private:
    std::vector<Recommendation> rows_;   // insertion order
    mutable std::mutex mutex_;

    Recommendation* find_locked(const std::string& recommendation_id, const std::string& project_id);

public:
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

    // Direct lookup regardless of project or state
    std::optional<Recommendation> find(const std::string& recommendation_id) const;
};

} // namespace agentcost
