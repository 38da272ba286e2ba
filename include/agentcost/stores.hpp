#pragma once

#include "agentcost/recommendation_types.hpp"
#include "agentcost/usage_types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace agentcost {

// ============================================================================
// Storage contracts
//
// Every write is one unit of work: it either fully applies or leaves the store
// untouched. Implementations throw std::runtime_error on storage failures.
// ============================================================================

// Read-only view of ingested usage events.
class EventStore {
public:
    virtual ~EventStore() = default;

    // Events of one project with from <= timestamp <= to, oldest first.
    virtual std::vector<Event> fetch_events(const std::string& project_id,
                                            TimePoint from,
                                            TimePoint to) = 0;
};

class BaselineStore {
public:
    virtual ~BaselineStore() = default;

    // Inserts or replaces one row per (project, agent, model) atomically.
    virtual void upsert_baselines(const std::string& project_id,
                                  const std::vector<Baseline>& baselines) = 0;

    virtual std::optional<Baseline> get_baseline(const std::string& project_id,
                                                 const std::string& agent_name,
                                                 const std::string& model) = 0;

    virtual std::vector<Baseline> list_baselines(const std::string& project_id,
                                                 const std::optional<std::string>& agent_name = std::nullopt,
                                                 const std::optional<std::string>& model = std::nullopt) = 0;

    virtual bool has_baselines(const std::string& project_id) = 0;
};

class RecommendationStore {
public:
    virtual ~RecommendationStore() = default;

    // Inserts rec unless its key already has a pending row with expires_at > now,
    // or a row dismissed at or after dismissed_since. Stale pending rows of the
    // same key are marked expired first. Returns the inserted row, or nullopt
    // when suppressed.
    virtual std::optional<Recommendation> create_if_absent(const Recommendation& rec,
                                                           TimePoint now,
                                                           TimePoint dismissed_since) = 0;

    // pending -> implemented / dismissed, only while expires_at > now.
    virtual ActionResult transition(const std::string& recommendation_id,
                                    const std::string& project_id,
                                    RecommendationStatus target,
                                    TimePoint now,
                                    const std::optional<std::string>& feedback) = 0;

    // Only implemented rows accept a measured figure.
    virtual ActionResult set_actual_savings(const std::string& recommendation_id,
                                            const std::string& project_id,
                                            double actual_monthly_savings) = 0;

    // Pending with expires_at > now, newest first.
    virtual std::vector<Recommendation> list_pending(const std::string& project_id,
                                                     TimePoint now) = 0;

    virtual std::vector<Recommendation> list_all(const std::string& project_id) = 0;
};

} // namespace agentcost
