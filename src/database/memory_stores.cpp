#include "agentcost/memory_stores.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace agentcost {

// ----------------------------------------------------------------------------
// MemoryEventStore
// ----------------------------------------------------------------------------

void MemoryEventStore::add_event(const Event& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
}

void MemoryEventStore::add_events(const std::vector<Event>& events) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.insert(events_.end(), events.begin(), events.end());
}

size_t MemoryEventStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

std::vector<Event> MemoryEventStore::fetch_events(const std::string& project_id,
                                                  TimePoint from,
                                                  TimePoint to) {
    std::vector<Event> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& event : events_) {
            if (event.project_id == project_id && event.timestamp >= from && event.timestamp <= to) {
                result.push_back(event);
            }
        }
    }
    std::stable_sort(result.begin(), result.end(), [](const Event& a, const Event& b) {
        return a.timestamp < b.timestamp;
    });
    return result;
}

// ----------------------------------------------------------------------------
// MemoryBaselineStore
// ----------------------------------------------------------------------------

void MemoryBaselineStore::upsert_baselines(const std::string& project_id,
                                           const std::vector<Baseline>& baselines) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& baseline : baselines) {
        Baseline row = baseline;
        row.project_id = project_id;
        baselines_[Key{project_id, row.agent_name, row.model}] = row;
    }
}

std::optional<Baseline> MemoryBaselineStore::get_baseline(const std::string& project_id,
                                                          const std::string& agent_name,
                                                          const std::string& model) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = baselines_.find(Key{project_id, agent_name, model});
    if (it == baselines_.end()) return std::nullopt;
    return it->second;
}

std::vector<Baseline> MemoryBaselineStore::list_baselines(const std::string& project_id,
                                                          const std::optional<std::string>& agent_name,
                                                          const std::optional<std::string>& model) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Baseline> result;
    for (const auto& entry : baselines_) {
        const Baseline& b = entry.second;
        if (b.project_id != project_id) continue;
        if (agent_name && b.agent_name != *agent_name) continue;
        if (model && b.model != *model) continue;
        result.push_back(b);
    }
    return result;
}

bool MemoryBaselineStore::has_baselines(const std::string& project_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(baselines_.begin(), baselines_.end(), [&project_id](const auto& entry) {
        return entry.second.project_id == project_id;
    });
}

// ----------------------------------------------------------------------------
// MemoryRecommendationStore
// ----------------------------------------------------------------------------

Recommendation* MemoryRecommendationStore::find_locked(const std::string& recommendation_id,
                                                       const std::string& project_id) {
    for (auto& row : rows_) {
        if (row.id == recommendation_id && row.project_id == project_id) return &row;
    }
    return nullptr;
}

std::optional<Recommendation> MemoryRecommendationStore::create_if_absent(const Recommendation& rec,
                                                                          TimePoint now,
                                                                          TimePoint dismissed_since) {
    std::lock_guard<std::mutex> lock(mutex_);
    RecommendationKey key{rec.project_id, rec.type, rec.agent_name, rec.model};

    for (auto& row : rows_) {
        if (!key.matches(row)) continue;

        if (row.status == RecommendationStatus::Pending) {
            if (row.expires_at > now) {
                spdlog::debug("Recommendation {} already pending for {}/{}", row.id, rec.project_id, rec.type);
                return std::nullopt;
            }
            row.status = RecommendationStatus::Expired;
        } else if (row.status == RecommendationStatus::Dismissed &&
                   row.dismissed_at && *row.dismissed_at >= dismissed_since) {
            spdlog::debug("Recommendation {} dismissed within cooldown for {}/{}", row.id, rec.project_id, rec.type);
            return std::nullopt;
        }
    }

    rows_.push_back(rec);
    return rec;
}

ActionResult MemoryRecommendationStore::transition(const std::string& recommendation_id,
                                                   const std::string& project_id,
                                                   RecommendationStatus target,
                                                   TimePoint now,
                                                   const std::optional<std::string>& feedback) {
    std::lock_guard<std::mutex> lock(mutex_);
    ActionResult result;

    Recommendation* row = find_locked(recommendation_id, project_id);
    if (!row) {
        result.status = ActionStatus::NotFound;
        return result;
    }
    if (!row->is_actionable(now) ||
        (target != RecommendationStatus::Implemented && target != RecommendationStatus::Dismissed)) {
        result.status = ActionStatus::Unavailable;
        return result;
    }

    row->status = target;
    if (target == RecommendationStatus::Implemented) {
        row->implemented_at = now;
    } else {
        row->dismissed_at = now;
        row->dismiss_feedback = feedback;
    }

    result.status = ActionStatus::Ok;
    result.recommendation = *row;
    return result;
}

ActionResult MemoryRecommendationStore::set_actual_savings(const std::string& recommendation_id,
                                                           const std::string& project_id,
                                                           double actual_monthly_savings) {
    std::lock_guard<std::mutex> lock(mutex_);
    ActionResult result;

    Recommendation* row = find_locked(recommendation_id, project_id);
    if (!row) {
        result.status = ActionStatus::NotFound;
        return result;
    }
    if (row->status != RecommendationStatus::Implemented) {
        result.status = ActionStatus::Unavailable;
        return result;
    }

    row->actual_monthly_savings = actual_monthly_savings;
    result.status = ActionStatus::Ok;
    result.recommendation = *row;
    return result;
}

std::vector<Recommendation> MemoryRecommendationStore::list_pending(const std::string& project_id,
                                                                    TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Recommendation> result;
    for (const auto& row : rows_) {
        if (row.project_id == project_id && row.is_actionable(now)) {
            result.push_back(row);
        }
    }
    std::stable_sort(result.begin(), result.end(), [](const Recommendation& a, const Recommendation& b) {
        return a.created_at > b.created_at;
    });
    return result;
}

std::vector<Recommendation> MemoryRecommendationStore::list_all(const std::string& project_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Recommendation> result;
    for (const auto& row : rows_) {
        if (row.project_id == project_id) result.push_back(row);
    }
    return result;
}

std::optional<Recommendation> MemoryRecommendationStore::find(const std::string& recommendation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& row : rows_) {
        if (row.id == recommendation_id) return row;
    }
    return std::nullopt;
}

} // namespace agentcost
