#pragma once

#include "agentcost/stores.hpp"
#include <map>
#include <memory>

namespace agentcost {

// count / sum / mean / sample standard deviation of one field
struct SummaryStats {
    int64_t count = 0;
    double sum = 0.0;
    double mean = 0.0;
    double stddev = 0.0;   // n-1 denominator, 0 below two samples

    static SummaryStats from_values(const std::vector<double>& values);
};

struct UsageGroupStats {
    std::string agent_name;
    std::string model;

    int64_t call_count = 0;
    int64_t error_count = 0;
    double total_cost = 0.0;
    double failed_cost = 0.0;
    int64_t total_input_tokens = 0;
    int64_t total_output_tokens = 0;

    SummaryStats cost;
    SummaryStats input_tokens;
    SummaryStats output_tokens;
    SummaryStats latency_ms;

    double avg_daily_calls = 0.0;

    double error_rate() const {
        return call_count > 0 ? static_cast<double>(error_count) / static_cast<double>(call_count) : 0.0;
    }
};

struct InputHashGroup {
    std::string agent_name;
    std::string input_hash;
    int64_t occurrences = 0;
    double total_cost = 0.0;
    double first_cost = 0.0;       // Cost of the chronologically first occurrence

    double duplicate_cost() const { return total_cost - first_cost; }
};

class EventAggregator {
private:
    std::shared_ptr<EventStore> event_store_;

public:
    explicit EventAggregator(std::shared_ptr<EventStore> event_store);

    std::vector<Event> fetch(const std::string& project_id, TimePoint from, TimePoint to);

    std::vector<UsageGroupStats> group_by_agent_model(const std::string& project_id, TimePoint from, TimePoint to);
    std::vector<InputHashGroup> group_by_input_hash(const std::string& project_id, TimePoint from, TimePoint to);
    std::map<std::string, int64_t> calls_by_agent(const std::string& project_id, TimePoint from, TimePoint to);
    UsageOverview overview(const std::string& project_id, TimePoint from, TimePoint to);

    // Same groupings over an already fetched window. Results are ordered by
    // (agent_name, model) and (agent_name, input_hash) respectively.
    static std::vector<UsageGroupStats> group_by_agent_model(const std::vector<Event>& events);
    static std::vector<InputHashGroup> group_by_input_hash(const std::vector<Event>& events);
    static std::map<std::string, int64_t> calls_by_agent(const std::vector<Event>& events);
    static UsageOverview overview(const std::vector<Event>& events);
};

} // namespace agentcost
