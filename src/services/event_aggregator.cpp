#include "agentcost/event_aggregator.hpp"
#include <cmath>
#include <utility>

namespace agentcost {

SummaryStats SummaryStats::from_values(const std::vector<double>& values) {
    SummaryStats stats;
    stats.count = static_cast<int64_t>(values.size());
    if (values.empty()) return stats;

    for (double v : values) stats.sum += v;
    stats.mean = stats.sum / static_cast<double>(stats.count);

    if (stats.count >= 2) {
        double sq = 0.0;
        for (double v : values) {
            double d = v - stats.mean;
            sq += d * d;
        }
        stats.stddev = std::sqrt(sq / static_cast<double>(stats.count - 1));
    }
    return stats;
}

EventAggregator::EventAggregator(std::shared_ptr<EventStore> event_store)
    : event_store_(std::move(event_store)) {
}

std::vector<Event> EventAggregator::fetch(const std::string& project_id, TimePoint from, TimePoint to) {
    if (to < from) return {};
    return event_store_->fetch_events(project_id, from, to);
}

std::vector<UsageGroupStats> EventAggregator::group_by_agent_model(const std::string& project_id,
                                                                   TimePoint from, TimePoint to) {
    return group_by_agent_model(fetch(project_id, from, to));
}

std::vector<InputHashGroup> EventAggregator::group_by_input_hash(const std::string& project_id,
                                                                 TimePoint from, TimePoint to) {
    return group_by_input_hash(fetch(project_id, from, to));
}

std::map<std::string, int64_t> EventAggregator::calls_by_agent(const std::string& project_id,
                                                               TimePoint from, TimePoint to) {
    return calls_by_agent(fetch(project_id, from, to));
}

UsageOverview EventAggregator::overview(const std::string& project_id, TimePoint from, TimePoint to) {
    return overview(fetch(project_id, from, to));
}

std::vector<UsageGroupStats> EventAggregator::group_by_agent_model(const std::vector<Event>& events) {
    struct Accumulator {
        UsageGroupStats stats;
        std::vector<double> cost;
        std::vector<double> input_tokens;
        std::vector<double> output_tokens;
        std::vector<double> latency_ms;
        std::map<std::string, int64_t> calls_per_day;
    };

    std::map<std::pair<std::string, std::string>, Accumulator> groups;

    for (const auto& e : events) {
        auto& acc = groups[{e.agent_name, e.model}];
        auto& s = acc.stats;
        s.call_count++;
        s.total_cost += e.cost;
        s.total_input_tokens += e.input_tokens;
        s.total_output_tokens += e.output_tokens;
        if (!e.success) {
            s.error_count++;
            s.failed_cost += e.cost;
        }
        acc.cost.push_back(e.cost);
        acc.input_tokens.push_back(static_cast<double>(e.input_tokens));
        acc.output_tokens.push_back(static_cast<double>(e.output_tokens));
        acc.latency_ms.push_back(e.latency_ms);
        acc.calls_per_day[utc_day_key(e.timestamp)]++;
    }

    std::vector<UsageGroupStats> result;
    result.reserve(groups.size());
    for (auto& entry : groups) {
        auto& acc = entry.second;
        UsageGroupStats s = std::move(acc.stats);
        s.agent_name = entry.first.first;
        s.model = entry.first.second;
        s.cost = SummaryStats::from_values(acc.cost);
        s.input_tokens = SummaryStats::from_values(acc.input_tokens);
        s.output_tokens = SummaryStats::from_values(acc.output_tokens);
        s.latency_ms = SummaryStats::from_values(acc.latency_ms);

        // Mean over days that saw traffic
        if (!acc.calls_per_day.empty()) {
            s.avg_daily_calls = static_cast<double>(s.call_count) /
                                static_cast<double>(acc.calls_per_day.size());
        }
        result.push_back(std::move(s));
    }
    return result;
}

std::vector<InputHashGroup> EventAggregator::group_by_input_hash(const std::vector<Event>& events) {
    std::map<std::pair<std::string, std::string>, InputHashGroup> groups;
    std::map<std::pair<std::string, std::string>, TimePoint> first_seen;

    for (const auto& e : events) {
        if (!e.input_hash || e.input_hash->empty()) continue;

        std::pair<std::string, std::string> key{e.agent_name, *e.input_hash};
        auto& group = groups[key];
        if (group.occurrences == 0 || e.timestamp < first_seen[key]) {
            first_seen[key] = e.timestamp;
            group.first_cost = e.cost;
        }
        group.occurrences++;
        group.total_cost += e.cost;
    }

    std::vector<InputHashGroup> result;
    result.reserve(groups.size());
    for (auto& entry : groups) {
        InputHashGroup g = std::move(entry.second);
        g.agent_name = entry.first.first;
        g.input_hash = entry.first.second;
        result.push_back(std::move(g));
    }
    return result;
}

std::map<std::string, int64_t> EventAggregator::calls_by_agent(const std::vector<Event>& events) {
    std::map<std::string, int64_t> calls;
    for (const auto& e : events) {
        calls[e.agent_name]++;
    }
    return calls;
}

UsageOverview EventAggregator::overview(const std::vector<Event>& events) {
    UsageOverview o;
    for (const auto& e : events) {
        o.total_calls++;
        o.total_cost += e.cost;
        if (!e.success) o.error_count++;
    }
    return o;
}

} // namespace agentcost
