/**
 * Event Aggregation Test
 *
 * Validates the per-group statistics every analyzer builds on:
 * 1. Sample standard deviation and the single-sample case
 * 2. (agent, model) grouping with error counts and daily call rate
 * 3. Input hash grouping and first-occurrence cost
 * 4. Window and project filtering of the in-memory store
 */

#include "test_support.hpp"
#include "agentcost/event_aggregator.hpp"
#include <spdlog/spdlog.h>
#include <memory>

using namespace agentcost;
using namespace agentcost::testing;

bool test_summary_stats() {
    std::cout << "\n=== Test 1: Summary Statistics ===" << std::endl;

    auto stats = SummaryStats::from_values({2, 4, 4, 4, 5, 5, 7, 9});
    TEST_ASSERT(stats.count == 8, "Count matches number of values");
    TEST_ASSERT(near(stats.sum, 40.0), "Sum is 40");
    TEST_ASSERT(near(stats.mean, 5.0), "Mean is 5");
    TEST_ASSERT(near(stats.stddev, std::sqrt(32.0 / 7.0)), "Stddev uses n-1 denominator");

    auto single = SummaryStats::from_values({3.5});
    TEST_ASSERT(near(single.mean, 3.5), "Single value mean");
    TEST_ASSERT(single.stddev == 0.0, "Single value has zero stddev");

    auto empty = SummaryStats::from_values({});
    TEST_ASSERT(empty.count == 0 && empty.mean == 0.0, "Empty input yields zeroed stats");

    return true;
}

bool test_group_by_agent_model() {
    std::cout << "\n=== Test 2: Agent/Model Grouping ===" << std::endl;

    std::vector<Event> events = {
        EventBuilder("p1", "writer", "gpt-4").cost(0.10).latency(400).tokens(1000, 200).at(hours_ago(30)).build(),
        EventBuilder("p1", "writer", "gpt-4").cost(0.20).latency(600).tokens(2000, 400).at(hours_ago(29)).build(),
        EventBuilder("p1", "writer", "gpt-4").cost(0.30).latency(500).tokens(3000, 600).at(hours_ago(2)).failed().build(),
        EventBuilder("p1", "writer", "gpt-4").cost(0.40).latency(500).tokens(4000, 800).at(hours_ago(1)).build(),
        EventBuilder("p1", "reader", "claude-3-haiku").cost(0.01).latency(100).tokens(100, 10).build()
    };

    auto groups = EventAggregator::group_by_agent_model(events);
    TEST_ASSERT(groups.size() == 2, "Two groups found");
    TEST_ASSERT(groups[0].agent_name == "reader" && groups[1].agent_name == "writer",
                "Groups ordered by agent name");

    const auto& writer = groups[1];
    TEST_ASSERT(writer.call_count == 4, "Writer call count");
    TEST_ASSERT(writer.error_count == 1, "Writer error count");
    TEST_ASSERT(near(writer.error_rate(), 0.25), "Writer error rate is 25%");
    TEST_ASSERT(near(writer.total_cost, 1.0), "Writer total cost");
    TEST_ASSERT(near(writer.failed_cost, 0.30), "Failed cost sums failed calls only");
    TEST_ASSERT(writer.total_input_tokens == 10000, "Input token total");
    TEST_ASSERT(writer.total_output_tokens == 2000, "Output token total");
    TEST_ASSERT(near(writer.cost.mean, 0.25), "Mean cost per call");
    TEST_ASSERT(near(writer.latency_ms.mean, 500.0), "Mean latency");
    TEST_ASSERT(near(writer.output_tokens.mean, 500.0), "Mean output tokens");
    // 2024-05-31 and 2024-06-01 in UTC
    TEST_ASSERT(near(writer.avg_daily_calls, 2.0), "Daily calls averaged over active days");

    return true;
}

bool test_group_by_input_hash() {
    std::cout << "\n=== Test 3: Input Hash Grouping ===" << std::endl;

    std::vector<Event> events = {
        EventBuilder("p1", "faq", "gpt-4").cost(0.05).hash("h1").at(hours_ago(1)).build(),
        EventBuilder("p1", "faq", "gpt-4").cost(0.02).hash("h1").at(hours_ago(5)).build(),
        EventBuilder("p1", "faq", "gpt-4").cost(0.03).hash("h1").at(hours_ago(3)).build(),
        EventBuilder("p1", "faq", "gpt-4").cost(0.50).build(),
        EventBuilder("p1", "faq", "gpt-4").cost(0.50).hash("").build(),
        EventBuilder("p1", "other", "gpt-4").cost(0.07).hash("h1").build()
    };

    auto groups = EventAggregator::group_by_input_hash(events);
    TEST_ASSERT(groups.size() == 2, "Hash groups are per agent; unhashed events ignored");

    const auto& faq = groups[0];
    TEST_ASSERT(faq.agent_name == "faq" && faq.input_hash == "h1", "First group is faq/h1");
    TEST_ASSERT(faq.occurrences == 3, "Three occurrences");
    TEST_ASSERT(near(faq.total_cost, 0.10), "Total cost of the pattern");
    TEST_ASSERT(near(faq.first_cost, 0.02), "First cost is the chronologically earliest call");
    TEST_ASSERT(near(faq.duplicate_cost(), 0.08), "Duplicate cost excludes the first call");

    auto calls = EventAggregator::calls_by_agent(events);
    TEST_ASSERT(calls["faq"] == 5 && calls["other"] == 1, "Calls per agent count every event");

    return true;
}

bool test_store_window_filtering() {
    std::cout << "\n=== Test 4: Window Filtering ===" << std::endl;

    auto store = std::make_shared<MemoryEventStore>();
    store->add_event(EventBuilder("p1", "a", "m").cost(1.0).at(hours_ago(48)).build());
    store->add_event(EventBuilder("p1", "a", "m").cost(2.0).at(hours_ago(24)).build());
    store->add_event(EventBuilder("p1", "a", "m").cost(4.0).at(fixed_now()).build());
    store->add_event(EventBuilder("p2", "a", "m").cost(8.0).at(hours_ago(1)).build());

    EventAggregator aggregator(store);

    auto overview = aggregator.overview("p1", hours_ago(24), fixed_now());
    TEST_ASSERT(overview.total_calls == 2, "Both window bounds are inclusive");
    TEST_ASSERT(near(overview.total_cost, 6.0), "Other projects are excluded");

    auto events = aggregator.fetch("p1", hours_ago(72), fixed_now());
    TEST_ASSERT(events.size() == 3, "Wide window returns all project events");
    TEST_ASSERT(events.front().timestamp < events.back().timestamp, "Events returned in time order");

    auto inverted = aggregator.fetch("p1", fixed_now(), hours_ago(24));
    TEST_ASSERT(inverted.empty(), "Inverted window is empty");

    auto none = aggregator.group_by_agent_model("missing", hours_ago(72), fixed_now());
    TEST_ASSERT(none.empty(), "Unknown project yields no groups");

    return true;
}

int main() {
    spdlog::set_level(spdlog::level::warn);  // Reduce noise during tests

    std::cout << "╔══════════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║     Event Aggregation Tests                              ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════════╝" << std::endl;

    bool all_passed = true;

    all_passed &= test_summary_stats();
    all_passed &= test_group_by_agent_model();
    all_passed &= test_group_by_input_hash();
    all_passed &= test_store_window_filtering();

    std::cout << "\n" << std::string(60, '=') << std::endl;
    if (all_passed) {
        std::cout << "✅ ALL TESTS PASSED!" << std::endl;
        return 0;
    } else {
        std::cout << "❌ SOME TESTS FAILED" << std::endl;
        return 1;
    }
}
