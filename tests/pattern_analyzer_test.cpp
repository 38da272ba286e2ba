/**
 * Caching Opportunity Test
 *
 * 1. Repeated fingerprints are priced per agent and scaled to a month
 * 2. Occurrence floor and savings floor
 * 3. Ordering by savings
 * 4. Remediation text for the caching suggestion
 */

#include "test_support.hpp"
#include "agentcost/action_items.hpp"
#include "agentcost/pattern_analyzer.hpp"
#include <spdlog/spdlog.h>
#include <memory>

using namespace agentcost;
using namespace agentcost::testing;

namespace {

void add_repeats(MemoryEventStore& store, const std::string& agent, int patterns, int repeats, double cost) {
    for (int p = 0; p < patterns; ++p) {
        for (int r = 0; r < repeats; ++r) {
            store.add_event(EventBuilder("proj", agent, "gpt-4")
                                .cost(cost)
                                .hash(agent + "-pattern-" + std::to_string(p))
                                .at(hours_ago(1 + p * repeats + r))
                                .build());
        }
    }
}

} // namespace

bool test_duplicate_rate_and_savings() {
    std::cout << "\n=== Test 1: Duplicate Rate and Savings ===" << std::endl;

    auto events = std::make_shared<MemoryEventStore>();
    add_repeats(*events, "faq", 10, 10, 1.0);

    PatternAnalyzer analyzer(std::make_shared<EventAggregator>(events), PatternConfig{}, fixed_clock());
    auto opportunities = analyzer.analyze_caching_opportunities("proj", 5, 1.0, 30);

    TEST_ASSERT(opportunities.size() == 1, "One agent with duplicates");
    const auto& opp = opportunities[0];
    TEST_ASSERT(opp.agent_name == "faq", "Agent name");
    TEST_ASSERT(opp.unique_patterns == 10, "10 unique patterns");
    TEST_ASSERT(opp.total_calls == 100, "100 calls in total");
    TEST_ASSERT(opp.duplicate_calls == 90, "90 calls are repeats");
    TEST_ASSERT(near(opp.duplicate_rate, 90.0), "Duplicate rate is 90%");
    TEST_ASSERT(near(opp.estimated_monthly_savings, 90.0), "Repeats cost $90 over a 30 day window");

    auto json = opp.to_json();
    TEST_ASSERT(json["duplicate_rate"].get<double>() == 90.0, "JSON rate rounded to one decimal");

    return true;
}

bool test_window_scaling() {
    std::cout << "\n=== Test 2: Monthly Scaling ===" << std::endl;

    auto events = std::make_shared<MemoryEventStore>();
    // 4 patterns x 5 calls at $0.50 inside 7 days: 4 * 4 * 0.5 = $8 of repeats
    add_repeats(*events, "support", 4, 5, 0.5);

    auto opportunities = PatternAnalyzer::analyze(events->fetch_events("proj", hours_ago(24 * 7), fixed_now()),
                                                  5, 1.0, 7);
    TEST_ASSERT(opportunities.size() == 1, "Opportunity found");
    TEST_ASSERT(near(opportunities[0].estimated_monthly_savings, 8.0 * 30.0 / 7.0),
                "Savings scaled by 30 / days");

    auto none = PatternAnalyzer::analyze(events->fetch_events("proj", hours_ago(24 * 7), fixed_now()),
                                         5, 1.0, 0);
    TEST_ASSERT(none.empty(), "Zero-day window yields nothing");

    return true;
}

bool test_floors() {
    std::cout << "\n=== Test 3: Occurrence and Savings Floors ===" << std::endl;

    auto events = std::make_shared<MemoryEventStore>();
    add_repeats(*events, "rare", 5, 3, 1.0);        // 3 occurrences per pattern
    add_repeats(*events, "cheap", 2, 10, 0.01);     // 18 repeats at $0.01
    add_repeats(*events, "busy", 3, 6, 2.0);        // 15 repeats at $2
    add_repeats(*events, "medium", 2, 6, 1.0);      // 10 repeats at $1

    auto window = events->fetch_events("proj", hours_ago(24 * 30), fixed_now());

    auto opportunities = PatternAnalyzer::analyze(window, 5, 1.0, 30);
    TEST_ASSERT(opportunities.size() == 2, "Rare patterns and cheap savings are filtered");
    TEST_ASSERT(opportunities[0].agent_name == "busy", "Highest savings first");
    TEST_ASSERT(near(opportunities[0].estimated_monthly_savings, 30.0), "busy saves $30");
    TEST_ASSERT(opportunities[1].agent_name == "medium", "Then medium");

    auto low_floor = PatternAnalyzer::analyze(window, 1, 0.0, 30);
    bool rare_found = false;
    for (const auto& o : low_floor) {
        if (o.agent_name == "rare") rare_found = true;
    }
    TEST_ASSERT(rare_found, "Occurrence floor of 1 is raised to 2, so 3 repeats count");
    TEST_ASSERT(low_floor.size() == 4, "All four agents with a zero savings floor");

    return true;
}

bool test_caching_actions() {
    std::cout << "\n=== Test 4: Caching Action Items ===" << std::endl;

    auto high = build_caching_actions("faq", 90.0, 10, 90);
    TEST_ASSERT(high.size() == 3, "Three steps without semantic matching");
    TEST_ASSERT(high[0] == "Implement cache with size 20 entries - you have 10 unique query patterns",
                "Cache sized at twice the unique patterns");
    TEST_ASSERT(high[1] == "High duplicate rate (90%) - use aggressive caching with 1-hour TTL",
                "Aggressive TTL above 50% duplicates");

    auto moderate = build_caching_actions("faq", 30.0, 8000, 250);
    TEST_ASSERT(moderate[0].find("size 10,000 entries") != std::string::npos, "Cache size capped at 10,000");
    TEST_ASSERT(moderate[1].find("30-minute TTL") != std::string::npos, "Moderate TTL between 20% and 50%");
    TEST_ASSERT(moderate[2].find("250 duplicate calls") != std::string::npos, "Semantic matching above 100 repeats");

    auto low = build_caching_actions("faq", 10.0, 3, 5);
    TEST_ASSERT(low[1] == "Use 15-minute TTL for faq cache", "Short TTL for low duplicate rate");
    TEST_ASSERT(low.back() == "Log cache hits/misses for faq to measure effectiveness", "Always ends with measurement");

    auto busy = build_model_switch_actions("writer", "gpt-4", "gpt-4o-mini", 50.0, "moderate", 1234567);
    TEST_ASSERT(busy[1].find("With 1,234,567 calls/period") != std::string::npos, "Thousands separator in call counts");
    auto repeated = build_caching_actions("faq", 60.0, 400, 999);
    TEST_ASSERT(repeated[0].find("size 800 entries - you have 400 unique") != std::string::npos,
                "No separator below 1000");
    TEST_ASSERT(repeated[2].find("999 duplicate calls") != std::string::npos, "Three digits left as is");

    return true;
}

int main() {
    spdlog::set_level(spdlog::level::warn);  // Reduce noise during tests

    std::cout << "╔══════════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║     Caching Opportunity Tests                            ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════════╝" << std::endl;

    bool all_passed = true;

    all_passed &= test_duplicate_rate_and_savings();
    all_passed &= test_window_scaling();
    all_passed &= test_floors();
    all_passed &= test_caching_actions();

    std::cout << "\n" << std::string(60, '=') << std::endl;
    if (all_passed) {
        std::cout << "✅ ALL TESTS PASSED!" << std::endl;
        return 0;
    } else {
        std::cout << "❌ SOME TESTS FAILED" << std::endl;
        return 1;
    }
}
