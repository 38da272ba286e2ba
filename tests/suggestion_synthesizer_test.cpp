/**
 * Suggestion Synthesis Test
 *
 * 1. Model downgrade pricing, priority and description
 * 2. Sorting and the low priority filter
 * 3. Error reduction and anomaly alerts against a seeded baseline
 * 4. Latency driven prompt optimization
 * 5. Summary totals and empty-state reasons
 * 6. A failing pricing lookup skips only its own group
 */

#include "test_support.hpp"
#include "agentcost/suggestion_synthesizer.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <stdexcept>

using namespace agentcost;
using namespace agentcost::testing;

namespace {

// Price table whose lookups fail for one model
class UnreliableCatalog : public PricingCatalog {
private:
    PriceTableCatalog table_;
    std::string broken_model_;

public:
    UnreliableCatalog(std::vector<ModelPrice> prices, std::string broken_model)
        : table_(std::move(prices)), broken_model_(std::move(broken_model)) {}

    std::vector<ModelAlternative> discover_alternatives(const std::string& model,
                                                        int64_t avg_input_tokens,
                                                        int64_t avg_output_tokens,
                                                        int max_results) override {
        if (model == broken_model_) {
            throw std::runtime_error("pricing backend unavailable");
        }
        return table_.discover_alternatives(model, avg_input_tokens, avg_output_tokens, max_results);
    }

    void record_outcome(const std::string& recommendation_id,
                        const std::string& model,
                        const std::string& alternative_model,
                        double estimated_monthly_savings,
                        double actual_monthly_savings) override {
        table_.record_outcome(recommendation_id, model, alternative_model,
                              estimated_monthly_savings, actual_monthly_savings);
    }
};

struct Harness {
    std::shared_ptr<MemoryEventStore> events = std::make_shared<MemoryEventStore>();
    std::shared_ptr<MemoryBaselineStore> baseline_store = std::make_shared<MemoryBaselineStore>();
    std::shared_ptr<MemoryRecommendationStore> recommendations = std::make_shared<MemoryRecommendationStore>();
    std::shared_ptr<PriceTableCatalog> pricing = std::make_shared<PriceTableCatalog>();
    std::shared_ptr<SuggestionSynthesizer> synthesizer;

    Harness() : Harness(nullptr) {}

    // A non-null catalog replaces the price table for synthesis
    explicit Harness(std::shared_ptr<PricingCatalog> catalog) {
        std::shared_ptr<PricingCatalog> active = catalog ? catalog : pricing;
        OptimizerConfig config;
        auto aggregator = std::make_shared<EventAggregator>(events);
        auto baselines = std::make_shared<BaselineComputer>(aggregator, baseline_store, config.baseline, fixed_clock());
        auto detector = std::make_shared<AnomalyDetector>(aggregator, baseline_store, config.anomaly, fixed_clock());
        auto tracker = std::make_shared<RecommendationTracker>(recommendations, active, config.recommendation, fixed_clock());
        synthesizer = std::make_shared<SuggestionSynthesizer>(aggregator, baselines, detector, active, tracker,
                                                              config, fixed_clock());
    }

    void add_calls(const std::string& agent, const std::string& model, int count,
                   double cost, double latency, int64_t input, int64_t output, int failures = 0) {
        for (int i = 0; i < count; ++i) {
            auto builder = EventBuilder("proj", agent, model)
                               .cost(cost)
                               .latency(latency)
                               .tokens(input, output)
                               .at(hours_ago(1 + i * 0.5));
            if (i < failures) builder.failed();
            events->add_event(builder.build());
        }
    }
};

Suggestion make_suggestion(const std::string& title, double savings, Priority priority) {
    Suggestion s;
    s.title = title;
    s.estimated_savings_monthly = savings;
    s.priority = priority;
    s.metrics = CachingMetrics{};
    return s;
}

} // namespace

bool test_model_downgrade() {
    std::cout << "\n=== Test 1: Model Downgrade ===" << std::endl;

    Harness h;
    h.pricing->set_price({"gpt-4", "openai", 0.03, 1.5, 1});
    h.pricing->set_price({"gpt-4-lite", "openai", 0.03, 0.5, 2});

    // 10 calls x 1,000 output tokens: $1.00/1k cheaper on 10k tokens over 30 days
    h.add_calls("summarizer", "gpt-4", 10, 2.0, 800, 0, 1000);

    auto suggestions = h.synthesizer->generate_suggestions("proj", 30);
    TEST_ASSERT(suggestions.size() == 1, "Exactly one suggestion");

    const auto& s = suggestions[0];
    TEST_ASSERT(s.type == SuggestionType::ModelDowngrade, "Suggestion is a model downgrade");
    TEST_ASSERT(s.alternative_model && *s.alternative_model == "gpt-4-lite", "Cheaper model proposed");
    TEST_ASSERT(near(s.estimated_savings_monthly, 10.0), "Savings are $10/month");
    TEST_ASSERT(s.priority == Priority::Medium, "$10/month is medium priority");
    TEST_ASSERT(near(s.estimated_savings_percent, 50.0), "Half of the $20 monthly spend");
    TEST_ASSERT(s.title == "Consider gpt-4-lite for summarizer", "Title names model and agent");
    TEST_ASSERT(s.description.find("average output of 1000 tokens") != std::string::npos,
                "Description carries the token profile");
    TEST_ASSERT(s.action_items.size() == 3, "Three steps below $100/month");
    TEST_ASSERT(s.action_items[1] == "Switch summarizer configuration from gpt-4 to gpt-4-lite",
                "Direct switch for low call volume");

    auto json = s.to_json();
    TEST_ASSERT(json["type"] == "model_downgrade", "JSON type string");
    TEST_ASSERT(json["metrics"]["quality_impact"] == "moderate", "Metrics carry quality impact");
    TEST_ASSERT(json["metrics"]["current_calls"] == 10, "Metrics carry call count");

    // Same volume over a 60 day window halves the monthly figure
    Harness wide;
    wide.pricing->set_price({"gpt-4", "openai", 0.03, 1.5, 1});
    wide.pricing->set_price({"gpt-4-lite", "openai", 0.03, 0.5, 2});
    wide.add_calls("summarizer", "gpt-4", 10, 2.0, 800, 0, 1000);
    auto scaled = wide.synthesizer->generate_suggestions("proj", 60);
    TEST_ASSERT(scaled.size() == 1 && near(scaled[0].estimated_savings_monthly, 5.0), "Savings scaled to 30 days");
    TEST_ASSERT(scaled[0].priority == Priority::Low, "$5/month is low priority");
    TEST_ASSERT(wide.synthesizer->generate_suggestions("proj", 60, false).empty(), "Low priority filtered on request");

    return true;
}

bool test_sorting_and_priority() {
    std::cout << "\n=== Test 2: Sorting and Priority ===" << std::endl;

    std::vector<Suggestion> input = {
        make_suggestion("low-a", 5.0, Priority::Low),
        make_suggestion("high", 60.0, Priority::High),
        make_suggestion("medium", 20.0, Priority::Medium),
        make_suggestion("low-b", 5.0, Priority::Low)
    };

    auto sorted = SuggestionSynthesizer::finalize(input, true);
    TEST_ASSERT(sorted.size() == 4, "Nothing dropped");
    TEST_ASSERT(sorted[0].title == "high" && sorted[1].title == "medium", "Descending savings");
    TEST_ASSERT(sorted[2].title == "low-a" && sorted[3].title == "low-b", "Ties keep their order");

    auto filtered = SuggestionSynthesizer::finalize(input, false);
    TEST_ASSERT(filtered.size() == 2, "Low priority removed");
    TEST_ASSERT(filtered[0].title == "high" && filtered[1].title == "medium", "Filtered list stays sorted");

    SuggestionConfig cfg;
    TEST_ASSERT(SuggestionSynthesizer::priority_for_savings(50.0, cfg) == Priority::High, "$50 is high");
    TEST_ASSERT(SuggestionSynthesizer::priority_for_savings(49.99, cfg) == Priority::Medium, "$49.99 is medium");
    TEST_ASSERT(SuggestionSynthesizer::priority_for_savings(10.0, cfg) == Priority::Medium, "$10 is medium");
    TEST_ASSERT(SuggestionSynthesizer::priority_for_savings(9.99, cfg) == Priority::Low, "$9.99 is low");

    return true;
}

bool test_error_reduction() {
    std::cout << "\n=== Test 3: Error Reduction and Anomaly Alerts ===" << std::endl;

    Harness h;
    Baseline baseline;
    baseline.agent_name = "extractor";
    baseline.model = "unpriced-model";
    baseline.avg_cost_per_call = 1.0;
    baseline.avg_latency_ms = 300.0;
    baseline.avg_error_rate = 0.02;
    baseline.sample_count = 200;
    h.baseline_store->upsert_baselines("proj", {baseline});

    // 6 of 20 calls fail at $1 each
    h.add_calls("extractor", "unpriced-model", 20, 1.0, 300, 500, 100, 6);

    auto suggestions = h.synthesizer->generate_suggestions("proj", 30);
    TEST_ASSERT(suggestions.size() == 2, "Error reduction plus an error rate alert");

    const auto& error = suggestions[0];
    TEST_ASSERT(error.type == SuggestionType::ErrorReduction, "Error reduction sorts first on savings");
    TEST_ASSERT(near(error.estimated_savings_monthly, 6.0), "Failed spend is the saving");
    TEST_ASSERT(error.priority == Priority::Low, "$6/month is low priority");
    auto metrics = std::get<ErrorReductionMetrics>(error.metrics);
    TEST_ASSERT(near(metrics.error_rate, 30.0), "Error rate as a percentage");
    TEST_ASSERT(near(metrics.baseline_error_rate, 2.0), "Baseline rate as a percentage");
    TEST_ASSERT(error.action_items[0].find("Critical: 30.0% error rate on extractor") == 0,
                "Critical wording above 10%");

    const auto& alert = suggestions[1];
    TEST_ASSERT(alert.type == SuggestionType::AnomalyAlert, "Anomaly alert present");
    TEST_ASSERT(alert.priority == Priority::High, "Error rate above twice baseline is high");
    TEST_ASSERT(alert.estimated_savings_monthly == 0.0, "Alerts carry no savings");
    TEST_ASSERT(alert.title == "Anomaly detected: error for extractor (unpriced-model)", "Alert title");

    auto high_only = h.synthesizer->generate_suggestions("proj", 30, false);
    TEST_ASSERT(high_only.size() == 1 && high_only[0].type == SuggestionType::AnomalyAlert,
                "Only the alert survives the low priority filter");

    return true;
}

bool test_latency() {
    std::cout << "\n=== Test 4: Latency ===" << std::endl;

    Harness h;
    Baseline baseline;
    baseline.agent_name = "planner";
    baseline.model = "unpriced-model";
    baseline.avg_cost_per_call = 0.01;
    baseline.avg_latency_ms = 500.0;
    baseline.stddev_latency_ms = 50.0;
    baseline.sample_count = 100;
    h.baseline_store->upsert_baselines("proj", {baseline});

    h.add_calls("planner", "unpriced-model", 10, 0.01, 700, 2500, 100);

    auto suggestions = h.synthesizer->generate_suggestions("proj", 30);
    const Suggestion* latency = nullptr;
    for (const auto& s : suggestions) {
        if (s.type == SuggestionType::PromptOptimization) latency = &s;
    }

    TEST_ASSERT(latency != nullptr, "Prompt optimization suggested");
    TEST_ASSERT(latency->priority == Priority::High, "z of 4 is high priority");
    auto metrics = std::get<LatencyMetrics>(latency->metrics);
    TEST_ASSERT(near(metrics.z_score, 4.0), "z recorded");
    TEST_ASSERT(near(metrics.avg_latency_ms, 700.0), "Current latency recorded");
    TEST_ASSERT(latency->action_items[0] ==
                "Reduce prompt size for planner - currently 2500 tokens, aim for <2000 tokens",
                "Large prompts flagged first");

    return true;
}

bool test_summary() {
    std::cout << "\n=== Test 5: Summary ===" << std::endl;

    Harness empty;
    auto none = empty.synthesizer->get_summary("proj", 30);
    TEST_ASSERT(none.suggestion_count == 0, "No suggestions without events");
    TEST_ASSERT(!none.has_data && none.event_count == 0, "No data reported");
    TEST_ASSERT(none.empty_reason && *none.empty_reason == "no_data", "Reason is no_data");

    Harness sparse;
    sparse.add_calls("agent", "unpriced-model", 5, 0.01, 100, 10, 10);
    auto insufficient = sparse.synthesizer->get_summary("proj", 30);
    TEST_ASSERT(insufficient.empty_reason && *insufficient.empty_reason == "insufficient_data",
                "Too few events to build baselines");

    Harness quiet;
    quiet.add_calls("agent", "unpriced-model", 20, 0.01, 100, 10, 10);
    auto optimized = quiet.synthesizer->get_summary("proj", 30);
    TEST_ASSERT(optimized.has_baselines, "Baselines bootstrapped");
    TEST_ASSERT(optimized.empty_reason && *optimized.empty_reason == "optimized", "Nothing left to optimize");

    // Enough events overall, but no single (agent, model) group reaches the baseline floor
    Harness split;
    split.add_calls("reader", "unpriced-model", 6, 0.01, 100, 10, 10);
    split.add_calls("writer", "unpriced-model", 6, 0.01, 100, 10, 10);
    auto unbaselined = split.synthesizer->get_summary("proj", 30);
    TEST_ASSERT(unbaselined.event_count == 12 && !unbaselined.has_baselines, "No group baselined");
    TEST_ASSERT(unbaselined.empty_reason && *unbaselined.empty_reason == "no_baselines", "Reason is no_baselines");

    // Bootstrap covers the requested window only
    Harness windowed;
    windowed.add_calls("agent", "unpriced-model", 6, 0.01, 100, 10, 10);
    for (int i = 0; i < 20; ++i) {
        windowed.events->add_event(EventBuilder("proj", "agent", "unpriced-model")
                                       .cost(0.01).latency(100).tokens(10, 10)
                                       .at(hours_ago(240 + i)).build());
    }
    auto week = windowed.synthesizer->get_summary("proj", 7);
    TEST_ASSERT(!week.has_baselines && week.event_count == 6, "Older events not bootstrapped into a 7-day summary");
    TEST_ASSERT(week.empty_reason && *week.empty_reason == "insufficient_data", "Reason reflects the window");

    Harness h;
    h.pricing->set_price({"gpt-4", "openai", 0.03, 1.5, 1});
    h.pricing->set_price({"gpt-4-lite", "openai", 0.03, 0.5, 2});
    h.add_calls("summarizer", "gpt-4", 10, 2.0, 800, 0, 1000);

    auto summary = h.synthesizer->get_summary("proj", 30);
    TEST_ASSERT(summary.suggestion_count == 1, "One suggestion counted");
    TEST_ASSERT(near(summary.total_potential_savings_monthly, 10.0), "Total savings");
    TEST_ASSERT(near(summary.current_monthly_spend, 20.0), "Monthly spend");
    TEST_ASSERT(near(summary.total_potential_savings_percent, 50.0), "Savings percent of spend");
    TEST_ASSERT(summary.by_type["model_downgrade"].count == 1, "Breakdown by type");
    TEST_ASSERT(!summary.empty_reason, "No empty reason with suggestions");

    auto json = summary.to_json();
    TEST_ASSERT(json["empty_reason"].is_null(), "Empty reason serialized as null");
    TEST_ASSERT(json["suggestions"].size() == 1, "Top suggestions included");
    TEST_ASSERT(json["effectiveness"]["total"] == 0, "Effectiveness included");

    return true;
}

bool test_pricing_failure_isolated() {
    std::cout << "\n=== Test 6: Pricing Failure Isolated ===" << std::endl;

    auto catalog = std::make_shared<UnreliableCatalog>(std::vector<ModelPrice>{
        {"gpt-4", "openai", 0.03, 1.5, 1},
        {"gpt-4-lite", "openai", 0.03, 0.5, 2},
        {"claude-flagship", "anthropic", 0.03, 1.5, 1}
    }, "claude-flagship");
    Harness h(catalog);
    h.add_calls("summarizer", "gpt-4", 10, 2.0, 800, 0, 1000);
    h.add_calls("classifier", "claude-flagship", 10, 2.0, 800, 0, 1000);

    std::vector<Suggestion> suggestions;
    bool threw = false;
    try {
        suggestions = h.synthesizer->generate_suggestions("proj", 30);
    } catch (const std::exception&) {
        threw = true;
    }
    TEST_ASSERT(!threw, "Pricing failure does not fail the batch");
    TEST_ASSERT(suggestions.size() == 1, "Other groups still analyzed");
    TEST_ASSERT(suggestions[0].agent_name && *suggestions[0].agent_name == "summarizer",
                "Suggestion for the healthy model kept");
    TEST_ASSERT(near(suggestions[0].estimated_savings_monthly, 10.0), "Healthy group priced normally");

    return true;
}

int main() {
    spdlog::set_level(spdlog::level::warn);  // Reduce noise during tests

    std::cout << "╔══════════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║     Suggestion Synthesis Tests                           ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════════╝" << std::endl;

    bool all_passed = true;

    all_passed &= test_model_downgrade();
    all_passed &= test_sorting_and_priority();
    all_passed &= test_error_reduction();
    all_passed &= test_latency();
    all_passed &= test_summary();
    all_passed &= test_pricing_failure_isolated();

    std::cout << "\n" << std::string(60, '=') << std::endl;
    if (all_passed) {
        std::cout << "✅ ALL TESTS PASSED!" << std::endl;
        return 0;
    } else {
        std::cout << "❌ SOME TESTS FAILED" << std::endl;
        return 1;
    }
}
