/**
 * PostgreSQL Store Test
 *
 * Runs against a live database when PG_HOST is set, otherwise skips.
 * 0. Pool keeps its size across checkouts
 * 1. Schema creation is idempotent
 * 2. Events round trip through the window query
 * 3. Baseline upsert replaces rows
 * 4. Pending recommendation dedup and conditional transitions
 * 5. Prices and learned outcomes drive alternatives
 */

#include "test_support.hpp"
#include "agentcost/config.hpp"
#include "agentcost/pg_stores.hpp"
#include "agentcost/recommendation_tracker.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <memory>

using namespace agentcost;
using namespace agentcost::testing;

namespace {

std::shared_ptr<DatabasePool> make_pool() {
    auto db = DatabaseConfig::from_env();
    return std::make_shared<DatabasePool>(db.connection_string(), 2,
                                          db.pool_acquisition_timeout,
                                          db.statement_timeout,
                                          db.lock_timeout,
                                          db.idle_timeout);
}

// Unique per run so repeated runs do not collide
std::string unique_name(const std::string& prefix) {
    return prefix + "-" + RecommendationTracker::generate_uuid();
}

Recommendation pending_row(const std::string& project_id, const std::string& agent, TimePoint now) {
    Recommendation rec;
    rec.id = RecommendationTracker::generate_uuid();
    rec.project_id = project_id;
    rec.type = "caching";
    rec.title = "Add caching for " + agent;
    rec.description = "Repeated queries";
    rec.agent_name = agent;
    rec.estimated_monthly_savings = 42.5;
    rec.estimated_savings_percent = 35.0;
    rec.metrics_snapshot = {{"unique_patterns", 12}, {"duplicate_rate", 35.0}};
    rec.created_at = now;
    rec.expires_at = days_after(now, 14);
    return rec;
}

} // namespace

bool test_pool(DatabasePool* pool) {
    std::cout << "\n=== Test 0: Pool ===" << std::endl;

    size_t initial = pool->size();
    TEST_ASSERT(initial == 2, "Pool opened at configured size");

    for (int i = 0; i < 5; ++i) {
        ScopedConnection conn(pool);
        auto result = QueryResult(conn->exec("SELECT 1 AS one"));
        TEST_ASSERT(result.is_success() && result.get_int64(0, "one") == 1, "Pooled connection answers");
    }
    TEST_ASSERT(pool->size() == initial, "Pool size unchanged after checkouts");

    return true;
}

bool test_schema(DatabasePool* pool) {
    std::cout << "\n=== Test 1: Schema ===" << std::endl;

    TEST_ASSERT(initialize_schema(pool), "Schema created");
    TEST_ASSERT(initialize_schema(pool), "Schema creation is idempotent");
    return true;
}

bool test_events(std::shared_ptr<DatabasePool> pool) {
    std::cout << "\n=== Test 2: Events ===" << std::endl;

    PgEventStore store(pool);
    std::string project = unique_name("events");
    TimePoint now = system_now();

    store.insert_event(EventBuilder(project, "writer", "gpt-4").cost(0.125).latency(420.5)
                           .tokens(1200, 300).at(now - std::chrono::hours(2)).hash("abc").build());
    store.insert_event(EventBuilder(project, "writer", "gpt-4").cost(0.25).latency(380)
                           .tokens(1000, 250).at(now - std::chrono::hours(1)).failed().build());
    store.insert_event(EventBuilder(project, "writer", "gpt-4").cost(1.0)
                           .at(days_before(now, 40)).build());

    auto events = store.fetch_events(project, days_before(now, 30), now);
    TEST_ASSERT(events.size() == 2, "Only events inside the window returned");
    TEST_ASSERT(events[0].timestamp < events[1].timestamp, "Ordered by timestamp");
    TEST_ASSERT(near(events[0].cost, 0.125), "Cost preserved");
    TEST_ASSERT(events[0].input_tokens == 1200 && events[0].output_tokens == 300, "Tokens preserved");
    TEST_ASSERT(events[0].input_hash && *events[0].input_hash == "abc", "Hash preserved");
    TEST_ASSERT(!events[1].success && !events[1].input_hash, "Failure flag and null hash preserved");
    TEST_ASSERT(std::llabs(to_epoch_ms(events[1].timestamp) - to_epoch_ms(now - std::chrono::hours(1))) <= 1,
                "Timestamp preserved to the millisecond");

    return true;
}

bool test_baselines(std::shared_ptr<DatabasePool> pool) {
    std::cout << "\n=== Test 3: Baselines ===" << std::endl;

    PgBaselineStore store(pool);
    std::string project = unique_name("baselines");
    TEST_ASSERT(!store.has_baselines(project), "New project has no baselines");

    Baseline b;
    b.agent_name = "writer";
    b.model = "gpt-4";
    b.avg_cost_per_call = 0.05;
    b.stddev_cost_per_call = 0.01;
    b.avg_latency_ms = 500;
    b.stddev_latency_ms = 50;
    b.avg_error_rate = 0.02;
    b.sample_count = 120;
    b.last_calculated_at = system_now();
    store.upsert_baselines(project, {b});

    b.sample_count = 150;
    b.avg_cost_per_call = 0.06;
    store.upsert_baselines(project, {b});

    auto all = store.list_baselines(project);
    TEST_ASSERT(all.size() == 1, "Upsert keeps one row per key");
    TEST_ASSERT(all[0].sample_count == 150, "Row replaced");
    TEST_ASSERT(near(all[0].avg_cost_per_call, 0.06), "Mean replaced");
    TEST_ASSERT(store.has_baselines(project), "Project has baselines");

    auto fetched = store.get_baseline(project, "writer", "gpt-4");
    TEST_ASSERT(fetched && near(fetched->stddev_latency_ms, 50.0), "Lookup by key");
    TEST_ASSERT(!store.get_baseline(project, "writer", "other"), "Missing key is empty");
    TEST_ASSERT(store.list_baselines(project, std::string("nobody")).empty(), "Agent filter applied");

    return true;
}

bool test_recommendations(std::shared_ptr<DatabasePool> pool) {
    std::cout << "\n=== Test 4: Recommendations ===" << std::endl;

    PgRecommendationStore store(pool);
    std::string project = unique_name("recs");
    TimePoint now = system_now();

    auto created = store.create_if_absent(pending_row(project, "faq", now), now, days_before(now, 14));
    TEST_ASSERT(created.has_value(), "Pending row inserted");
    TEST_ASSERT(created->metrics_snapshot["unique_patterns"] == 12, "Metrics snapshot stored as JSONB");

    auto duplicate = store.create_if_absent(pending_row(project, "faq", now), now, days_before(now, 14));
    TEST_ASSERT(!duplicate.has_value(), "Duplicate pending key rejected");
    TEST_ASSERT(store.list_pending(project, now).size() == 1, "One pending row");

    auto dismissed = store.transition(created->id, project, RecommendationStatus::Dismissed, now,
                                      std::string("later"));
    TEST_ASSERT(dismissed.ok(), "Pending row dismissed");
    TEST_ASSERT(dismissed.recommendation->dismiss_feedback == std::string("later"), "Feedback stored");

    auto again = store.transition(created->id, project, RecommendationStatus::Implemented, now, std::nullopt);
    TEST_ASSERT(again.status == ActionStatus::Unavailable, "Dismissed row cannot be implemented");

    auto missing = store.transition(RecommendationTracker::generate_uuid(), project,
                                    RecommendationStatus::Implemented, now, std::nullopt);
    TEST_ASSERT(missing.status == ActionStatus::NotFound, "Unknown id is not found");

    auto malformed = store.transition("not-a-uuid", project, RecommendationStatus::Implemented, now, std::nullopt);
    TEST_ASSERT(malformed.status == ActionStatus::NotFound, "Malformed id is not found");

    auto cooled = store.create_if_absent(pending_row(project, "faq", now), now, days_before(now, 14));
    TEST_ASSERT(!cooled.has_value(), "Dismissed key suppressed inside cooldown");

    auto other = store.create_if_absent(pending_row(project, "search", now), now, days_before(now, 14));
    TEST_ASSERT(other.has_value(), "Different key inserted");
    auto implemented = store.transition(other->id, project, RecommendationStatus::Implemented, now, std::nullopt);
    TEST_ASSERT(implemented.ok() && implemented.recommendation->implemented_at, "Implemented with timestamp");

    auto savings = store.set_actual_savings(other->id, project, 30.0);
    TEST_ASSERT(savings.ok() && savings.recommendation->actual_monthly_savings == 30.0, "Actual savings stored");

    TEST_ASSERT(store.list_all(project).size() == 2, "All rows listed");

    return true;
}

bool test_pricing(std::shared_ptr<DatabasePool> pool) {
    std::cout << "\n=== Test 5: Pricing ===" << std::endl;

    PgPricingCatalog catalog(pool);
    std::string flagship = unique_name("flagship");
    std::string compact = unique_name("compact");

    catalog.upsert_price({flagship, "test", 0.03, 0.06, 1});
    catalog.upsert_price({compact, "test", 0.001, 0.002, 2});

    auto alternatives = catalog.discover_alternatives(flagship, 1000, 500, 50);
    const ModelAlternative* found = nullptr;
    for (const auto& alt : alternatives) {
        if (alt.model == compact) found = &alt;
    }
    TEST_ASSERT(found != nullptr, "Cheaper model discovered");
    TEST_ASSERT(found->quality_impact == "moderate", "One tier down is moderate");
    TEST_ASSERT(found->source == "dynamic", "No outcomes recorded yet");

    // An implemented, measured downgrade makes the pair learned
    PgRecommendationStore store(pool);
    std::string project = unique_name("pricing");
    TimePoint now = system_now();
    Recommendation rec = pending_row(project, "writer", now);
    rec.type = "model_downgrade";
    rec.model = flagship;
    rec.alternative_model = compact;
    rec.estimated_monthly_savings = 100.0;
    auto created = store.create_if_absent(rec, now, days_before(now, 14));
    TEST_ASSERT(created.has_value(), "Downgrade recommendation stored");
    store.transition(created->id, project, RecommendationStatus::Implemented, now, std::nullopt);
    store.set_actual_savings(created->id, project, 90.0);

    alternatives = catalog.discover_alternatives(flagship, 1000, 500, 50);
    found = nullptr;
    for (const auto& alt : alternatives) {
        if (alt.model == compact) found = &alt;
    }
    TEST_ASSERT(found && found->source == "learned", "Outcome turns the pair into learned");
    TEST_ASSERT(found->savings_accuracy && near(*found->savings_accuracy, 0.9), "Accuracy from stored rows");

    return true;
}

int main() {
    spdlog::set_level(spdlog::level::warn);  // Reduce noise during tests

    std::cout << "╔══════════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║     PostgreSQL Store Tests                               ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════════╝" << std::endl;

    if (!std::getenv("PG_HOST")) {
        std::cout << "⚠️  PG_HOST not set, skipping database tests" << std::endl;
        return 0;
    }

    bool all_passed = true;

    try {
        auto pool = make_pool();

        all_passed &= test_pool(pool.get());
        all_passed &= test_schema(pool.get());
        if (all_passed) {
            all_passed &= test_events(pool);
            all_passed &= test_baselines(pool);
            all_passed &= test_recommendations(pool);
            all_passed &= test_pricing(pool);
        }
    } catch (const std::exception& e) {
        std::cerr << "❌ Database error: " << e.what() << std::endl;
        all_passed = false;
    }

    std::cout << "\n" << std::string(60, '=') << std::endl;
    if (all_passed) {
        std::cout << "✅ ALL TESTS PASSED!" << std::endl;
        return 0;
    } else {
        std::cout << "❌ SOME TESTS FAILED" << std::endl;
        return 1;
    }
}
