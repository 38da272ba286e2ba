#pragma once

#include "agentcost/memory_stores.hpp"
#include "agentcost/time_utils.hpp"
#include "agentcost/usage_types.hpp"
#include <chrono>
#include <cmath>
#include <iostream>
#include <optional>
#include <string>

// Test utilities
#define TEST_ASSERT(condition, message) \
    if (!(condition)) { \
        std::cerr << "❌ TEST FAILED: " << message << std::endl; \
        return false; \
    } else { \
        std::cout << "✅ " << message << std::endl; \
    }

namespace agentcost {
namespace testing {

// 2024-06-01T12:00:00Z
inline TimePoint fixed_now() {
    return from_epoch_ms(1717243200000LL);
}

inline Clock fixed_clock() {
    return [] { return fixed_now(); };
}

inline TimePoint hours_ago(double hours) {
    return fixed_now() - std::chrono::milliseconds(static_cast<int64_t>(hours * 3600.0 * 1000.0));
}

inline bool near(double a, double b, double tolerance = 1e-6) {
    return std::fabs(a - b) <= tolerance;
}

struct EventBuilder {
    Event event;

    EventBuilder(const std::string& project_id, const std::string& agent, const std::string& model) {
        static int64_t sequence = 0;
        event.id = "evt-" + std::to_string(++sequence);
        event.project_id = project_id;
        event.agent_name = agent;
        event.model = model;
        event.timestamp = hours_ago(1);
    }

    EventBuilder& cost(double value) { event.cost = value; return *this; }
    EventBuilder& latency(double value) { event.latency_ms = value; return *this; }
    EventBuilder& tokens(int64_t input, int64_t output) {
        event.input_tokens = input;
        event.output_tokens = output;
        return *this;
    }
    EventBuilder& at(TimePoint tp) { event.timestamp = tp; return *this; }
    EventBuilder& failed() { event.success = false; return *this; }
    EventBuilder& hash(const std::string& value) { event.input_hash = value; return *this; }

    Event build() const { return event; }
};

} // namespace testing
} // namespace agentcost
