#pragma once

#include <string>
#include <cstdlib>
#include <cstring>

namespace agentcost {

// Helper function to get boolean from environment
inline bool get_env_bool(const char* name, bool default_value) {
    const char* value = std::getenv(name);
    if (!value) return default_value;
    return std::strcmp(value, "true") == 0;
}

// Helper function to get int from environment
inline int get_env_int(const char* name, int default_value) {
    const char* value = std::getenv(name);
    return value ? std::atoi(value) : default_value;
}

// Helper function to get double from environment
inline double get_env_double(const char* name, double default_value) {
    const char* value = std::getenv(name);
    return value ? std::atof(value) : default_value;
}

// Helper function to get string from environment
inline std::string get_env_string(const char* name, const std::string& default_value) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : default_value;
}

struct DatabaseConfig {
    // Connection settings
    std::string user = "postgres";
    std::string host = "localhost";
    std::string database = "postgres";
    std::string password = "postgres";
    std::string port = "5432";

    // SSL configuration
    bool use_ssl = false;
    bool ssl_reject_unauthorized = true;

    // Pool configuration
    int pool_size = 10;
    int idle_timeout = 30000;           // 30 seconds
    int connection_timeout = 2000;       // 2 seconds
    int statement_timeout = 30000;       // 30 seconds
    int lock_timeout = 10000;            // 10 seconds
    int pool_acquisition_timeout = 10000; // 10 seconds - timeout for acquiring connection from pool

    static DatabaseConfig from_env() {
        DatabaseConfig config;
        config.user = get_env_string("PG_USER", "postgres");
        config.host = get_env_string("PG_HOST", "localhost");
        config.database = get_env_string("PG_DB", "postgres");
        config.password = get_env_string("PG_PASSWORD", "postgres");
        config.port = get_env_string("PG_PORT", "5432");

        config.use_ssl = get_env_bool("PG_USE_SSL", false);
        config.ssl_reject_unauthorized = get_env_bool("PG_SSL_REJECT_UNAUTHORIZED", true);

        config.pool_size = get_env_int("DB_POOL_SIZE", 10);
        config.idle_timeout = get_env_int("DB_IDLE_TIMEOUT", 30000);
        config.connection_timeout = get_env_int("DB_CONNECTION_TIMEOUT", 2000);
        config.statement_timeout = get_env_int("DB_STATEMENT_TIMEOUT", 30000);
        config.lock_timeout = get_env_int("DB_LOCK_TIMEOUT", 10000);
        config.pool_acquisition_timeout = get_env_int("DB_POOL_ACQUISITION_TIMEOUT", 10000);

        return config;
    }

    std::string connection_string() const {
        std::string conn_str = "host=" + host + " port=" + port + " dbname=" + database +
                               " user=" + user + " password=" + password;

        if (use_ssl) {
            conn_str += ssl_reject_unauthorized ? " sslmode=require" : " sslmode=prefer";
        } else {
            conn_str += " sslmode=disable";
        }

        // connect_timeout is in seconds; statement/lock/idle timeouts are applied
        // per connection with SET (see DatabaseConnection)
        conn_str += " connect_timeout=" + std::to_string(connection_timeout / 1000);

        return conn_str;
    }
};

struct BaselineConfig {
    int min_samples = 10;                // Groups below this call count get no baseline

    static BaselineConfig from_env() {
        BaselineConfig config;
        config.min_samples = get_env_int("AGENTCOST_BASELINE_MIN_SAMPLES", 10);
        return config;
    }
};

struct AnomalyConfig {
    int recent_hours = 24;               // Trailing window compared against baselines
    double z_threshold = 2.0;            // |z| >= this is an anomaly
    double high_severity_z = 3.0;        // |z| > this is "high"
    double error_rate_ratio = 1.5;       // current > baseline * ratio is an anomaly
    double error_rate_high_ratio = 2.0;  // current > baseline * ratio is "high"

    static AnomalyConfig from_env() {
        AnomalyConfig config;
        config.recent_hours = get_env_int("AGENTCOST_ANOMALY_RECENT_HOURS", 24);
        config.z_threshold = get_env_double("AGENTCOST_ANOMALY_Z_THRESHOLD", 2.0);
        config.high_severity_z = get_env_double("AGENTCOST_ANOMALY_HIGH_Z", 3.0);
        config.error_rate_ratio = get_env_double("AGENTCOST_ANOMALY_ERROR_RATIO", 1.5);
        config.error_rate_high_ratio = get_env_double("AGENTCOST_ANOMALY_ERROR_HIGH_RATIO", 2.0);
        return config;
    }
};

struct PatternConfig {
    int min_occurrences = 5;             // Hash groups below this are not duplicates
    double min_savings = 1.0;            // $/month floor for a caching opportunity
    int window_days = 30;

    static PatternConfig from_env() {
        PatternConfig config;
        config.min_occurrences = get_env_int("AGENTCOST_PATTERN_MIN_OCCURRENCES", 5);
        config.min_savings = get_env_double("AGENTCOST_PATTERN_MIN_SAVINGS", 1.0);
        config.window_days = get_env_int("AGENTCOST_PATTERN_WINDOW_DAYS", 30);
        return config;
    }
};

struct SuggestionConfig {
    // Group eligibility
    int min_calls = 10;
    double min_group_cost = 0.01;

    // Model downgrade
    double min_actionable_savings = 1.0; // $/month
    int max_alternatives = 3;

    // Priority buckets ($/month)
    double high_priority_savings = 50.0;
    double medium_priority_savings = 10.0;

    // Error reduction
    int min_error_count = 3;
    double default_error_rate = 0.02;    // Used when no baseline exists
    double error_rate_multiplier = 1.5;
    double min_monthly_waste = 0.50;

    // Latency
    double latency_z_threshold = 2.0;
    double latency_high_z = 3.0;

    // Output shaping
    int summary_top_n = 5;

    static SuggestionConfig from_env() {
        SuggestionConfig config;
        config.min_calls = get_env_int("AGENTCOST_SUGGESTION_MIN_CALLS", 10);
        config.min_group_cost = get_env_double("AGENTCOST_SUGGESTION_MIN_GROUP_COST", 0.01);
        config.min_actionable_savings = get_env_double("AGENTCOST_MIN_ACTIONABLE_SAVINGS", 1.0);
        config.max_alternatives = get_env_int("AGENTCOST_MAX_ALTERNATIVES", 3);
        config.high_priority_savings = get_env_double("AGENTCOST_HIGH_PRIORITY_SAVINGS", 50.0);
        config.medium_priority_savings = get_env_double("AGENTCOST_MEDIUM_PRIORITY_SAVINGS", 10.0);
        config.min_error_count = get_env_int("AGENTCOST_MIN_ERROR_COUNT", 3);
        config.default_error_rate = get_env_double("AGENTCOST_DEFAULT_ERROR_RATE", 0.02);
        config.error_rate_multiplier = get_env_double("AGENTCOST_ERROR_RATE_MULTIPLIER", 1.5);
        config.min_monthly_waste = get_env_double("AGENTCOST_MIN_MONTHLY_WASTE", 0.50);
        config.latency_z_threshold = get_env_double("AGENTCOST_LATENCY_Z_THRESHOLD", 2.0);
        config.latency_high_z = get_env_double("AGENTCOST_LATENCY_HIGH_Z", 3.0);
        config.summary_top_n = get_env_int("AGENTCOST_SUMMARY_TOP_N", 5);
        return config;
    }
};

struct RecommendationConfig {
    int cooldown_days = 14;              // Pending lifetime and duplicate suppression window
    int max_persisted = 10;              // Top-N suggestions persisted per generation
    double min_savings = 1.0;            // Suggestions below this are not persisted

    static RecommendationConfig from_env() {
        RecommendationConfig config;
        config.cooldown_days = get_env_int("AGENTCOST_RECOMMENDATION_COOLDOWN_DAYS", 14);
        config.max_persisted = get_env_int("AGENTCOST_RECOMMENDATION_MAX_PERSISTED", 10);
        config.min_savings = get_env_double("AGENTCOST_RECOMMENDATION_MIN_SAVINGS", 1.0);
        return config;
    }
};

struct OptimizerConfig {
    BaselineConfig baseline;
    AnomalyConfig anomaly;
    PatternConfig pattern;
    SuggestionConfig suggestion;
    RecommendationConfig recommendation;

    static OptimizerConfig from_env() {
        OptimizerConfig config;
        config.baseline = BaselineConfig::from_env();
        config.anomaly = AnomalyConfig::from_env();
        config.pattern = PatternConfig::from_env();
        config.suggestion = SuggestionConfig::from_env();
        config.recommendation = RecommendationConfig::from_env();
        return config;
    }
};

struct LoggingConfig {
    bool enable_logging = true;
    std::string log_level = "info";

    static LoggingConfig from_env() {
        LoggingConfig config;
        config.enable_logging = get_env_bool("ENABLE_LOGGING", true);
        config.log_level = get_env_string("LOG_LEVEL", "info");
        return config;
    }
};

struct Config {
    DatabaseConfig database;
    OptimizerConfig optimizer;
    LoggingConfig logging;

    static Config load() {
        Config config;
        config.database = DatabaseConfig::from_env();
        config.optimizer = OptimizerConfig::from_env();
        config.logging = LoggingConfig::from_env();
        return config;
    }
};

} // namespace agentcost
