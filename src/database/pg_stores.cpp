#include "agentcost/pg_stores.hpp"
#include <spdlog/spdlog.h>
#include <cstdio>
#include <stdexcept>

namespace agentcost {

namespace {

const char* kUniqueViolation = "23505";
const char* kInvalidTextRepresentation = "22P02";

std::string ms_param(TimePoint tp) {
    return std::to_string(to_epoch_ms(tp));
}

std::string double_param(double value) {
    // %.17g keeps doubles round-trippable through text
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.17g", value);
    return buf;
}

const std::string* nullable_param(const std::optional<std::string>& value) {
    return value ? &*value : nullptr;
}

std::optional<std::string> optional_text(const QueryResult& result, int row, const std::string& field) {
    if (result.is_null(row, field)) return std::nullopt;
    return result.get_value(row, field);
}

std::optional<TimePoint> optional_time(const QueryResult& result, int row, const std::string& field) {
    if (result.is_null(row, field)) return std::nullopt;
    return from_epoch_ms(result.get_int64(row, field));
}

// Rolls back and throws; every Pg store write funnels failures through here
[[noreturn]] void fail_transaction(DatabaseConnection& conn, const std::string& what, const QueryResult& result) {
    std::string message = what + ": " + result.error_message();
    conn.rollback_transaction();
    spdlog::error("{}", message);
    throw std::runtime_error(message);
}

void require_success(const QueryResult& result, const std::string& what) {
    if (!result.is_success()) {
        spdlog::error("{}: {}", what, result.error_message());
        throw std::runtime_error(what + ": " + result.error_message());
    }
}

void begin_or_throw(DatabaseConnection& conn, const std::string& what) {
    if (!conn.begin_transaction()) {
        throw std::runtime_error("Failed to begin transaction for " + what + ": " + conn.last_error());
    }
}

void commit_or_throw(DatabaseConnection& conn, const std::string& what) {
    if (!conn.commit_transaction()) {
        std::string error = conn.last_error();
        conn.rollback_transaction();
        throw std::runtime_error("Failed to commit " + what + ": " + error);
    }
}

const char* kBaselineColumns = R"(
    project_id, agent_name, model,
    avg_cost_per_call, stddev_cost_per_call,
    avg_input_tokens, stddev_input_tokens,
    avg_output_tokens, stddev_output_tokens,
    avg_latency_ms, stddev_latency_ms,
    avg_daily_calls, avg_error_rate, sample_count,
    (EXTRACT(EPOCH FROM last_calculated_at) * 1000)::BIGINT AS last_calculated_at_ms
)";

Baseline row_to_baseline(const QueryResult& result, int row) {
    Baseline b;
    b.project_id = result.get_value(row, "project_id");
    b.agent_name = result.get_value(row, "agent_name");
    b.model = result.get_value(row, "model");
    b.avg_cost_per_call = result.get_double(row, "avg_cost_per_call");
    b.stddev_cost_per_call = result.get_double(row, "stddev_cost_per_call");
    b.avg_input_tokens = result.get_double(row, "avg_input_tokens");
    b.stddev_input_tokens = result.get_double(row, "stddev_input_tokens");
    b.avg_output_tokens = result.get_double(row, "avg_output_tokens");
    b.stddev_output_tokens = result.get_double(row, "stddev_output_tokens");
    b.avg_latency_ms = result.get_double(row, "avg_latency_ms");
    b.stddev_latency_ms = result.get_double(row, "stddev_latency_ms");
    b.avg_daily_calls = result.get_double(row, "avg_daily_calls");
    b.avg_error_rate = result.get_double(row, "avg_error_rate");
    b.sample_count = result.get_int64(row, "sample_count");
    b.last_calculated_at = from_epoch_ms(result.get_int64(row, "last_calculated_at_ms"));
    return b;
}

const char* kRecommendationColumns = R"(
    id::text AS id, project_id, recommendation_type, title, description,
    agent_name, model, alternative_model,
    estimated_monthly_savings, estimated_savings_percent,
    metrics_snapshot::text AS metrics_snapshot, status,
    (EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_at_ms,
    (EXTRACT(EPOCH FROM expires_at) * 1000)::BIGINT AS expires_at_ms,
    (EXTRACT(EPOCH FROM implemented_at) * 1000)::BIGINT AS implemented_at_ms,
    (EXTRACT(EPOCH FROM dismissed_at) * 1000)::BIGINT AS dismissed_at_ms,
    dismiss_feedback, actual_monthly_savings
)";

Recommendation row_to_recommendation(const QueryResult& result, int row) {
    Recommendation rec;
    rec.id = result.get_value(row, "id");
    rec.project_id = result.get_value(row, "project_id");
    rec.type = result.get_value(row, "recommendation_type");
    rec.title = result.get_value(row, "title");
    rec.description = result.get_value(row, "description");
    rec.agent_name = optional_text(result, row, "agent_name");
    rec.model = optional_text(result, row, "model");
    rec.alternative_model = optional_text(result, row, "alternative_model");
    rec.estimated_monthly_savings = result.get_double(row, "estimated_monthly_savings");
    rec.estimated_savings_percent = result.get_double(row, "estimated_savings_percent");

    std::string snapshot = result.get_value(row, "metrics_snapshot");
    rec.metrics_snapshot = nlohmann::json::parse(snapshot.empty() ? "{}" : snapshot, nullptr, false);
    if (rec.metrics_snapshot.is_discarded()) {
        spdlog::warn("Unreadable metrics snapshot on recommendation {}", rec.id);
        rec.metrics_snapshot = nlohmann::json::object();
    }

    rec.status = parse_recommendation_status(result.get_value(row, "status"))
                     .value_or(RecommendationStatus::Pending);
    rec.created_at = from_epoch_ms(result.get_int64(row, "created_at_ms"));
    rec.expires_at = from_epoch_ms(result.get_int64(row, "expires_at_ms"));
    rec.implemented_at = optional_time(result, row, "implemented_at_ms");
    rec.dismissed_at = optional_time(result, row, "dismissed_at_ms");
    rec.dismiss_feedback = optional_text(result, row, "dismiss_feedback");
    if (!result.is_null(row, "actual_monthly_savings")) {
        rec.actual_monthly_savings = result.get_double(row, "actual_monthly_savings");
    }
    return rec;
}

std::vector<Recommendation> rows_to_recommendations(const QueryResult& result) {
    std::vector<Recommendation> rows;
    rows.reserve(static_cast<size_t>(result.num_rows()));
    for (int i = 0; i < result.num_rows(); ++i) {
        rows.push_back(row_to_recommendation(result, i));
    }
    return rows;
}

} // namespace

// ============================================================================
// Schema
// ============================================================================

bool initialize_schema(DatabasePool* pool) {
    try {
        ScopedConnection conn(pool);

        auto schema_result = QueryResult(conn->exec("CREATE SCHEMA IF NOT EXISTS agentcost"));
        if (!schema_result.is_success()) {
            spdlog::error("Failed to create schema: {}", schema_result.error_message());
            return false;
        }

        std::string create_tables_sql = R"(
            CREATE TABLE IF NOT EXISTS agentcost.events (
                id UUID PRIMARY KEY DEFAULT gen_random_uuid(),
                project_id VARCHAR(255) NOT NULL,
                agent_name VARCHAR(255) NOT NULL,
                model VARCHAR(255) NOT NULL,
                input_tokens BIGINT NOT NULL DEFAULT 0,
                output_tokens BIGINT NOT NULL DEFAULT 0,
                cost DOUBLE PRECISION NOT NULL DEFAULT 0,
                latency_ms DOUBLE PRECISION NOT NULL DEFAULT 0,
                success BOOLEAN NOT NULL DEFAULT TRUE,
                input_hash VARCHAR(128),
                timestamp TIMESTAMPTZ NOT NULL DEFAULT NOW()
            );

            CREATE TABLE IF NOT EXISTS agentcost.project_baselines (
                project_id VARCHAR(255) NOT NULL,
                agent_name VARCHAR(255) NOT NULL,
                model VARCHAR(255) NOT NULL,
                avg_cost_per_call DOUBLE PRECISION NOT NULL DEFAULT 0,
                stddev_cost_per_call DOUBLE PRECISION NOT NULL DEFAULT 0,
                avg_input_tokens DOUBLE PRECISION NOT NULL DEFAULT 0,
                stddev_input_tokens DOUBLE PRECISION NOT NULL DEFAULT 0,
                avg_output_tokens DOUBLE PRECISION NOT NULL DEFAULT 0,
                stddev_output_tokens DOUBLE PRECISION NOT NULL DEFAULT 0,
                avg_latency_ms DOUBLE PRECISION NOT NULL DEFAULT 0,
                stddev_latency_ms DOUBLE PRECISION NOT NULL DEFAULT 0,
                avg_daily_calls DOUBLE PRECISION NOT NULL DEFAULT 0,
                avg_error_rate DOUBLE PRECISION NOT NULL DEFAULT 0,
                sample_count BIGINT NOT NULL DEFAULT 0,
                last_calculated_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                PRIMARY KEY (project_id, agent_name, model)
            );

            CREATE TABLE IF NOT EXISTS agentcost.optimization_recommendations (
                id UUID PRIMARY KEY,
                project_id VARCHAR(255) NOT NULL,
                recommendation_type VARCHAR(64) NOT NULL,
                title TEXT NOT NULL,
                description TEXT NOT NULL,
                agent_name VARCHAR(255),
                model VARCHAR(255),
                alternative_model VARCHAR(255),
                estimated_monthly_savings DOUBLE PRECISION NOT NULL DEFAULT 0,
                estimated_savings_percent DOUBLE PRECISION NOT NULL DEFAULT 0,
                metrics_snapshot JSONB NOT NULL DEFAULT '{}'::jsonb,
                status VARCHAR(32) NOT NULL DEFAULT 'pending',
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                expires_at TIMESTAMPTZ NOT NULL,
                implemented_at TIMESTAMPTZ,
                dismissed_at TIMESTAMPTZ,
                dismiss_feedback TEXT,
                actual_monthly_savings DOUBLE PRECISION
            );

            CREATE TABLE IF NOT EXISTS agentcost.model_pricing (
                model VARCHAR(255) PRIMARY KEY,
                provider VARCHAR(255) NOT NULL DEFAULT '',
                input_per_1k DOUBLE PRECISION NOT NULL,
                output_per_1k DOUBLE PRECISION NOT NULL,
                tier INTEGER NOT NULL DEFAULT 1,
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            );
        )";

        auto tables_result = QueryResult(conn->exec(create_tables_sql));
        if (!tables_result.is_success()) {
            spdlog::error("Failed to create tables: {}", tables_result.error_message());
            return false;
        }

        // The partial unique index is what makes pending dedup safe under concurrency
        std::string create_indexes_sql = R"(
            CREATE INDEX IF NOT EXISTS idx_events_project_timestamp ON agentcost.events(project_id, timestamp);
            CREATE INDEX IF NOT EXISTS idx_events_project_hash ON agentcost.events(project_id, agent_name, input_hash) WHERE input_hash IS NOT NULL;
            CREATE INDEX IF NOT EXISTS idx_recommendations_project_status ON agentcost.optimization_recommendations(project_id, status, created_at DESC);
            CREATE UNIQUE INDEX IF NOT EXISTS idx_recommendations_pending_key
                ON agentcost.optimization_recommendations(project_id, recommendation_type, COALESCE(agent_name, ''), COALESCE(model, ''))
                WHERE status = 'pending';
        )";

        auto index_result = QueryResult(conn->exec(create_indexes_sql));
        if (!index_result.is_success()) {
            spdlog::error("Failed to create indexes: {}", index_result.error_message());
            return false;
        }

        spdlog::info("Database schema initialized");
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        return false;
    }
}

// ============================================================================
// PgEventStore
// ============================================================================

PgEventStore::PgEventStore(std::shared_ptr<DatabasePool> db_pool)
    : db_pool_(std::move(db_pool)) {
}

std::vector<Event> PgEventStore::fetch_events(const std::string& project_id,
                                              TimePoint from,
                                              TimePoint to) {
    ScopedConnection conn(db_pool_.get());

    std::string sql = R"(
        SELECT id::text AS id, project_id, agent_name, model,
               input_tokens, output_tokens, cost, latency_ms, success, input_hash,
               (EXTRACT(EPOCH FROM timestamp) * 1000)::BIGINT AS timestamp_ms
        FROM agentcost.events
        WHERE project_id = $1
          AND timestamp >= to_timestamp($2::double precision / 1000)
          AND timestamp <= to_timestamp($3::double precision / 1000)
        ORDER BY timestamp ASC, id ASC
    )";

    auto result = QueryResult(conn->exec_params(sql, {project_id, ms_param(from), ms_param(to)}));
    require_success(result, "Failed to fetch events");

    std::vector<Event> events;
    events.reserve(static_cast<size_t>(result.num_rows()));
    for (int i = 0; i < result.num_rows(); ++i) {
        Event e;
        e.id = result.get_value(i, "id");
        e.project_id = result.get_value(i, "project_id");
        e.agent_name = result.get_value(i, "agent_name");
        e.model = result.get_value(i, "model");
        e.input_tokens = result.get_int64(i, "input_tokens");
        e.output_tokens = result.get_int64(i, "output_tokens");
        e.cost = result.get_double(i, "cost");
        e.latency_ms = result.get_double(i, "latency_ms");
        e.success = result.get_bool(i, "success");
        e.input_hash = optional_text(result, i, "input_hash");
        e.timestamp = from_epoch_ms(result.get_int64(i, "timestamp_ms"));
        events.push_back(std::move(e));
    }
    return events;
}

void PgEventStore::insert_event(const Event& event) {
    ScopedConnection conn(db_pool_.get());

    std::string sql = R"(
        INSERT INTO agentcost.events
            (project_id, agent_name, model, input_tokens, output_tokens,
             cost, latency_ms, success, input_hash, timestamp)
        VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, to_timestamp($10::double precision / 1000))
    )";

    std::string input_tokens = std::to_string(event.input_tokens);
    std::string output_tokens = std::to_string(event.output_tokens);
    std::string cost = double_param(event.cost);
    std::string latency = double_param(event.latency_ms);
    std::string success = event.success ? "true" : "false";
    std::string timestamp = ms_param(event.timestamp);

    auto result = QueryResult(conn->exec_params_nullable(sql, {
        &event.project_id, &event.agent_name, &event.model,
        &input_tokens, &output_tokens, &cost, &latency, &success,
        nullable_param(event.input_hash), &timestamp
    }));
    require_success(result, "Failed to insert event");
}

// ============================================================================
// PgBaselineStore
// ============================================================================

PgBaselineStore::PgBaselineStore(std::shared_ptr<DatabasePool> db_pool)
    : db_pool_(std::move(db_pool)) {
}

void PgBaselineStore::upsert_baselines(const std::string& project_id,
                                       const std::vector<Baseline>& baselines) {
    if (baselines.empty()) return;

    ScopedConnection conn(db_pool_.get());
    begin_or_throw(*conn, "baseline upsert");

    std::string sql = R"(
        INSERT INTO agentcost.project_baselines (
            project_id, agent_name, model,
            avg_cost_per_call, stddev_cost_per_call,
            avg_input_tokens, stddev_input_tokens,
            avg_output_tokens, stddev_output_tokens,
            avg_latency_ms, stddev_latency_ms,
            avg_daily_calls, avg_error_rate, sample_count, last_calculated_at
        ) VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14,
                  to_timestamp($15::double precision / 1000))
        ON CONFLICT (project_id, agent_name, model) DO UPDATE SET
            avg_cost_per_call = EXCLUDED.avg_cost_per_call,
            stddev_cost_per_call = EXCLUDED.stddev_cost_per_call,
            avg_input_tokens = EXCLUDED.avg_input_tokens,
            stddev_input_tokens = EXCLUDED.stddev_input_tokens,
            avg_output_tokens = EXCLUDED.avg_output_tokens,
            stddev_output_tokens = EXCLUDED.stddev_output_tokens,
            avg_latency_ms = EXCLUDED.avg_latency_ms,
            stddev_latency_ms = EXCLUDED.stddev_latency_ms,
            avg_daily_calls = EXCLUDED.avg_daily_calls,
            avg_error_rate = EXCLUDED.avg_error_rate,
            sample_count = EXCLUDED.sample_count,
            last_calculated_at = EXCLUDED.last_calculated_at
    )";

    for (const auto& b : baselines) {
        auto result = QueryResult(conn->exec_params(sql, {
            project_id, b.agent_name, b.model,
            double_param(b.avg_cost_per_call), double_param(b.stddev_cost_per_call),
            double_param(b.avg_input_tokens), double_param(b.stddev_input_tokens),
            double_param(b.avg_output_tokens), double_param(b.stddev_output_tokens),
            double_param(b.avg_latency_ms), double_param(b.stddev_latency_ms),
            double_param(b.avg_daily_calls), double_param(b.avg_error_rate),
            std::to_string(b.sample_count), ms_param(b.last_calculated_at)
        }));
        if (!result.is_success()) {
            fail_transaction(*conn, "Failed to upsert baseline " + b.agent_name + "/" + b.model, result);
        }
    }

    commit_or_throw(*conn, "baseline upsert");
}

std::optional<Baseline> PgBaselineStore::get_baseline(const std::string& project_id,
                                                      const std::string& agent_name,
                                                      const std::string& model) {
    ScopedConnection conn(db_pool_.get());

    std::string sql = std::string("SELECT ") + kBaselineColumns +
        " FROM agentcost.project_baselines WHERE project_id = $1 AND agent_name = $2 AND model = $3";

    auto result = QueryResult(conn->exec_params(sql, {project_id, agent_name, model}));
    require_success(result, "Failed to load baseline");

    if (result.num_rows() == 0) return std::nullopt;
    return row_to_baseline(result, 0);
}

std::vector<Baseline> PgBaselineStore::list_baselines(const std::string& project_id,
                                                      const std::optional<std::string>& agent_name,
                                                      const std::optional<std::string>& model) {
    ScopedConnection conn(db_pool_.get());

    std::string sql = std::string("SELECT ") + kBaselineColumns + R"(
        FROM agentcost.project_baselines
        WHERE project_id = $1
          AND ($2::text IS NULL OR agent_name = $2)
          AND ($3::text IS NULL OR model = $3)
        ORDER BY agent_name, model
    )";

    auto result = QueryResult(conn->exec_params_nullable(sql, {
        &project_id, nullable_param(agent_name), nullable_param(model)
    }));
    require_success(result, "Failed to list baselines");

    std::vector<Baseline> baselines;
    for (int i = 0; i < result.num_rows(); ++i) {
        baselines.push_back(row_to_baseline(result, i));
    }
    return baselines;
}

bool PgBaselineStore::has_baselines(const std::string& project_id) {
    ScopedConnection conn(db_pool_.get());

    auto result = QueryResult(conn->exec_params(
        "SELECT EXISTS(SELECT 1 FROM agentcost.project_baselines WHERE project_id = $1) AS present",
        {project_id}));
    require_success(result, "Failed to check baselines");

    return result.num_rows() > 0 && result.get_bool(0, "present");
}

// ============================================================================
// PgRecommendationStore
// ============================================================================

PgRecommendationStore::PgRecommendationStore(std::shared_ptr<DatabasePool> db_pool)
    : db_pool_(std::move(db_pool)) {
}

std::optional<Recommendation> PgRecommendationStore::create_if_absent(const Recommendation& rec,
                                                                      TimePoint now,
                                                                      TimePoint dismissed_since) {
    ScopedConnection conn(db_pool_.get());
    begin_or_throw(*conn, "recommendation create");

    std::string now_ms = ms_param(now);
    std::string since_ms = ms_param(dismissed_since);

    // Lazy expiry of stale pending rows for this key
    std::string expire_sql = R"(
        UPDATE agentcost.optimization_recommendations
        SET status = 'expired'
        WHERE project_id = $1 AND recommendation_type = $2
          AND COALESCE(agent_name, '') = COALESCE($3, '')
          AND COALESCE(model, '') = COALESCE($4, '')
          AND status = 'pending'
          AND expires_at <= to_timestamp($5::double precision / 1000)
    )";
    auto expire_result = QueryResult(conn->exec_params_nullable(expire_sql, {
        &rec.project_id, &rec.type, nullable_param(rec.agent_name), nullable_param(rec.model), &now_ms
    }));
    if (!expire_result.is_success()) {
        fail_transaction(*conn, "Failed to expire stale recommendations", expire_result);
    }

    std::string existing_sql = R"(
        SELECT id::text AS id FROM agentcost.optimization_recommendations
        WHERE project_id = $1 AND recommendation_type = $2
          AND COALESCE(agent_name, '') = COALESCE($3, '')
          AND COALESCE(model, '') = COALESCE($4, '')
          AND (
              (status = 'pending' AND expires_at > to_timestamp($5::double precision / 1000))
              OR (status = 'dismissed' AND dismissed_at >= to_timestamp($6::double precision / 1000))
          )
        LIMIT 1
    )";
    auto existing = QueryResult(conn->exec_params_nullable(existing_sql, {
        &rec.project_id, &rec.type, nullable_param(rec.agent_name), nullable_param(rec.model),
        &now_ms, &since_ms
    }));
    if (!existing.is_success()) {
        fail_transaction(*conn, "Failed to check existing recommendations", existing);
    }
    if (existing.num_rows() > 0) {
        spdlog::debug("Recommendation {} suppresses new {} for project {}",
                      existing.get_value(0, "id"), rec.type, rec.project_id);
        commit_or_throw(*conn, "recommendation create");
        return std::nullopt;
    }

    std::string insert_sql = std::string(R"(
        INSERT INTO agentcost.optimization_recommendations (
            id, project_id, recommendation_type, title, description,
            agent_name, model, alternative_model,
            estimated_monthly_savings, estimated_savings_percent, metrics_snapshot,
            status, created_at, expires_at
        ) VALUES ($1::uuid, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11::jsonb, 'pending',
                  to_timestamp($12::double precision / 1000),
                  to_timestamp($13::double precision / 1000))
        RETURNING )") + kRecommendationColumns;

    std::string savings = double_param(rec.estimated_monthly_savings);
    std::string percent = double_param(rec.estimated_savings_percent);
    std::string snapshot = rec.metrics_snapshot.dump();
    std::string created_ms = ms_param(rec.created_at);
    std::string expires_ms = ms_param(rec.expires_at);

    auto inserted = QueryResult(conn->exec_params_nullable(insert_sql, {
        &rec.id, &rec.project_id, &rec.type, &rec.title, &rec.description,
        nullable_param(rec.agent_name), nullable_param(rec.model), nullable_param(rec.alternative_model),
        &savings, &percent, &snapshot, &created_ms, &expires_ms
    }));

    if (!inserted.is_success()) {
        if (inserted.sql_state() == kUniqueViolation) {
            // A concurrent writer won the race for this key
            conn->rollback_transaction();
            spdlog::debug("Concurrent pending {} recommendation for project {}, skipped",
                          rec.type, rec.project_id);
            return std::nullopt;
        }
        fail_transaction(*conn, "Failed to insert recommendation", inserted);
    }

    commit_or_throw(*conn, "recommendation create");
    return row_to_recommendation(inserted, 0);
}

ActionStatus PgRecommendationStore::classify_miss(DatabaseConnection& conn,
                                                  const std::string& recommendation_id,
                                                  const std::string& project_id) {
    auto result = QueryResult(conn.exec_params(
        "SELECT 1 FROM agentcost.optimization_recommendations WHERE id = $1::uuid AND project_id = $2",
        {recommendation_id, project_id}));
    if (!result.is_success()) {
        if (result.sql_state() == kInvalidTextRepresentation) return ActionStatus::NotFound;
        require_success(result, "Failed to look up recommendation");
    }
    return result.num_rows() > 0 ? ActionStatus::Unavailable : ActionStatus::NotFound;
}

ActionResult PgRecommendationStore::transition(const std::string& recommendation_id,
                                               const std::string& project_id,
                                               RecommendationStatus target,
                                               TimePoint now,
                                               const std::optional<std::string>& feedback) {
    ActionResult action;
    if (target != RecommendationStatus::Implemented && target != RecommendationStatus::Dismissed) {
        action.status = ActionStatus::Unavailable;
        return action;
    }

    ScopedConnection conn(db_pool_.get());

    // The WHERE clause is the whole precondition, so the check and the write are one statement
    std::string sql = std::string(R"(
        UPDATE agentcost.optimization_recommendations
        SET status = $3,
            implemented_at = CASE WHEN $3 = 'implemented' THEN to_timestamp($4::double precision / 1000) ELSE implemented_at END,
            dismissed_at = CASE WHEN $3 = 'dismissed' THEN to_timestamp($4::double precision / 1000) ELSE dismissed_at END,
            dismiss_feedback = CASE WHEN $3 = 'dismissed' THEN $5 ELSE dismiss_feedback END
        WHERE id = $1::uuid AND project_id = $2
          AND status = 'pending'
          AND expires_at > to_timestamp($4::double precision / 1000)
        RETURNING )") + kRecommendationColumns;

    std::string status = to_string(target);
    std::string now_ms = ms_param(now);

    auto result = QueryResult(conn->exec_params_nullable(sql, {
        &recommendation_id, &project_id, &status, &now_ms, nullable_param(feedback)
    }));

    if (!result.is_success()) {
        if (result.sql_state() == kInvalidTextRepresentation) {
            action.status = ActionStatus::NotFound;
            return action;
        }
        require_success(result, "Failed to update recommendation");
    }

    if (result.num_rows() == 0) {
        action.status = classify_miss(*conn, recommendation_id, project_id);
        return action;
    }

    action.status = ActionStatus::Ok;
    action.recommendation = row_to_recommendation(result, 0);
    spdlog::info("Recommendation {} marked {}", recommendation_id, status);
    return action;
}

ActionResult PgRecommendationStore::set_actual_savings(const std::string& recommendation_id,
                                                       const std::string& project_id,
                                                       double actual_monthly_savings) {
    ActionResult action;
    ScopedConnection conn(db_pool_.get());

    std::string sql = std::string(R"(
        UPDATE agentcost.optimization_recommendations
        SET actual_monthly_savings = $3
        WHERE id = $1::uuid AND project_id = $2 AND status = 'implemented'
        RETURNING )") + kRecommendationColumns;

    auto result = QueryResult(conn->exec_params(sql, {
        recommendation_id, project_id, double_param(actual_monthly_savings)
    }));

    if (!result.is_success()) {
        if (result.sql_state() == kInvalidTextRepresentation) {
            action.status = ActionStatus::NotFound;
            return action;
        }
        require_success(result, "Failed to record actual savings");
    }

    if (result.num_rows() == 0) {
        action.status = classify_miss(*conn, recommendation_id, project_id);
        return action;
    }

    action.status = ActionStatus::Ok;
    action.recommendation = row_to_recommendation(result, 0);
    return action;
}

std::vector<Recommendation> PgRecommendationStore::list_pending(const std::string& project_id,
                                                                TimePoint now) {
    ScopedConnection conn(db_pool_.get());

    std::string sql = std::string("SELECT ") + kRecommendationColumns + R"(
        FROM agentcost.optimization_recommendations
        WHERE project_id = $1 AND status = 'pending'
          AND expires_at > to_timestamp($2::double precision / 1000)
        ORDER BY created_at DESC, id DESC
    )";

    auto result = QueryResult(conn->exec_params(sql, {project_id, ms_param(now)}));
    require_success(result, "Failed to list pending recommendations");
    return rows_to_recommendations(result);
}

std::vector<Recommendation> PgRecommendationStore::list_all(const std::string& project_id) {
    ScopedConnection conn(db_pool_.get());

    std::string sql = std::string("SELECT ") + kRecommendationColumns + R"(
        FROM agentcost.optimization_recommendations
        WHERE project_id = $1
        ORDER BY created_at ASC, id ASC
    )";

    auto result = QueryResult(conn->exec_params(sql, {project_id}));
    require_success(result, "Failed to list recommendations");
    return rows_to_recommendations(result);
}

// ============================================================================
// PgPricingCatalog
// ============================================================================

PgPricingCatalog::PgPricingCatalog(std::shared_ptr<DatabasePool> db_pool)
    : db_pool_(std::move(db_pool)) {
}

std::vector<ModelPrice> PgPricingCatalog::load_prices(DatabaseConnection& conn) {
    auto result = QueryResult(conn.exec(
        "SELECT model, provider, input_per_1k, output_per_1k, tier FROM agentcost.model_pricing ORDER BY model"));
    require_success(result, "Failed to load model pricing");

    std::vector<ModelPrice> prices;
    for (int i = 0; i < result.num_rows(); ++i) {
        ModelPrice price;
        price.model = result.get_value(i, "model");
        price.provider = result.get_value(i, "provider");
        price.input_per_1k = result.get_double(i, "input_per_1k");
        price.output_per_1k = result.get_double(i, "output_per_1k");
        price.tier = static_cast<int>(result.get_int64(i, "tier", 1));
        prices.push_back(std::move(price));
    }
    return prices;
}

LearnedOutcomes PgPricingCatalog::load_learned_outcomes(DatabaseConnection& conn) {
    std::string sql = R"(
        SELECT model, alternative_model,
               COUNT(*) AS times_implemented,
               COUNT(actual_monthly_savings) AS measured_count,
               COALESCE(SUM(estimated_monthly_savings) FILTER (WHERE actual_monthly_savings IS NOT NULL), 0) AS total_estimated,
               COALESCE(SUM(actual_monthly_savings), 0) AS total_actual
        FROM agentcost.optimization_recommendations
        WHERE recommendation_type = 'model_downgrade'
          AND status = 'implemented'
          AND model IS NOT NULL AND alternative_model IS NOT NULL
        GROUP BY model, alternative_model
    )";

    auto result = QueryResult(conn.exec(sql));
    require_success(result, "Failed to load learned pricing outcomes");

    LearnedOutcomes learned;
    for (int i = 0; i < result.num_rows(); ++i) {
        LearnedOutcome outcome;
        outcome.times_implemented = result.get_int64(i, "times_implemented");
        outcome.measured_count = result.get_int64(i, "measured_count");
        outcome.total_estimated = result.get_double(i, "total_estimated");
        outcome.total_actual = result.get_double(i, "total_actual");
        learned[{result.get_value(i, "model"), result.get_value(i, "alternative_model")}] = outcome;
    }
    return learned;
}

std::vector<ModelAlternative> PgPricingCatalog::discover_alternatives(const std::string& model,
                                                                      int64_t avg_input_tokens,
                                                                      int64_t avg_output_tokens,
                                                                      int max_results) {
    ScopedConnection conn(db_pool_.get());
    auto prices = load_prices(*conn);
    auto learned = load_learned_outcomes(*conn);
    return rank_alternatives(prices, learned, model, avg_input_tokens, avg_output_tokens, max_results);
}

void PgPricingCatalog::record_outcome(const std::string& recommendation_id,
                                      const std::string& model,
                                      const std::string& alternative_model,
                                      double estimated_monthly_savings,
                                      double actual_monthly_savings) {
    // Outcomes are read back from the recommendation rows themselves
    spdlog::debug("Recorded outcome {} -> {} from {}: estimated ${:.2f}, actual ${:.2f}",
                  model, alternative_model, recommendation_id, estimated_monthly_savings, actual_monthly_savings);
}

void PgPricingCatalog::upsert_price(const ModelPrice& price) {
    ScopedConnection conn(db_pool_.get());

    std::string sql = R"(
        INSERT INTO agentcost.model_pricing (model, provider, input_per_1k, output_per_1k, tier, updated_at)
        VALUES ($1, $2, $3, $4, $5, NOW())
        ON CONFLICT (model) DO UPDATE SET
            provider = EXCLUDED.provider,
            input_per_1k = EXCLUDED.input_per_1k,
            output_per_1k = EXCLUDED.output_per_1k,
            tier = EXCLUDED.tier,
            updated_at = NOW()
    )";

    auto result = QueryResult(conn->exec_params(sql, {
        price.model, price.provider, double_param(price.input_per_1k),
        double_param(price.output_per_1k), std::to_string(price.tier)
    }));
    require_success(result, "Failed to upsert model price");
}

} // namespace agentcost
