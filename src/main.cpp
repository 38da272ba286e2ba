#include "agentcost/config.hpp"
#include "agentcost/database.hpp"
#include "agentcost/optimization_service.hpp"
#include "agentcost/pg_stores.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [--debug] <command> [args]\n"
              << "Commands:\n"
              << "  init-schema                              Create tables and indexes\n"
              << "  refresh-baselines PROJECT [--days N]     Recompute baselines (7-90 days, default 30)\n"
              << "  suggestions PROJECT [--days N] [--no-low] [--persist]\n"
              << "  summary PROJECT [--days N]\n"
              << "  baselines PROJECT [--agent NAME] [--model NAME]\n"
              << "  caching PROJECT [--min-occurrences N]\n"
              << "  anomalies PROJECT [--all]\n"
              << "  recommendations PROJECT                  List pending recommendations\n"
              << "  implement PROJECT ID\n"
              << "  dismiss PROJECT ID [--feedback TEXT]\n"
              << "  record-savings PROJECT ID AMOUNT         Measured $/month after implementation\n"
              << "  effectiveness PROJECT\n"
              << "  set-price MODEL PROVIDER IN_PER_1K OUT_PER_1K [TIER]\n"
              << "\n"
              << "Environment variables:\n"
              << "  PG_HOST, PG_PORT, PG_DB, PG_USER, PG_PASSWORD, PG_USE_SSL\n"
              << "  DB_POOL_SIZE       Database pool size (default: 10)\n"
              << "  LOG_LEVEL          trace|debug|info|warn|error (default: info)\n"
              << "  AGENTCOST_*        Analyzer thresholds, see config.hpp\n"
              << std::endl;
}

// Positional arguments plus --flag [value] options
struct CommandLine {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;

    bool has(const std::string& name) const { return options.count(name) > 0; }

    std::string get(const std::string& name, const std::string& default_value = "") const {
        auto it = options.find(name);
        return it != options.end() ? it->second : default_value;
    }

    int get_int(const std::string& name, int default_value) const {
        auto it = options.find(name);
        return it != options.end() ? std::atoi(it->second.c_str()) : default_value;
    }

    std::optional<std::string> get_optional(const std::string& name) const {
        auto it = options.find(name);
        if (it == options.end()) return std::nullopt;
        return it->second;
    }
};

CommandLine parse_command_line(int argc, char* argv[], int start) {
    static const std::vector<std::string> kValueOptions = {
        "--days", "--agent", "--model", "--min-occurrences", "--feedback"
    };

    CommandLine cmd;
    for (int i = start; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            cmd.positional.push_back(arg);
            continue;
        }
        bool takes_value = std::find(kValueOptions.begin(), kValueOptions.end(), arg) != kValueOptions.end();
        if (takes_value && i + 1 < argc) {
            cmd.options[arg] = argv[++i];
        } else {
            cmd.options[arg] = "true";
        }
    }
    return cmd;
}

void apply_logging(const agentcost::LoggingConfig& logging) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    if (!logging.enable_logging) {
        spdlog::set_level(spdlog::level::off);
        return;
    }
    spdlog::set_level(spdlog::level::from_str(logging.log_level));
}

void print_json(const nlohmann::json& value) {
    std::cout << value.dump(2) << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    agentcost::Config config = agentcost::Config::load();
    apply_logging(config.logging);

    int first = 1;
    if (first < argc && std::string(argv[first]) == "--debug") {
        spdlog::set_level(spdlog::level::debug);
        ++first;
    }

    if (first >= argc) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[first];
    if (command == "--help" || command == "-h" || command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    CommandLine cmd = parse_command_line(argc, argv, first + 1);

    auto require_args = [&](size_t count) {
        if (cmd.positional.size() < count) {
            std::cerr << "Missing arguments for '" << command << "'" << std::endl;
            print_usage(argv[0]);
            return false;
        }
        return true;
    };

    try {
        const auto& db = config.database;
        auto pool = std::make_shared<agentcost::DatabasePool>(
            db.connection_string(),
            static_cast<size_t>(db.pool_size),
            db.pool_acquisition_timeout,
            db.statement_timeout,
            db.lock_timeout,
            db.idle_timeout);

        spdlog::debug("Connected to {}:{}/{} (pool size {})", db.host, db.port, db.database, pool->size());

        if (command == "init-schema") {
            if (!agentcost::initialize_schema(pool.get())) {
                spdlog::error("Schema initialization failed");
                return 1;
            }
            return 0;
        }

        auto pricing = std::make_shared<agentcost::PgPricingCatalog>(pool);

        if (command == "set-price") {
            if (!require_args(4)) return 1;
            agentcost::ModelPrice price;
            price.model = cmd.positional[0];
            price.provider = cmd.positional[1];
            price.input_per_1k = std::atof(cmd.positional[2].c_str());
            price.output_per_1k = std::atof(cmd.positional[3].c_str());
            price.tier = cmd.positional.size() > 4 ? std::atoi(cmd.positional[4].c_str()) : 1;
            pricing->upsert_price(price);
            spdlog::info("Price for {} updated", price.model);
            return 0;
        }

        agentcost::OptimizationService service(
            std::make_shared<agentcost::PgEventStore>(pool),
            std::make_shared<agentcost::PgBaselineStore>(pool),
            std::make_shared<agentcost::PgRecommendationStore>(pool),
            pricing,
            config.optimizer);

        if (!require_args(1)) return 1;
        const std::string& project_id = cmd.positional[0];
        int days = cmd.get_int("--days", 30);

        if (command == "refresh-baselines") {
            print_json(service.compute_baselines(project_id, days));
        } else if (command == "suggestions") {
            print_json(service.get_suggestions(project_id, days, !cmd.has("--no-low"), cmd.has("--persist")));
        } else if (command == "summary") {
            print_json(service.get_summary(project_id, days));
        } else if (command == "baselines") {
            print_json(service.get_baselines(project_id, cmd.get_optional("--agent"), cmd.get_optional("--model")));
        } else if (command == "caching") {
            print_json(service.get_caching_opportunities(project_id, cmd.get_int("--min-occurrences", 5)));
        } else if (command == "anomalies") {
            print_json(service.detect_anomalies(project_id, !cmd.has("--all")));
        } else if (command == "recommendations") {
            print_json(service.list_pending_recommendations(project_id));
        } else if (command == "implement") {
            if (!require_args(2)) return 1;
            auto response = service.implement_recommendation(cmd.positional[1], project_id);
            print_json(response);
            return response.value("success", false) ? 0 : 2;
        } else if (command == "dismiss") {
            if (!require_args(2)) return 1;
            auto response = service.dismiss_recommendation(cmd.positional[1], project_id, cmd.get_optional("--feedback"));
            print_json(response);
            return response.value("success", false) ? 0 : 2;
        } else if (command == "record-savings") {
            if (!require_args(3)) return 1;
            auto response = service.record_actual_savings(cmd.positional[1], project_id,
                                                          std::atof(cmd.positional[2].c_str()));
            print_json(response);
            return response.value("success", false) ? 0 : 2;
        } else if (command == "effectiveness") {
            print_json(service.get_recommendation_effectiveness(project_id));
        } else {
            std::cerr << "Unknown command: " << command << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        spdlog::error("{} failed: {}", command, e.what());
        return 1;
    }

    return 0;
}
