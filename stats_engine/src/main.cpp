#include "config.hpp"
#include "binance_client.hpp"
#include "store_pg.hpp"
#include "redis_cache.hpp"
#include "session_calendar.hpp"
#include "asset_locks.hpp"
#include "smart_runner.hpp"
#include "report_reader.hpp"
#include "health.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <thread>
#include <chrono>
#include <cstring>
#include <functional>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& service_name, const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(service_name, console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

// Next exchange-local SYNC_TIME strictly after now
int64_t next_sync_ms(const SessionCalendar& calendar, int sync_minute, int64_t now_ms) {
    SessionDate today = calendar.session_date_of(now_ms);
    int64_t at = calendar.to_utc_ms(today, sync_minute);
    if (at <= now_ms) at = calendar.to_utc_ms(today + 1, sync_minute);
    return at;
}

bool run_once_logged(SmartRunner& runner, HealthCheck& health, bool force_full) {
    health.set_scheduler_status("running");
    try {
        auto summary = runner.run_all_assets(util::current_timestamp_ms(), force_full);
        health.record_run(summary, util::current_timestamp_ms());
        health.set_scheduler_status("idle");
        return summary.failed == 0;
    } catch (const RunFatalError& e) {
        spdlog::error("Run aborted: {}", e.what());
        health.set_scheduler_status("error");
        return false;
    }
}

void scheduler_loop(std::shared_ptr<Config> config,
                    std::shared_ptr<SmartRunner> runner,
                    std::shared_ptr<HealthCheck> health,
                    std::atomic<bool>& running) {
    SessionCalendar calendar(*config);

    spdlog::info("Scheduler: startup run");
    run_once_logged(*runner, *health, config->force_full_recalc);

    while (running) {
        int64_t next = next_sync_ms(calendar, config->sync_minute, util::current_timestamp_ms());
        spdlog::info("Scheduler: next run at {}", util::iso8601_from_ms(next));

        while (running && util::current_timestamp_ms() < next) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
        if (!running) break;

        run_once_logged(*runner, *health, false);
    }

    spdlog::info("Scheduler stopped");
}

int main(int argc, char* argv[]) {
    try {
        auto config = std::make_shared<Config>(Config::from_env());

        for (int i = 1; i < argc; ++i) {
            if (std::strcmp(argv[i], "--once") == 0) {
                config->run_once = true;
            } else if (std::strcmp(argv[i], "--full-recalc") == 0) {
                config->force_full_recalc = true;
            } else {
                throw std::runtime_error(std::string("Unknown argument: ") + argv[i]);
            }
        }

        setup_logging(config->service_name, config->log_level);

        spdlog::info("==============================================");
        spdlog::info("Equilibrium Stats Engine v1.0");
        spdlog::info("==============================================");

        config->validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        // Initialize components
        const int64_t interval_ms = static_cast<int64_t>(config->candle_interval_seconds) * 1000;

        auto source = std::make_shared<BinanceClient>(config->binance_base, config->candle_interval,
                                                      interval_ms, config->fetch_timeout_ms,
                                                      config->fetch_max_retries);
        source->set_retry_backoff(config->retry_backoff_ms_min, config->retry_backoff_ms_max);

        auto pg = std::make_shared<PostgresStore>(config->pg_dsn, config->store_timeout_ms);
        auto redis = std::make_shared<RedisReportCache>(config->redis_url, config->cache_timeout_ms);
        auto locks = std::make_shared<AssetLocks>(pg);
        auto health = std::make_shared<HealthCheck>(redis, pg);

        // Initialize database
        pg->init_schema();

        auto runner = std::make_shared<SmartRunner>(*config, source, pg, pg, redis, locks);

        if (config->run_once) {
            bool ok = run_once_logged(*runner, *health, config->force_full_recalc);
            spdlog::info("Single run complete");
            return ok ? 0 : 1;
        }

        auto reader = std::make_shared<ReportReader>(redis, config->report_stale_after_seconds);

        // Start scheduler
        std::atomic<bool> loop_running{true};
        std::thread scheduler_thread(scheduler_loop, config, runner, health, std::ref(loop_running));

        // Start HTTP server
        httplib::Server server;

        server.Get("/health", [health](const httplib::Request&, httplib::Response& res) {
            auto status = health->get_status();
            res.set_content(status.dump(), "application/json");
            res.status = status["ok"].get<bool>() ? 200 : 503;
        });

        server.Get("/analytics/assets", [reader, config](const httplib::Request&, httplib::Response& res) {
            auto assets = reader->assets();
            if (assets.empty()) assets = config->tracked_assets;
            nlohmann::json body = {{"assets", assets}};
            res.set_content(body.dump(), "application/json");
        });

        server.Get("/analytics/get-report", [reader](const httplib::Request& req, httplib::Response& res) {
            std::string symbol = req.get_param_value("symbol");
            std::string period = req.has_param("period") ? req.get_param_value("period") : "YTD";

            if (symbol.empty()) {
                res.status = 400;
                res.set_content(nlohmann::json{{"detail", "symbol is required"}}.dump(),
                                "application/json");
                return;
            }

            auto lookup = reader->lookup(symbol, period, util::current_timestamp_ms());
            if (lookup.status == ReportStatus::Unavailable) {
                res.status = 404;
                nlohmann::json body = {
                    {"detail", "No report for " + symbol + " (" + period + ")"},
                    {"available_periods", reader->available_periods(symbol)}
                };
                res.set_content(body.dump(), "application/json");
                return;
            }

            auto body = lookup.envelope;
            body["status"] = ReportReader::status_name(lookup.status);
            res.set_content(body.dump(), "application/json");
        });

        std::thread http_thread([&server, config]() {
            spdlog::info("Starting HTTP server on {}:{}", config->listen_addr, config->listen_port);
            server.listen(config->listen_addr.c_str(), config->listen_port);
        });

        spdlog::info("Stats engine started");

        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        // Shutdown
        spdlog::info("Stopping services...");
        loop_running = false;
        server.stop();

        if (scheduler_thread.joinable()) scheduler_thread.join();
        if (http_thread.joinable()) http_thread.join();

        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
