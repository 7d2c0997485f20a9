#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iomanip>
#include <iostream>

#include "core/config.hpp"
#include "core/log.hpp"
#include "net/http_upstream.hpp"
#include "weather/weather_cache.hpp"
#include "sensor/sensor_registry.hpp"
#include "control/query_api.hpp"
#include "ipc/value_pub.hpp"
#include "ipc/query_rep.hpp"

// Global flag for clean shutdown
std::atomic<bool> shutdown_requested{false};

void signal_handler(int) {
    shutdown_requested.store(true);
}

int main(int argc, char** argv) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        Config config = argc > 1 ? Config::load(argv[1]) : Config{};
        Log::set_debug(config.debug);

        log_info("Weather station thing service - starting up");
        log_info("Station: ", config.station_url, " (cache ", config.cache_window.count(),
                 " ms, update every ", config.update_interval.count(), " ms)");

        CurlGlobal curl;
        HttpUpstream upstream(config.station_url, config.fetch_timeout);
        WeatherCache cache(upstream, config.cache_window);

        ValuePub value_pub(config.pub_endpoint);
        QueryRep query_rep(config.query_endpoint);
        log_info("Value publisher bound to: ", value_pub.get_bind_address());
        log_info("Query responder bound to: ", query_rep.get_bind_address());

        SensorRegistry registry(cache, value_pub, config.update_interval);
        for (const auto& spec : config.sensors) {
            registry.add(spec);
        }

        QueryAPI api{registry, cache};

        log_info("starting the server");
        registry.start();

        auto last_stats_time = std::chrono::steady_clock::now();
        while (!shutdown_requested.load()) {
            if (query_rep.poll(100)) {
                auto cmd = query_rep.recv();
                if (!cmd) {
                    log_warn("query receive failed: ", zmq_strerror(zmq_errno()));
                } else if (!query_rep.reply(api.handle_cmd(*cmd))) {
                    log_warn("query reply failed: ", zmq_strerror(zmq_errno()));
                }
            }

            auto now = std::chrono::steady_clock::now();
            if (std::chrono::duration_cast<std::chrono::seconds>(now - last_stats_time).count() >= 60) {
                auto stats = cache.get_statistics();
                log_info("Cache stats: ", stats.fetch_attempts, " fetches, ",
                         stats.successful_fetches, " ok, ",
                         stats.transport_errors, " transport errors, ",
                         stats.upstream_errors, " upstream errors, ",
                         stats.stale_serves, " stale serves, ",
                         std::fixed, std::setprecision(1), stats.mean_fetch_time_ms, " ms avg");
                last_stats_time = now;
            }
        }

        log_info("Shutdown signal received, stopping sensors");
        registry.stop_all();
        log_info("done");

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
