#pragma once
#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../sensor/sensor_spec.hpp"

/**
 * @brief Static service parameters, read once at start
 *
 * Every key is optional; absent keys keep the defaults below.
 *
 * Example:
 * {
 *   "station_url": "http://192.168.13.3/rrd/weather.te838.week.json",
 *   "update_interval_ms": 3000,
 *   "cache_window_ms": 10000,
 *   "debug": true,
 *   "sensors": [
 *     {"kind": "temperature", "location": "office", "prefix": "office", "humidity": true},
 *     {"kind": "pressure", "location": "outside", "field": "baro"}
 *   ]
 * }
 */
struct Config {
    std::string station_url{"http://192.168.13.3/rrd/weather.te838.week.json"};
    std::chrono::milliseconds update_interval{3000};  ///< Sensor tick period
    std::chrono::milliseconds cache_window{10000};    ///< Observation freshness window
    std::chrono::milliseconds fetch_timeout{5000};    ///< Upper bound per station request
    std::string pub_endpoint{"tcp://127.0.0.1:8888"};     ///< ZeroMQ PUB for value updates
    std::string query_endpoint{"tcp://127.0.0.1:8889"};   ///< ZeroMQ REP for queries
    bool debug{false};
    std::vector<SensorSpec> sensors{default_deployment()};

    /**
     * @brief Build a configuration from a parsed document
     * @throws std::runtime_error on wrong types or invalid values
     */
    static Config from_json(const nlohmann::json& j) {
        if (!j.is_object()) {
            throw std::runtime_error("configuration must be a JSON object");
        }

        Config c;
        try {
            c.station_url = j.value("station_url", c.station_url);
            c.update_interval = std::chrono::milliseconds(
                j.value("update_interval_ms", static_cast<long long>(c.update_interval.count())));
            c.cache_window = std::chrono::milliseconds(
                j.value("cache_window_ms", static_cast<long long>(c.cache_window.count())));
            c.fetch_timeout = std::chrono::milliseconds(
                j.value("fetch_timeout_ms", static_cast<long long>(c.fetch_timeout.count())));
            c.pub_endpoint = j.value("pub_endpoint", c.pub_endpoint);
            c.query_endpoint = j.value("query_endpoint", c.query_endpoint);
            c.debug = j.value("debug", c.debug);

            if (j.contains("sensors")) {
                const auto& arr = j.at("sensors");
                if (!arr.is_array()) {
                    throw std::runtime_error("'sensors' must be an array");
                }
                c.sensors.clear();
                for (const auto& s : arr) {
                    c.sensors.push_back(sensor_from_json(s));
                }
            }
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error(std::string("invalid configuration: ") + e.what());
        }

        if (c.station_url.empty()) {
            throw std::runtime_error("station_url must not be empty");
        }
        if (c.update_interval.count() <= 0) {
            throw std::runtime_error("update_interval_ms must be positive");
        }
        if (c.cache_window.count() < 0) {
            throw std::runtime_error("cache_window_ms must not be negative");
        }
        if (c.fetch_timeout.count() <= 0) {
            throw std::runtime_error("fetch_timeout_ms must be positive");
        }
        return c;
    }

    /**
     * @brief Load a configuration file
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static Config load(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            throw std::runtime_error("cannot open configuration file " + path);
        }
        std::stringstream ss;
        ss << in.rdbuf();

        auto j = nlohmann::json::parse(ss.str(), nullptr, false);
        if (j.is_discarded()) {
            throw std::runtime_error("configuration file " + path + " is not valid JSON");
        }
        return from_json(j);
    }

private:
    static SensorSpec sensor_from_json(const nlohmann::json& s) {
        std::string kind = s.at("kind").get<std::string>();
        std::string location = s.at("location").get<std::string>();

        if (kind == "humidity") {
            return humidity_sensor(location, s.at("prefix").get<std::string>());
        } else if (kind == "temperature") {
            return temperature_sensor(location, s.at("prefix").get<std::string>(),
                                      s.value("humidity", false));
        } else if (kind == "pressure") {
            return pressure_sensor(location, s.value("field", std::string("baro")));
        }
        throw std::runtime_error("unknown sensor kind '" + kind + "'");
    }
};
