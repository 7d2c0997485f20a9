#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "../sensor/sensor_registry.hpp"
#include "../weather/weather_cache.hpp"
using json = nlohmann::json;

/**
 * @brief Read-only JSON command interface over the sensor registry
 *
 * Answers thing descriptions (property metadata with current values),
 * single property reads and service status. Never throws: malformed or
 * unknown commands get {"ok":false}.
 */
struct QueryAPI {
    SensorRegistry& registry;  ///< Sensors to describe
    WeatherCache& cache;       ///< Shared observation cache (status only)
    std::string name{"WeatherStation"};

    /**
     * @brief Handle one JSON command
     * @param s JSON command string
     * @return JSON response string
     */
    std::string handle_cmd(const std::string& s) const {
        auto j = json::parse(s, nullptr, false);
        if (!j.is_object() || !j.contains("cmd") || !j["cmd"].is_string()) return "{\"ok\":false}";

        const std::string cmd = j["cmd"].get<std::string>();
        if (cmd == "get_things") {
            json things = json::array();
            for (const auto& spec : registry.specs()) {
                things.push_back(describe(spec));
            }
            return json{{"ok", true}, {"name", name}, {"things", things}}.dump();
        } else if (cmd == "get_property") {
            std::string thing = j.value("thing", std::string());
            std::string property = j.value("property", std::string());
            const SensorSpec* spec = find_spec(thing);
            if (!spec) {
                return json{{"ok", false}, {"error", "unknown thing"}}.dump();
            }
            bool known = false;
            for (const auto& f : spec->fields) {
                if (f.property == property) known = true;
            }
            if (!known) {
                return json{{"ok", false}, {"error", "unknown property"}}.dump();
            }
            return json{{"ok", true}, {"thing", thing}, {"property", property},
                        {"value", to_json(current_value(thing, property))}}.dump();
        } else if (cmd == "get_status") {
            auto stats = cache.get_statistics();
            auto age = cache.entry_age_seconds();
            json status = {
                {"ok", true},
                {"sensor_count", registry.size()},
                {"running", registry.is_started() && !registry.is_stopped()},
                {"cache_window_ms", cache.get_window().count()},
                {"cache_age_sec", age ? json(*age) : json(nullptr)},
                {"fetch_attempts", stats.fetch_attempts},
                {"successful_fetches", stats.successful_fetches},
                {"transport_errors", stats.transport_errors},
                {"upstream_errors", stats.upstream_errors},
                {"stale_serves", stats.stale_serves},
                {"mean_fetch_time_ms", stats.mean_fetch_time_ms},
                {"max_fetch_time_ms", stats.max_fetch_time_ms}
            };
            return status.dump();
        }
        return "{\"ok\":false}";
    }

private:
    static json to_json(std::optional<double> v) {
        return v ? json(*v) : json(nullptr);
    }

    const SensorSpec* find_spec(const std::string& id) const {
        for (const auto& spec : registry.specs()) {
            if (spec.id == id) return &spec;
        }
        return nullptr;
    }

    std::optional<double> current_value(const std::string& id, const std::string& property) const {
        const SensorUpdater* u = registry.find(id);
        if (!u) return std::nullopt;
        return u->state().get(property);
    }

    json describe(const SensorSpec& spec) const {
        json props = json::object();
        for (const auto& f : spec.fields) {
            json p = {
                {"@type", f.semantic_type},
                {"title", f.title},
                {"type", "number"},
                {"description", f.description},
                {"unit", f.unit},
                {"readOnly", true},
                {"value", to_json(current_value(spec.id, f.property))}
            };
            if (f.minimum) p["minimum"] = *f.minimum;
            if (f.maximum) p["maximum"] = *f.maximum;
            props[f.property] = p;
        }
        return {
            {"id", spec.id},
            {"title", spec.title},
            {"@type", json::array({spec.type})},
            {"description", spec.description},
            {"properties", props}
        };
    }
};
