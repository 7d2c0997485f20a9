#pragma once
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "sensor_spec.hpp"

/**
 * @brief Values a sensor currently publishes, one slot per property
 *
 * Written only by the owning updater's tick; snapshots may be taken from
 * any thread. A slot holding nullopt reads as "unknown".
 */
class SensorState {
public:
    using Values = std::map<std::string, std::optional<double>>;

    explicit SensorState(const SensorSpec& spec) {
        for (const auto& f : spec.fields) {
            values_[f.property] = std::nullopt;
        }
    }

    void set(const std::string& property, std::optional<double> value) {
        std::lock_guard<std::mutex> lock(mtx_);
        values_[property] = value;
        updated_at_ = std::chrono::steady_clock::now();
    }

    /**
     * @brief Current value of one property
     * @return Value, or nullopt if unknown or not a property of this sensor
     */
    std::optional<double> get(const std::string& property) const {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = values_.find(property);
        if (it == values_.end()) return std::nullopt;
        return it->second;
    }

    bool has_property(const std::string& property) const {
        std::lock_guard<std::mutex> lock(mtx_);
        return values_.count(property) != 0;
    }

    Values snapshot() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return values_;
    }

    /**
     * @brief Time of the last write, nullopt before the first tick
     */
    std::optional<std::chrono::steady_clock::time_point> updated_at() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return updated_at_;
    }

private:
    mutable std::mutex mtx_;
    Values values_;
    std::optional<std::chrono::steady_clock::time_point> updated_at_;
};
