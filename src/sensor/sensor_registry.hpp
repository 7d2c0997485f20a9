#pragma once
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "../core/log.hpp"
#include "../weather/weather_cache.hpp"
#include "isink.hpp"
#include "sensor_spec.hpp"
#include "sensor_updater.hpp"

/**
 * @brief Owns the deployment's sensors and their update loops
 *
 * Sensors are registered up front; start() launches all of them and
 * stop_all() brings all of them down. The cache and sink are shared by
 * every sensor and must outlive the registry.
 */
class SensorRegistry {
public:
    SensorRegistry(WeatherCache& weather, IValueSink& out,
                   std::chrono::milliseconds interval = std::chrono::seconds(3))
        : cache_(weather), sink_(out), interval_(interval) {}

    ~SensorRegistry() { stop_all(); }

    SensorRegistry(const SensorRegistry&) = delete;
    SensorRegistry& operator=(const SensorRegistry&) = delete;

    /**
     * @brief Register a sensor
     * @throws std::runtime_error after start() or on a duplicate id
     */
    void add(SensorSpec spec) {
        if (started_) {
            throw std::runtime_error("cannot add sensor " + spec.id + " to a started registry");
        }
        for (const auto& s : specs_) {
            if (s.id == spec.id) {
                throw std::runtime_error("duplicate sensor id " + spec.id);
            }
        }
        specs_.push_back(std::move(spec));
    }

    /**
     * @brief Create every sensor's state and launch its update loop
     *
     * Returns as soon as all loops are launched.
     */
    void start() {
        if (started_) {
            throw std::runtime_error("sensor registry already started");
        }
        started_ = true;
        updaters_.reserve(specs_.size());
        for (const auto& spec : specs_) {
            updaters_.push_back(std::make_unique<SensorUpdater>(spec, cache_, sink_, interval_));
        }
        for (auto& u : updaters_) {
            u->start();
        }
        log_info("started ", updaters_.size(), " sensor update loops");
    }

    /**
     * @brief Cancel all loops, then wait for every one of them to exit
     *
     * All cancellations go out before the first join so loops that are
     * sleeping wake together while others finish their fetch.
     */
    void stop_all() {
        if (updaters_.empty() || stopped_) return;
        stopped_ = true;
        log_debug("canceling the sensor update looping tasks");
        for (auto& u : updaters_) {
            u->request_stop();
        }
        for (auto& u : updaters_) {
            u->stop();
        }
        log_info("stopped ", updaters_.size(), " sensor update loops");
    }

    bool is_started() const { return started_; }
    bool is_stopped() const { return stopped_; }
    size_t size() const { return specs_.size(); }
    const std::vector<SensorSpec>& specs() const { return specs_; }

    /**
     * @brief Updater of a sensor (kept after stop_all() for inspection)
     * @return Updater, or nullptr if unknown or the registry never started
     */
    const SensorUpdater* find(const std::string& id) const {
        for (const auto& u : updaters_) {
            if (u->spec().id == id) return u.get();
        }
        return nullptr;
    }

    const std::vector<std::unique_ptr<SensorUpdater>>& updaters() const { return updaters_; }

private:
    WeatherCache& cache_;
    IValueSink& sink_;
    std::chrono::milliseconds interval_;

    std::vector<SensorSpec> specs_;
    std::vector<std::unique_ptr<SensorUpdater>> updaters_;
    bool started_{false};
    bool stopped_{false};
};
