#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <thread>
#include "../core/clock.hpp"
#include "../core/log.hpp"
#include "../weather/weather_cache.hpp"
#include "isink.hpp"
#include "sensor_spec.hpp"
#include "sensor_state.hpp"

/**
 * @brief Periodic update loop for one sensor
 *
 * Every interval the loop takes one observation from the shared cache and
 * publishes each configured field from it. Upstream trouble turns into
 * "unknown" values, never into a stopped loop; only stop() ends it.
 *
 * Cancellation wakes the sleep immediately. A tick whose cache call
 * returns after cancellation publishes nothing, so the fields of a tick
 * are written together or not at all, and no write happens once stop()
 * has returned.
 */
class SensorUpdater {
public:
    /**
     * @brief Loop counters
     */
    struct Statistics {
        uint64_t ticks{0};           ///< Completed ticks
        uint64_t writes{0};          ///< Values published (numeric or unknown)
        uint64_t unknown_writes{0};  ///< Values published as unknown
    };

    /**
     * @brief Constructor
     * @param sensor Static sensor description
     * @param weather Shared observation cache
     * @param out Presentation sink notified on every write
     * @param interval Tick period
     */
    SensorUpdater(SensorSpec sensor, WeatherCache& weather, IValueSink& out,
                  std::chrono::milliseconds interval = std::chrono::seconds(3))
        : spec_(std::move(sensor)), cache_(weather), sink_(out),
          interval_(interval), state_(spec_) {}

    ~SensorUpdater() { stop(); }

    SensorUpdater(const SensorUpdater&) = delete;
    SensorUpdater& operator=(const SensorUpdater&) = delete;

    /**
     * @brief Launch the update thread; returns without waiting for a tick
     * @throws std::runtime_error if the updater was already started
     */
    void start() {
        if (started_.exchange(true)) {
            throw std::runtime_error("sensor updater " + spec_.id + " already started");
        }
        log_debug("starting the ", spec_.title, " update loop");
        worker_ = std::thread([this] { run(); });
    }

    /**
     * @brief Ask the loop to stop at its next checkpoint (non-blocking)
     */
    void request_stop() { token_.cancel(); }

    /**
     * @brief Stop the loop and wait until its thread has exited
     */
    void stop() {
        request_stop();
        if (worker_.joinable()) {
            worker_.join();
            log_debug("stopped the ", spec_.title, " update loop");
        }
    }

    bool is_running() const { return running_.load(); }

    /**
     * @brief Perform one update step
     * @return false if cancellation arrived before anything was published
     */
    bool tick() {
        CacheResult latest = cache_.get_latest();
        if (token_.is_cancelled()) return false;

        if (!latest.ok()) {
            log_warn(spec_.title, ": ", error_to_string(latest.error), ", publishing unknown");
        }

        for (const auto& field : spec_.fields) {
            std::optional<double> value;
            if (latest.ok()) {
                value = latest.observation.get(field.source);
                if (!value) {
                    log_warn(spec_.title, ": ", error_to_string(FetchError::FIELD_MISSING),
                             " '", field.source, "', publishing unknown");
                }
            }
            publish(field, value);
        }

        ticks_.fetch_add(1);
        return true;
    }

    const SensorSpec& spec() const { return spec_; }
    const SensorState& state() const { return state_; }

    Statistics get_statistics() const {
        return Statistics{ticks_.load(), writes_.load(), unknown_writes_.load()};
    }

private:
    void run() {
        running_.store(true);
        PeriodicClock clk(interval_);
        while (clk.wait_next(token_)) {
            try {
                tick();
            } catch (const std::exception& e) {
                log_error(spec_.title, " update failed: ", e.what());
            }
        }
        running_.store(false);
    }

    void publish(const FieldSpec& field, std::optional<double> value) {
        if (value) {
            log_debug("setting new ", spec_.location, " ", field.property, ": ", *value);
        } else {
            log_debug("setting new ", spec_.location, " ", field.property, ": unknown");
            unknown_writes_.fetch_add(1);
        }
        state_.set(field.property, value);
        sink_.publish(spec_, field, value);
        writes_.fetch_add(1);
    }

    SensorSpec spec_;
    WeatherCache& cache_;
    IValueSink& sink_;
    std::chrono::milliseconds interval_;
    SensorState state_;

    CancellationToken token_;
    std::thread worker_;
    std::atomic<bool> started_{false};
    std::atomic<bool> running_{false};

    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> writes_{0};
    std::atomic<uint64_t> unknown_writes_{0};
};
