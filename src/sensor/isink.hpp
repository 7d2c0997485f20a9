#pragma once
#include <optional>
#include "sensor_spec.hpp"

/**
 * @brief Write side of the presentation layer
 *
 * Receives every value a sensor publishes; nullopt means "value unknown".
 * Called concurrently from all update loops, so implementations must be
 * thread-safe.
 */
struct IValueSink {
    virtual ~IValueSink() = default;
    virtual void publish(const SensorSpec& sensor, const FieldSpec& field,
                         std::optional<double> value) = 0;
};

/**
 * @brief Sink that drops every value (sensors without subscribers)
 */
struct NullSink : IValueSink {
    void publish(const SensorSpec&, const FieldSpec&, std::optional<double>) override {}
};
