#pragma once
#include <cctype>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief One published property of a sensor and where its value comes from
 */
struct FieldSpec {
    std::string property;             ///< Published property name ("level", "temperature", "humidity")
    std::string source;               ///< Field name in the station observation
    std::string semantic_type;        ///< "LevelProperty" or "TemperatureProperty"
    std::string title;
    std::string description;
    std::string unit;
    std::optional<double> minimum;
    std::optional<double> maximum;
};

/**
 * @brief Static description of one sensor thing
 *
 * Immutable after construction. Bounds and units are presentation
 * metadata only; the update loop publishes whatever the station reports.
 */
struct SensorSpec {
    std::string id;                   ///< Stable identifier, e.g. "office-temperature"
    std::string title;                ///< e.g. "Office Temperature Sensor"
    std::string type;                 ///< "MultiLevelSensor" or "TemperatureSensor"
    std::string description;
    std::string location;
    std::vector<FieldSpec> fields;
};

/**
 * @brief "living room" -> "Living Room"
 */
inline std::string title_case(const std::string& s) {
    std::string out = s;
    bool start = true;
    for (char& ch : out) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isspace(c)) {
            start = true;
        } else {
            ch = static_cast<char>(start ? std::toupper(c) : std::tolower(c));
            start = false;
        }
    }
    return out;
}

/**
 * @brief "living room" -> "living-room"
 */
inline std::string slug(const std::string& s) {
    std::string out;
    for (char ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c)) {
            out += static_cast<char>(std::tolower(c));
        } else if (!out.empty() && out.back() != '-') {
            out += '-';
        }
    }
    while (!out.empty() && out.back() == '-') out.pop_back();
    return out;
}

inline FieldSpec humidity_field(const std::string& location, const std::string& property,
                                const std::string& source) {
    return FieldSpec{property, source, "LevelProperty",
                     title_case(location) + " Humidity",
                     "The current " + location + " humidity in %",
                     "percent", 0.0, 100.0};
}

/**
 * @brief Stand-alone humidity sensor reading "<prefix>_hygro"
 */
inline SensorSpec humidity_sensor(const std::string& location, const std::string& prefix) {
    SensorSpec s;
    s.id = slug(location) + "-humidity";
    s.title = title_case(location) + " Humidity Sensor";
    s.type = "MultiLevelSensor";
    s.description = "The humidity sensor in " + location;
    s.location = location;
    s.fields.push_back(humidity_field(location, "level", prefix + "_hygro"));
    return s;
}

/**
 * @brief Temperature sensor reading "<prefix>_temp", optionally also
 *        publishing "<prefix>_hygro" as a "humidity" property
 */
inline SensorSpec temperature_sensor(const std::string& location, const std::string& prefix,
                                     bool has_humidity = false) {
    SensorSpec s;
    s.id = slug(location) + "-temperature";
    s.title = title_case(location) + " Temperature Sensor";
    s.type = "TemperatureSensor";
    s.description = "The temperature sensor in " + location;
    s.location = location;
    s.fields.push_back(FieldSpec{"temperature", prefix + "_temp", "TemperatureProperty",
                                 title_case(location) + " Temperature",
                                 "The current " + location + " temperature in °C",
                                 "degree celsius", std::nullopt, std::nullopt});
    if (has_humidity) {
        s.fields.push_back(humidity_field(location, "humidity", prefix + "_hygro"));
    }
    return s;
}

/**
 * @brief Barometer reading the named station field directly
 */
inline SensorSpec pressure_sensor(const std::string& location, const std::string& field) {
    SensorSpec s;
    s.id = slug(location) + "-barometer";
    s.title = title_case(location) + " Barometer";
    s.type = "MultiLevelSensor";
    s.description = "The barometer (air pressure sensor) in " + location;
    s.location = location;
    s.fields.push_back(FieldSpec{"level", field, "LevelProperty",
                                 title_case(location) + " Air Pressure",
                                 "The current " + location + " air pressure in hPa/mbar",
                                 "hPa", 0.0, 10000.0});
    return s;
}

/**
 * @brief The station's standard set of sensors
 */
inline std::vector<SensorSpec> default_deployment() {
    return {
        humidity_sensor("living room", "in"),
        humidity_sensor("outside", "out"),
        temperature_sensor("living room", "in", true),
        temperature_sensor("outside", "out", true),
        temperature_sensor("office", "office", true),
        temperature_sensor("kitchen", "kitchen", true),
        temperature_sensor("bathroom", "bathroom", true),
        temperature_sensor("bedroom", "bedroom", true),
        pressure_sensor("outside", "baro"),
    };
}
