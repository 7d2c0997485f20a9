#pragma once
#include <cerrno>
#include <cstdlib>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief One timestamped snapshot of all station fields
 *
 * Built wholesale from the latest entry of a station document and never
 * modified afterwards. Non-numeric field values (the station reports
 * missing probes as null) are left out, so a lookup for them reports the
 * field as absent.
 */
struct Observation {
    std::string key;                       ///< Timestamp key the entry was stored under
    std::map<std::string, double> fields;  ///< Field name -> value

    /**
     * @brief Look up a field by name
     * @return Value, or nullopt if the field is not part of this observation
     */
    std::optional<double> get(const std::string& name) const {
        auto it = fields.find(name);
        if (it == fields.end()) return std::nullopt;
        return it->second;
    }

    bool has(const std::string& name) const { return fields.count(name) != 0; }
    bool empty() const { return fields.empty(); }
};

namespace detail {
// Plain decimal keys only: digits with at most one decimal point
inline bool parse_key_number(const std::string& s, double& out) {
    bool seen_digit = false;
    bool seen_point = false;
    for (char c : s) {
        if (c >= '0' && c <= '9') {
            seen_digit = true;
        } else if (c == '.' && !seen_point) {
            seen_point = true;
        } else {
            return false;
        }
    }
    if (!seen_digit) return false;
    char* end = nullptr;
    errno = 0;
    out = std::strtod(s.c_str(), &end);
    return errno == 0 && end == s.c_str() + s.size();
}
}

/**
 * @brief Ordering of station timestamp keys
 *
 * Two numeric keys compare by value ("99" < "100"); otherwise the keys
 * compare as plain strings.
 */
inline bool timestamp_key_less(const std::string& a, const std::string& b) {
    double na = 0.0, nb = 0.0;
    if (detail::parse_key_number(a, na) && detail::parse_key_number(b, nb)) {
        if (na != nb) return na < nb;
    }
    return a < b;
}

/**
 * @brief Pick the current observation out of a station document
 *
 * The document maps timestamp keys to field objects. The entry under the
 * greatest key is the current one.
 *
 * @param set Parsed station document
 * @return The latest observation, or nullopt if the document is not an
 *         object, is empty, or its latest entry is not an object
 */
inline std::optional<Observation> select_latest(const nlohmann::json& set) {
    if (!set.is_object() || set.empty()) return std::nullopt;

    auto latest = set.begin();
    for (auto it = set.begin(); it != set.end(); ++it) {
        if (timestamp_key_less(latest.key(), it.key())) {
            latest = it;
        }
    }

    if (!latest.value().is_object()) return std::nullopt;

    Observation obs;
    obs.key = latest.key();
    for (auto it = latest.value().begin(); it != latest.value().end(); ++it) {
        if (it.value().is_number()) {
            obs.fields[it.key()] = it.value().get<double>();
        }
    }
    return obs;
}
