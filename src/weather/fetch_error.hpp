#pragma once
#include <string>

/**
 * @brief Outcome classes for a weather station fetch
 *
 * Only NO_DATA_YET and FIELD_MISSING ever reach a sensor; transport and
 * upstream errors are absorbed by the cache and only logged and counted.
 */
enum class FetchError {
    OK = 0,              ///< Observation available
    TRANSPORT_ERROR,     ///< Station unreachable (refused, timeout, DNS)
    UPSTREAM_ERROR,      ///< Station answered with an error status or unusable body
    NO_DATA_YET,         ///< Fetch failed and nothing was ever cached
    FIELD_MISSING        ///< Observation lacks the requested field
};

inline std::string error_to_string(FetchError error) {
    switch (error) {
        case FetchError::OK: return "OK";
        case FetchError::TRANSPORT_ERROR: return "TRANSPORT_ERROR";
        case FetchError::UPSTREAM_ERROR: return "UPSTREAM_ERROR";
        case FetchError::NO_DATA_YET: return "NO_DATA_YET";
        case FetchError::FIELD_MISSING: return "FIELD_MISSING";
        default: return "INVALID_FETCH_ERROR";
    }
}
