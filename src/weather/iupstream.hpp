#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "fetch_error.hpp"

/**
 * @brief Result of a single request to the weather station
 */
struct UpstreamResponse {
    FetchError error{FetchError::OK};  ///< OK, TRANSPORT_ERROR or UPSTREAM_ERROR
    long status{0};                    ///< HTTP status, 0 when no response arrived
    nlohmann::json body;               ///< Parsed document (error body on failure, if any)
    std::string message;               ///< Human-readable failure description

    bool ok() const { return error == FetchError::OK; }
};

/**
 * @brief Source of station documents ("fetch JSON or error")
 *
 * The cache only ever talks to this interface; tests substitute scripted
 * stubs for the HTTP implementation.
 */
struct IUpstream {
    virtual ~IUpstream() = default;
    virtual UpstreamResponse fetch() = 0;
};
