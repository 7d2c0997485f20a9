#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include "../core/log.hpp"
#include "fetch_error.hpp"
#include "iupstream.hpp"
#include "observation.hpp"

/**
 * @brief Result of WeatherCache::get_latest()
 */
struct CacheResult {
    Observation observation;           ///< Current observation (empty unless ok())
    FetchError error{FetchError::OK};  ///< OK or NO_DATA_YET
    bool stale{false};                 ///< Served from an expired entry after a failed refresh

    bool ok() const { return error == FetchError::OK; }
};

/**
 * @brief Single-flight, time-bounded cache of the latest station observation
 *
 * Every sensor asks this cache on each tick; only the first caller after
 * the freshness window expires goes to the station. Callers that arrive
 * while that fetch is in flight block on the fetch lock and then reuse
 * the entry it produced.
 *
 * A failed refresh never touches the cached entry or its timestamp, so
 * the next call retries right away. While a stale entry exists it keeps
 * being served; only a cache that was never filled reports NO_DATA_YET.
 */
class WeatherCache {
public:
    using clock = std::chrono::steady_clock;
    using TimeSource = std::function<clock::time_point()>;

    /**
     * @brief Fetch statistics
     */
    struct Statistics {
        uint64_t fetch_attempts{0};       ///< Upstream requests issued
        uint64_t successful_fetches{0};   ///< Requests that replaced the entry
        uint64_t transport_errors{0};     ///< Station unreachable
        uint64_t upstream_errors{0};      ///< Error status or unusable document
        uint64_t stale_serves{0};         ///< Failed refreshes answered from the old entry
        double mean_fetch_time_ms{0.0};   ///< Mean request duration
        double max_fetch_time_ms{0.0};    ///< Longest request duration
    };

    /**
     * @brief Constructor
     * @param up Station document source
     * @param freshness_window Age after which the entry is refreshed
     * @param time_source Clock used for entry ages (injectable for tests)
     */
    explicit WeatherCache(IUpstream& up,
                          std::chrono::milliseconds freshness_window = std::chrono::seconds(10),
                          TimeSource time_source = [] { return clock::now(); })
        : upstream(up), window(freshness_window), now(std::move(time_source)) {}

    WeatherCache(const WeatherCache&) = delete;
    WeatherCache& operator=(const WeatherCache&) = delete;

    /**
     * @brief Get the current observation, refreshing it when expired
     * @return Observation with error OK, or NO_DATA_YET if the refresh
     *         failed and nothing was ever cached
     */
    CacheResult get_latest() {
        uint64_t seen_generation;
        {
            std::lock_guard<std::mutex> lock(state_mtx);
            seen_generation = generation;
        }

        std::lock_guard<std::mutex> flight(fetch_mtx);

        {
            std::lock_guard<std::mutex> lock(state_mtx);
            if (entry && now() - entry->fetched_at < window) {
                return CacheResult{entry->observation, FetchError::OK, false};
            }
            // A fetch finished while we waited for the lock: share its outcome
            if (generation != seen_generation && last_outcome) {
                return *last_outcome;
            }
        }

        log_debug("Get weather info from upstream station");
        auto start = clock::now();
        UpstreamResponse response = upstream.fetch();
        double fetch_ms = std::chrono::duration<double, std::milli>(clock::now() - start).count();

        std::optional<Observation> observation;
        if (response.ok()) {
            observation = select_latest(response.body);
            if (!observation) {
                response.error = FetchError::UPSTREAM_ERROR;
                response.message = "station document holds no usable observation";
            }
        }

        std::lock_guard<std::mutex> lock(state_mtx);
        record_fetch(fetch_ms, response.error);
        generation++;

        if (observation) {
            log_debug("Got HTTP status ", response.status, ", save observation ", observation->key);
            entry = CacheEntry{*observation, now()};
            last_outcome = CacheResult{entry->observation, FetchError::OK, false};
            return *last_outcome;
        }

        log_error("Got ", error_to_string(response.error), " (HTTP status ", response.status,
                  "), weather data not usable: ", response.message);

        if (entry) {
            stats.stale_serves++;
            log_warn("Serving stale observation ", entry->observation.key);
            last_outcome = CacheResult{entry->observation, FetchError::OK, true};
        } else {
            last_outcome = CacheResult{Observation{}, FetchError::NO_DATA_YET, false};
        }
        return *last_outcome;
    }

    /**
     * @brief Age of the cached entry
     * @return Age in seconds, or nullopt if nothing was cached yet
     */
    std::optional<double> entry_age_seconds() const {
        std::lock_guard<std::mutex> lock(state_mtx);
        if (!entry) return std::nullopt;
        return std::chrono::duration<double>(now() - entry->fetched_at).count();
    }

    bool has_entry() const {
        std::lock_guard<std::mutex> lock(state_mtx);
        return entry.has_value();
    }

    Statistics get_statistics() const {
        std::lock_guard<std::mutex> lock(state_mtx);
        return stats;
    }

    std::chrono::milliseconds get_window() const { return window; }

private:
    struct CacheEntry {
        Observation observation;
        clock::time_point fetched_at;
    };

    void record_fetch(double fetch_ms, FetchError error) {
        stats.fetch_attempts++;
        stats.mean_fetch_time_ms += (fetch_ms - stats.mean_fetch_time_ms) / stats.fetch_attempts;
        if (fetch_ms > stats.max_fetch_time_ms) {
            stats.max_fetch_time_ms = fetch_ms;
        }
        switch (error) {
            case FetchError::OK: stats.successful_fetches++; break;
            case FetchError::TRANSPORT_ERROR: stats.transport_errors++; break;
            default: stats.upstream_errors++; break;
        }
    }

    IUpstream& upstream;
    std::chrono::milliseconds window;
    TimeSource now;

    std::mutex fetch_mtx;            ///< Held across check-fetch-replace (single flight)
    mutable std::mutex state_mtx;    ///< Guards entry and stats for readers
    std::optional<CacheEntry> entry;
    uint64_t generation{0};                 ///< Completed fetches
    std::optional<CacheResult> last_outcome; ///< Result of the latest completed fetch
    Statistics stats;
};
