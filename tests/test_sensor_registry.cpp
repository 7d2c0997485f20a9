#include "../src/sensor/sensor_registry.hpp"
#include "../src/net/http_upstream.hpp"
#include "weather_stubs.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <thread>

/**
 * @brief Tests for SensorRegistry and the end-to-end update path
 *
 * Tests include:
 * 1. Default deployment layout
 * 2. All sensors share one fetch and publish their fields
 * 3. Orderly shutdown while a fetch is in flight
 * 4. Station error followed by recovery (unknown -> value)
 * 5. Registration rules
 * 6. Orderly shutdown while a failing fetch is in flight
 */

using namespace std::chrono_literals;
using Stubs::ScriptedUpstream;
using Stubs::RecordingSink;

static const char* STATION_DOC = R"({
    "1700000000": {"in_temp": 20.0},
    "1700000300": {
        "in_temp": 21.5, "in_hygro": 45.0,
        "out_temp": 4.5, "out_hygro": 88.0,
        "office_temp": 19.5, "office_hygro": 50.0,
        "bathroom_temp": 22.0, "bathroom_hygro": 65.0,
        "bedroom_temp": 18.0, "bedroom_hygro": 48.0,
        "baro": 1012.4
    }
})";

int main() {
    std::cout << "Testing SensorRegistry functionality..." << std::endl;

    // Test 1: Default deployment layout
    {
        std::cout << "Test 1: Default deployment" << std::endl;

        auto specs = default_deployment();
        assert(specs.size() == 9);
        assert(specs[0].id == "living-room-humidity");
        assert(specs[0].title == "Living Room Humidity Sensor");
        assert(specs[0].fields.size() == 1);
        assert(specs[0].fields[0].source == "in_hygro");
        assert(specs[2].id == "living-room-temperature");
        assert(specs[2].type == "TemperatureSensor");
        assert(specs[2].fields.size() == 2);
        assert(specs[2].fields[1].property == "humidity");
        assert(specs[8].id == "outside-barometer");
        assert(specs[8].fields[0].source == "baro");
        assert(specs[8].fields[0].unit == "hPa");
        assert(specs[8].fields[0].maximum.value() == 10000.0);

        std::cout << "  Default deployment test passed" << std::endl;
    }

    // Test 2: All sensors share one fetch and publish their fields
    {
        std::cout << "Test 2: Shared fetch" << std::endl;

        ScriptedUpstream up;
        up.push(Stubs::ok_response(STATION_DOC));
        WeatherCache cache(up, 10s);
        RecordingSink sink;
        SensorRegistry registry(cache, sink, 30ms);
        for (auto& spec : default_deployment()) {
            registry.add(spec);
        }

        registry.start();
        std::this_thread::sleep_for(200ms);
        registry.stop_all();

        assert(up.fetch_count.load() == 1);
        assert(registry.find("living-room-temperature")->state().get("temperature").value() == 21.5);
        assert(registry.find("outside-humidity")->state().get("level").value() == 88.0);
        assert(registry.find("office-temperature")->state().get("humidity").value() == 50.0);
        assert(registry.find("outside-barometer")->state().get("level").value() == 1012.4);

        // Kitchen fields are absent: unknown there, without disturbing the others
        assert(!registry.find("kitchen-temperature")->state().get("temperature").has_value());
        assert(registry.find("bathroom-temperature")->state().get("temperature").value() == 22.0);

        for (const auto& u : registry.updaters()) {
            assert(!u->is_running());
            assert(u->get_statistics().ticks >= 2);
        }

        size_t count = sink.count();
        std::this_thread::sleep_for(100ms);
        assert(sink.count() == count);

        std::cout << "  Shared fetch test passed" << std::endl;
    }

    // Test 3: Orderly shutdown while a fetch is in flight
    {
        std::cout << "Test 3: Shutdown during fetch" << std::endl;

        ScriptedUpstream up;
        up.delay = 300ms;
        up.push(Stubs::ok_response(STATION_DOC));
        WeatherCache cache(up, 10s);
        NullSink sink;
        SensorRegistry registry(cache, sink, 10ms);
        for (auto& spec : default_deployment()) {
            registry.add(spec);
        }

        registry.start();
        std::this_thread::sleep_for(50ms);  // one updater fetching, the rest queued on the cache

        auto t0 = std::chrono::steady_clock::now();
        registry.stop_all();
        auto elapsed = std::chrono::steady_clock::now() - t0;

        for (const auto& u : registry.updaters()) {
            assert(!u->is_running());
            assert(u->get_statistics().writes == 0);
        }
        assert(up.fetch_count.load() == 1);
        assert(elapsed < 2s);
        assert(registry.is_stopped());

        std::cout << "  Shutdown took "
                  << std::chrono::duration<double, std::milli>(elapsed).count() << " ms" << std::endl;
        std::cout << "  Shutdown during fetch test passed" << std::endl;
    }

    // Test 4: Station error followed by recovery
    {
        std::cout << "Test 4: Error then recovery" << std::endl;

        ScriptedUpstream up;
        up.push(classify_response(503, "application/json",
                                  R"({"messagesource":"weatherstation","message":"boom"})"));
        up.push(classify_response(200, "application/json", STATION_DOC));
        WeatherCache cache(up, 10s);
        RecordingSink sink;
        SensorRegistry registry(cache, sink, 100ms);
        registry.add(temperature_sensor("living room", "in", true));

        registry.start();
        std::this_thread::sleep_for(350ms);
        registry.stop_all();

        auto writes = sink.all();
        assert(writes.size() >= 4);
        // First tick: station error, nothing cached -> unknown
        assert(writes[0].property == "temperature");
        assert(!writes[0].value.has_value());
        assert(!writes[1].value.has_value());
        // Second tick: retried immediately, values from the payload
        assert(writes[2].property == "temperature");
        assert(writes[2].value.value() == 21.5);
        assert(writes[3].property == "humidity");
        assert(writes[3].value.value() == 45.0);
        assert(up.fetch_count.load() == 2);

        auto stats = cache.get_statistics();
        assert(stats.upstream_errors == 1);
        assert(stats.successful_fetches == 1);

        std::cout << "  Error then recovery test passed" << std::endl;
    }

    // Test 5: Registration rules
    {
        std::cout << "Test 5: Registration rules" << std::endl;

        ScriptedUpstream up;
        WeatherCache cache(up);
        NullSink sink;
        SensorRegistry registry(cache, sink, 10s);
        registry.add(humidity_sensor("outside", "out"));

        bool threw = false;
        try {
            registry.add(humidity_sensor("outside", "out"));
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);

        registry.start();
        threw = false;
        try {
            registry.add(pressure_sensor("outside", "baro"));
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
        assert(registry.size() == 1);

        registry.stop_all();
        registry.stop_all();  // second call is a no-op

        std::cout << "  Registration rules test passed" << std::endl;
    }

    // Test 6: Orderly shutdown while a failing fetch is in flight
    {
        std::cout << "Test 6: Shutdown during failing fetch" << std::endl;

        ScriptedUpstream up;
        up.delay = 300ms;
        up.push(Stubs::error_response(FetchError::TRANSPORT_ERROR, 0, "timed out"));
        WeatherCache cache(up, 10s);
        RecordingSink sink;
        SensorRegistry registry(cache, sink, 10ms);
        for (auto& spec : default_deployment()) {
            registry.add(spec);
        }

        registry.start();
        std::this_thread::sleep_for(50ms);  // one updater fetching, the rest queued behind it

        auto t0 = std::chrono::steady_clock::now();
        registry.stop_all();
        auto elapsed = std::chrono::steady_clock::now() - t0;

        // The queued updaters shared the one failed fetch and published nothing
        assert(up.fetch_count.load() == 1);
        assert(elapsed < 1s);
        for (const auto& u : registry.updaters()) {
            assert(!u->is_running());
            assert(u->get_statistics().writes == 0);
            assert(u->get_statistics().unknown_writes == 0);
        }
        assert(sink.count() == 0);
        std::this_thread::sleep_for(100ms);
        assert(sink.count() == 0);

        std::cout << "  Shutdown took "
                  << std::chrono::duration<double, std::milli>(elapsed).count() << " ms" << std::endl;
        std::cout << "  Shutdown during failing fetch test passed" << std::endl;
    }

    std::cout << "\n✅ All SensorRegistry tests passed!" << std::endl;
    return 0;
}
