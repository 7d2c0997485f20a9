#pragma once
#include <chrono>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <zmq.h>
#include <nlohmann/json.hpp>
#include "../sensor/isink.hpp"

/**
 * @brief ZeroMQ publisher for sensor value updates
 *
 * Every value a sensor publishes goes out on the "property" topic as
 *
 * {"thing": "<sensor id>", "property": "<name>", "value": <number|null>, "t": <sec>}
 *
 * where t is seconds since the publisher was created. Any number of SUB
 * sockets may subscribe. Sends are serialized because the update loops
 * call publish() from their own threads.
 */
class ValuePub : public IValueSink {
private:
    void* ctx{nullptr};  ///< ZeroMQ context
    void* pub{nullptr};  ///< ZeroMQ PUB socket
    std::string endpoint;
    std::mutex send_mtx;
    std::chrono::steady_clock::time_point t0{std::chrono::steady_clock::now()};

public:
    static constexpr const char* TOPIC = "property";

    /**
     * @brief Constructor - creates and binds publisher socket
     * @param bind_address ZeroMQ endpoint, e.g. "tcp://127.0.0.1:8888"
     * @throws std::runtime_error if the endpoint cannot be bound
     */
    explicit ValuePub(const std::string& bind_address) : endpoint(bind_address) {
        ctx = zmq_ctx_new();
        pub = zmq_socket(ctx, ZMQ_PUB);
        int linger = 0;
        zmq_setsockopt(pub, ZMQ_LINGER, &linger, sizeof(linger));
        if (zmq_bind(pub, endpoint.c_str()) != 0) {
            std::string err = zmq_strerror(zmq_errno());
            zmq_close(pub);
            zmq_ctx_term(ctx);
            throw std::runtime_error("cannot bind value publisher to " + endpoint + ": " + err);
        }
    }

    /**
     * @brief Destructor - cleanup ZeroMQ resources
     */
    ~ValuePub() override {
        zmq_close(pub);
        zmq_ctx_term(ctx);
    }

    ValuePub(const ValuePub&) = delete;
    ValuePub& operator=(const ValuePub&) = delete;

    void publish(const SensorSpec& sensor, const FieldSpec& field,
                 std::optional<double> value) override {
        nlohmann::json j = {
            {"thing", sensor.id},
            {"property", field.property},
            {"value", value ? nlohmann::json(*value) : nlohmann::json(nullptr)},
            {"t", std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count()}
        };
        send(j.dump());
    }

    /**
     * @brief Send one message on the property topic
     */
    void send(const std::string& s) {
        std::lock_guard<std::mutex> lock(send_mtx);
        zmq_send(pub, TOPIC, std::char_traits<char>::length(TOPIC), ZMQ_SNDMORE);
        zmq_send(pub, s.data(), s.size(), 0);
    }

    const std::string& get_bind_address() const { return endpoint; }
};
