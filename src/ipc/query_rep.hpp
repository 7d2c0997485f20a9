#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <zmq.h>

/**
 * @brief ZeroMQ responder for sensor queries
 *
 * Receives JSON commands and sends JSON replies (see QueryAPI).
 *
 * Supported commands:
 * - {"cmd":"get_things"}
 * - {"cmd":"get_property","thing":"office-temperature","property":"temperature"}
 * - {"cmd":"get_status"}
 */
class QueryRep {
private:
    void* ctx{nullptr};  ///< ZeroMQ context
    void* rep{nullptr};  ///< ZeroMQ REP socket
    std::string endpoint;

public:
    /**
     * @brief Constructor - creates and binds responder socket
     * @throws std::runtime_error if the endpoint cannot be bound
     */
    explicit QueryRep(const std::string& bind_address) : endpoint(bind_address) {
        ctx = zmq_ctx_new();
        rep = zmq_socket(ctx, ZMQ_REP);
        int linger = 0;
        zmq_setsockopt(rep, ZMQ_LINGER, &linger, sizeof(linger));
        if (zmq_bind(rep, endpoint.c_str()) != 0) {
            std::string err = zmq_strerror(zmq_errno());
            zmq_close(rep);
            zmq_ctx_term(ctx);
            throw std::runtime_error("cannot bind query responder to " + endpoint + ": " + err);
        }
    }

    /**
     * @brief Destructor - cleanup ZeroMQ resources
     */
    ~QueryRep() {
        zmq_close(rep);
        zmq_ctx_term(ctx);
    }

    QueryRep(const QueryRep&) = delete;
    QueryRep& operator=(const QueryRep&) = delete;

    /**
     * @brief Wait for a request
     * @param timeout_ms Poll timeout in milliseconds
     * @return true if a request is ready to be received
     */
    bool poll(long timeout_ms) {
        zmq_pollitem_t items[] = {{rep, 0, ZMQ_POLLIN, 0}};
        int rc = zmq_poll(items, 1, timeout_ms);
        return rc > 0 && (items[0].revents & ZMQ_POLLIN);
    }

    /**
     * @brief Receive a request. Caller must reply when one was received.
     * @param flags zmq_msg_recv flags (ZMQ_DONTWAIT for a non-blocking read)
     * @return Request text, or nullopt if nothing was received
     */
    std::optional<std::string> recv(int flags = 0) {
        zmq_msg_t msg;
        zmq_msg_init(&msg);
        if (zmq_msg_recv(&msg, rep, flags) < 0) {
            zmq_msg_close(&msg);
            return std::nullopt;
        }
        std::string s(static_cast<const char*>(zmq_msg_data(&msg)), zmq_msg_size(&msg));
        zmq_msg_close(&msg);
        return s;
    }

    /**
     * @brief Send reply to the received request
     * @return true if the reply was queued
     */
    bool reply(const std::string& s) {
        return zmq_send(rep, s.data(), s.size(), 0) >= 0;
    }

    const std::string& get_bind_address() const { return endpoint; }
};
