#include "../include/transport.hpp"

const char* transportStatusToString(TransportStatus status) {
    switch (status) {
        case TransportStatus::OK: return "OK";
        case TransportStatus::TIMEOUT: return "TIMEOUT";
        case TransportStatus::SEND_FAILED: return "SEND_FAILED";
        case TransportStatus::CANCELLED: return "CANCELLED";
        default: return "UNKNOWN";
    }
}

Transport::Transport()
    : cancel_requested_(false), shut_down_(false), exchange_count_(0) {}

Transport::~Transport() {}

TransportStatus Transport::exchange(const std::vector<uint8_t>& request,
                                    std::vector<uint8_t>& response,
                                    uint32_t timeout_ms) {
    std::lock_guard<std::mutex> lock(exchange_mutex_);
    if (shut_down_.load()) return TransportStatus::CANCELLED;
    exchange_count_++;
    response.clear();
    TransportStatus status = doExchange(request, response, timeout_ms);
    // Consumed by this exchange; a cancel() that arrives while no exchange
    // runs applies to the next one.
    if (!shut_down_.load()) cancel_requested_.store(false);
    return status;
}

void Transport::cancel() {
    cancel_requested_.store(true);
}

void Transport::shutdown() {
    shut_down_.store(true);
    cancel_requested_.store(true);
    std::lock_guard<std::mutex> lock(exchange_mutex_);
    closeSocket();
}
