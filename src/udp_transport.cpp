#include "../include/udp_transport.hpp"
#include "../include/logger.hpp"

UdpTransport::UdpTransport(const std::string& host, uint16_t port)
    : host_(host), port_(port) {
    if (!address_.fromString(host_.c_str())) {
        Logger::warn("[UDP] Invalid host address '%s'", host_.c_str());
    }
}

UdpTransport::~UdpTransport() {
    shutdown();
}

bool UdpTransport::setHost(const std::string& host) {
    IPAddress parsed;
    if (!parsed.fromString(host.c_str())) return false;
    std::lock_guard<std::mutex> lock(deviceLock());
    closeSocket();
    address_ = parsed;
    host_ = host;
    Logger::info("[UDP] Device address changed to %s", host_.c_str());
    return true;
}

std::string UdpTransport::getHost() {
    std::lock_guard<std::mutex> lock(deviceLock());
    return host_;
}

bool UdpTransport::openSocket() {
    // Port 0: let the stack pick an ephemeral local port.
    if (!udp_.begin(0)) {
        Logger::warn("[UDP] Failed to open socket for %s", host_.c_str());
        return false;
    }
    open_ = true;
    return true;
}

void UdpTransport::closeSocket() {
    if (!open_) return;
    udp_.stop();
    open_ = false;
}

void UdpTransport::discardPending() {
    while (udp_.parsePacket() > 0) {
        udp_.flush();
    }
}

TransportStatus UdpTransport::doExchange(const std::vector<uint8_t>& request,
                                         std::vector<uint8_t>& response,
                                         uint32_t timeout_ms) {
    if (WiFi.status() != WL_CONNECTED) {
        Logger::debug("[UDP] WiFi not connected, cannot reach %s", host_.c_str());
        return TransportStatus::SEND_FAILED;
    }
    if (!open_ && !openSocket()) return TransportStatus::SEND_FAILED;

    // Late answers to an earlier, timed-out request must not be taken for
    // the answer to this one.
    discardPending();

    if (!udp_.beginPacket(address_, port_)) {
        closeSocket();
        return TransportStatus::SEND_FAILED;
    }
    udp_.write(request.data(), request.size());
    if (!udp_.endPacket()) {
        Logger::warn("[UDP] Send to %s failed", host_.c_str());
        closeSocket();
        return TransportStatus::SEND_FAILED;
    }

    const uint16_t expected_id = frame_transaction_id(request);
    const uint32_t start = millis();
    while ((uint32_t)(millis() - start) < timeout_ms) {
        if (cancelRequested()) {
            closeSocket();
            return TransportStatus::CANCELLED;
        }
        int size = udp_.parsePacket();
        if (size <= 0) {
            delay(RECEIVE_POLL_MS);
            continue;
        }
        if (udp_.remoteIP() != address_) {
            udp_.flush();
            continue;
        }
        std::vector<uint8_t> datagram((size_t)size, 0);
        int n = udp_.read(datagram.data(), datagram.size());
        if (n <= 0) continue;
        datagram.resize((size_t)n);
        if (frame_transaction_id(datagram) != expected_id && datagram.size() >= FRAME_HEADER_LENGTH) {
            Logger::debug("[UDP] Dropping stale response id=%u from %s (want %u)",
                          (unsigned)frame_transaction_id(datagram), host_.c_str(), (unsigned)expected_id);
            continue;
        }
        response.swap(datagram);
        return TransportStatus::OK;
    }

    Logger::debug("[UDP] Timeout after %lu ms waiting for %s", (unsigned long)timeout_ms, host_.c_str());
    closeSocket();
    return TransportStatus::TIMEOUT;
}
