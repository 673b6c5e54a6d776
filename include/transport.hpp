#pragma once
#include <stdint.h>
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

enum class TransportStatus {
    OK,
    TIMEOUT,        // nothing came back before the deadline
    SEND_FAILED,    // socket could not be opened or the datagram not sent
    CANCELLED       // cancel() or shutdown() interrupted the wait
};

const char* transportStatusToString(TransportStatus status);

// Request/response exchange with one device.
//
// Only one exchange is outstanding per device: exchange() serialises callers
// on the device lock, so a write issued during a poll waits for the poll's
// exchange to finish instead of interleaving with it.
class Transport {
public:
    Transport();
    virtual ~Transport();

    TransportStatus exchange(const std::vector<uint8_t>& request,
                             std::vector<uint8_t>& response,
                             uint32_t timeout_ms);

    // Aborts the exchange waiting for a response, or the next one to take
    // the device lock when none is in flight.
    void cancel();

    // Cancels, waits for the in-flight exchange to return and releases the
    // socket. Every later exchange() returns CANCELLED.
    void shutdown();
    bool isShutdown() const { return shut_down_.load(); }

    uint32_t getExchangeCount() const { return exchange_count_.load(); }

    // Re-points the transport at a corrected host. Takes the device lock.
    virtual bool setHost(const std::string& host) = 0;

protected:
    // Called with the device lock held.
    virtual TransportStatus doExchange(const std::vector<uint8_t>& request,
                                       std::vector<uint8_t>& response,
                                       uint32_t timeout_ms) = 0;
    // Called with the device lock held.
    virtual void closeSocket() = 0;

    bool cancelRequested() const { return cancel_requested_.load(); }
    std::mutex& deviceLock() { return exchange_mutex_; }

private:
    std::mutex exchange_mutex_;
    std::atomic<bool> cancel_requested_;
    std::atomic<bool> shut_down_;
    std::atomic<uint32_t> exchange_count_;
};
