#include <Arduino.h>
#include <cstdio>
#include "../include/sihas_device.hpp"
#include "../include/logger.hpp"

SihasDevice::SihasDevice(const DeviceAddress& address, const CapabilitySet& capabilities,
                         Transport* transport, uint32_t timeout_ms)
    : address_(address), capabilities_(capabilities), shut_down_(false), transport_(transport) {
    label_ = std::string(deviceTypeToTag(capabilities_.type)) + "-" + compactMac(address_.mac);
    classifier_ = new ErrorClassifier(label_);
    adapter_ = new ProtocolAdapter(transport_, classifier_, timeout_ms);
    poller_ = new DevicePoller(adapter_, &capabilities_, label_);
    dispatcher_ = new CommandDispatcher(adapter_, &capabilities_, poller_, label_);
}

SihasDevice::~SihasDevice() {
    shutdown();
    delete dispatcher_;
    delete poller_;
    delete adapter_;
    delete classifier_;
    delete transport_;
}

void SihasDevice::begin(uint32_t poll_interval_ms) {
    Logger::info("[Device] %s at %s: cfg=%lu, %u channels", label_.c_str(), getAddress().host.c_str(),
                 (unsigned long)capabilities_.config_code, (unsigned)capabilities_.channels.size());
    poller_->begin(poll_interval_ms);
}

void SihasDevice::loop() {
    if (shut_down_.load()) return;
    poller_->loop();
}

void SihasDevice::shutdown() {
    if (shut_down_.exchange(true)) return;
    poller_->end();
    transport_->shutdown();
    // end() refuses new cycles; one already past its start check is waited for.
    while (poller_->isBusy()) {
        delay(1);
    }
    Logger::info("[Device] %s stopped", label_.c_str());
}

DeviceState SihasDevice::getState() const {
    return poller_->snapshot();
}

CommandResult SihasDevice::write(const std::string& channel, const ChannelValue& value) {
    return dispatcher_->write(channel, value);
}

void SihasDevice::subscribe(StateListener listener) {
    poller_->subscribe(listener);
}

bool SihasDevice::refresh(PollResult* result) {
    if (shut_down_.load()) return false;
    return poller_->refresh(result);
}

bool SihasDevice::updateHost(const std::string& host) {
    if (!transport_->setHost(host)) return false;
    std::lock_guard<std::mutex> lock(address_mutex_);
    address_.host = host;
    return true;
}

DeviceAddress SihasDevice::getAddress() const {
    std::lock_guard<std::mutex> lock(address_mutex_);
    return address_;
}

uint32_t SihasDevice::getPollInterval() const {
    return poller_->getInterval();
}

uint32_t SihasDevice::getFaultCount(ErrorCode code) const {
    return classifier_->getFaultCount(code);
}

void SihasDevice::getStatistics(char* outBuf, size_t outBufSize) const {
    char poll_stats[128];
    char fault_stats[96];
    poller_->getStatistics(poll_stats, sizeof(poll_stats));
    classifier_->getStatistics(fault_stats, sizeof(fault_stats));
    snprintf(outBuf, outBufSize, "%s: %s, %s, commands=%lu (failed %lu)", label_.c_str(), poll_stats, fault_stats,
             (unsigned long)dispatcher_->getExecutedCount(), (unsigned long)dispatcher_->getFailedCount());
}
