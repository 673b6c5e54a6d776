/**
 * Device poller test program.
 *
 * Runs the poller against FakeTransport; no network needed.
 */

#include <Arduino.h>
#include <unity.h>
#include <thread>
#include "fake_transport.hpp"
#include "../include/device_poller.hpp"
#include "../include/protocol_adapter.hpp"
#include "../include/error_classifier.hpp"

void setUp(void) {}
void tearDown(void) {}

struct PollerFixture {
    FakeTransport transport;
    ErrorClassifier classifier;
    ProtocolAdapter adapter;
    CapabilitySet caps;
    DevicePoller* poller;

    PollerFixture(DeviceType type, uint32_t cfg)
        : classifier("TEST"), adapter(&transport, &classifier, 500), poller(nullptr) {
        resolveProfile(type, cfg, caps);
        poller = new DevicePoller(&adapter, &caps, "TEST");
    }
    ~PollerFixture() { delete poller; }
};

static std::vector<uint16_t> pmmWords() {
    std::vector<uint16_t> words(64, 0);
    words[0] = 2305;     // 230.5 V
    words[48] = 1000;
    words[49] = 2000;
    return words;
}

void test_every_channel_starts_invalid(void) {
    PollerFixture f(DeviceType::PMM, 2);
    DeviceState state = f.poller->snapshot();
    TEST_ASSERT_FALSE(state.available);
    TEST_ASSERT_EQUAL(f.caps.channels.size(), state.values.size());
    TEST_ASSERT_FALSE(state.values["voltage"].valid);
}

void test_submeter_channels_decode_scaled(void) {
    PollerFixture f(DeviceType::PMM, 2);
    f.transport.queue(replyFrame(readResponseFrame(pmmWords())));

    PollResult result;
    TEST_ASSERT_TRUE(f.poller->refresh(&result));
    TEST_ASSERT_TRUE(result.ok());
    TEST_ASSERT_TRUE(result.availability_changed);
    TEST_ASSERT_TRUE(result.state.available);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 100.0f, result.state.values["submeter_power_1"].number);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 200.0f, result.state.values["submeter_power_2"].number);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 230.5f, result.state.values["voltage"].number);

    // One 64-register read at address 0.
    TEST_ASSERT_EQUAL(1, f.transport.requests.size());
    TEST_ASSERT_EQUAL_HEX8(FC_READ_HOLDING_REGISTERS, f.transport.requests[0][7]);
    TEST_ASSERT_EQUAL_HEX8(64, f.transport.requests[0][11]);
}

void test_availability_flips_once_after_three_failures(void) {
    PollerFixture f(DeviceType::PMM, 2);
    int availability_events = 0;
    f.poller->subscribe([&availability_events](const StateChange& change) {
        if (change.availability_changed) availability_events++;
    });

    f.transport.queue(replyFrame(readResponseFrame(pmmWords())));
    PollResult result;
    f.poller->refresh(&result);
    TEST_ASSERT_EQUAL(1, availability_events);

    for (int i = 1; i <= 4; ++i) {
        f.poller->refresh(&result);
        TEST_ASSERT_EQUAL(ERR_TIMEOUT, result.error);
        TEST_ASSERT_EQUAL(i == 3, result.availability_changed);
        TEST_ASSERT_EQUAL(i < 3, result.state.available);
    }
    TEST_ASSERT_EQUAL(2, availability_events);
    TEST_ASSERT_EQUAL_UINT32(4, f.poller->getConsecutiveFailures());
    // Last known values are kept while the device is unreachable.
    TEST_ASSERT_TRUE(f.poller->snapshot().values["submeter_power_1"].valid);

    f.transport.queue(replyFrame(readResponseFrame(pmmWords())));
    f.poller->refresh(&result);
    TEST_ASSERT_TRUE(result.ok());
    TEST_ASSERT_TRUE(result.availability_changed);
    TEST_ASSERT_TRUE(result.state.available);
    TEST_ASSERT_EQUAL(3, availability_events);
    TEST_ASSERT_EQUAL_UINT32(0, f.poller->getConsecutiveFailures());
}

void test_unchanged_values_do_not_notify(void) {
    PollerFixture f(DeviceType::PMM, 2);
    int notifications = 0;
    f.poller->subscribe([&notifications](const StateChange&) { notifications++; });

    f.transport.queue(replyFrame(readResponseFrame(pmmWords())));
    f.transport.queue(replyFrame(readResponseFrame(pmmWords())));
    PollResult result;
    f.poller->refresh(&result);
    f.poller->refresh(&result);
    TEST_ASSERT_FALSE(result.values_changed);
    TEST_ASSERT_EQUAL(1, notifications);
}

void test_malformed_response_keeps_state(void) {
    PollerFixture f(DeviceType::PMM, 2);
    f.transport.queue(replyFrame(readResponseFrame(pmmWords(), 10)));

    PollResult result;
    f.poller->refresh(&result);
    TEST_ASSERT_EQUAL(ERR_MALFORMED_RESPONSE, result.error);
    TEST_ASSERT_FALSE(result.state.available);
    TEST_ASSERT_FALSE(result.state.values["voltage"].valid);
}

void test_tick_is_skipped_while_cycle_runs(void) {
    PollerFixture f(DeviceType::PMM, 2);
    f.poller->begin(1000);
    f.transport.hold = true;
    f.transport.queue(replyFrame(readResponseFrame(pmmWords())));

    std::thread worker([&f]() { f.poller->refresh(); });
    uint32_t start = millis();
    while (!f.transport.in_exchange.load() && millis() - start < 2000) {
        delay(1);
    }
    TEST_ASSERT_TRUE(f.poller->isBusy());

    // Due tick during the running cycle: skipped, no second exchange queued.
    TEST_ASSERT_FALSE(f.poller->tick(millis()));
    TEST_ASSERT_EQUAL_UINT32(1, f.poller->getSkippedTicks());

    f.transport.hold = false;
    worker.join();
    TEST_ASSERT_EQUAL(1, f.transport.requestCount());
    TEST_ASSERT_TRUE(f.poller->snapshot().available);
    TEST_ASSERT_EQUAL_UINT32(1000, f.poller->getInterval());
}

void test_write_during_cycle_survives_merge(void) {
    PollerFixture f(DeviceType::SDM, 1);
    std::vector<uint16_t> words(64, 0);
    words[0] = 50;
    f.transport.queue(replyFrame(readResponseFrame(words)));
    TEST_ASSERT_TRUE(f.poller->refresh());
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 50.0f, f.poller->snapshot().values["brightness_1"].number);

    // The device answers with its pre-write word while the write is acked.
    f.transport.hold = true;
    f.transport.queue(replyFrame(readResponseFrame(words)));
    std::thread worker([&f]() { f.poller->refresh(); });
    uint32_t start = millis();
    while (!f.transport.in_exchange.load() && millis() - start < 2000) {
        delay(1);
    }
    TEST_ASSERT_TRUE(f.poller->isBusy());

    f.poller->applyWrite(*f.caps.findChannel("brightness_1"), 0, ChannelValue::fromNumber(0.0f));
    f.transport.hold = false;
    worker.join();

    DeviceState state = f.poller->snapshot();
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 0.0f, state.values["brightness_1"].number);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, state.values["light_1"].number);
    uint16_t word = 0xFFFF;
    TEST_ASSERT_TRUE(f.poller->cachedWord(0, word));
    TEST_ASSERT_EQUAL_UINT16(0, word);

    // The next cycle takes the device's word again.
    words[0] = 75;
    f.transport.queue(replyFrame(readResponseFrame(words)));
    TEST_ASSERT_TRUE(f.poller->refresh());
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 75.0f, f.poller->snapshot().values["brightness_1"].number);
}

void test_energy_counters_decode_in_kwh(void) {
    PollerFixture f(DeviceType::PMM, 2);
    std::vector<uint16_t> words = pmmWords();
    words[8] = 123;
    words[10] = 500;
    words[11] = 200;
    words[16] = 45;
    f.transport.queue(replyFrame(readResponseFrame(words)));
    PollResult result;
    TEST_ASSERT_TRUE(f.poller->refresh(&result));
    TEST_ASSERT_FLOAT_WITHIN(0.0005f, 1.275f, result.state.values["this_day_energy"].number);
    TEST_ASSERT_FLOAT_WITHIN(0.0005f, 5.045f, result.state.values["this_month_energy"].number);
    TEST_ASSERT_FLOAT_WITHIN(0.0005f, 2.0f, result.state.values["last_month_energy"].number);

    // Register 31 set: monthly counters count in 100 Wh steps.
    words[31] = 1;
    f.transport.queue(replyFrame(readResponseFrame(words)));
    TEST_ASSERT_TRUE(f.poller->refresh(&result));
    TEST_ASSERT_FLOAT_WITHIN(0.0005f, 1.275f, result.state.values["this_day_energy"].number);
    TEST_ASSERT_FLOAT_WITHIN(0.005f, 50.045f, result.state.values["this_month_energy"].number);
    TEST_ASSERT_FLOAT_WITHIN(0.005f, 20.0f, result.state.values["last_month_energy"].number);
    TEST_ASSERT_EQUAL_STRING("kWh", f.caps.findChannel("this_month_energy")->unit.c_str());
}

void test_ticker_waits_for_interval(void) {
    PollerFixture f(DeviceType::PMM, 2);
    f.poller->begin(1000);
    uint32_t now = millis();
    TEST_ASSERT_TRUE(f.poller->tick(now));            // first tick fires at once
    TEST_ASSERT_FALSE(f.poller->tick(now + 500));
    TEST_ASSERT_TRUE(f.poller->tick(now + 1000));
    f.poller->end();
    size_t sent = f.transport.requestCount();
    TEST_ASSERT_FALSE(f.poller->tick(now + 5000));
    // Stopped: manual refreshes are refused too.
    TEST_ASSERT_FALSE(f.poller->refresh());
    TEST_ASSERT_EQUAL(sent, f.transport.requestCount());
}

void setup() {
    Serial.begin(115200);
    delay(2000);

    UNITY_BEGIN();
    RUN_TEST(test_every_channel_starts_invalid);
    RUN_TEST(test_submeter_channels_decode_scaled);
    RUN_TEST(test_availability_flips_once_after_three_failures);
    RUN_TEST(test_unchanged_values_do_not_notify);
    RUN_TEST(test_malformed_response_keeps_state);
    RUN_TEST(test_tick_is_skipped_while_cycle_runs);
    RUN_TEST(test_ticker_waits_for_interval);
    RUN_TEST(test_write_during_cycle_survives_merge);
    RUN_TEST(test_energy_counters_decode_in_kwh);
    UNITY_END();
}

void loop() {}
