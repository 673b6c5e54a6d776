/**
 * Transport lock and cancellation test program.
 */

#include <Arduino.h>
#include <unity.h>
#include <thread>
#include "fake_transport.hpp"

void setUp(void) {}
void tearDown(void) {}

static std::vector<uint8_t> anyRequest() {
    return build_read_request(7, 0, 64);
}

void test_exchange_returns_queued_reply(void) {
    FakeTransport transport;
    transport.queue(replyEcho());
    std::vector<uint8_t> response;
    TEST_ASSERT_TRUE(transport.exchange(anyRequest(), response, 100) == TransportStatus::OK);
    TEST_ASSERT_EQUAL_UINT32(anyRequest().size(), response.size());
    TEST_ASSERT_TRUE(transport.exchange(anyRequest(), response, 100) == TransportStatus::TIMEOUT);
    TEST_ASSERT_EQUAL_UINT32(2, transport.getExchangeCount());
}

void test_cancel_while_idle_aborts_next_exchange_only(void) {
    FakeTransport transport;
    transport.queue(replyEcho());
    transport.queue(replyEcho());
    transport.cancel();

    std::vector<uint8_t> response;
    TEST_ASSERT_TRUE(transport.exchange(anyRequest(), response, 100) == TransportStatus::CANCELLED);
    TEST_ASSERT_TRUE(transport.exchange(anyRequest(), response, 100) == TransportStatus::OK);
}

void test_cancel_interrupts_held_exchange(void) {
    FakeTransport transport;
    transport.hold = true;
    transport.queue(replyEcho());

    TransportStatus status = TransportStatus::OK;
    std::thread worker([&transport, &status]() {
        std::vector<uint8_t> response;
        status = transport.exchange(anyRequest(), response, 5000);
    });
    while (!transport.in_exchange.load()) delay(1);
    uint32_t started = millis();
    transport.cancel();
    worker.join();

    TEST_ASSERT_TRUE(status == TransportStatus::CANCELLED);
    TEST_ASSERT_TRUE(millis() - started < 500);

    // The cancel was consumed; the queued reply is still delivered.
    transport.hold = false;
    std::vector<uint8_t> response;
    TEST_ASSERT_TRUE(transport.exchange(anyRequest(), response, 100) == TransportStatus::OK);
}

void test_shutdown_rejects_every_later_exchange(void) {
    FakeTransport transport;
    transport.queue(replyEcho());
    transport.shutdown();
    TEST_ASSERT_TRUE(transport.isShutdown());

    std::vector<uint8_t> response;
    TEST_ASSERT_TRUE(transport.exchange(anyRequest(), response, 100) == TransportStatus::CANCELLED);
    TEST_ASSERT_TRUE(transport.exchange(anyRequest(), response, 100) == TransportStatus::CANCELLED);
    TEST_ASSERT_EQUAL_UINT32(0, transport.getExchangeCount());
    TEST_ASSERT_EQUAL_UINT32(0, transport.requestCount());
}

void setup() {
    Serial.begin(115200);
    delay(2000);

    UNITY_BEGIN();
    RUN_TEST(test_exchange_returns_queued_reply);
    RUN_TEST(test_cancel_while_idle_aborts_next_exchange_only);
    RUN_TEST(test_cancel_interrupts_held_exchange);
    RUN_TEST(test_shutdown_rejects_every_later_exchange);
    UNITY_END();
}

void loop() {}
