#include <catch2/catch_test_macros.hpp>

#include "ring_buffer.hpp"

#include <algorithm>
#include <cstdint>
#include <numeric>
#include <vector>

TEST_CASE("RingBuffer", "[ring_buffer]") {
    constexpr size_t cap = 256;
    RingBuffer rb(cap);

    SECTION("WriteAndRead") {
        std::vector<uint8_t> data(64);
        std::iota(data.begin(), data.end(), uint8_t(0));

        REQUIRE(rb.write(data.data(), data.size()) == 64);
        REQUIRE(rb.available() == 64);

        std::vector<uint8_t> out(64);
        REQUIRE(rb.read(out.data(), out.size()) == 64);
        REQUIRE(out == data);
    }

    SECTION("Wraparound") {
        // Fill most of the buffer, read it, then write across the wrap boundary
        std::vector<uint8_t> fill(200);
        std::iota(fill.begin(), fill.end(), uint8_t(1));
        REQUIRE(rb.write(fill.data(), fill.size()) == 200);

        std::vector<uint8_t> sink(200);
        REQUIRE(rb.read(sink.data(), sink.size()) == 200);
        REQUIRE(sink == fill);

        // Now write_pos is at 200, read_pos is at 200. Write 128 bytes wraps around 256.
        std::vector<uint8_t> wrap(128);
        std::iota(wrap.begin(), wrap.end(), uint8_t(42));
        REQUIRE(rb.write(wrap.data(), wrap.size()) == 128);

        std::vector<uint8_t> out(128);
        REQUIRE(rb.read(out.data(), out.size()) == 128);
        REQUIRE(out == wrap);
    }

    SECTION("OverflowDrops") {
        std::vector<uint8_t> big(cap + 100);
        std::fill(big.begin(), big.end(), uint8_t(0xAB));

        size_t written = rb.write(big.data(), big.size());
        REQUIRE(written == cap);
        REQUIRE(rb.available() == cap);
    }

    SECTION("DrainAllFloats") {
        std::vector<float> samples = {0.25f, -0.5f, 1.0f, -1.0f, 0.0f};
        size_t byte_len = samples.size() * sizeof(float);
        REQUIRE(rb.write(samples.data(), byte_len) == byte_len);

        auto drained = rb.drain_all();
        REQUIRE(drained == samples);
        REQUIRE(rb.available() == 0);
    }

    SECTION("DrainAllKeepsPartialSample") {
        std::vector<uint8_t> bytes(10, 0x00);
        rb.write(bytes.data(), bytes.size());

        // 10 bytes -> 2 whole floats, 2 bytes stay queued
        auto drained = rb.drain_all();
        REQUIRE(drained.size() == 2);
        REQUIRE(rb.available() == 2);
    }

    SECTION("DrainAllAcrossWrap") {
        std::vector<uint8_t> fill(240, 0x00);
        rb.write(fill.data(), fill.size());
        std::vector<uint8_t> sink(240);
        rb.read(sink.data(), sink.size());

        std::vector<float> samples(12);
        std::iota(samples.begin(), samples.end(), 1.0f);
        REQUIRE(rb.write(samples.data(), samples.size() * sizeof(float)) == 48);
        REQUIRE(rb.drain_all() == samples);
    }

    SECTION("BytesForDuration") {
        REQUIRE(RingBuffer::bytes_for(2, 16000) == 2 * 16000 * sizeof(float));
        REQUIRE(rb.capacity() == cap);
    }

    SECTION("EmptyRead") {
        uint8_t buf[16];
        REQUIRE(rb.read(buf, sizeof(buf)) == 0);
    }

    SECTION("ResetClearsState") {
        std::vector<uint8_t> data(32, 0xFF);
        rb.write(data.data(), data.size());
        REQUIRE(rb.available() == 32);

        rb.reset();
        REQUIRE(rb.available() == 0);
    }
}
