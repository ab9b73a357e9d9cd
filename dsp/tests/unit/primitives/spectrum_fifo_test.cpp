// ==============================================================================
// Layer 1: DSP Primitive Tests - Spectrum FIFO
// ==============================================================================
// Latest-window semantics of the audio -> analyser sample stream.
// ==============================================================================

#include <tonic/dsp/primitives/spectrum_fifo.h>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <array>
#include <thread>
#include <vector>

using namespace Tonic::DSP;

namespace {

/// Push `total` consecutive integers (as floats) in blocks of `blockSize`
template <size_t Capacity>
void pushCounting(SpectrumFIFO<Capacity>& fifo, size_t total, size_t blockSize) {
    std::vector<float> block(blockSize);
    size_t next = 0;
    while (next < total) {
        const size_t n = std::min(blockSize, total - next);
        for (size_t i = 0; i < n; ++i) {
            block[i] = static_cast<float>(next + i);
        }
        fifo.push(block.data(), n);
        next += n;
    }
}

} // namespace

TEST_CASE("A fresh FIFO has nothing to analyse", "[spectrum][fifo][primitives]") {
    SpectrumFIFO<512> fifo;
    std::array<float, 64> window{};

    REQUIRE(fifo.totalWritten() == 0);
    REQUIRE(fifo.readLatest(window.data(), window.size()) == 0);
    STATIC_REQUIRE(SpectrumFIFO<512>::capacity() == 512);
}

TEST_CASE("readLatest returns the newest window oldest first", "[spectrum][fifo][primitives]") {
    SpectrumFIFO<512> fifo;

    SECTION("within the first lap") {
        pushCounting(fifo, 300, 64);
        std::array<float, 128> window{};
        REQUIRE(fifo.readLatest(window.data(), window.size()) == window.size());
        REQUIRE(window.front() == 172.0f);
        REQUIRE(window.back() == 299.0f);
    }

    SECTION("after the ring has wrapped several times") {
        pushCounting(fifo, 5000, 480);
        REQUIRE(fifo.totalWritten() == 5000);

        std::array<float, 512> window{};
        REQUIRE(fifo.readLatest(window.data(), window.size()) == window.size());
        for (size_t i = 0; i < window.size(); ++i) {
            REQUIRE(window[i] == static_cast<float>(5000 - 512 + i));
        }
    }

    SECTION("reading does not consume") {
        pushCounting(fifo, 100, 100);
        std::array<float, 10> first{};
        std::array<float, 10> second{};
        REQUIRE(fifo.readLatest(first.data(), first.size()) == 10);
        REQUIRE(fifo.readLatest(second.data(), second.size()) == 10);
        REQUIRE(first == second);
    }
}

TEST_CASE("readLatest refuses windows it cannot fill", "[spectrum][fifo][primitives]") {
    SpectrumFIFO<512> fifo;
    pushCounting(fifo, 200, 50);

    std::vector<float> window(1024, -1.0f);

    SECTION("more than has been written") {
        REQUIRE(fifo.readLatest(window.data(), 201) == 0);
    }

    SECTION("more than the capacity") {
        pushCounting(fifo, 2000, 500);
        REQUIRE(fifo.readLatest(window.data(), 513) == 0);
    }

    SECTION("null destination or empty request") {
        REQUIRE(fifo.readLatest(nullptr, 16) == 0);
        REQUIRE(fifo.readLatest(window.data(), 0) == 0);
    }

    REQUIRE(window.front() == -1.0f);
}

TEST_CASE("push ignores empty input and clear forgets history", "[spectrum][fifo][primitives]") {
    SpectrumFIFO<256> fifo;
    fifo.push(nullptr, 32);
    REQUIRE(fifo.totalWritten() == 0);

    pushCounting(fifo, 256, 256);
    fifo.clear();
    REQUIRE(fifo.totalWritten() == 0);

    std::array<float, 16> window{};
    REQUIRE(fifo.readLatest(window.data(), window.size()) == 0);
}

TEST_CASE("Concurrent audio producer and analyser consumer", "[spectrum][fifo][primitives]") {
    SpectrumFIFO<8192> fifo;
    constexpr size_t kBlockSize = 512;
    constexpr size_t kBlocks = 1000;

    std::thread audio([&fifo] {
        std::vector<float> block(kBlockSize, 0.25f);
        for (size_t i = 0; i < kBlocks; ++i) {
            fifo.push(block.data(), block.size());
        }
    });

    // Every sample the producer ever writes is 0.25, so any complete read
    // holds only that value
    std::array<float, 2048> window{};
    size_t badReads = 0;
    while (fifo.totalWritten() < kBlockSize * kBlocks) {
        if (fifo.readLatest(window.data(), window.size()) == window.size()) {
            if (window.front() != 0.25f || window.back() != 0.25f) ++badReads;
        }
    }
    audio.join();

    REQUIRE(badReads == 0);
    REQUIRE(fifo.readLatest(window.data(), window.size()) == window.size());
    REQUIRE(window[1000] == 0.25f);
}
