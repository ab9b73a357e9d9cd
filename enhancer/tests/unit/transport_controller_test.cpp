// ==============================================================================
// Tests: TransportController
// ==============================================================================
// State machine transitions and position arithmetic on a manual clock.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "engine/transport_controller.h"

#include "test_helpers/buffer_factory.h"
#include "test_helpers/manual_clock.h"

#include <vector>

using Catch::Approx;
using namespace Tonic::Enhancer;

namespace {

constexpr double kSampleRate = 8000.0;

} // namespace

TEST_CASE("TransportController without a buffer", "[transport]") {
    TestHelpers::ManualClock clock;
    TransportController transport(clock);

    REQUIRE_FALSE(transport.hasBuffer());
    REQUIRE(transport.getDuration() == 0.0);
    REQUIRE(transport.getProgress() == 0.0);

    SECTION("play is a silent no-op") {
        REQUIRE_FALSE(transport.play());
        REQUIRE(transport.getPlaybackState() == PlaybackState::Stopped);
        REQUIRE_FALSE(transport.isPlaying());
    }

    SECTION("render outputs silence") {
        std::vector<float> left(32, 1.0f);
        std::vector<float> right(32, 1.0f);
        REQUIRE(transport.render(left.data(), right.data(), 32) == 0);
        REQUIRE(left[0] == 0.0f);
        REQUIRE(right[31] == 0.0f);
    }
}

TEST_CASE("TransportController play / pause / resume", "[transport]") {
    TestHelpers::ManualClock clock(50.0);
    TransportController transport(clock);
    transport.setEngineSampleRate(kSampleRate);
    transport.setBuffer(TestHelpers::makeConstantBuffer(16000, kSampleRate, 0.5f));

    REQUIRE(transport.getDuration() == Approx(2.0));

    REQUIRE(transport.play());
    REQUIRE(transport.isPlaying());
    REQUIRE(transport.getCurrentTime() == Approx(0.0));

    clock.advance(0.75);
    REQUIRE(transport.getCurrentTime() == Approx(0.75));
    REQUIRE(transport.getProgress() == Approx(0.375));

    SECTION("pause freezes the position") {
        REQUIRE(transport.pause());
        REQUIRE(transport.getPlaybackState() == PlaybackState::Paused);
        REQUIRE(transport.getPausedOffset() == Approx(0.75));

        clock.advance(10.0);
        REQUIRE(transport.getCurrentTime() == Approx(0.75));

        SECTION("play resumes from the paused offset") {
            REQUIRE(transport.play());
            REQUIRE(transport.getPausedOffset() == 0.0);
            REQUIRE(transport.getCurrentTime() == Approx(0.75));
            clock.advance(0.25);
            REQUIRE(transport.getCurrentTime() == Approx(1.0));
        }

        SECTION("pause while paused is ignored") {
            REQUIRE_FALSE(transport.pause());
            REQUIRE(transport.getPausedOffset() == Approx(0.75));
        }
    }

    SECTION("play while playing restarts from the beginning") {
        REQUIRE(transport.play());
        REQUIRE(transport.getCurrentTime() == Approx(0.0));
    }
}

TEST_CASE("TransportController resumed voice starts at the paused offset", "[transport]") {
    TestHelpers::ManualClock clock;
    TransportController transport(clock);
    transport.setEngineSampleRate(kSampleRate);
    transport.setBuffer(TestHelpers::makeRampBuffer(16000, kSampleRate));

    REQUIRE(transport.play());
    clock.advance(0.5);
    REQUIRE(transport.pause());
    REQUIRE(transport.play());

    std::vector<float> left(4);
    std::vector<float> right(4);
    REQUIRE(transport.render(left.data(), right.data(), 4) == 4);
    REQUIRE(left[0] == Approx(4000.0f));
}

TEST_CASE("TransportController stop from any state", "[transport]") {
    TestHelpers::ManualClock clock;
    TransportController transport(clock);
    transport.setEngineSampleRate(kSampleRate);
    transport.setBuffer(TestHelpers::makeConstantBuffer(16000, kSampleRate, 0.5f));

    SECTION("from Stopped") {
        transport.stop();
    }

    SECTION("from Playing") {
        REQUIRE(transport.play());
        clock.advance(0.4);
    }

    SECTION("from Paused") {
        REQUIRE(transport.play());
        clock.advance(0.4);
        REQUIRE(transport.pause());
    }

    transport.stop();
    REQUIRE(transport.getPlaybackState() == PlaybackState::Stopped);
    REQUIRE_FALSE(transport.isPlaying());
    REQUIRE(transport.getCurrentTime() == 0.0);

    std::vector<float> left(8, 1.0f);
    std::vector<float> right(8, 1.0f);
    REQUIRE(transport.render(left.data(), right.data(), 8) == 0);
    REQUIRE(left[0] == 0.0f);
}

TEST_CASE("TransportController immediate pause", "[transport]") {
    TestHelpers::ManualClock clock;
    TransportController transport(clock);
    transport.setBuffer(TestHelpers::makeConstantBuffer(8000, kSampleRate, 0.5f));

    const double before = clock.now();
    REQUIRE(transport.play());
    clock.advance(0.001);
    REQUIRE(transport.pause());
    const double elapsed = clock.now() - before;

    REQUIRE(transport.getPausedOffset() >= 0.0);
    REQUIRE(transport.getPausedOffset() <= elapsed + 1e-9);
}

TEST_CASE("TransportController auto-stop is left to the caller", "[transport]") {
    TestHelpers::ManualClock clock;
    TransportController transport(clock);
    transport.setBuffer(TestHelpers::makeConstantBuffer(8000, kSampleRate, 0.5f));

    REQUIRE(transport.play());
    clock.advance(0.5);
    REQUIRE_FALSE(transport.shouldAutoStop());

    clock.advance(0.6);
    REQUIRE(transport.shouldAutoStop());
    REQUIRE(transport.isPlaying());
    REQUIRE(transport.getProgress() == 1.0);

    transport.stop();
    REQUIRE_FALSE(transport.shouldAutoStop());
}

TEST_CASE("TransportController replacing the buffer stops playback", "[transport]") {
    TestHelpers::ManualClock clock;
    TransportController transport(clock);
    transport.setBuffer(TestHelpers::makeConstantBuffer(8000, kSampleRate, 0.5f));
    REQUIRE(transport.play());
    clock.advance(0.3);

    transport.setBuffer(TestHelpers::makeConstantBuffer(4000, kSampleRate, 0.5f));
    REQUIRE(transport.getPlaybackState() == PlaybackState::Stopped);
    REQUIRE(transport.getCurrentTime() == 0.0);
    REQUIRE(transport.getDuration() == Approx(0.5));
}

TEST_CASE("TransportController fires the ended callback once per completion", "[transport]") {
    TestHelpers::ManualClock clock;
    TransportController transport(clock);
    transport.setEngineSampleRate(kSampleRate);

    int endedCount = 0;
    transport.setBuffer(TestHelpers::makeConstantBuffer(100, kSampleRate, 0.5f),
                        [&endedCount] { ++endedCount; });

    std::vector<float> left(256);
    std::vector<float> right(256);

    REQUIRE(transport.play());
    transport.render(left.data(), right.data(), 256);
    transport.render(left.data(), right.data(), 256);
    REQUIRE(endedCount == 1);

    SECTION("a new playback can complete again") {
        transport.stop();
        REQUIRE(transport.play());
        transport.render(left.data(), right.data(), 256);
        REQUIRE(endedCount == 2);
    }

    SECTION("pausing before the end does not fire") {
        transport.stop();
        REQUIRE(transport.play());
        transport.render(left.data(), right.data(), 50);
        REQUIRE(transport.pause());
        REQUIRE(endedCount == 1);
    }
}

TEST_CASE("TransportController ended callback may drive the transport", "[transport]") {
    TestHelpers::ManualClock clock;
    TransportController transport(clock);
    transport.setEngineSampleRate(kSampleRate);

    std::vector<float> left(256, 1.0f);
    std::vector<float> right(256, 1.0f);

    SECTION("stop from the callback") {
        int endedCount = 0;
        transport.setBuffer(TestHelpers::makeConstantBuffer(100, kSampleRate, 0.5f),
                            [&transport, &endedCount] {
                                ++endedCount;
                                transport.stop();
                            });

        REQUIRE(transport.play());
        REQUIRE(transport.render(left.data(), right.data(), 256) == 100);

        REQUIRE(endedCount == 1);
        REQUIRE(transport.getPlaybackState() == PlaybackState::Stopped);
        REQUIRE(transport.getCurrentTime() == 0.0);
        REQUIRE(left[99] == 0.5f);
        REQUIRE(left[100] == 0.0f);

        REQUIRE(transport.render(left.data(), right.data(), 256) == 0);
        REQUIRE(endedCount == 1);
    }

    SECTION("loop by replaying from the callback") {
        int endedCount = 0;
        transport.setBuffer(TestHelpers::makeConstantBuffer(100, kSampleRate, 0.5f),
                            [&transport, &endedCount] {
                                if (++endedCount < 3) transport.play();
                            });

        REQUIRE(transport.play());
        for (int block = 0; block < 5; ++block) {
            transport.render(left.data(), right.data(), 256);
        }
        REQUIRE(endedCount == 3);
        REQUIRE(transport.isPlaying());
    }
}

TEST_CASE("TransportController renderVoice defers the ended callback", "[transport]") {
    TestHelpers::ManualClock clock;
    TransportController transport(clock);
    transport.setEngineSampleRate(kSampleRate);

    int endedCount = 0;
    transport.setBuffer(TestHelpers::makeConstantBuffer(100, kSampleRate, 0.5f),
                        [&endedCount] { ++endedCount; });

    std::vector<float> left(256);
    std::vector<float> right(256);

    REQUIRE(transport.play());
    REQUIRE(transport.renderVoice(left.data(), right.data(), 256) == 100);
    REQUIRE(endedCount == 0);

    transport.dispatchEnded();
    REQUIRE(endedCount == 1);

    transport.dispatchEnded();
    REQUIRE(endedCount == 1);
}
