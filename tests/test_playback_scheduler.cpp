/**
 * Gapless playback scheduling against a fake output device with a test-driven clock.
 * Asserts:
 * - Back-to-back buffers never overlap and leave no gap.
 * - A late buffer resyncs to the device clock instead of being backdated.
 * - reset() discards unstarted buffers and re-initializes the cursor.
 * - stop() releases the device and is idempotent.
 * - A full queue drops the chunk and counts it; a stopped scheduler does not count.
 */

#include "playback_scheduler.h"
#include "logger.h"
#include "test_fakes.h"
#include <cmath>
#include <iostream>
#include <mutex>
#include <random>

using namespace duplex_voice;
using namespace duplex_voice::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

static DecodedAudioBuffer make_buffer(double seconds, int rate = 24000) {
    DecodedAudioBuffer buffer;
    buffer.sample_rate = rate;
    buffer.samples.assign(static_cast<size_t>(seconds * rate + 0.5), 0.25f);
    return buffer;
}

static void test_cursor() {
    PlaybackCursor cursor;
    ASSERT(!cursor.initialized());
    ASSERT(near(cursor.schedule(1.0, 0.5), 1.0));     // first use: device clock
    ASSERT(near(cursor.schedule(1.2, 0.5), 1.5));     // still ahead of the clock: back to back
    ASSERT(near(cursor.next_start_time(), 2.0));
    ASSERT(near(cursor.schedule(3.0, 0.25), 3.0));    // underrun: resync to now
    ASSERT(near(cursor.next_start_time(), 3.25));
    cursor.reset();
    ASSERT(!cursor.initialized());
    ASSERT(near(cursor.schedule(0.1, 0.1), 0.1));     // re-initialized, may go backwards only via reset

    // Random arrivals: never overlap, never in the past
    std::mt19937 rng(42);
    std::uniform_real_distribution<double> jitter(0.0, 0.15);
    std::uniform_real_distribution<double> length(0.02, 0.1);
    PlaybackCursor c;
    double now = 0.0;
    double prev_start = -1.0;
    double prev_duration = 0.0;
    bool ordered = true;
    bool not_past = true;
    for (int i = 0; i < 500; ++i) {
        now += jitter(rng);
        double d = length(rng);
        double start = c.schedule(now, d);
        if (prev_start >= 0.0 && start < prev_start + prev_duration - 1e-12) ordered = false;
        if (start < now) not_past = false;
        prev_start = start;
        prev_duration = d;
    }
    ASSERT(ordered);
    ASSERT(not_past);
}

static void test_back_to_back() {
    auto state = std::make_shared<FakeOutputState>();
    PlaybackScheduler scheduler(std::make_unique<FakeOutputDevice>(state), 24000, 16);

    ASSERT(!scheduler.enqueue(make_buffer(0.1)));  // not started
    ASSERT(scheduler.start().is_ok());
    ASSERT(state->open);
    ASSERT(scheduler.is_running());

    state->set_clock(0.0);
    for (int i = 0; i < 5; ++i) {
        ASSERT(scheduler.enqueue(make_buffer(0.1)));
    }
    scheduler.wait_until_idle();

    auto scheduled = state->snapshot();
    ASSERT(scheduled.size() == 5);
    for (size_t i = 0; i < scheduled.size(); ++i) {
        ASSERT(near(scheduled[i].start, 0.1 * static_cast<double>(i)));
        if (i > 0) {
            ASSERT(near(scheduled[i].start, scheduled[i - 1].start + scheduled[i - 1].duration));
        }
    }
    ASSERT(scheduler.buffers_scheduled() == 5);

    // Clock moved past the end of the queued audio: late chunk starts now
    state->set_clock(2.0);
    scheduler.enqueue(make_buffer(0.1));
    scheduler.wait_until_idle();
    // Clock still inside the previous buffer: next one follows it, no overlap
    state->set_clock(2.05);
    scheduler.enqueue(make_buffer(0.1));
    scheduler.wait_until_idle();

    scheduled = state->snapshot();
    ASSERT(scheduled.size() == 7);
    ASSERT(near(scheduled[5].start, 2.0));
    ASSERT(near(scheduled[6].start, 2.1));

    scheduler.stop();
    ASSERT(!state->open);
    ASSERT(!scheduler.is_running());
    ASSERT(!scheduler.enqueue(make_buffer(0.1)));
    scheduler.stop();  // idempotent
    ASSERT(!state->open);
}

static void test_reset() {
    auto state = std::make_shared<FakeOutputState>();
    PlaybackScheduler scheduler(std::make_unique<FakeOutputDevice>(state), 24000, 16);
    ASSERT(scheduler.start().is_ok());

    state->set_clock(1.0);
    for (int i = 0; i < 4; ++i) {
        scheduler.enqueue(make_buffer(0.5));
    }
    scheduler.wait_until_idle();
    ASSERT(state->snapshot().size() == 4);  // 1.0, 1.5, 2.0, 2.5

    // First buffer is playing, the other three have not started
    state->set_clock(1.2);
    scheduler.reset();
    scheduler.wait_until_idle();
    auto remaining = state->snapshot();
    ASSERT(remaining.size() == 1);
    ASSERT(state->cancelled_buffers == 3);

    // Cursor starts over from the device clock, not from 3.0
    scheduler.enqueue(make_buffer(0.1));
    scheduler.wait_until_idle();
    auto after = state->snapshot();
    ASSERT(after.size() == 2);
    ASSERT(near(after.back().start, 1.2));

    scheduler.stop();
}

static void test_full_queue_and_stop() {
    auto state = std::make_shared<FakeOutputState>();
    PlaybackScheduler scheduler(std::make_unique<FakeOutputDevice>(state), 24000, 2);
    ASSERT(scheduler.start().is_ok());

    // Hold the device so the worker stalls on the first buffer it takes
    int accepted = 0;
    {
        std::unique_lock<std::mutex> device_busy(state->mutex);
        for (int i = 0; i < 5; ++i) {
            if (scheduler.enqueue(make_buffer(0.1))) accepted++;
        }
    }
    ASSERT(accepted >= 2 && accepted <= 3);
    ASSERT(scheduler.buffers_dropped() == static_cast<uint64_t>(5 - accepted));

    scheduler.wait_until_idle();
    ASSERT(scheduler.buffers_scheduled() == static_cast<uint64_t>(accepted));

    // Refused after stop() is not a full queue
    scheduler.stop();
    ASSERT(!scheduler.enqueue(make_buffer(0.1)));
    ASSERT(scheduler.buffers_dropped() == static_cast<uint64_t>(5 - accepted));
}

static void test_open_failure() {
    auto state = std::make_shared<FakeOutputState>();
    state->open_error = make_device_error("no output device");
    PlaybackScheduler scheduler(std::make_unique<FakeOutputDevice>(state), 24000, 16);
    auto started = scheduler.start();
    ASSERT(started.is_error());
    ASSERT(started.error().type == ErrorType::DeviceUnavailable);
    ASSERT(!scheduler.is_running());
    ASSERT(!scheduler.device_open());
    scheduler.stop();
}

int main() {
    Logger::initialize(LogLevel::WARN);

    test_cursor();
    test_back_to_back();
    test_reset();
    test_full_queue_and_stop();
    test_open_failure();

    Logger::shutdown();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All playback scheduler tests passed.\n";
    return 0;
}
