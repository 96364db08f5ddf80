/**
 * Capture and playback path checks: resampling, PCM coding, the gapless
 * scheduler, interruption and the voice effect graph.
 *
 * Run from build dir: ./test_audio_pipeline
 * No audio hardware required.
 */

#include "audio/audio_pipeline.h"
#include "audio/effect_chain.h"
#include "audio/pcm_codec.h"
#include "audio/playback_scheduler.h"
#include "fakes.h"
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace voxlink;
using voxlink::testing::FakeAudioDevice;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps;
}

static void test_downsample() {
    std::vector<float> block(4096, 0.25f);

    FloatBuffer out = pcm::downsample(block.data(), block.size(), 48000, 16000);
    ASSERT(out.size() == 1365);  // round(4096 / 3)
    ASSERT(near(out[0], 0.25f, 1e-6));
    ASSERT(near(out.back(), 0.25f, 1e-6));

    out = pcm::downsample(block.data(), block.size(), 44100, 16000);
    ASSERT(out.size() == 1486);  // round(4096 * 16000 / 44100)

    // Each output sample averages the inputs that map onto it
    std::vector<float> steps = {1.0f, 1.0f, 1.0f, 0.0f, 0.0f, 0.0f, -0.5f, -0.5f, -0.5f};
    out = pcm::downsample(steps.data(), steps.size(), 48000, 16000);
    ASSERT(out.size() == 3);
    ASSERT(near(out[0], 1.0f, 1e-6));
    ASSERT(near(out[1], 0.0f, 1e-6));
    ASSERT(near(out[2], -0.5f, 1e-6));

    // Equal rates copy
    out = pcm::downsample(steps.data(), steps.size(), 16000, 16000);
    ASSERT(out.size() == steps.size());
    ASSERT(out[6] == -0.5f);

    bool threw = false;
    try {
        pcm::downsample(block.data(), block.size(), 8000, 16000);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ASSERT(threw);
}

static void test_pcm_coding() {
    const double step = 1.0 / 32768.0;
    std::vector<float> samples = {-1.0f, -0.5f, -0.123f, 0.0f, 0.25f, 0.3333f, 0.5f};
    PcmBuffer pcm16 = pcm::float_to_pcm16(samples.data(), samples.size());
    FloatBuffer back = pcm::pcm16_to_float(pcm16);
    ASSERT(back.size() == samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        ASSERT(std::fabs(back[i] - samples[i]) <= step + 1e-7);
    }

    // Asymmetric scaling with clamping
    std::vector<float> extremes = {1.0f, -1.0f, 1.5f, -1.5f};
    pcm16 = pcm::float_to_pcm16(extremes.data(), extremes.size());
    ASSERT(pcm16[0] == 32767);
    ASSERT(pcm16[1] == -32768);
    ASSERT(pcm16[2] == 32767);
    ASSERT(pcm16[3] == -32768);

    // Little-endian wire bytes
    PcmBuffer wire = {1, -2};
    std::string bytes = pcm::pcm16_to_bytes(wire);
    ASSERT(bytes.size() == 4);
    ASSERT(static_cast<unsigned char>(bytes[0]) == 0x01);
    ASSERT(static_cast<unsigned char>(bytes[1]) == 0x00);
    ASSERT(static_cast<unsigned char>(bytes[2]) == 0xFE);
    ASSERT(static_cast<unsigned char>(bytes[3]) == 0xFF);

    auto parsed = pcm::bytes_to_pcm16(bytes);
    ASSERT(parsed.is_ok());
    ASSERT(parsed.value() == wire);

    auto odd = pcm::bytes_to_pcm16(std::string(3, '\0'));
    ASSERT(odd.is_error());
    ASSERT(odd.error().type == ErrorType::ParseError);

    ASSERT(pcm::base64_encode("Man") == "TWFu");
    ASSERT(pcm::base64_encode("Ma") == "TWE=");
    ASSERT(pcm::base64_encode("M") == "TQ==");
    auto decoded = pcm::base64_decode("TWE=");
    ASSERT(decoded.is_ok() && decoded.value() == "Ma");
    ASSERT(pcm::base64_decode("TW$u").is_error());
}

static void test_rms() {
    std::vector<float> constant(256, 0.5f);
    ASSERT(near(pcm::compute_rms(constant.data(), constant.size()), 0.5, 1e-6));
    std::vector<float> alternating = {1.0f, -1.0f, 1.0f, -1.0f};
    ASSERT(near(pcm::compute_rms(alternating.data(), alternating.size()), 1.0, 1e-6));
    ASSERT(pcm::compute_rms(nullptr, 0) == 0.0f);
}

static void test_gapless_schedule() {
    PlaybackScheduler scheduler(1000);

    PlaybackHandle a = scheduler.schedule(FloatBuffer(100, 0.1f));
    PlaybackHandle b = scheduler.schedule(FloatBuffer(50, 0.1f));
    ASSERT(near(a.start, 0.0));
    ASSERT(near(a.duration, 0.1));
    ASSERT(near(b.start, a.start + a.duration));
    ASSERT(near(scheduler.cursor(), 0.15));
    ASSERT(scheduler.active_count() == 2);

    // Chunk arriving while earlier audio is still playing queues behind it
    std::vector<float> block(40);
    scheduler.render(block.data(), block.size());
    PlaybackHandle c = scheduler.schedule(FloatBuffer(10, 0.1f));
    ASSERT(near(c.start, 0.15));

    // Late chunk snaps to the clock
    std::vector<float> big(300);
    scheduler.render(big.data(), big.size());
    ASSERT(near(scheduler.now(), 0.34));
    ASSERT(scheduler.active_count() == 0);
    PlaybackHandle d = scheduler.schedule(FloatBuffer(20, 0.1f));
    ASSERT(near(d.start, 0.34));

    // No overlap across the whole sequence
    std::vector<PlaybackHandle> all = {a, b, c, d};
    for (size_t i = 1; i < all.size(); ++i) {
        ASSERT(all[i].start + 1e-12 >= all[i - 1].start + all[i - 1].duration);
    }

    // Back-to-back buffers render without a gap
    PlaybackScheduler joined(1000);
    joined.schedule(FloatBuffer(5, 0.5f));
    joined.schedule(FloatBuffer(5, 0.25f));
    std::vector<float> out(12);
    joined.render(out.data(), out.size());
    ASSERT(out[4] == 0.5f);
    ASSERT(out[5] == 0.25f);
    ASSERT(out[9] == 0.25f);
    ASSERT(out[10] == 0.0f);
}

static void test_interruption_reset() {
    PlaybackScheduler scheduler(1000);
    PlaybackHandle first = scheduler.schedule(FloatBuffer(500, 0.2f));
    scheduler.schedule(FloatBuffer(500, 0.2f));

    std::vector<float> block(50);
    scheduler.render(block.data(), block.size());
    ASSERT(scheduler.is_active(first.id));

    scheduler.stop_all();
    ASSERT(scheduler.active_count() == 0);
    ASSERT(near(scheduler.cursor(), 0.0));

    // Next chunk starts at the clock, not at the discarded cursor (1.0 s)
    PlaybackHandle next = scheduler.schedule(FloatBuffer(10, 0.2f));
    ASSERT(near(next.start, scheduler.now()));
    ASSERT(near(next.start, 0.05));

    scheduler.render(block.data(), block.size());
    ASSERT(block[0] == 0.2f);
    ASSERT(block[10] == 0.0f);
}

static void test_pipeline_capture_and_playback() {
    AudioConfig audio;
    EffectsConfig effects;
    effects.enabled = false;
    FakeAudioDevice device;
    device.native_rate = 48000;

    AudioPipeline pipeline(device, audio, effects);
    std::vector<PcmBuffer> frames;
    auto started = pipeline.start([&frames](PcmBuffer frame) { frames.push_back(std::move(frame)); });
    ASSERT(started.is_ok());
    ASSERT(pipeline.is_running());
    ASSERT(device.playback_rate == PLAYBACK_WIRE_RATE);

    device.feed(std::vector<float>(4096, 0.5f));
    ASSERT(frames.size() == 1);
    ASSERT(frames[0].size() == 1365);
    ASSERT(frames[0][0] == 16384);
    ASSERT(near(pipeline.volume(), 0.5, 1e-6));

    // Malformed chunk is dropped, pipeline keeps going
    ASSERT(!pipeline.play_chunk(std::string(3, '\x01')));
    ASSERT(pipeline.scheduler().active_count() == 0);

    PcmBuffer chunk(240, 16384);
    ASSERT(pipeline.play_chunk(pcm::pcm16_to_bytes(chunk)));
    ASSERT(pipeline.scheduler().active_count() == 1);

    std::vector<float> out = device.render(480);
    ASSERT(near(out[0], 0.5, 1e-6));
    ASSERT(out[300] == 0.0f);
    ASSERT(pipeline.scheduler().active_count() == 0);

    ASSERT(pipeline.play_chunk(pcm::pcm16_to_bytes(chunk)));
    pipeline.interrupt();
    ASSERT(pipeline.scheduler().active_count() == 0);

    pipeline.stop();
    ASSERT(!pipeline.is_running());
    ASSERT(!device.capturing());
    ASSERT(pipeline.volume() == 0.0f);

    // Frames after stop go nowhere
    device.feed(std::vector<float>(4096, 0.5f));
    ASSERT(frames.size() == 1);
}

static void test_pipeline_start_failures() {
    AudioConfig audio;
    EffectsConfig effects;

    FakeAudioDevice denied;
    denied.deny_capture = true;
    AudioPipeline p1(denied, audio, effects);
    auto r1 = p1.start([](PcmBuffer) {});
    ASSERT(r1.is_error());
    ASSERT(r1.error().type == ErrorType::DeviceError);
    ASSERT(!p1.is_running());

    // Capture slower than the wire rate would need upsampling
    FakeAudioDevice slow;
    slow.native_rate = 8000;
    AudioPipeline p2(slow, audio, effects);
    auto r2 = p2.start([](PcmBuffer) {});
    ASSERT(r2.is_error());
    ASSERT(r2.error().type == ErrorType::DeviceError);
    ASSERT(!slow.capturing());
}

static void test_capture_during_open() {
    AudioConfig audio;
    EffectsConfig effects;

    FakeAudioDevice device;
    device.block_on_open = std::vector<float>(480, 0.5f);
    AudioPipeline pipeline(device, audio, effects);
    std::vector<PcmBuffer> frames;
    ASSERT(pipeline.start([&frames](PcmBuffer frame) { frames.push_back(std::move(frame)); }).is_ok());
    ASSERT(frames.size() == 1);
    ASSERT(frames[0].size() == 160);
    ASSERT(frames[0][0] == 16384);

    // Too-slow stream: the early block is dropped and start still fails cleanly
    FakeAudioDevice slow;
    slow.native_rate = 8000;
    slow.block_on_open = std::vector<float>(480, 0.5f);
    AudioPipeline p2(slow, audio, effects);
    std::vector<PcmBuffer> slow_frames;
    auto r = p2.start([&slow_frames](PcmBuffer frame) { slow_frames.push_back(std::move(frame)); });
    ASSERT(r.is_error());
    ASSERT(slow_frames.empty());
    ASSERT(!slow.capturing());
}

static void test_effects() {
    // High-pass removes DC
    HighPassFilter hp(150.0f, 24000);
    float y = 0.0f;
    for (int i = 0; i < 24000; ++i) y = hp.process(1.0f);
    ASSERT(std::fabs(y) < 1e-3f);

    // Delay line: echo after D samples, decaying by the feedback gain
    FeedbackDelay delay(10.0f, 0.5f, 1000);
    std::vector<float> out;
    for (int i = 0; i < 25; ++i) out.push_back(delay.process(i == 0 ? 1.0f : 0.0f));
    ASSERT(out[0] == 0.0f);
    ASSERT(out[9] == 0.0f);
    ASSERT(near(out[10], 1.0, 1e-6));
    ASSERT(near(out[20], 0.5, 1e-6));

    // Static curve: transparent well below threshold, ratio above the knee
    Compressor comp(-24.0f, 30.0f, 12.0f, 3.0f, 250.0f, 24000);
    ASSERT(near(comp.curve_db(-80.0f), -80.0, 1e-4));
    ASSERT(near(comp.curve_db(0.0f), -22.0, 1e-4));
    ASSERT(comp.curve_db(-24.0f) < -24.0f);

    // Disabled chain is a pass-through
    EffectsConfig off;
    off.enabled = false;
    EffectChain bypass(off, 24000);
    std::vector<float> samples = {0.1f, -0.2f, 0.3f};
    bypass.process(samples.data(), samples.size());
    ASSERT(samples[1] == -0.2f);

    // Enabled chain stays bounded
    EffectChain chain(EffectsConfig{}, 24000);
    std::vector<float> loud(4800);
    for (size_t i = 0; i < loud.size(); ++i) loud[i] = std::sin(0.05f * static_cast<float>(i));
    chain.process(loud.data(), loud.size());
    for (float s : loud) {
        ASSERT(std::isfinite(s));
    }
}

int main() {
    test_downsample();
    test_pcm_coding();
    test_rms();
    test_gapless_schedule();
    test_interruption_reset();
    test_pipeline_capture_and_playback();
    test_pipeline_start_failures();
    test_capture_during_open();
    test_effects();

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All audio pipeline tests passed.\n";
    return 0;
}
