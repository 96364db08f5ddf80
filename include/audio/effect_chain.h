#pragma once

#include "config.h"
#include <vector>

namespace voxlink {

/**
 * @brief Second-order high-pass (RBJ cookbook biquad, Q = 1/sqrt(2))
 */
class HighPassFilter {
public:
    HighPassFilter(float cutoff_hz, int sample_rate);

    float process(float x);
    void reset();

private:
    float b0_, b1_, b2_, a1_, a2_;
    float x1_ = 0.0f, x2_ = 0.0f, y1_ = 0.0f, y2_ = 0.0f;
};

/**
 * @brief Short delay line with a feedback loop: out = d[n - D], d[n] = in + fb * out
 */
class FeedbackDelay {
public:
    FeedbackDelay(float delay_ms, float feedback, int sample_rate);

    float process(float x);
    void reset();

private:
    std::vector<float> line_;
    size_t pos_ = 0;
    float feedback_;
};

/**
 * @brief Soft-knee feed-forward compressor with attack/release smoothing
 */
class Compressor {
public:
    Compressor(float threshold_db, float knee_db, float ratio,
               float attack_ms, float release_ms, int sample_rate);

    float process(float x);
    void reset();

    /// Static curve: output level (dB) for an input level (dB)
    float curve_db(float input_db) const;

private:
    float threshold_db_;
    float knee_db_;
    float ratio_;
    float attack_coef_;
    float release_coef_;
    float reduction_db_ = 0.0f;
};

/**
 * @brief Fixed voice graph applied to the mixed playback signal:
 * high-pass -> (dry gain + feedback delay * wet gain) -> compressor
 */
class EffectChain {
public:
    EffectChain(const EffectsConfig& config, int sample_rate);

    void process(float* samples, size_t count);
    void reset();

    bool enabled() const { return enabled_; }

private:
    bool enabled_;
    float dry_gain_;
    float wet_gain_;
    HighPassFilter highpass_;
    FeedbackDelay delay_;
    Compressor compressor_;
};

} // namespace voxlink
