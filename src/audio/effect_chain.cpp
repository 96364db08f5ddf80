#include "audio/effect_chain.h"
#include <algorithm>
#include <cmath>

namespace voxlink {

namespace {

constexpr float kPi = 3.14159265358979f;
constexpr float kMinLevelDb = -120.0f;

float time_coef(float ms, int sample_rate) {
    if (ms <= 0.0f) return 0.0f;
    return std::exp(-1.0f / (ms * 0.001f * static_cast<float>(sample_rate)));
}

} // namespace

// --- HighPassFilter ---

HighPassFilter::HighPassFilter(float cutoff_hz, int sample_rate) {
    const float q = 0.70710678f;
    float w0 = 2.0f * kPi * cutoff_hz / static_cast<float>(sample_rate);
    float cos_w0 = std::cos(w0);
    float alpha = std::sin(w0) / (2.0f * q);
    float a0 = 1.0f + alpha;

    b0_ = ((1.0f + cos_w0) / 2.0f) / a0;
    b1_ = (-(1.0f + cos_w0)) / a0;
    b2_ = ((1.0f + cos_w0) / 2.0f) / a0;
    a1_ = (-2.0f * cos_w0) / a0;
    a2_ = (1.0f - alpha) / a0;
}

float HighPassFilter::process(float x) {
    float y = b0_ * x + b1_ * x1_ + b2_ * x2_ - a1_ * y1_ - a2_ * y2_;
    x2_ = x1_;
    x1_ = x;
    y2_ = y1_;
    y1_ = y;
    return y;
}

void HighPassFilter::reset() {
    x1_ = x2_ = y1_ = y2_ = 0.0f;
}

// --- FeedbackDelay ---

FeedbackDelay::FeedbackDelay(float delay_ms, float feedback, int sample_rate)
    : feedback_(feedback) {
    size_t length = static_cast<size_t>(std::lround(delay_ms * 0.001f * static_cast<float>(sample_rate)));
    line_.assign(std::max<size_t>(1, length), 0.0f);
}

float FeedbackDelay::process(float x) {
    float out = line_[pos_];
    line_[pos_] = x + feedback_ * out;
    pos_ = (pos_ + 1) % line_.size();
    return out;
}

void FeedbackDelay::reset() {
    std::fill(line_.begin(), line_.end(), 0.0f);
    pos_ = 0;
}

// --- Compressor ---

Compressor::Compressor(float threshold_db, float knee_db, float ratio,
                       float attack_ms, float release_ms, int sample_rate)
    : threshold_db_(threshold_db),
      knee_db_(std::max(0.0f, knee_db)),
      ratio_(std::max(1.0f, ratio)),
      attack_coef_(time_coef(attack_ms, sample_rate)),
      release_coef_(time_coef(release_ms, sample_rate)) {}

float Compressor::curve_db(float input_db) const {
    float over = input_db - threshold_db_;
    if (knee_db_ > 0.0f && 2.0f * std::fabs(over) <= knee_db_) {
        float k = over + knee_db_ / 2.0f;
        return input_db + (1.0f / ratio_ - 1.0f) * k * k / (2.0f * knee_db_);
    }
    if (over > 0.0f) {
        return threshold_db_ + over / ratio_;
    }
    return input_db;
}

float Compressor::process(float x) {
    float level = std::fabs(x);
    float level_db = level > 0.0f ? 20.0f * std::log10(level) : kMinLevelDb;
    float target = curve_db(level_db) - level_db;  // <= 0

    // More reduction = attack, less = release
    float coef = target < reduction_db_ ? attack_coef_ : release_coef_;
    reduction_db_ = coef * reduction_db_ + (1.0f - coef) * target;

    return x * std::pow(10.0f, reduction_db_ / 20.0f);
}

void Compressor::reset() {
    reduction_db_ = 0.0f;
}

// --- EffectChain ---

EffectChain::EffectChain(const EffectsConfig& config, int sample_rate)
    : enabled_(config.enabled),
      dry_gain_(config.dry_gain),
      wet_gain_(config.wet_gain),
      highpass_(config.highpass_hz, sample_rate),
      delay_(config.delay_ms, config.feedback, sample_rate),
      compressor_(config.compressor_threshold_db, config.compressor_knee_db,
                  config.compressor_ratio, config.compressor_attack_ms,
                  config.compressor_release_ms, sample_rate) {}

void EffectChain::process(float* samples, size_t count) {
    if (!enabled_) return;
    for (size_t i = 0; i < count; ++i) {
        float filtered = highpass_.process(samples[i]);
        float mixed = filtered * dry_gain_ + delay_.process(filtered) * wet_gain_;
        samples[i] = compressor_.process(mixed);
    }
}

void EffectChain::reset() {
    highpass_.reset();
    delay_.reset();
    compressor_.reset();
}

} // namespace voxlink
