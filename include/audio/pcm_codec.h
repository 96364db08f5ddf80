#pragma once

#include "common.h"
#include "errors.h"
#include <string>

namespace voxlink {
namespace pcm {

/**
 * @brief Root-mean-square loudness of a block (0 for an empty block)
 */
float compute_rms(const float* samples, size_t count);

/**
 * @brief Boxcar decimation from in_rate to out_rate
 *
 * Output length is round(count * out_rate / in_rate); each output sample is
 * the mean of the input samples whose index range maps onto it.
 * Equal rates copy the input.
 *
 * @throws std::invalid_argument if out_rate > in_rate or a rate is not positive
 */
FloatBuffer downsample(const float* samples, size_t count, int in_rate, int out_rate);

/**
 * @brief Float [-1, 1] to signed 16-bit; clamps first, negatives scale by 32768,
 * positives by 32767, rounding to nearest
 */
PcmBuffer float_to_pcm16(const float* samples, size_t count);

/// Signed 16-bit to float (divide by 32768)
FloatBuffer pcm16_to_float(const PcmBuffer& pcm);

/// Little-endian byte serialization of PCM samples
std::string pcm16_to_bytes(const PcmBuffer& pcm);

/// Parse little-endian PCM bytes; an odd byte count is a ParseError
Result<PcmBuffer> bytes_to_pcm16(const std::string& bytes);

std::string base64_encode(const std::string& data);

/// Standard alphabet, padding optional; whitespace is skipped
Result<std::string> base64_decode(const std::string& encoded);

} // namespace pcm
} // namespace voxlink
