#include "audio/pcm_codec.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace voxlink {
namespace pcm {

namespace {

const char* kBase64Alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int base64_value(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+' || c == '-') return 62;
    if (c == '/' || c == '_') return 63;
    return -1;
}

} // namespace

float compute_rms(const float* samples, size_t count) {
    if (count == 0) return 0.0f;
    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sum += static_cast<double>(samples[i]) * samples[i];
    }
    return static_cast<float>(std::sqrt(sum / static_cast<double>(count)));
}

FloatBuffer downsample(const float* samples, size_t count, int in_rate, int out_rate) {
    if (in_rate <= 0 || out_rate <= 0) {
        throw std::invalid_argument("sample rates must be positive");
    }
    if (out_rate > in_rate) {
        throw std::invalid_argument("upsampling is not supported (" +
                                    std::to_string(in_rate) + " -> " +
                                    std::to_string(out_rate) + ")");
    }
    if (out_rate == in_rate) {
        return FloatBuffer(samples, samples + count);
    }

    const double ratio = static_cast<double>(in_rate) / out_rate;
    const size_t out_len = static_cast<size_t>(std::llround(count / ratio));
    FloatBuffer out(out_len, 0.0f);

    size_t offset = 0;
    for (size_t i = 0; i < out_len; ++i) {
        size_t next = static_cast<size_t>(std::llround((i + 1) * ratio));
        double accum = 0.0;
        size_t n = 0;
        for (size_t j = offset; j < next && j < count; ++j) {
            accum += samples[j];
            ++n;
        }
        out[i] = n > 0 ? static_cast<float>(accum / n) : 0.0f;
        offset = next;
    }
    return out;
}

PcmBuffer float_to_pcm16(const float* samples, size_t count) {
    PcmBuffer out(count);
    for (size_t i = 0; i < count; ++i) {
        float s = std::max(-1.0f, std::min(1.0f, samples[i]));
        out[i] = static_cast<Sample>(std::lround(s < 0 ? s * 32768.0f : s * 32767.0f));
    }
    return out;
}

FloatBuffer pcm16_to_float(const PcmBuffer& pcm) {
    FloatBuffer out(pcm.size());
    for (size_t i = 0; i < pcm.size(); ++i) {
        out[i] = static_cast<float>(pcm[i]) / 32768.0f;
    }
    return out;
}

std::string pcm16_to_bytes(const PcmBuffer& pcm) {
    std::string out(pcm.size() * 2, '\0');
    for (size_t i = 0; i < pcm.size(); ++i) {
        uint16_t v = static_cast<uint16_t>(pcm[i]);
        out[2 * i] = static_cast<char>(v & 0xFF);
        out[2 * i + 1] = static_cast<char>((v >> 8) & 0xFF);
    }
    return out;
}

Result<PcmBuffer> bytes_to_pcm16(const std::string& bytes) {
    if (bytes.size() % 2 != 0) {
        return make_parse_error("PCM chunk has odd byte count (" + std::to_string(bytes.size()) + ")");
    }
    PcmBuffer out(bytes.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        uint16_t lo = static_cast<unsigned char>(bytes[2 * i]);
        uint16_t hi = static_cast<unsigned char>(bytes[2 * i + 1]);
        out[i] = static_cast<Sample>(static_cast<uint16_t>(lo | (hi << 8)));
    }
    return out;
}

std::string base64_encode(const std::string& data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);
    size_t i = 0;
    while (i + 2 < data.size()) {
        uint32_t n = (static_cast<unsigned char>(data[i]) << 16) |
                     (static_cast<unsigned char>(data[i + 1]) << 8) |
                     static_cast<unsigned char>(data[i + 2]);
        out += kBase64Alphabet[(n >> 18) & 63];
        out += kBase64Alphabet[(n >> 12) & 63];
        out += kBase64Alphabet[(n >> 6) & 63];
        out += kBase64Alphabet[n & 63];
        i += 3;
    }
    size_t rest = data.size() - i;
    if (rest == 1) {
        uint32_t n = static_cast<unsigned char>(data[i]) << 16;
        out += kBase64Alphabet[(n >> 18) & 63];
        out += kBase64Alphabet[(n >> 12) & 63];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (static_cast<unsigned char>(data[i]) << 16) |
                     (static_cast<unsigned char>(data[i + 1]) << 8);
        out += kBase64Alphabet[(n >> 18) & 63];
        out += kBase64Alphabet[(n >> 12) & 63];
        out += kBase64Alphabet[(n >> 6) & 63];
        out += '=';
    }
    return out;
}

Result<std::string> base64_decode(const std::string& encoded) {
    std::string out;
    out.reserve(encoded.size() * 3 / 4);
    uint32_t buffer = 0;
    int bits = 0;
    bool padding = false;
    for (unsigned char c : encoded) {
        if (c == '\n' || c == '\r' || c == ' ' || c == '\t') continue;
        if (c == '=') {
            padding = true;
            continue;
        }
        int v = base64_value(c);
        if (v < 0 || padding) {
            return make_parse_error("invalid base64 input");
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out += static_cast<char>((buffer >> bits) & 0xFF);
        }
    }
    if (bits >= 6) {
        return make_parse_error("truncated base64 input");
    }
    return out;
}

} // namespace pcm
} // namespace voxlink
