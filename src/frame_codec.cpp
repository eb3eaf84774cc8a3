#include "frame_codec.h"
#include <algorithm>
#include <cmath>

namespace duplex_voice {
namespace codec {

namespace {

const char BASE64_ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int base64_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // anonymous namespace

Sample float_to_pcm16(float value) {
    if (std::isnan(value)) return 0;
    float s = std::max(-1.0f, std::min(1.0f, value));
    long scaled = s < 0 ? std::lround(s * 32768.0f) : std::lround(s * 32767.0f);
    return static_cast<Sample>(scaled);
}

float pcm16_to_float(Sample value) {
    // Exact inverse of float_to_pcm16, so repeated round trips are stable
    return value < 0 ? static_cast<float>(value) / 32768.0f
                     : static_cast<float>(value) / 32767.0f;
}

std::vector<Sample> float_to_pcm16(const FloatSamples& samples) {
    std::vector<Sample> out(samples.size());
    std::transform(samples.begin(), samples.end(), out.begin(),
                   [](float v) { return float_to_pcm16(v); });
    return out;
}

FloatSamples pcm16_to_float(const std::vector<Sample>& samples) {
    FloatSamples out(samples.size());
    std::transform(samples.begin(), samples.end(), out.begin(),
                   [](Sample v) { return pcm16_to_float(v); });
    return out;
}

std::string pcm16_to_bytes(const std::vector<Sample>& samples) {
    std::string bytes;
    bytes.resize(samples.size() * 2);
    for (size_t i = 0; i < samples.size(); ++i) {
        uint16_t u = static_cast<uint16_t>(samples[i]);
        bytes[2 * i] = static_cast<char>(u & 0xFF);
        bytes[2 * i + 1] = static_cast<char>((u >> 8) & 0xFF);
    }
    return bytes;
}

Result<std::vector<Sample>> bytes_to_pcm16(const std::string& bytes) {
    if (bytes.size() % 2 != 0) {
        return make_decode_error("PCM16 payload has odd byte count " + std::to_string(bytes.size()));
    }
    std::vector<Sample> samples(bytes.size() / 2);
    for (size_t i = 0; i < samples.size(); ++i) {
        uint16_t lo = static_cast<uint8_t>(bytes[2 * i]);
        uint16_t hi = static_cast<uint8_t>(bytes[2 * i + 1]);
        samples[i] = static_cast<Sample>(static_cast<uint16_t>(lo | (hi << 8)));
    }
    return samples;
}

std::string base64_encode(const std::string& bytes) {
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        uint32_t n = (static_cast<uint8_t>(bytes[i]) << 16) |
                     (static_cast<uint8_t>(bytes[i + 1]) << 8) |
                     static_cast<uint8_t>(bytes[i + 2]);
        out += BASE64_ALPHABET[(n >> 18) & 0x3F];
        out += BASE64_ALPHABET[(n >> 12) & 0x3F];
        out += BASE64_ALPHABET[(n >> 6) & 0x3F];
        out += BASE64_ALPHABET[n & 0x3F];
    }

    size_t remaining = bytes.size() - i;
    if (remaining == 1) {
        uint32_t n = static_cast<uint8_t>(bytes[i]) << 16;
        out += BASE64_ALPHABET[(n >> 18) & 0x3F];
        out += BASE64_ALPHABET[(n >> 12) & 0x3F];
        out += "==";
    } else if (remaining == 2) {
        uint32_t n = (static_cast<uint8_t>(bytes[i]) << 16) |
                     (static_cast<uint8_t>(bytes[i + 1]) << 8);
        out += BASE64_ALPHABET[(n >> 18) & 0x3F];
        out += BASE64_ALPHABET[(n >> 12) & 0x3F];
        out += BASE64_ALPHABET[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

Result<std::string> base64_decode(const std::string& text) {
    if (text.size() % 4 != 0) {
        return make_decode_error("base64 length " + std::to_string(text.size()) + " is not a multiple of 4");
    }

    std::string out;
    out.reserve((text.size() / 4) * 3);

    for (size_t i = 0; i < text.size(); i += 4) {
        bool last_group = (i + 4 == text.size());
        int padding = 0;
        uint32_t n = 0;
        for (size_t k = 0; k < 4; ++k) {
            char c = text[i + k];
            if (c == '=') {
                // Padding only in the last two positions of the final group
                if (!last_group || k < 2) {
                    return make_decode_error("misplaced base64 padding");
                }
                padding++;
                n <<= 6;
                continue;
            }
            if (padding > 0) {
                return make_decode_error("data after base64 padding");
            }
            int v = base64_value(c);
            if (v < 0) {
                return make_decode_error("invalid base64 character");
            }
            n = (n << 6) | static_cast<uint32_t>(v);
        }
        out += static_cast<char>((n >> 16) & 0xFF);
        if (padding < 2) out += static_cast<char>((n >> 8) & 0xFF);
        if (padding < 1) out += static_cast<char>(n & 0xFF);
    }
    return out;
}

float compute_rms(const FloatSamples& samples) {
    if (samples.empty()) return 0.0f;
    double sum = 0.0;
    for (float s : samples) {
        sum += static_cast<double>(s) * s;
    }
    double rms = std::sqrt(sum / samples.size());
    return static_cast<float>(std::min(1.0, rms));
}

float compute_rms(const std::vector<Sample>& samples) {
    if (samples.empty()) return 0.0f;
    double sum = 0.0;
    for (Sample s : samples) {
        double v = pcm16_to_float(s);
        sum += v * v;
    }
    double rms = std::sqrt(sum / samples.size());
    return static_cast<float>(std::min(1.0, rms));
}

std::string encode_frame(const AudioFrame& frame) {
    return base64_encode(pcm16_to_bytes(frame.samples));
}

Result<DecodedAudioBuffer> decode_audio_chunk(const std::string& base64_payload, int sample_rate) {
    auto bytes = base64_decode(base64_payload);
    if (bytes.is_error()) {
        return bytes.error();
    }
    auto pcm = bytes_to_pcm16(bytes.value());
    if (pcm.is_error()) {
        return pcm.error();
    }
    if (pcm.value().empty()) {
        return make_decode_error("audio chunk is empty");
    }

    DecodedAudioBuffer buffer;
    buffer.samples = pcm16_to_float(pcm.value());
    buffer.sample_rate = sample_rate;
    return buffer;
}

} // namespace codec
} // namespace duplex_voice
