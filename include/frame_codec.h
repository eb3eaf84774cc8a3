#pragma once

/**
 * @file frame_codec.h
 * @brief Conversions between float audio, PCM16, wire bytes and base64
 *
 * Stateless. Byte order on the wire is little-endian regardless of host.
 */

#include "common.h"
#include "errors.h"
#include <string>
#include <vector>
#include <cstdint>

namespace duplex_voice {
namespace codec {

/// Clamp to [-1, 1] then scale and round: negatives by 32768, non-negatives by 32767
Sample float_to_pcm16(float value);

/// Inverse scaling of float_to_pcm16; result in [-1, 1]
float pcm16_to_float(Sample value);

std::vector<Sample> float_to_pcm16(const FloatSamples& samples);
FloatSamples pcm16_to_float(const std::vector<Sample>& samples);

std::string pcm16_to_bytes(const std::vector<Sample>& samples);

/**
 * @brief Reassemble little-endian PCM16
 * @return Samples, or DecodeError for an odd byte count
 */
Result<std::vector<Sample>> bytes_to_pcm16(const std::string& bytes);

std::string base64_encode(const std::string& bytes);

/**
 * @brief Standard alphabet, padding required
 * @return Raw bytes, or DecodeError for bad length or characters
 */
Result<std::string> base64_decode(const std::string& text);

/**
 * @brief Root-mean-square of normalized samples, clamped to [0, 1]
 * @return 0 for an empty block
 */
float compute_rms(const FloatSamples& samples);
float compute_rms(const std::vector<Sample>& samples);

/// Frame -> base64(PCM16 LE), the payload of an outbound audio message
std::string encode_frame(const AudioFrame& frame);

/**
 * @brief base64(PCM16 LE) -> float buffer at `sample_rate`
 * @return Buffer, or DecodeError for malformed or empty payloads
 */
Result<DecodedAudioBuffer> decode_audio_chunk(const std::string& base64_payload, int sample_rate);

} // namespace codec
} // namespace duplex_voice
