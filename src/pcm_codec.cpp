#include "pcm_codec.h"
#include <mbedtls/base64.h>
#include <algorithm>
#include <cstdint>
#include <vector>

namespace orbion {
namespace pcm {

PcmBytes encode(const Sample* samples, size_t count) {
    PcmBytes out;
    out.resize(count * 2);
    for (size_t i = 0; i < count; ++i) {
        float s = std::max(-1.0f, std::min(1.0f, samples[i]));
        int16_t v = static_cast<int16_t>(s < 0.0f ? s * 32768.0f : s * 32767.0f);
        uint16_t u = static_cast<uint16_t>(v);
        out[2 * i] = static_cast<char>(u & 0xFF);
        out[2 * i + 1] = static_cast<char>((u >> 8) & 0xFF);
    }
    return out;
}

Result<AudioFrame> decode(const PcmBytes& bytes) {
    if (bytes.size() % 2 != 0) {
        return make_decode_error("PCM16 payload has odd byte count (" +
                                 std::to_string(bytes.size()) + ")");
    }
    AudioFrame samples(bytes.size() / 2);
    for (size_t i = 0; i < samples.size(); ++i) {
        uint16_t lo = static_cast<uint8_t>(bytes[2 * i]);
        uint16_t hi = static_cast<uint8_t>(bytes[2 * i + 1]);
        int16_t v = static_cast<int16_t>(lo | (hi << 8));
        samples[i] = static_cast<float>(v) / 32768.0f;
    }
    return samples;
}

std::string base64_encode(const std::string& bytes) {
    if (bytes.empty()) return "";
    size_t olen = 0;
    // First call reports the required size (including the terminating NUL)
    mbedtls_base64_encode(nullptr, 0, &olen,
                          reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size());
    std::vector<unsigned char> buf(olen);
    int ret = mbedtls_base64_encode(buf.data(), buf.size(), &olen,
                                    reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size());
    if (ret != 0) {
        return "";
    }
    return std::string(reinterpret_cast<const char*>(buf.data()), olen);
}

Result<std::string> base64_decode(const std::string& text) {
    if (text.empty()) return std::string();
    size_t olen = 0;
    int ret = mbedtls_base64_decode(nullptr, 0, &olen,
                                    reinterpret_cast<const unsigned char*>(text.data()), text.size());
    if (ret == MBEDTLS_ERR_BASE64_INVALID_CHARACTER) {
        return make_decode_error("invalid base64 payload");
    }
    std::vector<unsigned char> buf(olen);
    ret = mbedtls_base64_decode(buf.data(), buf.size(), &olen,
                                reinterpret_cast<const unsigned char*>(text.data()), text.size());
    if (ret != 0) {
        return make_decode_error("base64 decode failed (mbedtls " + std::to_string(ret) + ")");
    }
    return std::string(reinterpret_cast<const char*>(buf.data()), olen);
}

} // namespace pcm
} // namespace orbion
