#include "wav_decoder.hpp"

#include <cstring>
#include <format>
#include <fstream>
#include <iterator>

namespace wav {

namespace {

uint16_t read_u16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, 2);
    return v;
}

uint32_t read_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return v;
}

bool tag_is(const uint8_t* p, const char* tag) {
    return std::memcmp(p, tag, 4) == 0;
}

} // namespace

std::expected<DecodedAudio, AudioError> decode(std::span<const uint8_t> bytes) {
    if (bytes.size() < 12 || !tag_is(bytes.data(), "RIFF") || !tag_is(bytes.data() + 8, "WAVE")) {
        return std::unexpected(AudioError::decode_failure("not a RIFF/WAVE file"));
    }

    DecodedAudio out;
    uint16_t format = 0;
    bool have_fmt = false;
    bool have_data = false;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint8_t* hdr = bytes.data() + pos;
        uint32_t chunk_size = read_u32(hdr + 4);
        size_t body = pos + 8;
        size_t available = bytes.size() - body;

        if (tag_is(hdr, "fmt ")) {
            if (chunk_size < 16 || chunk_size > available) {
                return std::unexpected(AudioError::decode_failure("truncated fmt chunk"));
            }
            const uint8_t* f = bytes.data() + body;
            format = read_u16(f);
            out.channel_count = read_u16(f + 2);
            out.sample_rate_hz = read_u32(f + 4);
            out.bit_depth = read_u16(f + 14);

            // WAVE_FORMAT_EXTENSIBLE: the real format tag leads the sub-format GUID
            if (format == kFormatExtensible) {
                if (chunk_size < 40) {
                    return std::unexpected(AudioError::decode_failure("truncated extensible fmt chunk"));
                }
                format = read_u16(f + 24);
            }
            have_fmt = true;
        } else if (tag_is(hdr, "data")) {
            // Streaming writers leave 0xFFFFFFFF; a size past the end means take what is there.
            size_t len = chunk_size;
            if (len > available) len = available;
            out.data.assign(bytes.begin() + body, bytes.begin() + body + len);
            have_data = true;
            break;
        }

        // Chunks are padded to an even size
        size_t advance = 8 + static_cast<size_t>(chunk_size) + (chunk_size & 1);
        if (advance > bytes.size() - pos) break;
        pos += advance;
    }

    if (!have_fmt) {
        return std::unexpected(AudioError::decode_failure("missing fmt chunk"));
    }
    if (!have_data) {
        return std::unexpected(AudioError::decode_failure("missing data chunk"));
    }

    if (format == kFormatFloat) {
        out.is_float = true;
    } else if (format != kFormatPcm) {
        return std::unexpected(AudioError::decode_failure(
            std::format("unsupported format tag {}", format)));
    }

    if (out.channel_count == 0) {
        return std::unexpected(AudioError::decode_failure("zero channels"));
    }

    bool depth_ok = out.is_float ? out.bit_depth == 32
                                 : (out.bit_depth == 8 || out.bit_depth == 16 || out.bit_depth == 32);
    if (!depth_ok) {
        return std::unexpected(AudioError::decode_failure(
            std::format("unsupported bit depth {}", out.bit_depth)));
    }

    return out;
}

std::expected<std::vector<uint8_t>, AudioError> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected(AudioError::decode_failure("could not open " + path));
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                               std::istreambuf_iterator<char>());
    if (f.bad()) {
        return std::unexpected(AudioError::decode_failure("read error on " + path));
    }
    return bytes;
}

} // namespace wav
