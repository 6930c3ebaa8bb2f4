#include <catch2/catch_test_macros.hpp>

#include "audio/wav_decoder.hpp"
#include "wav_fixture.hpp"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

void put_u32(std::vector<uint8_t>& v, size_t pos, uint32_t x) {
    std::memcpy(v.data() + pos, &x, 4);
}

} // namespace

TEST_CASE("wav::decode", "[wav]") {
    std::vector<int16_t> samples = {0, 100, -100, 32767, -32768, 7};

    SECTION("Mono16") {
        auto bytes = fixture::wav_s16(samples, 16000);
        auto d = wav::decode(bytes);
        REQUIRE(d.has_value());
        REQUIRE(d->sample_rate_hz == 16000);
        REQUIRE(d->channel_count == 1);
        REQUIRE(d->bit_depth == 16);
        REQUIRE_FALSE(d->is_float);
        REQUIRE(d->data.size() == samples.size() * 2);
        REQUIRE(std::memcmp(d->data.data(), samples.data(), d->data.size()) == 0);
    }

    SECTION("Stereo8") {
        std::vector<uint8_t> raw = {128, 128, 255, 0};
        auto d = wav::decode(fixture::wav_bytes(raw, 8000, 2, 8));
        REQUIRE(d.has_value());
        REQUIRE(d->channel_count == 2);
        REQUIRE(d->bit_depth == 8);
        REQUIRE(d->data == raw);
    }

    SECTION("Float32") {
        std::vector<float> f = {0.5f, -0.25f};
        std::vector<uint8_t> raw(8);
        std::memcpy(raw.data(), f.data(), 8);
        auto d = wav::decode(fixture::wav_bytes(raw, 48000, 1, 32, wav::kFormatFloat));
        REQUIRE(d.has_value());
        REQUIRE(d->is_float);
        REQUIRE(d->bit_depth == 32);
    }

    SECTION("SkipsUnknownChunks") {
        auto bytes = fixture::wav_s16(samples, 16000);
        // Insert an odd-sized LIST chunk (with pad byte) between fmt and data
        std::vector<uint8_t> list = {'L', 'I', 'S', 'T', 3, 0, 0, 0, 'a', 'b', 'c', 0};
        bytes.insert(bytes.begin() + 36, list.begin(), list.end());
        put_u32(bytes, 4, static_cast<uint32_t>(bytes.size() - 8));

        auto d = wav::decode(bytes);
        REQUIRE(d.has_value());
        REQUIRE(d->data.size() == samples.size() * 2);
    }

    SECTION("TruncatedDataChunkTakesAvailable") {
        auto bytes = fixture::wav_s16(samples, 16000);
        bytes.resize(bytes.size() - 4);
        auto d = wav::decode(bytes);
        REQUIRE(d.has_value());
        REQUIRE(d->data.size() == samples.size() * 2 - 4);
    }

    SECTION("ZeroSizeDataChunkIsEmpty") {
        // Empty recording with a metadata chunk after the data chunk
        std::vector<int16_t> none;
        auto bytes = fixture::wav_s16(none, 16000);
        std::vector<uint8_t> list = {'L', 'I', 'S', 'T', 4, 0, 0, 0, 'I', 'N', 'F', 'O'};
        bytes.insert(bytes.end(), list.begin(), list.end());
        put_u32(bytes, 4, static_cast<uint32_t>(bytes.size() - 8));

        auto d = wav::decode(bytes);
        REQUIRE(d.has_value());
        REQUIRE(d->data.empty());
    }

    SECTION("StreamingDataSizeTakesAvailable") {
        auto bytes = fixture::wav_s16(samples, 16000);
        put_u32(bytes, 40, 0xFFFFFFFF);
        auto d = wav::decode(bytes);
        REQUIRE(d.has_value());
        REQUIRE(d->data.size() == samples.size() * 2);
    }

    SECTION("NotRiff") {
        std::vector<uint8_t> junk = {'O', 'g', 'g', 'S', 0, 0, 0, 0, 0, 0, 0, 0, 0, 0};
        auto d = wav::decode(junk);
        REQUIRE_FALSE(d.has_value());
        REQUIRE(d.error().kind == AudioError::Kind::AudioDecodeFailure);
    }

    SECTION("TooShort") {
        std::vector<uint8_t> tiny = {'R', 'I', 'F', 'F'};
        REQUIRE_FALSE(wav::decode(tiny).has_value());
    }

    SECTION("MissingData") {
        auto bytes = fixture::wav_s16(samples, 16000);
        bytes.resize(36);
        auto d = wav::decode(bytes);
        REQUIRE_FALSE(d.has_value());
        REQUIRE(d.error().message == "missing data chunk");
    }

    SECTION("UnsupportedFormatTag") {
        std::vector<uint8_t> raw(4, 0);
        auto d = wav::decode(fixture::wav_bytes(raw, 8000, 1, 8, 7)); // mu-law
        REQUIRE_FALSE(d.has_value());
        REQUIRE(d.error().kind == AudioError::Kind::AudioDecodeFailure);
    }

    SECTION("Unsupported24Bit") {
        std::vector<uint8_t> raw(6, 0);
        REQUIRE_FALSE(wav::decode(fixture::wav_bytes(raw, 8000, 1, 24)).has_value());
    }
}

TEST_CASE("wav::read_file", "[wav]") {

    SECTION("ReadsBytes") {
        auto path = std::filesystem::temp_directory_path() /
                    ("sg_test_wav_" + std::to_string(getpid()) + ".wav");
        std::vector<int16_t> samples = {1, 2, 3};
        auto bytes = fixture::wav_s16(samples, 16000);
        {
            std::ofstream f(path, std::ios::binary);
            f.write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        }
        auto read = wav::read_file(path.string());
        std::filesystem::remove(path);
        REQUIRE(read.has_value());
        REQUIRE(*read == bytes);
    }

    SECTION("MissingFile") {
        auto read = wav::read_file("/tmp/sg_test_nonexistent_audio.wav");
        REQUIRE_FALSE(read.has_value());
        REQUIRE(read.error().kind == AudioError::Kind::AudioDecodeFailure);
    }
}
