/**
 * Wire encoding, sample conversion, resampling and WAV handling.
 * Run from build dir: ./test_codec
 */

#include "test_common.h"
#include "audio_codec.h"

using namespace holo_oracle;

namespace {

std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

int main() {
    // --- base64 ---
    ASSERT(codec::base64_encode(bytes_of("Man")) == "TWFu");
    ASSERT(codec::base64_encode(bytes_of("Ma")) == "TWE=");
    ASSERT(codec::base64_encode(bytes_of("M")) == "TQ==");
    ASSERT(codec::base64_encode(std::vector<uint8_t>()).empty());

    auto decoded = codec::base64_decode("TWFu\nTWE=");
    ASSERT(decoded.ok() && *decoded.value == bytes_of("ManMa"));
    ASSERT(codec::base64_decode("TQ==TQ==").failed());

    decoded = codec::base64_decode("TW Fu\r\n");
    ASSERT(decoded.ok());
    if (decoded.ok()) ASSERT(*decoded.value == bytes_of("Man"));

    decoded = codec::base64_decode("TQ==");
    ASSERT(decoded.ok() && *decoded.value == bytes_of("M"));

    ASSERT(codec::base64_decode("TW*u").failed());
    ASSERT(codec::base64_decode("").ok());

    // --- PCM16 little-endian ---
    {
        AudioBuffer s = codec::pcm16_from_bytes({0x01, 0x00, 0xFF, 0xFF, 0x00, 0x80, 0x7F});
        ASSERT(s.size() == 3);  // odd trailing byte dropped
        if (s.size() == 3) {
            ASSERT(s[0] == 1);
            ASSERT(s[1] == -1);
            ASSERT(s[2] == -32768);
        }
        std::vector<uint8_t> b = codec::pcm16_to_bytes({256, -2});
        ASSERT(b.size() == 4);
        ASSERT(b[0] == 0x00 && b[1] == 0x01);
        ASSERT(b[2] == 0xFE && b[3] == 0xFF);

        AudioBuffer wave{0, 1200, -1200, 32767, -32768};
        auto back = codec::decode_pcm16_base64(codec::encode_pcm16_base64(wave));
        ASSERT(back.ok());
        if (back.ok()) ASSERT(*back.value == wave);
        ASSERT(codec::decode_pcm16_base64("not base64!").failed());
    }

    // --- float conversion ---
    {
        auto f = codec::to_float({16384, -32768});
        ASSERT_NEAR(f[0], 0.5, 1e-6);
        ASSERT_NEAR(f[1], -1.0, 1e-6);
        AudioBuffer s = codec::from_float({2.0f, -2.0f, 0.0f});
        ASSERT(s[0] == 32767);
        ASSERT(s[1] == -32767);
        ASSERT(s[2] == 0);
    }

    // --- resampling ---
    {
        AudioBuffer one_second(16000, 100);
        ASSERT(codec::resample_linear(one_second, 16000, 22050).size() == 22050);
        ASSERT(codec::resample_linear(AudioBuffer(2205, 5), 22050, 16000).size() == 1600);
        ASSERT(codec::resample_linear(AudioBuffer(24000, 5), 24000, 22050).size() == 22050);
        ASSERT(codec::resample_linear(one_second, 16000, 16000) == one_second);
        ASSERT(codec::resample_linear(one_second, 0, 16000) == one_second);
        ASSERT(codec::resample_linear(AudioBuffer(), 16000, 22050).empty());

        // Interpolation midway between two samples
        AudioBuffer up = codec::resample_linear({0, 100, 200, 300}, 1, 2);
        ASSERT(up.size() == 8);
        if (up.size() == 8) {
            ASSERT(up[0] == 0);
            ASSERT(up[1] == 50);
            ASSERT(up[2] == 100);
        }
    }

    // --- gain ---
    {
        AudioBuffer s{1000, -1000, 20000};
        codec::apply_gain(s, 0.5f);
        ASSERT(s[0] == 500 && s[1] == -500 && s[2] == 10000);
        codec::apply_gain(s, 10.0f);
        ASSERT(s[2] == 32767);
        ASSERT(s[1] == -5000);
    }

    // --- WAV ---
    {
        AudioBuffer samples{0, 1, -1, 1000, -1000};
        auto bytes = codec::build_wav(samples, 22050);
        ASSERT(bytes.size() == 44 + samples.size() * 2);

        auto wav = codec::parse_wav(bytes);
        ASSERT(wav.ok());
        if (wav.ok()) {
            ASSERT(wav.value->sample_rate == 22050);
            ASSERT(wav.value->channels == 1);
            ASSERT(wav.value->samples == samples);
        }

        // LIST chunk ahead of data, odd-sized to exercise word alignment
        std::vector<uint8_t> with_list(bytes.begin(), bytes.begin() + 36);
        const uint8_t list_chunk[] = {'L', 'I', 'S', 'T', 3, 0, 0, 0, 'a', 'b', 'c', 0};
        with_list.insert(with_list.end(), std::begin(list_chunk), std::end(list_chunk));
        with_list.insert(with_list.end(), bytes.begin() + 36, bytes.end());
        auto listed = codec::parse_wav(with_list);
        ASSERT(listed.ok());
        if (listed.ok()) ASSERT(listed.value->samples == samples);

        // Streaming writers leave the data size at 0
        std::vector<uint8_t> streamed = bytes;
        streamed[40] = streamed[41] = streamed[42] = streamed[43] = 0;
        auto s = codec::parse_wav(streamed);
        ASSERT(s.ok() && s.value->samples.size() == samples.size());

        ASSERT(codec::parse_wav(bytes_of("RIFF0000WAVX")).failed());
        ASSERT(codec::parse_wav({}).failed());

        std::vector<uint8_t> eight_bit = bytes;
        eight_bit[34] = 8;
        ASSERT(codec::parse_wav(eight_bit).failed());

        ASSERT(codec::read_wav_file("/nonexistent/clip.wav").failed());
    }

    return report("codec");
}
