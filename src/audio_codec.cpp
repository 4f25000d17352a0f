#include "audio_codec.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>

namespace holo_oracle {
namespace codec {

namespace {

const char kBase64Alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int base64_value(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

uint16_t read_u16(const std::vector<uint8_t>& b, size_t offset) {
    return static_cast<uint16_t>(b[offset] | (b[offset + 1] << 8));
}

uint32_t read_u32(const std::vector<uint8_t>& b, size_t offset) {
    return static_cast<uint32_t>(b[offset]) |
           (static_cast<uint32_t>(b[offset + 1]) << 8) |
           (static_cast<uint32_t>(b[offset + 2]) << 16) |
           (static_cast<uint32_t>(b[offset + 3]) << 24);
}

void put_u16(std::vector<uint8_t>& b, uint16_t v) {
    b.push_back(static_cast<uint8_t>(v & 0xFF));
    b.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void put_u32(std::vector<uint8_t>& b, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        b.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    }
}

void put_tag(std::vector<uint8_t>& b, const char* tag) {
    b.insert(b.end(), tag, tag + 4);
}

} // namespace

std::string base64_encode(const uint8_t* data, size_t size) {
    std::string out;
    out.reserve(((size + 2) / 3) * 4);

    size_t i = 0;
    while (i + 3 <= size) {
        uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                     (static_cast<uint32_t>(data[i + 1]) << 8) |
                     static_cast<uint32_t>(data[i + 2]);
        out += kBase64Alphabet[(n >> 18) & 0x3F];
        out += kBase64Alphabet[(n >> 12) & 0x3F];
        out += kBase64Alphabet[(n >> 6) & 0x3F];
        out += kBase64Alphabet[n & 0x3F];
        i += 3;
    }

    size_t rest = size - i;
    if (rest == 1) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        out += kBase64Alphabet[(n >> 18) & 0x3F];
        out += kBase64Alphabet[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                     (static_cast<uint32_t>(data[i + 1]) << 8);
        out += kBase64Alphabet[(n >> 18) & 0x3F];
        out += kBase64Alphabet[(n >> 12) & 0x3F];
        out += kBase64Alphabet[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    return base64_encode(data.data(), data.size());
}

Result<std::vector<uint8_t>> base64_decode(const std::string& text) {
    std::vector<uint8_t> out;
    out.reserve((text.size() / 4) * 3);

    uint32_t accum = 0;
    int bits = 0;
    bool padding = false;
    for (unsigned char c : text) {
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
        if (c == '=') {
            padding = true;
            continue;
        }
        int v = base64_value(c);
        if (v < 0 || padding) {
            return Result<std::vector<uint8_t>>::failure("invalid base64 character");
        }
        accum = (accum << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((accum >> bits) & 0xFF));
        }
    }
    return Result<std::vector<uint8_t>>::success(std::move(out));
}

AudioBuffer pcm16_from_bytes(const std::vector<uint8_t>& bytes) {
    AudioBuffer samples(bytes.size() / 2);
    for (size_t i = 0; i < samples.size(); ++i) {
        samples[i] = static_cast<Sample>(
            static_cast<uint16_t>(bytes[2 * i]) |
            (static_cast<uint16_t>(bytes[2 * i + 1]) << 8));
    }
    return samples;
}

std::vector<uint8_t> pcm16_to_bytes(const AudioBuffer& samples) {
    std::vector<uint8_t> bytes;
    bytes.reserve(samples.size() * 2);
    for (Sample s : samples) {
        put_u16(bytes, static_cast<uint16_t>(s));
    }
    return bytes;
}

std::string encode_pcm16_base64(const AudioBuffer& samples) {
    return base64_encode(pcm16_to_bytes(samples));
}

Result<AudioBuffer> decode_pcm16_base64(const std::string& text) {
    auto bytes = base64_decode(text);
    if (!bytes.ok()) {
        return Result<AudioBuffer>::failure(bytes.error);
    }
    return Result<AudioBuffer>::success(pcm16_from_bytes(*bytes.value));
}

std::vector<float> to_float(const AudioBuffer& samples) {
    std::vector<float> out(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        out[i] = static_cast<float>(samples[i]) / 32768.0f;
    }
    return out;
}

AudioBuffer from_float(const std::vector<float>& samples) {
    AudioBuffer out(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        float v = std::clamp(samples[i], -1.0f, 1.0f);
        out[i] = static_cast<Sample>(std::lround(v * 32767.0f));
    }
    return out;
}

AudioBuffer resample_linear(const AudioBuffer& input, int from_rate, int to_rate) {
    if (from_rate == to_rate || from_rate <= 0 || to_rate <= 0 || input.empty()) return input;

    double ratio = static_cast<double>(from_rate) / static_cast<double>(to_rate);
    size_t output_samples = static_cast<size_t>(
        (static_cast<uint64_t>(input.size()) * static_cast<uint64_t>(to_rate)) /
        static_cast<uint64_t>(from_rate));

    AudioBuffer output;
    output.reserve(output_samples);

    for (size_t i = 0; i < output_samples; i++) {
        double input_pos = static_cast<double>(i) * ratio;
        size_t idx0 = static_cast<size_t>(input_pos);
        if (idx0 >= input.size()) break;
        size_t idx1 = std::min(idx0 + 1, input.size() - 1);

        // Linear interpolation
        double t = input_pos - static_cast<double>(idx0);
        double interpolated = static_cast<double>(input[idx0]) * (1.0 - t) +
                              static_cast<double>(input[idx1]) * t;

        output.push_back(static_cast<Sample>(std::lround(interpolated)));
    }

    return output;
}

void apply_gain(AudioBuffer& samples, float gain) {
    if (std::abs(gain - 1.0f) < 0.001f) return;

    for (auto& sample : samples) {
        float scaled = static_cast<float>(sample) * gain;
        sample = static_cast<Sample>(std::clamp(scaled, -32768.0f, 32767.0f));
    }
}

Result<WavData> parse_wav(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < 12 ||
        std::string(bytes.begin(), bytes.begin() + 4) != "RIFF" ||
        std::string(bytes.begin() + 8, bytes.begin() + 12) != "WAVE") {
        return Result<WavData>::failure("not a RIFF/WAVE file");
    }

    WavData wav;
    int bits_per_sample = 0;
    bool have_format = false;
    size_t offset = 12;

    while (offset + 8 <= bytes.size()) {
        std::string id(bytes.begin() + offset, bytes.begin() + offset + 4);
        uint32_t chunk_size = read_u32(bytes, offset + 4);
        size_t body = offset + 8;

        if (id == "fmt ") {
            if (body + 16 > bytes.size()) {
                return Result<WavData>::failure("truncated fmt chunk");
            }
            uint16_t format = read_u16(bytes, body);
            wav.channels = read_u16(bytes, body + 2);
            wav.sample_rate = static_cast<int>(read_u32(bytes, body + 4));
            bits_per_sample = read_u16(bytes, body + 14);
            if (format != 1 && format != 0xFFFE) {
                return Result<WavData>::failure("unsupported WAV format " + std::to_string(format));
            }
            have_format = true;
        } else if (id == "data") {
            if (!have_format) {
                return Result<WavData>::failure("data chunk before fmt chunk");
            }
            if (bits_per_sample != 16 || wav.channels < 1) {
                return Result<WavData>::failure("only PCM16 WAV is supported");
            }
            // Streaming writers leave the size at 0 or 0xFFFFFFFF; use what is present
            size_t available = bytes.size() - body;
            size_t data_size = (chunk_size == 0 || chunk_size > available) ? available : chunk_size;

            size_t frame_bytes = static_cast<size_t>(wav.channels) * 2;
            size_t frames = data_size / frame_bytes;
            wav.samples.resize(frames);
            for (size_t i = 0; i < frames; ++i) {
                wav.samples[i] = static_cast<Sample>(read_u16(bytes, body + i * frame_bytes));
            }
            return Result<WavData>::success(std::move(wav));
        }

        // Chunks are word-aligned
        offset = body + chunk_size + (chunk_size & 1);
    }

    return Result<WavData>::failure("no data chunk");
}

Result<WavData> read_wav_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Result<WavData>::failure("failed to open WAV file: " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    return parse_wav(bytes);
}

std::vector<uint8_t> build_wav(const AudioBuffer& samples, int sample_rate) {
    const uint32_t data_size = static_cast<uint32_t>(samples.size() * 2);
    std::vector<uint8_t> b;
    b.reserve(44 + data_size);

    put_tag(b, "RIFF");
    put_u32(b, 36 + data_size);
    put_tag(b, "WAVE");
    put_tag(b, "fmt ");
    put_u32(b, 16);
    put_u16(b, 1);                                      // PCM
    put_u16(b, 1);                                      // mono
    put_u32(b, static_cast<uint32_t>(sample_rate));
    put_u32(b, static_cast<uint32_t>(sample_rate) * 2); // byte rate
    put_u16(b, 2);                                      // block align
    put_u16(b, 16);
    put_tag(b, "data");
    put_u32(b, data_size);

    std::vector<uint8_t> pcm = pcm16_to_bytes(samples);
    b.insert(b.end(), pcm.begin(), pcm.end());
    return b;
}

VoidResult write_wav_file(const std::string& path, const AudioBuffer& samples, int sample_rate) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return VoidResult::failure("failed to open for writing: " + path);
    }
    std::vector<uint8_t> bytes = build_wav(samples, sample_rate);
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        return VoidResult::failure("failed to write WAV file: " + path);
    }
    return VoidResult::ok_result();
}

} // namespace codec
} // namespace holo_oracle
