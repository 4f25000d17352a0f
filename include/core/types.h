#pragma once

/**
 * @file types.h
 * @brief Core type definitions for the holo-oracle voice pipeline
 *
 * Fundamental audio, timing and result types shared by every module.
 */

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <functional>

namespace holo_oracle {

// =============================================================================
// Audio Types
// =============================================================================

/// Raw audio sample (16-bit signed PCM)
using Sample = int16_t;

/// Fixed-duration frame handed to a speech detector
using AudioFrame = std::vector<Sample>;

/// Variable-length audio buffer
using AudioBuffer = std::vector<Sample>;

// =============================================================================
// Timing Types
// =============================================================================

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

/// Milliseconds elapsed since a time point
inline int64_t ms_since(TimePoint start) {
    return std::chrono::duration_cast<Duration>(Clock::now() - start).count();
}

/// Wall-clock milliseconds since epoch (for ids and logging)
inline int64_t now_ms() {
    return std::chrono::duration_cast<Duration>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

namespace audio {
    /// Convert a duration to a sample count at the given rate
    constexpr size_t ms_to_samples(int64_t ms, int sample_rate) {
        return static_cast<size_t>((ms * sample_rate) / 1000);
    }

    /// Convert a sample count to a duration at the given rate
    constexpr int64_t samples_to_ms(size_t samples, int sample_rate) {
        return sample_rate > 0 ? static_cast<int64_t>((samples * 1000) / static_cast<size_t>(sample_rate)) : 0;
    }
}

// =============================================================================
// Result Types (for error handling without exceptions)
// =============================================================================

/// Generic result type for operations that can fail
template<typename T>
struct Result {
    std::optional<T> value;
    std::string error;

    bool ok() const { return value.has_value(); }
    bool failed() const { return !ok(); }

    static Result success(T val) { return {std::move(val), ""}; }
    static Result failure(std::string err) { return {std::nullopt, std::move(err)}; }

    /// Get value or return default
    T value_or(T default_val) const {
        return ok() ? *value : default_val;
    }
};

/// Void result for operations that don't return a value
struct VoidResult {
    bool success;
    std::string error;

    bool ok() const { return success; }
    bool failed() const { return !ok(); }

    static VoidResult ok_result() { return {true, ""}; }
    static VoidResult failure(std::string err) { return {false, std::move(err)}; }
};

// =============================================================================
// Conversation Types
// =============================================================================

/// Conversation message roles
enum class MessageRole {
    User,
    Assistant
};

inline const char* role_to_string(MessageRole role) {
    switch (role) {
        case MessageRole::User: return "user";
        case MessageRole::Assistant: return "assistant";
    }
    return "user";
}

/// Single turn in a session's conversation history
struct Turn {
    MessageRole role;
    std::string text;
};

/// Per-session voice parameters forwarded to the synthesis chain
struct VoiceSettings {
    int speed = 140;          ///< Words per minute
    float volume = 0.9f;      ///< 0-1
    float intensity = 1.0f;   ///< Forwarded to display integrations, not used by synthesis
    float emotion = 0.8f;     ///< Forwarded to display integrations, not used by synthesis
};

/// Outbound message callback (serialized JSON text)
using MessageSink = std::function<void(const std::string&)>;

} // namespace holo_oracle
