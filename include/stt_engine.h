#pragma once

#include "core/types.h"
#include "config.h"
#include <string>
#include <memory>
#include <optional>

namespace holo_oracle {

/**
 * @brief Speech-to-text collaborator
 *
 * Returns nullopt when there is nothing usable to reply to (engine not
 * loaded, inference error, or a blank/noise transcript).
 */
class ITranscriber {
public:
    virtual ~ITranscriber() = default;

    virtual std::optional<std::string> transcribe(const AudioBuffer& samples, int sample_rate) = 0;

    virtual bool is_ready() const = 0;
};

/**
 * @brief whisper.cpp transcriber
 *
 * One model context for the whole process; concurrent sessions are
 * serialized on an internal mutex.
 */
class WhisperTranscriber : public ITranscriber {
public:
    explicit WhisperTranscriber(const STTConfig& config);
    ~WhisperTranscriber() override;

    // Non-copyable
    WhisperTranscriber(const WhisperTranscriber&) = delete;
    WhisperTranscriber& operator=(const WhisperTranscriber&) = delete;

    std::optional<std::string> transcribe(const AudioBuffer& samples, int sample_rate) override;

    bool is_ready() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace holo_oracle
