#pragma once

#include "core/types.h"
#include "config.h"
#include <string>
#include <memory>
#include <vector>

namespace holo_oracle {

/**
 * @brief Generative reply collaborator
 *
 * Always returns something speakable; failures degrade to persona fallback
 * lines inside the implementation.
 */
class IResponder {
public:
    virtual ~IResponder() = default;

    /**
     * @param prompt Latest user utterance
     * @param history Earlier turns, oldest first (does not include prompt)
     */
    virtual std::string respond(const std::string& prompt, const std::vector<Turn>& history) = 0;
};

/**
 * @brief Chat-completions client (OpenAI-compatible or Ollama /api/chat)
 *
 * Sends the persona system prompt, the last context_max_turns history turns
 * and the prompt. With no endpoint, no API key (OpenAI provider) or on any
 * request error it answers with keyword fallback lines.
 */
class LLMClient : public IResponder {
public:
    explicit LLMClient(const LLMConfig& config);
    ~LLMClient() override;

    // Non-copyable
    LLMClient(const LLMClient&) = delete;
    LLMClient& operator=(const LLMClient&) = delete;

    std::string respond(const std::string& prompt, const std::vector<Turn>& history) override;

    /// True when requests will be sent (false = fallback lines only)
    bool is_ready() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace holo_oracle
