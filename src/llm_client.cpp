#include "llm_client.h"
#include "fallback_responses.h"
#include "http_client.h"
#include "logger.h"
#include "utils.h"
#include <atomic>
#include <algorithm>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace holo_oracle {

class LLMClient::Impl {
public:
    Impl(const LLMConfig& config)
        : config_(config)
        , api_key_(read_api_key(config.api_key_env))
    {
        is_ollama_ = config_.provider == "ollama" ||
                     config_.endpoint.find("/api/chat") != std::string::npos;

        if (config_.endpoint.empty()) {
            LOG_WARN("[LLM] No endpoint configured - will use fallback responses");
        } else if (!is_ollama_ && api_key_.empty()) {
            LOG_WARN("[LLM] " + config_.api_key_env + " not set - will use fallback responses");
        } else {
            ready_ = true;
            LOG_LLM(std::string(is_ollama_ ? "Ollama" : "OpenAI") + " chat at " + config_.endpoint +
                    " model=" + config_.model_name);
        }
    }

    std::string respond(const std::string& prompt, const std::vector<Turn>& history) {
        if (!ready_) {
            return fallback(prompt);
        }

        std::string body;
        try {
            body = build_request(prompt, history).dump(-1, ' ', false, json::error_handler_t::replace);
        } catch (const json::exception& e) {
            LOG_ERROR("[LLM] Cannot encode request: " + std::string(e.what()));
            return fallback(prompt);
        }

        std::string preview = prompt.substr(0, 50);
        LOG_LLM("Generating response for: " + preview + (prompt.size() > 50 ? "..." : ""));

        auto start = Clock::now();
        auto response = http::post_json(config_.endpoint, body,
                                        is_ollama_ ? "" : api_key_, config_.timeout_ms);
        if (response.failed()) {
            LOG_ERROR("[LLM] Request failed: " + response.error);
            return fallback(prompt);
        }

        std::string content;
        try {
            json reply = json::parse(response.value->body);
            if (is_ollama_) {
                if (reply.contains("message") && reply["message"].contains("content")) {
                    content = reply["message"]["content"].get<std::string>();
                }
            } else if (reply.contains("choices") && !reply["choices"].empty()) {
                const json& message = reply["choices"][0]["message"];
                if (message.contains("content") && !message["content"].is_null()) {
                    content = message["content"].get<std::string>();
                }
            }
        } catch (const json::exception& e) {
            LOG_ERROR("[LLM] JSON parse error: " + std::string(e.what()));
            return fallback(prompt);
        }

        utils::trim(content);
        if (content.empty()) {
            LOG_WARN("[LLM] Empty completion, using fallback");
            return fallback(prompt);
        }

        std::ostringstream oss;
        oss << "Generated response in " << ms_since(start) << "ms: " << content.substr(0, 100);
        LOG_LLM(oss.str());
        return content;
    }

    bool is_ready() const {
        return ready_;
    }

private:
    json build_request(const std::string& prompt, const std::vector<Turn>& history) const {
        json request;
        request["model"] = config_.model_name;
        request["messages"] = build_messages(prompt, history);
        request["stream"] = false;
        if (is_ollama_) {
            request["options"] = {
                {"temperature", config_.temperature},
                {"num_predict", config_.max_tokens}
            };
        } else {
            request["max_tokens"] = config_.max_tokens;
            request["temperature"] = config_.temperature;
            request["presence_penalty"] = config_.presence_penalty;
            request["frequency_penalty"] = config_.frequency_penalty;
        }
        return request;
    }

    json build_messages(const std::string& prompt, const std::vector<Turn>& history) const {
        json messages = json::array();
        messages.push_back({{"role", "system"}, {"content", config_.system_prompt}});

        size_t keep = static_cast<size_t>(std::max(0, config_.context_max_turns));
        size_t first = history.size() > keep ? history.size() - keep : 0;
        for (size_t i = first; i < history.size(); ++i) {
            messages.push_back({{"role", role_to_string(history[i].role)},
                                {"content", history[i].text}});
        }

        messages.push_back({{"role", "user"}, {"content", prompt}});
        return messages;
    }

    std::string fallback(const std::string& prompt) {
        return fallback_response(prompt, rotation_++);
    }

    LLMConfig config_;
    std::string api_key_;
    bool is_ollama_ = false;
    bool ready_ = false;
    std::atomic<size_t> rotation_{0};
};

LLMClient::LLMClient(const LLMConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

LLMClient::~LLMClient() = default;

std::string LLMClient::respond(const std::string& prompt, const std::vector<Turn>& history) {
    return pimpl_->respond(prompt, history);
}

bool LLMClient::is_ready() const {
    return pimpl_->is_ready();
}

} // namespace holo_oracle
