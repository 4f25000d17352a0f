#include "config.h"
#include "faq/faq_router.h"
#include "http_client.h"
#include "llm_client.h"
#include "logger.h"
#include "session.h"
#include "stt_engine.h"
#include "tts/espeak_tts.h"
#include "tts/neural_tts.h"
#include "tts/synthesis_chain.h"
#include "vad/vad_interface.h"
#include "ws_server.h"
#include <signal.h>
#include <csignal>
#include <unistd.h>
#include <fstream>
#include <iostream>
#include <sstream>

namespace holo_oracle {

static WebSocketServer* g_server = nullptr;

void signal_handler(int signal) {
    (void)signal;
    if (g_server) {
        g_server->stop();
    }
}

namespace {

void print_usage(const char* prog) {
    std::cout << "Usage:\n"
              << "  " << prog << " [config.json] [--log-level debug|info|warn|error]\n"
              << "  " << prog << " --faq-add <config.json> \"<trigger1>|<trigger2>\" \"<response>\" [type]\n"
              << "  " << prog << " --faq-stats <config.json>\n";
}

std::vector<std::string> split_triggers(const std::string& joined) {
    std::vector<std::string> triggers;
    std::istringstream iss(joined);
    std::string part;
    while (std::getline(iss, part, '|')) {
        if (part.find_first_not_of(" \t") != std::string::npos) {
            triggers.push_back(part);
        }
    }
    return triggers;
}

/// Config next to the executable (build/../config/config.json), else the working directory
std::string default_config_path() {
    std::string config_path = "config/config.json";
    char buf[1024];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len != -1) {
        buf[len] = '\0';
        std::string exe_dir(buf);
        size_t pos = exe_dir.find_last_of('/');
        if (pos != std::string::npos) {
            std::string candidate = exe_dir.substr(0, pos) + "/../config/config.json";
            std::ifstream test(candidate);
            if (test.good()) {
                config_path = candidate;
            }
        }
    }
    return config_path;
}

int run_faq_add(const std::string& config_path, const std::string& triggers,
                const std::string& response, const std::string& type) {
    Config config = Config::load_from_file(config_path);
    faq::FaqRouter router(config.faq);
    auto init = router.initialize();
    if (init.failed()) {
        Logger::warn("FAQ table initialized with defaults: " + init.error);
    }

    auto id = router.add_entry(split_triggers(triggers), response, type);
    if (id.failed()) {
        Logger::error("Failed to add FAQ entry: " + id.error);
        return 1;
    }

    std::cout << "Added FAQ entry " << *id.value << " (" << router.size() << " entries in "
              << config.faq.database_path << ")\n";
    return 0;
}

int run_faq_stats(const std::string& config_path) {
    Config config = Config::load_from_file(config_path);
    faq::FaqRouter router(config.faq);
    auto init = router.initialize();
    if (init.failed()) {
        Logger::warn("FAQ table initialized with defaults: " + init.error);
    }

    faq::FaqStats stats = router.stats();
    std::cout << "FAQ entries: " << stats.total_entries << "\n"
              << "Similarity threshold: " << stats.similarity_threshold << "\n"
              << "By type:\n";
    for (const auto& entry : stats.types) {
        std::cout << "  " << entry.first << ": " << entry.second << "\n";
    }
    std::cout << "By source:\n";
    for (const auto& entry : stats.sources) {
        std::cout << "  " << entry.first << ": " << entry.second << "\n";
    }
    return 0;
}

int run_server(const std::string& config_path, const std::string& log_level_override) {
    Config config = Config::load_from_file(config_path);

    std::string level = log_level_override.empty() ? config.log.level : log_level_override;
    Logger::initialize(parse_log_level(level), config.log.file);

    // Subprocess pipes and client sockets can close under us
    std::signal(SIGPIPE, SIG_IGN);
    http::global_init();

    Logger::info("=== Holo-Oracle Voice Server ===");
    Logger::info("Config: " + config_path);

    std::unique_ptr<faq::FaqRouter> faq_router;
    if (config.faq.enabled) {
        faq_router = std::make_unique<faq::FaqRouter>(config.faq);
        auto init = faq_router->initialize();
        if (init.failed()) {
            Logger::warn("FAQ router using default table: " + init.error);
        }
    } else {
        Logger::info("FAQ router disabled");
    }

    WhisperTranscriber transcriber(config.stt);
    if (!transcriber.is_ready()) {
        Logger::warn("Speech-to-text not loaded; spoken input will report 'Could not transcribe audio'");
    }

    LLMClient responder(config.llm);

    std::vector<std::unique_ptr<tts::ISynthesizer>> engines;
    engines.push_back(std::make_unique<tts::NeuralTTS>(config.tts.neural, config.tts.output_sample_rate));
    engines.push_back(std::make_unique<tts::EspeakTTS>(config.tts.offline, config.tts.output_sample_rate));
    tts::SynthesisChain synthesis(std::move(engines), config.tts.output_sample_rate,
                                  config.tts.cache_entries);
    if (!synthesis.has_available_engine()) {
        Logger::warn("No synthesis engine available; replies will be text-only");
    }

    SessionServices services{config, faq_router.get(), transcriber, responder, synthesis};
    DetectorFactory make_detector = [&config]() {
        return vad::make_speech_detector(config.vad, config.server.sample_rate);
    };

    int result = 0;
    {
        WebSocketServer server(config, services, make_detector);
        auto started = server.start();
        if (started.failed()) {
            Logger::error(started.error);
            result = 1;
        } else {
            g_server = &server;
            std::signal(SIGINT, signal_handler);
            std::signal(SIGTERM, signal_handler);

            result = server.run();

            std::signal(SIGINT, SIG_DFL);
            std::signal(SIGTERM, SIG_DFL);
            g_server = nullptr;
        }
    }

    http::global_cleanup();
    Logger::info("Shutdown complete");
    return result;
}

} // namespace

} // namespace holo_oracle

int main(int argc, char* argv[]) {
    holo_oracle::Logger::initialize(holo_oracle::LogLevel::INFO);

    std::vector<std::string> args(argv + 1, argv + argc);
    int result = 0;

    if (!args.empty() && (args[0] == "--help" || args[0] == "-h")) {
        holo_oracle::print_usage(argv[0]);
    } else if (!args.empty() && args[0] == "--faq-add") {
        if (args.size() < 4) {
            holo_oracle::print_usage(argv[0]);
            result = 2;
        } else {
            result = holo_oracle::run_faq_add(args[1], args[2], args[3],
                                              args.size() > 4 ? args[4] : "custom");
        }
    } else if (!args.empty() && args[0] == "--faq-stats") {
        if (args.size() < 2) {
            holo_oracle::print_usage(argv[0]);
            result = 2;
        } else {
            result = holo_oracle::run_faq_stats(args[1]);
        }
    } else {
        std::string config_path;
        std::string log_level;
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--log-level" && i + 1 < args.size()) {
                log_level = args[++i];
            } else if (config_path.empty() && args[i].rfind("--", 0) != 0) {
                config_path = args[i];
            } else {
                holo_oracle::Logger::warn("Ignoring argument: " + args[i]);
            }
        }
        if (config_path.empty()) {
            config_path = holo_oracle::default_config_path();
        }
        result = holo_oracle::run_server(config_path, log_level);
    }

    holo_oracle::Logger::shutdown();
    return result;
}
