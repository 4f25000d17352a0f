#include "tts/voice_selection.h"
#include "utils.h"
#include <algorithm>
#include <sstream>

namespace holo_oracle {
namespace tts {

namespace {

bool contains_any(const std::string& haystack, const std::vector<std::string>& needles) {
    for (const auto& needle : needles) {
        if (haystack.find(needle) != std::string::npos) return true;
    }
    return false;
}

bool has_male_marker(const std::string& name_lower) {
    // "female" and "woman" contain the male markers as substrings
    std::string stripped = name_lower;
    for (const char* exclude : {"female", "woman"}) {
        size_t pos;
        while ((pos = stripped.find(exclude)) != std::string::npos) {
            stripped.erase(pos, std::string(exclude).size());
        }
    }
    return contains_any(stripped, {"male", "man", "masculine"});
}

} // namespace

Platform current_platform() {
#if defined(_WIN32)
    return Platform::Windows;
#elif defined(__APPLE__)
    return Platform::MacOS;
#else
    return Platform::Linux;
#endif
}

int score_voice(const VoiceInfo& voice, Platform platform) {
    std::string name = utils::normalize_copy(voice.name);
    std::string id = utils::normalize_copy(voice.id);
    int score = 0;

    if (has_male_marker(name) || voice.gender == "M") {
        score += 3;
    }

    if (contains_any(name, {"david", "mark", "alex", "tom", "paul", "william", "richard"})) {
        score += 2;
    }

    if (contains_any(id, {"sapi", "microsoft"})) {
        score += 1;
    }

    if (contains_any(name, {"robotic", "synthetic", "computer"})) {
        score -= 2;
    }

    switch (platform) {
        case Platform::Windows:
            if (contains_any(name, {"david", "mark"})) score += 3;
            break;
        case Platform::MacOS:
            if (contains_any(name, {"alex", "tom", "daniel"})) score += 3;
            break;
        case Platform::Linux:
            break;
    }

    return score;
}

std::optional<size_t> select_voice(const std::vector<VoiceInfo>& voices, Platform platform) {
    if (voices.empty()) {
        return std::nullopt;
    }

    size_t best = 0;
    int best_score = score_voice(voices[0], platform);
    for (size_t i = 1; i < voices.size(); ++i) {
        int s = score_voice(voices[i], platform);
        if (s > best_score) {
            best_score = s;
            best = i;
        }
    }
    return best;
}

std::vector<VoiceInfo> parse_espeak_voices(const std::string& listing) {
    std::vector<VoiceInfo> voices;
    std::istringstream stream(listing);
    std::string line;

    while (std::getline(stream, line)) {
        std::istringstream fields(line);
        std::vector<std::string> cols;
        std::string col;
        while (fields >> col) {
            cols.push_back(col);
        }
        if (cols.size() < 5 || cols[0] == "Pty") {
            continue;
        }

        VoiceInfo voice;
        voice.id = cols[1];
        voice.name = cols[3];
        std::replace(voice.name.begin(), voice.name.end(), '_', ' ');
        voice.languages.push_back(cols[1]);

        // Age/Gender is "--/M", "--/F" or "--/-"
        auto slash = cols[2].find('/');
        if (slash != std::string::npos && slash + 1 < cols[2].size()) {
            std::string g = cols[2].substr(slash + 1);
            if (g == "M" || g == "F") voice.gender = g;
        }

        // Remaining columns are "(lang priority)" pairs
        for (size_t i = 5; i < cols.size(); ++i) {
            std::string lang = cols[i];
            if (!lang.empty() && lang.front() == '(') {
                lang.erase(0, 1);
                if (!lang.empty()) voice.languages.push_back(lang);
            }
        }

        voices.push_back(std::move(voice));
    }

    return voices;
}

} // namespace tts
} // namespace holo_oracle
