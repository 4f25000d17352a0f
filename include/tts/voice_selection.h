#pragma once

/**
 * @file voice_selection.h
 * @brief Offline voice enumeration and heuristic scoring
 *
 * Pure functions so the scoring rules can be tested without a synthesizer
 * installed.
 */

#include <string>
#include <vector>
#include <optional>

namespace holo_oracle {
namespace tts {

struct VoiceInfo {
    std::string id;          ///< Value passed to the synthesizer (-v)
    std::string name;        ///< Human-readable name
    std::vector<std::string> languages;
    std::string gender;      ///< "M", "F" or empty when unknown
};

enum class Platform {
    Linux,
    MacOS,
    Windows
};

Platform current_platform();

/**
 * @brief Score one voice for the persona
 *
 * +3 male marker in the name (or gender "M"), +2 known mature first name,
 * +1 SAPI/Microsoft id, -2 robotic-sounding name, +3 platform preferred name.
 */
int score_voice(const VoiceInfo& voice, Platform platform);

/**
 * @brief Pick the highest-scoring voice; ties go to the earliest voice
 * @return Index into voices, or nullopt for an empty list (use the system default)
 */
std::optional<size_t> select_voice(const std::vector<VoiceInfo>& voices, Platform platform);

/**
 * @brief Parse the table printed by `espeak-ng --voices[=lang]`
 *
 * Columns: Pty Language Age/Gender VoiceName File Other-languages. Lines
 * that do not have at least five columns are skipped.
 */
std::vector<VoiceInfo> parse_espeak_voices(const std::string& listing);

} // namespace tts
} // namespace holo_oracle
