#pragma once

/**
 * @file fallback_responses.h
 * @brief Keyword-matched persona lines used when generation is unavailable
 */

#include <string>
#include <cstddef>

namespace holo_oracle {

/**
 * @brief Pick a fallback reply for a user prompt
 *
 * Topics are checked in order (greeting, life/meaning, death, war, writing)
 * against whole words of the prompt. When no topic matches, one of the
 * generic lines is returned, chosen by rotation modulo the line count.
 */
std::string fallback_response(const std::string& prompt, size_t rotation);

/// Number of generic (no topic) lines in the rotation
size_t fallback_generic_count();

} // namespace holo_oracle
