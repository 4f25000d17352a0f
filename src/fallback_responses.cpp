#include "fallback_responses.h"
#include "utils.h"
#include <algorithm>
#include <vector>

namespace holo_oracle {

namespace {

struct TopicLine {
    std::vector<std::string> keywords;
    const char* response;
};

const std::vector<TopicLine>& topic_lines() {
    static const std::vector<TopicLine> lines = {
        {{"hello", "hi", "hey"},
         "Hi ho. Listen: It's good to have someone to talk to. What brings you here today?"},
        {{"life", "meaning", "purpose"},
         "Listen: We are here on Earth to fart around, and don't let anybody tell you different. "
         "I tell you, the meaning of life is to be kind to one another."},
        {{"death", "die", "died"},
         "So it goes. That is what I say about death and dying. We all come unstuck in time eventually."},
        {{"war", "dresden", "vietnam"},
         "I tell you, war is nothing but a children's crusade. I was there in Dresden when it happened. "
         "So it goes."},
        {{"write", "writing", "book"},
         "Listen: The first rule of writing is to pity the reader. Make your characters want something "
         "right away, even if it's just a glass of water."},
    };
    return lines;
}

const char* const GENERIC_LINES[] = {
    "Hi ho. What an interesting thing to say. Care to elaborate?",
    "Listen: I tell you, that's something worth thinking about.",
    "My God, my God - you've given me something to ponder. So it goes.",
    "That reminds me of something Uncle Alex used to say about being present in good moments.",
};

} // namespace

std::string fallback_response(const std::string& prompt, size_t rotation) {
    auto words = utils::split_words(prompt);

    for (const auto& topic : topic_lines()) {
        for (const auto& keyword : topic.keywords) {
            if (std::find(words.begin(), words.end(), keyword) != words.end()) {
                return topic.response;
            }
        }
    }

    return GENERIC_LINES[rotation % fallback_generic_count()];
}

size_t fallback_generic_count() {
    return sizeof(GENERIC_LINES) / sizeof(GENERIC_LINES[0]);
}

} // namespace holo_oracle
