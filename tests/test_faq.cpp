/**
 * Canned-response table: extraction, scoring, routing and persistence.
 * Run from build dir: ./test_faq
 */

#include "test_common.h"
#include "faq/faq_extractor.h"
#include "faq/faq_router.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using namespace holo_oracle;
namespace fs = std::filesystem;

namespace {

void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

FAQConfig temp_config(const std::string& dir) {
    FAQConfig c;
    c.database_path = dir + "/data/faq_database.json";
    c.similarity_threshold = 0.7f;
    return c;
}

} // namespace

int main() {
    // --- Sentence splitting and contexts ---
    {
        auto sentences = faq::split_sentences(
            "Short. This sentence is long enough to keep! Another one that is long enough?  ");
        ASSERT(sentences.size() == 2);
        if (sentences.size() == 2) {
            ASSERT(sentences[0] == "This sentence is long enough to keep");
            ASSERT(sentences[1] == "Another one that is long enough");
        }

        std::vector<std::string> s{"So it goes, said the soldier", "Nothing here", "and so IT GOES again"};
        auto ctx = faq::find_phrase_contexts(s, "So it goes", 1);
        ASSERT(ctx.size() == 1);
        ASSERT(faq::find_phrase_contexts(s, "so it goes").size() == 2);
    }

    // --- Transcript validation and BOM handling ---
    {
        ASSERT(!faq::validate_transcript("short"));
        ASSERT(!faq::validate_transcript("1234567890 1234567890 ab"));
        ASSERT(faq::validate_transcript("All this happened, more or less."));

        std::string dir = test::make_temp_dir("faq_bom");
        write_file(dir + "/t.txt", "\xEF\xBB\xBF  So it goes.\n");
        auto t = faq::read_transcript(dir + "/t.txt");
        ASSERT(t.ok());
        ASSERT(t.value_or("") == "So it goes.");
        ASSERT(faq::read_transcript(dir + "/missing.txt").failed());
        fs::remove_all(dir);
    }

    // --- Trigger generation ---
    {
        auto triggers = faq::generate_question_triggers("Everything was beautiful because nothing hurt");
        ASSERT(triggers.size() == 5);
        if (triggers.size() == 5) {
            ASSERT(triggers[0] == "what is everything");
            ASSERT(triggers[3] == "everything");
            ASSERT(triggers[4] == "what is beautiful");
        }
        ASSERT(faq::generate_question_triggers("It is so").empty());

        ASSERT(faq::philosophical_keyword_count("Life and death and time") == 3);
        ASSERT(faq::philosophical_keyword_count("Nothing to see") == 0);
    }

    // --- Connectives are whole words ---
    {
        auto none = faq::extract_explanations({"The soda was cold and flat every single day"});
        ASSERT(none.empty());
        auto one = faq::extract_explanations({"We laughed because nothing else seemed possible"});
        ASSERT(one.size() == 1);
        if (!one.empty()) {
            ASSERT(one[0].type == "explanation");
            ASSERT(one[0].source == "transcript");
        }
    }

    // --- One character entry per sentence ---
    {
        auto entries = faq::extract_character_references({"Billy Pilgrim met Kilgore Trout at the fair"});
        ASSERT(entries.size() == 1);
        if (!entries.empty()) {
            ASSERT(entries[0].trigger_phrases[0] == "billy pilgrim");
            ASSERT(entries[0].trigger_phrases[1] == "who is billy pilgrim");
        }
    }

    // --- Dedupe keeps first, ranks by boost ---
    {
        faq::FaqEntry a;
        a.type = "low";
        a.response = "same answer";
        a.confidence_boost = 0.1f;
        faq::FaqEntry b = a;
        b.type = "duplicate";
        b.confidence_boost = 0.9f;
        faq::FaqEntry c;
        c.type = "high";
        c.response = "other answer";
        c.confidence_boost = 0.5f;

        auto ranked = faq::dedupe_and_rank({a, b, c});
        ASSERT(ranked.size() == 2);
        if (ranked.size() == 2) {
            ASSERT(ranked[0].type == "high");
            ASSERT(ranked[1].type == "low");
        }
        ASSERT(faq::dedupe_and_rank({a, c}, 1).size() == 1);
    }

    // --- Scoring ---
    {
        faq::FaqEntry e;
        e.trigger_phrases = {"so it goes", "death"};
        e.trigger_words = faq::build_word_counts(e.trigger_phrases);
        e.confidence_boost = 0.0f;
        ASSERT_NEAR(faq::score_entry({"so", "it", "goes"}, e), 1.0, 1e-6);
        ASSERT_NEAR(faq::score_entry({"death", "and", "taxes", "today"}, e), 0.25, 1e-6);
        ASSERT(faq::score_entry({}, e) == 0.0f);
        e.confidence_boost = 0.9f;
        ASSERT(faq::score_entry({"death", "and"}, e) == 1.0f);
    }

    // --- Router over the default table ---
    {
        std::string dir = test::make_temp_dir("faq_default");
        FAQConfig config = temp_config(dir);
        faq::FaqRouter router(config);
        ASSERT(router.initialize().ok());
        ASSERT(router.size() == 4);
        ASSERT(fs::exists(config.database_path));

        auto quote = router.check("So it goes.");
        ASSERT(quote.has_value());
        if (quote) {
            ASSERT(quote->type == "famous_quote");
            ASSERT(quote->text == "So it goes. That is what I say about death and dying.");
            ASSERT_NEAR(quote->confidence, 1.0, 1e-6);
        }

        auto hello = router.check("Hello!");
        ASSERT(hello.has_value() && hello->type == "greeting");

        auto meaning = router.check("the meaning of life");
        ASSERT(meaning.has_value() && meaning->type == "philosophical");

        ASSERT(!router.check("what is the weather like today").has_value());
        ASSERT(!router.check("").has_value());
        ASSERT(!router.check("   ").has_value());

        faq::FaqStats stats = router.stats();
        ASSERT(stats.total_entries == 4);
        ASSERT(stats.sources["default"] == 4);
        ASSERT(stats.types["greeting"] == 1);
        ASSERT_NEAR(stats.similarity_threshold, 0.7, 1e-6);

        // Manual entries persist and survive a reload
        ASSERT(router.add_entry({}, "nothing").failed());
        ASSERT(router.add_entry({"  "}, "nothing").failed());
        ASSERT(router.add_entry({"who are you"}, "  ").failed());
        ASSERT(router.size() == 4);

        auto added = router.add_entry({"who are you", ""}, "An old man who was once a soldier.", "identity");
        ASSERT(added.ok());
        ASSERT(added.value_or(-1) == 4);
        auto who = router.check("Who are you?");
        ASSERT(who.has_value());
        if (who) {
            ASSERT(who->type == "identity");
            ASSERT(who->entry_id == 4);
        }

        faq::FaqRouter reloaded(config);
        ASSERT(reloaded.initialize().ok());
        ASSERT(reloaded.size() == 5);
        auto entries = reloaded.entries();
        if (entries.size() == 5) {
            ASSERT(entries[4].source == "manual");
            ASSERT(entries[4].trigger_phrases.size() == 1);
            ASSERT(!entries[4].created_at.empty());
            ASSERT(!entries[4].trigger_words.empty());
        }
        ASSERT(reloaded.stats().sources["manual"] == 1);
        fs::remove_all(dir);
    }

    // --- Short-query guard ---
    {
        FAQConfig config;
        config.database_path.clear();
        config.min_query_words = 2;
        faq::FaqRouter router(config);
        ASSERT(router.initialize().ok());
        ASSERT(!router.check("hello").has_value());
        ASSERT(router.check("hello there").has_value());
    }

    // --- Ties keep the earlier entry ---
    {
        FAQConfig config;
        config.database_path.clear();
        faq::FaqRouter router(config);
        faq::FaqEntry first;
        first.type = "first";
        first.trigger_phrases = {"apple"};
        first.response = "one";
        faq::FaqEntry second = first;
        second.type = "second";
        second.response = "two";
        router.replace_entries({first, second});

        auto m = router.check("apple");
        ASSERT(m.has_value());
        if (m) {
            ASSERT(m->type == "first");
            ASSERT(m->entry_id == 0);
        }
    }

    // --- Built from a transcript ---
    {
        std::string dir = test::make_temp_dir("faq_transcript");
        FAQConfig config = temp_config(dir);
        config.transcript_path = dir + "/transcript.txt";
        write_file(config.transcript_path,
                   "So it goes, said the old soldier about the dead. "
                   "He knew that life and death were the same thing in the end. "
                   "Billy Pilgrim has come unstuck in time, because nobody told him otherwise.");

        faq::FaqRouter router(config);
        ASSERT(router.initialize().ok());
        auto entries = router.entries();
        ASSERT(!entries.empty());
        if (!entries.empty()) {
            ASSERT(entries[0].type == "famous_quote");
            for (size_t i = 0; i < entries.size(); ++i) {
                ASSERT(entries[i].id == static_cast<int>(i));
                ASSERT(entries[i].source == "transcript");
            }
        }

        auto m = router.check("so it goes");
        ASSERT(m.has_value());
        if (m) {
            ASSERT(m->text == "So it goes, said the old soldier about the dead");
        }
        fs::remove_all(dir);
    }

    // --- A corrupt table file is rebuilt ---
    {
        std::string dir = test::make_temp_dir("faq_corrupt");
        FAQConfig config = temp_config(dir);
        fs::create_directories(dir + "/data");
        write_file(config.database_path, "{not json");

        faq::FaqRouter router(config);
        ASSERT(router.initialize().ok());
        ASSERT(router.size() == 4);

        faq::FaqRouter reloaded(config);
        ASSERT(reloaded.initialize().ok());
        ASSERT(reloaded.size() == 4);
        ASSERT(fs::exists(config.database_path + ".bad"));
        ASSERT(read_file(config.database_path + ".bad") == "{not json");
        fs::remove_all(dir);
    }

    // --- One malformed entry is skipped, the rest of the table survives ---
    {
        std::string dir = test::make_temp_dir("faq_bad_entry");
        FAQConfig config = temp_config(dir);

        {
            faq::FaqRouter router(config);
            ASSERT(router.initialize().ok());
            ASSERT(router.add_entry({"who are you"}, "An old soldier who came unstuck in time.").ok());
            ASSERT(router.add_entry({"where do you live"}, "Cape Cod, mostly.").ok());
            ASSERT(router.size() == 6);
        }

        nlohmann::json table = nlohmann::json::parse(read_file(config.database_path));
        ASSERT(table["entries"].size() == 6);
        auto& broken = table["entries"][5];
        broken["answer"] = broken["response"];
        broken.erase("response");
        write_file(config.database_path, table.dump(2));

        faq::FaqRouter reloaded(config);
        ASSERT(reloaded.initialize().ok());
        ASSERT(reloaded.size() == 5);
        ASSERT(reloaded.stats().sources["manual"] == 1);
        ASSERT(reloaded.check("who are you").has_value());
        ASSERT(read_file(config.database_path).find("An old soldier") != std::string::npos);
        ASSERT(read_file(config.database_path).find("Cape Cod") != std::string::npos);
        ASSERT(!fs::exists(config.database_path + ".bad"));
        fs::remove_all(dir);
    }

    return report("FAQ");
}
