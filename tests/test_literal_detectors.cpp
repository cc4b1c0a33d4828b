#include <catch2/catch_test_macros.hpp>
#include "context/literal_detectors.hpp"

using namespace biip;

template<typename Detector>
static std::vector<Span> spans_of(const Detector& detector, std::string_view text) {
    std::vector<Match> out;
    detector.find(text, 0, out);
    std::vector<Span> spans;
    for (const auto& m : out) spans.push_back(m.span);
    return spans;
}

TEST_CASE("SecretLiteralDetector: exact substrings", "[literals]") {

    SECTION("Every occurrence found") {
        const SecretLiteralDetector d({{"hunter2", SecretClass::KEYWORD, "***"}});
        CHECK(spans_of(d, "hunter2 and hunter2") ==
              std::vector<Span>{{0, 7}, {12, 19}});
    }

    SECTION("Match is case-sensitive and boundary-free") {
        const SecretLiteralDetector d({{"abc", SecretClass::KEYWORD, "***"}});
        CHECK(spans_of(d, "ABC xabcx") == std::vector<Span>{{5, 8}});
    }

    SECTION("Longer literal claims its region before a contained shorter one") {
        // Ordered longest first, as build_context produces them
        const SecretLiteralDetector d({
            {"supersecret", SecretClass::KEYWORD, "***"},
            {"secret", SecretClass::KEYWORD, "***"},
        });
        CHECK(spans_of(d, "supersecret") == std::vector<Span>{{0, 11}});
        CHECK(spans_of(d, "secret supersecret") == std::vector<Span>{{7, 18}, {0, 6}});
    }

    SECTION("Category follows the literal's source") {
        const SecretLiteralDetector d({
            {"aaa", SecretClass::KEYWORD, "k"},
            {"bbb", SecretClass::CUSTOM, "c"},
        });
        std::vector<Match> out;
        d.find("aaa bbb", 0, out);
        REQUIRE(out.size() == 2);
        CHECK(out[0].category == Category::ENV_SECRET);
        CHECK(out[0].priority == priority::kSecretLiteral);
        CHECK(out[1].category == Category::CUSTOM_PATTERN);
        CHECK(out[1].token == "c");
    }
}

TEST_CASE("UsernameDetector: plain substring", "[literals]") {

    SECTION("Every occurrence, no word boundary required") {
        const UsernameDetector d("alice", "user");
        CHECK(spans_of(d, "Hi alice, alice_bot") == std::vector<Span>{{3, 8}, {10, 15}});
    }

    SECTION("Case-sensitive") {
        const UsernameDetector d("alice", "user");
        CHECK(spans_of(d, "Alice").empty());
    }

    SECTION("Name contained in its own token is skipped") {
        const UsernameDetector d("use", "user");
        CHECK(spans_of(d, "use the user").empty());
    }
}

TEST_CASE("HomeDirDetector: path boundary", "[literals]") {
    const HomeDirDetector d("/home/alice", "~");

    SECTION("Followed by separator, punctuation or end of text") {
        CHECK(spans_of(d, "/home/alice/proj") == std::vector<Span>{{0, 11}});
        CHECK(spans_of(d, "cd /home/alice") == std::vector<Span>{{3, 14}});
        CHECK(spans_of(d, "'/home/alice'") == std::vector<Span>{{1, 12}});
    }

    SECTION("Sibling directories sharing the prefix are left alone") {
        CHECK(spans_of(d, "/home/alice2/x").empty());
        CHECK(spans_of(d, "/home/alice.bak").empty());
        CHECK(spans_of(d, "/home/alice-old /home/alice") == std::vector<Span>{{16, 27}});
    }

    SECTION("Same path nested under another directory is left alone") {
        CHECK(spans_of(d, "/mnt/backup/home/alice/x").empty());
        CHECK(spans_of(d, "/mnt//home/alice").empty());
        CHECK(spans_of(d, "rsync x:/home/alice/ .") == std::vector<Span>{{8, 19}});
    }
}
