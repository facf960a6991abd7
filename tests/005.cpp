#include "utils.hpp"

#include "voxgate/markup.hpp"

namespace voxgate::test {
    using namespace std::string_view_literals;

    namespace detail {
        inline constexpr auto session_url = "http://gateway:7501/?"sv;
        inline constexpr auto origin_url = "http://www.example.com/cgi-bin/guess.cgi"sv;
    }  // namespace detail

    TEST_CASE("005: audio fragments", "[005][markup]") {
        CHECK(markup::render_audio(speech("Hi & bye"), detail::origin_url) == "<audio>Hi &amp; bye</audio>");
        CHECK(markup::render_audio(wav_file("beep.wav", "beep"), detail::origin_url) ==
              R"(<audio src="http://www.example.com/cgi-bin/beep.wav">beep</audio>)");
        CHECK(markup::render_audio(audio_options{.data = "abc"}, detail::origin_url) ==
              R"(<audio data="abc"></audio>)");
        CHECK(markup::render_pause(250) == "<pause>250</pause>");
    }

    TEST_CASE("005: option validation", "[005][markup]") {
        CHECK_THROWS_AS(validate(audio_options{}), std::invalid_argument);
        CHECK_THROWS_AS(validate(audio_options{.wav = "a.wav", .data = "xyz"}), std::invalid_argument);
        CHECK_NOTHROW(validate(audio_options{.wav = "a.wav", .tts = "fallback"}));

        CHECK_THROWS_AS(validate(listen_options{}), std::invalid_argument);
        CHECK_THROWS_AS(validate(listen_options{.grammar = "YES_NO", .grammar_src = "yn.gram"}), std::invalid_argument);
        CHECK_THROWS_AS(validate(listen_options{.grammar = "YES_NO", .timeout_s = 0}), std::invalid_argument);
        CHECK_NOTHROW(validate(listen_options{.grammar_src = "yn.gram"}));

        // empty strings count as unset
        CHECK_THROWS_AS(validate(listen_options{.grammar = ""}), std::invalid_argument);
        CHECK_THROWS_AS(validate(listen_options{.grammar = "", .grammar_src = ""}), std::invalid_argument);
        CHECK_NOTHROW(validate(listen_options{.grammar = "", .grammar_src = "yn.gram"}));
        CHECK_NOTHROW(validate(listen_options{.grammar = "YES_NO", .grammar_src = ""}));

        CHECK_THROWS_AS(validate(record_options{}), std::invalid_argument);
        CHECK_NOTHROW(validate(record_options{.grammar = "KEEP_OR_RETRY"}));

        CHECK_THROWS_AS(validate_pause(0), std::invalid_argument);
        CHECK_NOTHROW(validate_pause(500));
    }

    TEST_CASE("005: redirect document", "[005][markup]") {
        auto doc = markup::render_redirect("http://www.example.com/guess.cgi?proxyfor=7501&"sv);
        CHECK(doc.find(R"(<goto next="http://www.example.com/guess.cgi?proxyfor=7501&amp;x=y"/>)") !=
              std::string::npos);
        CHECK(detail::count_occurrences(doc, "<goto"sv) == 1U);
    }

    TEST_CASE("005: listen document", "[005][markup]") {
        std::vector<std::string> fragments{"<audio>Pick a number</audio>"};

        SECTION("inline grammar with default handlers") {
            auto doc = markup::render_listen(
                    fragments, listen_options{.grammar = "NATURAL_NUMBER_THRU_99"}, detail::session_url, detail::origin_url);
            CHECK(doc.find("<prompt><audio>Pick a number</audio></prompt>") != std::string::npos);
            CHECK(doc.find("<grammar><![CDATA[NATURAL_NUMBER_THRU_99]]></grammar>") != std::string::npos);
            CHECK(doc.find(R"(<field name="session.vxmllib.result">)") != std::string::npos);
            CHECK(doc.find(R"(<goto next="http://gateway:7501/?result={session.vxmllib.result}"/>)") !=
                  std::string::npos);
            CHECK(doc.find("<reprompt/>") != std::string::npos);
        }

        SECTION("grammar reference and reply values for misses") {
            auto doc = markup::render_listen(
                    {},
                    listen_options{
                            .grammar_src = "numbers.gram",
                            .noinput = "no input",
                            .nomatch = "huh",
                            .timeout_s = 5,
                            .bargein = false},
                    detail::session_url,
                    detail::origin_url);
            CHECK(doc.find(R"(<grammar src="http://www.example.com/cgi-bin/numbers.gram"/>)") != std::string::npos);
            CHECK(doc.find(R"(<goto next="http://gateway:7501/?result=no%20input"/>)") != std::string::npos);
            CHECK(doc.find(R"(<goto next="http://gateway:7501/?result=huh"/>)") != std::string::npos);
            CHECK(doc.find(R"( timeout="5")") != std::string::npos);
            CHECK(doc.find(R"( bargein="false")") != std::string::npos);
            CHECK(doc.find("<prompt>") == std::string::npos);
        }

        SECTION("proxied session URL is escaped") {
            auto doc = markup::render_listen(
                    {},
                    listen_options{.grammar = "YES_NO"},
                    "http://www.example.com/guess.cgi?proxyfor=7501&"sv,
                    detail::origin_url);
            CHECK(doc.find("proxyfor=7501&amp;result={session.vxmllib.result}") != std::string::npos);
        }

        SECTION("empty grammar reference falls back to the inline grammar") {
            auto doc = markup::render_listen(
                    {}, listen_options{.grammar = "YES_NO", .grammar_src = ""}, detail::session_url, detail::origin_url);
            CHECK(doc.find("<grammar><![CDATA[YES_NO]]></grammar>") != std::string::npos);
            CHECK(doc.find("<grammar src=") == std::string::npos);
        }
    }

    TEST_CASE("005: record document", "[005][markup]") {
        record_options opts{.grammar = "KEEP_OR_RETRY", .null_audio_word = "retry", .replay_word = "replay"};
        opts.max_time_s = 45;
        auto doc = markup::render_record({}, opts, detail::session_url, detail::origin_url);

        CHECK(doc.find(R"(<record name="session.vxmllib.recordvalue" dtmfterm="true" finalsilence="2" maxtime="45">)") !=
              std::string::npos);
        CHECK(doc.find("<![CDATA[KEEP_OR_RETRY]]>") != std::string::npos);
        CHECK(doc.find(R"(method="post" namelist="session.vxmllib.recordvalue")") != std::string::npos);
        CHECK(doc.find(R"(<goto next="http://gateway:7501/?result=0&amp;"/>)") != std::string::npos);
        CHECK(doc.find(R"(<goto next="http://gateway:7501/?result=retry&amp;"/>)") != std::string::npos);
        CHECK(doc.find("beep_end.wav") != std::string::npos);
        CHECK(doc.find("I'm sorry, I didn't get that.") != std::string::npos);
    }

    TEST_CASE("005: final documents", "[005][markup]") {
        std::vector<std::string> fragments{"<audio>Goodbye</audio>"};

        auto hangup_doc = markup::render_disconnect(fragments);
        CHECK(hangup_doc.find("<audio>Goodbye</audio>") != std::string::npos);
        CHECK(hangup_doc.find("<disconnect/>") != std::string::npos);
        CHECK(hangup_doc.find("<field") == std::string::npos);

        auto goto_doc = markup::render_goto(fragments, "http://www.example.com/menu.vxml?a=1&b=2"sv);
        CHECK(goto_doc.find(R"(<goto next="http://www.example.com/menu.vxml?a=1&amp;b=2"/>)") != std::string::npos);
        CHECK(goto_doc.find("<field") == std::string::npos);
    }

    TEST_CASE("005: spoken error document", "[005][markup]") {
        CHECK(markup::render_spoken_error("Can't connect to localhost:7501 (Connection refused)"sv) ==
              "<vxml><form><block><audio>Can't connect to localhost:7501 (Connection refused)</audio></block></form>"
              "</vxml>\n");
    }

}  // namespace voxgate::test
