#include "voxgate/markup.hpp"

#include "voxgate/format.hpp"
#include "voxgate/http.hpp"

#include <stdexcept>

using namespace voxgate::literals;

namespace voxgate {

    namespace detail {

        // An empty string counts as unset.
        static bool present(const std::optional<std::string>& value) {
            return value && !value->empty();
        }

    }  // namespace detail

    void validate(const audio_options& opts) {
        if (!opts.wav && !opts.tts && !opts.data) {
            throw std::invalid_argument("audio requires at least one of 'wav', 'tts' or 'data'");
        }
        if (opts.wav && opts.data) {
            throw std::invalid_argument("audio cannot combine 'wav' and 'data'");
        }
    }

    void validate(const listen_options& opts) {
        if (detail::present(opts.grammar) == detail::present(opts.grammar_src)) {
            throw std::invalid_argument("listen requires exactly one of 'grammar' and 'grammar_src'");
        }
        if (opts.timeout_s && *opts.timeout_s <= 0) {
            throw std::invalid_argument("listen timeout must be positive");
        }
    }

    void validate(const record_options& opts) {
        if (opts.grammar.empty()) {
            throw std::invalid_argument("record requires a 'grammar'");
        }
        if (opts.max_time_s <= 0 || opts.final_silence_s <= 0) {
            throw std::invalid_argument("record max_time and final_silence must be positive");
        }
        validate(opts.done_recording_audio);
        for (const auto* list :
             {&opts.replay_pre_audio, &opts.replay_post_audio, &opts.help_audio, &opts.nomatch, &opts.noinput}) {
            for (const auto& audio : *list) {
                validate(audio);
            }
        }
    }

    void validate_pause(int milliseconds) {
        if (milliseconds <= 0) {
            throw std::invalid_argument("pause requires a positive number of milliseconds");
        }
    }

}  // namespace voxgate

namespace voxgate::markup {

    using namespace std::string_view_literals;

    namespace detail {

        static constexpr auto tellme_header = R"(<?xml version="1.0"?>
<!DOCTYPE vxml PUBLIC "-//Tellme Networks//Voice Markup Language 1.0//EN"
"http://resources.tellme.com/toolbox/vxml-tellme.dtd">

<vxml application="http://resources.tellme.com/lib/universals.vxml">
)"sv;

        static std::string prompt_block(const std::vector<std::string>& fragments) {
            if (fragments.empty()) {
                return {};
            }
            return "<prompt>{}</prompt>"_format(utils::join_with_separator(fragments, "\n"sv));
        }

        static std::string render_audio_list(const std::vector<audio_options>& list, std::string_view origin_url) {
            std::vector<std::string> rendered{};
            rendered.reserve(list.size());
            for (const auto& audio : list) {
                rendered.push_back(render_audio(audio, origin_url));
            }
            return utils::join_with_separator(rendered, "\n"sv);
        }

        // each entry becomes its own <tag> handler that speaks and reprompts
        static std::string render_handler_list(
                std::string_view tag, const std::vector<audio_options>& list, std::string_view origin_url) {
            std::string out{};
            for (const auto& audio : list) {
                out += "<{0}>{1}<reprompt/></{0}>"_format(tag, render_audio(audio, origin_url));
            }
            return out;
        }

        static std::string result_goto(std::string_view escaped_url, std::string_view value) {
            return R"(<goto next="{}result={}"/>)"_format(escaped_url, http::escape_markup(http::url_encode(value)));
        }

    }  // namespace detail

    std::string render_audio(const audio_options& opts, std::string_view origin_url) {
        std::string out{};
        if (opts.wav) {
            out = R"(<audio src="{}">)"_format(http::escape_markup(http::make_absolute_url(origin_url, *opts.wav)));
        }
        else if (opts.data) {
            out = R"(<audio data="{}">)"_format(http::escape_markup(*opts.data));
        }
        else {
            out = "<audio>";
        }
        out += http::escape_markup(opts.tts.value_or(std::string{}));
        out += "</audio>";
        return out;
    }

    std::string render_pause(int milliseconds) {
        return "<pause>{}</pause>"_format(milliseconds);
    }

    std::string render_redirect(std::string_view session_url) {
        auto url = http::escape_markup("{}x=y"_format(session_url));
        return R"({}
<form><block>
  <goto next="{}"/>
</block></form>

</vxml>
)"_format(detail::tellme_header, url);
    }

    std::string render_listen(
            const std::vector<std::string>& fragments,
            const listen_options& opts,
            std::string_view session_url,
            std::string_view origin_url) {
        auto myurl = http::escape_markup(session_url);

        std::string grammar{};
        if (detail::present(opts.grammar_src)) {
            grammar = R"(<grammar src="{}"/>)"_format(
                    http::escape_markup(http::make_absolute_url(origin_url, *opts.grammar_src)));
        }
        else {
            grammar = "<grammar><![CDATA[{}]]></grammar>"_format(opts.grammar.value_or(std::string{}));
        }

        std::string noinput{"\n  <audio>Sorry, I did not hear anything.</audio>\n  <reprompt/>\n"};
        if (opts.noinput) {
            noinput = detail::result_goto(myurl, *opts.noinput);
        }

        std::string nomatch{"<audio>What was that again?</audio>\n<reprompt/>\n"};
        if (opts.nomatch) {
            nomatch = detail::result_goto(myurl, *opts.nomatch);
        }

        std::string attributes{};
        if (opts.timeout_s) {
            attributes += R"( timeout="{}")"_format(*opts.timeout_s);
        }
        if (!opts.bargein) {
            attributes += R"( bargein="false")";
        }

        return R"({0}
<form id="top">
<field name="{1}"{2}>
{3}
{4}
<noinput>
{5}
</noinput>
<default>
{6}
</default>
<filled>
  <goto next="{7}result={{{1}}}"/>
</filled>
</field>
</form>
</vxml>
)"_format(detail::tellme_header,
          result_field,
          attributes,
          detail::prompt_block(fragments),
          grammar,
          noinput,
          nomatch,
          myurl);
    }

    std::string render_record(
            const std::vector<std::string>& fragments,
            const record_options& opts,
            std::string_view session_url,
            std::string_view origin_url) {
        auto myurl = http::escape_markup(session_url);
        auto null_audio_goto = R"(<goto next="{}result={}&amp;"/>)"_format(
                myurl, http::escape_markup(http::url_encode(opts.null_audio_word)));

        return R"({0}
    <form id="RecordTest">
        <record name="{1}" dtmfterm="true" finalsilence="{2}" maxtime="{3}">
            {4}
            <filled>
                {5}
            </filled>
            <noinput>
                <goto next="#Abort"/>
            </noinput>
            <default>
                <goto next="#Abort"/>
            </default>
        </record>
        <field name="{6}">
            <prompt>
            </prompt>
            <grammar><![CDATA[{7}]]></grammar>
            {8}
            {9}
            <filled>
                <result name="{10}">
                    {11}
                    <audio data="{{{1}}}"/>
                    {12}
                    <reprompt/>
                </result>
                <result name="{13}">
                    {14}
                </result>
                <result name="{15}">
                    {16}
                    <reprompt/>
                </result>
                <submit next="{17}result={{{6}}}&amp;" method="post" namelist="{1}" />
            </filled>
            <default>
                <reprompt/>
            </default>
        </field>
    </form>
    <form id="Abort">
        <block>
            <goto next="{17}result=0&amp;"/>
        </block>
    </form>
</vxml>
)"_format(detail::tellme_header,
          record_field,
          opts.final_silence_s,
          opts.max_time_s,
          detail::prompt_block(fragments),
          render_audio(opts.done_recording_audio, origin_url),
          result_field,
          opts.grammar,
          detail::render_handler_list("nomatch"sv, opts.nomatch, origin_url),
          detail::render_handler_list("noinput"sv, opts.noinput, origin_url),
          http::escape_markup(opts.replay_word),
          detail::render_audio_list(opts.replay_pre_audio, origin_url),
          detail::render_audio_list(opts.replay_post_audio, origin_url),
          http::escape_markup(opts.null_audio_word),
          null_audio_goto,
          http::escape_markup(opts.help_word),
          detail::render_audio_list(opts.help_audio, origin_url),
          myurl);
    }

    std::string render_goto(const std::vector<std::string>& fragments, std::string_view url) {
        return R"(<?xml version="1.0" ?>
<vxml>
 <form>
  <block>
   {}
   <goto next="{}"/>
  </block>
 </form>
</vxml>
)"_format(utils::join_with_separator(fragments, "\n"sv), http::escape_markup(url));
    }

    std::string render_disconnect(const std::vector<std::string>& fragments) {
        return R"(<?xml version="1.0" ?>
<vxml>
 <form>
  <block>
   {}
   <disconnect/>
  </block>
 </form>
</vxml>
)"_format(utils::join_with_separator(fragments, "\n"sv));
    }

    std::string render_spoken_error(std::string_view message) {
        return "<vxml><form><block><audio>{}</audio></block></form></vxml>\n"_format(http::escape_markup(message));
    }

}  // namespace voxgate::markup
