#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace voxgate {

    // One Audio() call. At least one field must be set, and `wav` excludes `data`.
    struct audio_options {
        std::optional<std::string> wav{};
        std::optional<std::string> tts{};
        std::optional<std::string> data{};
    };

    inline audio_options speech(std::string text) {
        return audio_options{.tts = std::move(text)};
    }

    inline audio_options wav_file(std::string wav, std::optional<std::string> fallback_tts = std::nullopt) {
        return audio_options{.wav = std::move(wav), .tts = std::move(fallback_tts)};
    }

    // One Listen() turn. Exactly one of `grammar` and `grammar_src` must be set and non-empty.
    struct listen_options {
        std::optional<std::string> grammar{};
        std::optional<std::string> grammar_src{};
        std::optional<std::string> noinput{};
        std::optional<std::string> nomatch{};
        std::optional<int> timeout_s{};
        bool bargein{true};
    };

    // One Record() turn.
    struct record_options {
        audio_options done_recording_audio{.wav = "http://resources.tellme.com/audio/earcons/beep_end.wav"};
        std::string grammar{};
        std::string null_audio_word{};
        std::string replay_word{};
        std::vector<audio_options> replay_pre_audio{};
        std::vector<audio_options> replay_post_audio{};
        std::string help_word{};
        std::vector<audio_options> help_audio{};
        std::vector<audio_options> nomatch{speech("I'm sorry, I didn't get that.")};
        std::vector<audio_options> noinput{speech("I'm sorry, I didn't hear anything.")};
        int max_time_s{30};
        int final_silence_s{2};
    };

    // All validators throw std::invalid_argument.
    void validate(const audio_options& opts);
    void validate(const listen_options& opts);
    void validate(const record_options& opts);
    void validate_pause(int milliseconds);

    namespace markup {

        inline constexpr std::string_view result_field = "session.vxmllib.result";
        inline constexpr std::string_view record_field = "session.vxmllib.recordvalue";

        // `origin_url` resolves relative wav references.
        std::string render_audio(const audio_options& opts, std::string_view origin_url);
        std::string render_pause(int milliseconds);

        // Invoker -> client: a single navigation to the session URL.
        std::string render_redirect(std::string_view session_url);

        // `session_url` is the raw URL ending in '?' or '&'; escaping happens here.
        std::string render_listen(
                const std::vector<std::string>& fragments,
                const listen_options& opts,
                std::string_view session_url,
                std::string_view origin_url);

        std::string render_record(
                const std::vector<std::string>& fragments,
                const record_options& opts,
                std::string_view session_url,
                std::string_view origin_url);

        std::string render_goto(const std::vector<std::string>& fragments, std::string_view url);
        std::string render_disconnect(const std::vector<std::string>& fragments);

        // Spoken fallback when a relay hop fails.
        std::string render_spoken_error(std::string_view message);

    }  // namespace markup

}  // namespace voxgate
