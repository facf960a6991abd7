#pragma once

#include "cgi.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace voxgate {

    namespace proxy {

        // Recording submissions carry this name in the relayed query and travel as POST.
        inline constexpr std::string_view recording_marker = "vxmllib.recordvalue";

        bool is_recording_submission(std::string_view remainder);

        // POST when the caller posted or the query is a recording submission, GET otherwise.
        bool relays_as_post(const proxy_request& request, std::string_view inbound_method);

        struct relay_options {
            std::string inbound_method{"GET"};
            std::optional<std::string> body{};
            std::string content_type{"application/octet-stream"};
            std::chrono::milliseconds timeout{std::chrono::seconds{120}};
        };

        // Forwards to http://localhost:<port>/?<remainder> and returns the worker's document
        // byte for byte. Transport failures and error statuses come back as a spoken-error
        // document instead.
        std::string relay(const proxy_request& request, const relay_options& opts);

        // CGI output: headers then the document.
        std::string render_cgi_document(std::string_view document);

    }  // namespace proxy

}  // namespace voxgate
