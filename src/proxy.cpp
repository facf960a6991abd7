#include "voxgate/proxy.hpp"

#include "voxgate/format.hpp"
#include "voxgate/markup.hpp"

#include <httplib.h>

extern "C" {
#include <sys/socket.h>
}

using namespace voxgate::literals;

namespace voxgate::proxy {

    using namespace std::string_view_literals;

    bool is_recording_submission(std::string_view remainder) {
        return remainder.find(recording_marker) != std::string_view::npos;
    }

    bool relays_as_post(const proxy_request& request, std::string_view inbound_method) {
        return utils::str_case_eq(inbound_method, "POST"sv) || is_recording_submission(request.remainder);
    }

    std::string relay(const proxy_request& request, const relay_options& opts) {
        // the worker only listens on IPv4
        httplib::Client cli{"localhost", request.target_port};
        cli.set_address_family(AF_INET);
        cli.set_keep_alive(false);
        // the remainder is already query-encoded and must reach the worker unchanged
        cli.set_path_encode(false);
        cli.set_connection_timeout(opts.timeout);
        cli.set_read_timeout(opts.timeout);
        cli.set_write_timeout(opts.timeout);

        auto path = "/?{}"_format(request.remainder);
        auto res = relays_as_post(request, opts.inbound_method)
                         ? cli.Post(path, opts.body.value_or(std::string{}), opts.content_type)
                         : cli.Get(path);

        if (!res) {
            return markup::render_spoken_error(
                    "Can't reach localhost:{} ({})"_format(request.target_port, httplib::to_string(res.error())));
        }
        if (res->status >= 400) {
            auto reason = res->reason.empty() ? std::string{httplib::status_message(res->status)} : res->reason;
            return markup::render_spoken_error(reason);
        }
        return std::move(res->body);
    }

    std::string render_cgi_document(std::string_view document) {
        return "Cache-Control: no-cache\nContent-type: text/vxml\n\n{}"_format(document);
    }

}  // namespace voxgate::proxy
