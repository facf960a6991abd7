#pragma once

#include "cgi.hpp"
#include "config.hpp"
#include "conversation.hpp"
#include "log.hpp"

#include <functional>
#include <iostream>

namespace voxgate {

    using conversation_script = std::function<void(conversation&)>;

    // Entry point for a script installed as a CGI program. One invocation either relays a
    // turn (proxy request), plays the script on the terminal (no web server around), or
    // detaches a worker that serves the whole call while the invoker redirects the caller.
    class voice_server {
      public:
        voice_server(bridge_config cfg, cgi_environment env);

        // Returns the process exit status. In markup mode it returns in both the invoker and
        // the worker; each should exit with the returned status.
        int run(const conversation_script& script, std::ostream& out = std::cout, std::istream& in = std::cin);

        invocation_mode mode() const { return env_.mode(); }
        const session_log& log() const { return log_; }

      private:
        int run_proxy(std::ostream& out, std::istream& in);
        int run_terminal(const conversation_script& script, std::ostream& out);
        int run_markup(const conversation_script& script, std::ostream& out);

        bridge_config cfg_;
        cgi_environment env_;
        session_log log_;
    };

}  // namespace voxgate
