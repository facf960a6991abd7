#pragma once

#include "http.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace voxgate {

    // One-shot, one-way pipe carrying the worker's session URL back to the invoker.
    // Created before detaching; after the fork each side closes the end it does not use,
    // so the invoker sees end-of-file if the worker dies before publishing.
    class handoff_channel {
      public:
        handoff_channel();

        handoff_channel(const handoff_channel&) = delete;
        handoff_channel& operator=(const handoff_channel&) = delete;
        handoff_channel(handoff_channel&&) = default;
        handoff_channel& operator=(handoff_channel&&) = default;

        // Invoker side: keeps the read end.
        void become_reader();
        // Worker side: keeps the write end.
        void become_writer();

        // Writes `url` plus a newline exactly once, then closes the write end.
        void publish(std::string_view url);

        // Drops the write end without publishing (the worker failed to bind).
        void abandon();

        // Blocks until a full line arrives, the writer goes away, or `timeout` passes.
        std::optional<std::string> await(std::chrono::milliseconds timeout);

        bool published() const { return published_; }

      private:
        unique_fd read_end_{};
        unique_fd write_end_{};
        bool published_{false};
        bool consumed_{false};
    };

}  // namespace voxgate
