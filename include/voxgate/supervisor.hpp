#pragma once

#include "handoff.hpp"
#include "log.hpp"

#include <cstdint>
#include <string_view>

namespace voxgate {

    using namespace std::string_view_literals;

    enum class process_role : uint8_t { invoker, worker };

    inline constexpr std::string_view to_string(process_role role) {
        switch (role) {
            case process_role::invoker:
                return "invoker"sv;
            case process_role::worker:
                return "worker"sv;
        }
        return "invoker"sv;
    }

    // Spawns a worker that outlives the calling process. Returns in both processes, like
    // fork(): once as the invoker and once as the fully detached worker.
    class detach_platform {
      public:
        virtual ~detach_platform() = default;
        virtual process_role spawn_detached() = 0;
    };

    // Double fork: the intermediate child points stdin/stdout at /dev/null, forks the
    // worker and exits; the worker starts a new session and sends stderr to the debug
    // stderr file (or /dev/null). The invoker reaps the intermediate child, so no zombie
    // is left behind. Failures inside the children are logged and end that process.
    class posix_detach_platform final : public detach_platform {
      public:
        explicit posix_detach_platform(const session_log& log) : log_{log} {}

        process_role spawn_detached() override;

      private:
        [[noreturn]] void die(std::string_view message) const;
        void become_intermediate() const;
        void become_worker() const;

        const session_log& log_;
    };

    // Owns the single detach of a conversation and splits the handoff channel between
    // the two roles.
    class process_supervisor {
      public:
        process_supervisor(detach_platform& platform, handoff_channel& channel, const session_log& log)
                : platform_{platform}, channel_{channel}, log_{log} {}

        process_role detach();

        bool detached() const { return detached_; }

      private:
        detach_platform& platform_;
        handoff_channel& channel_;
        const session_log& log_;
        bool detached_{false};
    };

}  // namespace voxgate
