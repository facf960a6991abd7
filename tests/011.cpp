#include "utils.hpp"

#include "voxgate/format.hpp"
#include "voxgate/server.hpp"

#include <cerrno>
#include <iterator>

using namespace voxgate::literals;

namespace voxgate::test {
    using namespace std::string_view_literals;

    namespace detail {

        inline std::string slurp(const fs::path& p) {
            std::ifstream in{p};
            return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
        }

        inline int wait_exit_status(pid_t pid) {
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR) {
                    return -1;
                }
            }
            return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        }

        // Runs a markup-mode invocation in a forked child so the real double fork happens
        // away from the test runner. The invoker writes its CGI output to `invoker_out`; the
        // worker's script records "<sid> <pid> <ppid> <stdout target>" in `worker_facts`.
        inline pid_t spawn_cgi_invocation(const fs::path& invoker_out, const fs::path& worker_facts) {
            auto pid = ::fork();
            if (pid != 0) {
                return pid;
            }

            cgi_environment env{};
            env.server_name = "127.0.0.1";
            env.script_name = "/cgi-bin/guess.cgi";

            bridge_config cfg{};
            cfg.min_port = test_min_port;
            cfg.max_port = test_max_port;
            cfg.advertise_host = "127.0.0.1";
            cfg.idle_timeout = std::chrono::seconds{5};
            cfg.handoff_timeout = std::chrono::seconds{5};

            auto self = ::getpid();
            int status = 3;
            std::ostringstream out{};
            std::istringstream in{};
            try {
                voice_server server{cfg, env};
                status = server.run(
                        [&worker_facts](conversation& call) {
                            {
                                std::error_code ec{};
                                auto stdout_target = fs::read_symlink("/proc/self/fd/1", ec);
                                std::ofstream facts{worker_facts};
                                facts << ::getsid(0) << ' ' << ::getpid() << ' ' << ::getppid() << ' '
                                      << (ec ? std::string{"?"} : stdout_target.string()) << '\n';
                            }
                            call.say("pick");
                            call.collect_input(listen_options{.grammar = "YES_NO"});
                            call.end_conversation(hangup{});
                        },
                        out,
                        in);
            } catch (const std::exception&) {
                status = 4;
            }

            if (::getpid() == self) {
                std::ofstream file{invoker_out};
                file << out.str();
            }
            ::_exit(status);
        }

        inline std::optional<uint16_t> redirect_port(std::string_view document) {
            constexpr auto prefix = R"(<goto next="http://127.0.0.1:)"sv;
            auto start = document.find(prefix);
            if (start == std::string_view::npos) {
                return std::nullopt;
            }
            auto rest = document.substr(start + prefix.size());
            return utils::parse_integer<uint16_t>(rest.substr(0, rest.find('/')));
        }

        inline std::string get(uint16_t port, std::string_view query) {
            return exchange(port, "GET /?{} HTTP/1.0\r\nHost: 127.0.0.1\r\n\r\n"_format(query));
        }

    }  // namespace detail

    TEST_CASE("011: CGI invocation detaches a worker that serves the call", "[011][server]") {
        detail::temp_dir tmp{"voxgate_e2e"};
        auto invoker_out = tmp.path / "invoker.out";
        auto worker_facts = tmp.path / "worker.txt";

        auto child = detail::spawn_cgi_invocation(invoker_out, worker_facts);
        REQUIRE(child > 0);
        REQUIRE(detail::wait_exit_status(child) == 0);

        auto redirect = detail::slurp(invoker_out);
        CHECK(redirect.starts_with("Cache-Control: no-cache\nContent-type: text/vxml\n\n"));
        CHECK(detail::count_occurrences(redirect, "<goto"sv) == 1U);
        auto port = detail::redirect_port(redirect);
        REQUIRE(port);
        CHECK(redirect.find(R"(<goto next="http://127.0.0.1:{}/?x=y"/>)"_format(*port)) != std::string::npos);

        // the redirected caller arrives, answers once and is hung up on
        auto first_doc = detail::get(*port, "x=y"sv);
        CHECK(first_doc.starts_with("HTTP/1.1 200 OK"));
        CHECK(first_doc.find("<audio>pick</audio>") != std::string::npos);
        CHECK(first_doc.find(R"(<field name="session.vxmllib.result">)") != std::string::npos);

        auto final_doc = detail::get(*port, "result=yes"sv);
        CHECK(final_doc.starts_with("HTTP/1.1 200 OK"));
        CHECK(final_doc.find("<disconnect/>") != std::string::npos);

        std::istringstream facts{detail::slurp(worker_facts)};
        long worker_sid{-1};
        long worker_pid{-1};
        long worker_ppid{-1};
        std::string worker_stdout{};
        facts >> worker_sid >> worker_pid >> worker_ppid >> worker_stdout;
        REQUIRE(worker_pid > 0);

        CHECK(worker_sid == worker_pid);
        CHECK(worker_sid != static_cast<long>(::getsid(0)));
        CHECK(worker_pid != static_cast<long>(child));
        CHECK(worker_ppid != static_cast<long>(child));
        CHECK(worker_stdout == "/dev/null");
    }

}  // namespace voxgate::test
