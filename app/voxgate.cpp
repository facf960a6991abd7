#include "voxgate/cli.hpp"
#include "voxgate/format.hpp"
#include "voxgate/server.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <random>

using namespace voxgate::literals;

namespace {

    // Guess-a-number over the phone: the caller has five tries at a number from 1 to 99.
    void guess_the_number(voxgate::conversation& call) {
        std::mt19937 rng{std::random_device{}()};
        std::uniform_int_distribution<int> pick{1, 99};
        auto answer = pick(rng);

        call.say("I'm thinking of a number between one and ninety nine.");
        for (int tries = 1; tries <= 5; ++tries) {
            call.say("What is your guess?");
            auto reply = call.collect_input(voxgate::listen_options{.grammar = "NATURAL_NUMBER_THRU_99"});
            auto guess = voxgate::utils::parse_integer<int>(reply);
            if (!guess) {
                call.say("That didn't sound like a number.");
                continue;
            }
            if (*guess == answer) {
                call.say("You got it in {} tries!"_format(tries));
                call.end_conversation(voxgate::hangup{});
                return;
            }
            call.say(*guess < answer ? "Higher." : "Lower.");
        }
        call.say("Out of guesses. The number was {}."_format(answer));
        call.end_conversation(voxgate::hangup{});
    }

}  // namespace

int main(int argc, char** argv) {
    try {
        voxgate::bridge_config cfg{};
        if (argc > 0) {
            cfg.program_name = std::filesystem::path{argv[0]}.filename().string();
        }
        if (auto cli_result = voxgate::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        voxgate::voice_server server{cfg, voxgate::cgi_environment::from_process()};
        return server.run(guess_the_number);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
