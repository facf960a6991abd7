#include "utils.hpp"

namespace voxgate::test {
    using namespace std::string_view_literals;

    TEST_CASE("004: query decoding", "[004][http]") {
        auto query = http::parse_query("result=forty+two&name=a%26b&empty=&flag&result=later"sv);
        REQUIRE(query);
        CHECK(query->at("result") == "forty two");
        CHECK(query->at("name") == "a&b");
        CHECK(query->at("empty").empty());
        CHECK(query->contains("flag"));

        CHECK(http::parse_query(""sv)->empty());
        CHECK_FALSE(http::parse_query("result=%zz"sv));
        CHECK_FALSE(http::parse_query("result=50%"sv));
        CHECK_FALSE(http::parse_query("result=%4"sv));
    }

    TEST_CASE("004: url encode escapes reserved characters", "[004][http]") {
        CHECK(http::url_encode("abc-_.~09"sv) == "abc-_.~09");
        CHECK(http::url_encode("a b&c=d"sv) == "a%20b%26c%3Dd");
        auto decoded = http::url_decode(http::url_encode("no match / 100%"sv));
        REQUIRE(decoded);
        CHECK(*decoded == "no match / 100%");
    }

    TEST_CASE("004: request parsing", "[004][http]") {
        SECTION("get with query") {
            auto request = http::parse_request("GET /?result=7&x=y HTTP/1.1\r\nHost: localhost:7500\r\n\r\n"sv);
            REQUIRE(request);
            CHECK(request->method == "GET");
            CHECK(request->target == "/?result=7&x=y");
            CHECK(request->raw_query == "result=7&x=y");
            CHECK(request->query.at("result") == "7");
            CHECK(request->headers.at("host") == "localhost:7500");
            CHECK_FALSE(request->body);
        }

        SECTION("post with body and bare newlines") {
            auto request = http::parse_request(
                    "POST /?result=keep HTTP/1.0\nContent-Length: 5\nContent-Type: multipart/form-data\n\nhello"sv);
            REQUIRE(request);
            CHECK(request->method == "POST");
            REQUIRE(request->body);
            CHECK(*request->body == "hello");
            CHECK(request->headers.at("content-type") == "multipart/form-data");
        }

        SECTION("malformed query keeps the request but drops the parameters") {
            auto request = http::parse_request("GET /?result=%zz HTTP/1.0\r\n\r\n"sv);
            REQUIRE(request);
            CHECK(request->raw_query == "result=%zz");
            CHECK(request->query.empty());
        }

        SECTION("garbage") {
            CHECK_FALSE(http::parse_request("hello\r\n\r\n"sv));
            CHECK_FALSE(http::parse_request("GET / FTP/1.0\r\n\r\n"sv));
            CHECK_FALSE(http::parse_request("GET /?a=b HTTP/1.0\r\n"sv));
            CHECK_FALSE(http::parse_request("POST / HTTP/1.0\r\nContent-Length: 10\r\n\r\nshort"sv));
        }
    }

    TEST_CASE("004: read_request over a socket pair", "[004][http]") {
        int fds[2]{};
        REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
        unique_fd server{fds[0]};
        unique_fd client{fds[1]};

        SECTION("request split over several writes") {
            std::thread writer{[&client] {
                http::write_all(client.get(), "POST /?result=1 HTTP/1.0\r\nContent-Le"sv);
                std::this_thread::sleep_for(std::chrono::milliseconds{20});
                http::write_all(client.get(), "ngth: 4\r\n\r\nab"sv);
                std::this_thread::sleep_for(std::chrono::milliseconds{20});
                http::write_all(client.get(), "cd"sv);
            }};
            auto request = http::read_request(server.get(), std::chrono::seconds{2});
            writer.join();
            REQUIRE(request);
            REQUIRE(request->body);
            CHECK(*request->body == "abcd");
        }

        SECTION("peer closes early") {
            http::write_all(client.get(), "GET / HTTP/1.0\r\n"sv);
            client.reset();
            CHECK_FALSE(http::read_request(server.get(), std::chrono::seconds{2}));
        }

        SECTION("stalled peer times out") {
            http::write_all(client.get(), "GET / HTTP/1.0\r\n"sv);
            CHECK_FALSE(http::read_request(server.get(), std::chrono::milliseconds{100}));
        }
    }

    TEST_CASE("004: responses", "[004][http]") {
        auto ok = http::make_response(200, "<vxml/>"sv);
        CHECK(ok.starts_with("HTTP/1.1 200 OK\r\n"));
        CHECK(ok.find("Cache-Control: no-cache\r\n") != std::string::npos);
        CHECK(ok.find("Content-Type: text/vxml\r\n") != std::string::npos);
        CHECK(ok.find("Content-Length: 7\r\n") != std::string::npos);
        CHECK(ok.ends_with("\r\n\r\n<vxml/>"));

        auto forbidden = http::make_error_response(403);
        CHECK(forbidden.starts_with("HTTP/1.1 403 Forbidden\r\n"));
    }

    TEST_CASE("004: markup escaping", "[004][http]") {
        CHECK(http::escape_markup(R"(a&b "c" <d>)"sv) == "a&amp;b &quot;c&quot; &lt;d&gt;");
        CHECK(http::escape_markup("plain"sv) == "plain");
    }

    TEST_CASE("004: absolute URL resolution", "[004][http]") {
        constexpr auto origin = "http://www.example.com/cgi-bin/guess.cgi"sv;

        CHECK(http::make_absolute_url(origin, "http://other.example.com/a.vxml"sv) ==
              "http://other.example.com/a.vxml");
        CHECK(http::make_absolute_url(origin, "HTTPS://secure.example.com/"sv) == "HTTPS://secure.example.com/");
        CHECK(http::make_absolute_url(origin, "_home"sv) == "_home");
        CHECK(http::make_absolute_url(origin, "/audio/beep.wav"sv) == "http://www.example.com/audio/beep.wav");
        CHECK(http::make_absolute_url(origin, "menu.vxml"sv) == "http://www.example.com/cgi-bin/menu.vxml");
        CHECK(http::make_absolute_url(origin, "'menu.vxml'"sv) == "http://www.example.com/cgi-bin/menu.vxml");
        CHECK(http::make_absolute_url("http://www.example.com"sv, "menu.vxml"sv) ==
              "http://www.example.com/menu.vxml");
        CHECK(http::make_absolute_url(""sv, "menu.vxml"sv) == "menu.vxml");
    }

}  // namespace voxgate::test
