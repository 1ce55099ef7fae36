#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#define BOOST_TEST_MAIN
#include <boost/test/unit_test.hpp>

#include <coincidence/http.hpp>

#include "local_server.hpp"

BOOST_AUTO_TEST_SUITE(HTTPTest)

std::vector<coincidence::HTTP::Header> headers_global({
    {"User-Agent", "coincidence-test/0.1"},
    {"Accept", "text/plain"}
});

LocalServer::Response echo(LocalServer::Request const& req)
{
    std::string body;
    body += std::string(req.method_string()) + " " + std::string(req.target()) + "\n";
    for (auto & field : req) {
        body += std::string(field.name_string()) + ": " + std::string(field.value()) + "\n";
    }
    return LocalServer::respond(http::status::ok, body);
}

BOOST_AUTO_TEST_CASE(get_string_http)
{
    using namespace coincidence;

    LocalServer server(echo);
    std::string response_str = HTTP::request_string(server.url("/get"), headers_global);
    std::cout << "Server Response: " << response_str << std::endl;

    BOOST_CHECK(response_str.starts_with("GET /get\n"));
    BOOST_CHECK(response_str.find("User-Agent: coincidence-test/0.1") != std::string::npos);
    BOOST_CHECK(response_str.find("Accept: text/plain") != std::string::npos);
    BOOST_CHECK(response_str.find("Host: 127.0.0.1") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(default_user_agent)
{
    using namespace coincidence;

    LocalServer server(echo);
    std::string response_str = HTTP::request_string(server.url("/"));

    BOOST_CHECK(response_str.find("User-Agent: coincidence-http-client") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(target_keeps_encoding_and_query)
{
    using namespace coincidence;

    LocalServer server(echo);
    HTTP::request_string(server.url("/wiki/Caf%C3%A9?action=raw"));

    auto requests = server.requests();
    BOOST_REQUIRE_EQUAL(requests.size(), 1u);
    BOOST_CHECK_EQUAL(std::string(requests[0].target()), "/wiki/Caf%C3%A9?action=raw");
}

BOOST_AUTO_TEST_CASE(redirect_is_reported)
{
    using namespace coincidence;

    LocalServer server([](LocalServer::Request const&) {
        auto res = LocalServer::respond(http::status::found, "");
        res.set(http::field::location, "https://en.wikipedia.org/wiki/Walrus");
        return res;
    });
    HTTP::Response res = HTTP::request(server.url("/wiki/Special:Random/"));

    BOOST_CHECK_EQUAL(res.status, 302u);
    BOOST_CHECK_EQUAL(res.location, "https://en.wikipedia.org/wiki/Walrus");
    // not followed
    BOOST_CHECK_EQUAL(server.requests().size(), 1u);
}

BOOST_AUTO_TEST_CASE(error_status_throws)
{
    using namespace coincidence;

    LocalServer server([](LocalServer::Request const&) {
        return LocalServer::respond(http::status::not_found, "no such page");
    });

    HTTP::Response res = HTTP::request(server.url("/missing"));
    BOOST_CHECK_EQUAL(res.status, 404u);
    BOOST_CHECK_EQUAL(res.reason, "Not Found");
    BOOST_CHECK_EQUAL(res.body, "no such page");

    try {
        HTTP::request_string(server.url("/missing"));
        BOOST_FAIL("expected std::runtime_error");
    } catch (std::runtime_error const& e) {
        BOOST_CHECK(std::string_view(e.what()).starts_with("HTTP 404 Not Found from " + server.url("/missing")));
        BOOST_CHECK(std::string_view(e.what()).find("no such page") != std::string_view::npos);
    }
}

BOOST_AUTO_TEST_CASE(invalid_url_throws)
{
    using namespace coincidence;

    BOOST_CHECK_THROW(HTTP::request_string("not a url"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(connection_refused_throws)
{
    using namespace coincidence;

    std::string url;
    {
        LocalServer server(echo);
        url = server.url("/");
    }
    BOOST_CHECK_THROW(HTTP::request_string(url), boost::system::system_error);
}

BOOST_AUTO_TEST_SUITE_END()
