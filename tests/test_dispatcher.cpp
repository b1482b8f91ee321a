/**
 * @file test_dispatcher.cpp
 * @brief Tests for path routing and request parsing helpers.
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <sstream>
#include <string>

#include "http/dispatcher.hpp"
#include "http/http_request.hpp"

namespace {

class CountingHandler : public HttpHandler
{
public:
    int gets = 0;
    int posts = 0;

    void handle_get(HttpRequest &request) override
    {
        ++gets;
        request.send_status(200);
    }

    void handle_post(HttpRequest &request) override
    {
        ++posts;
        request.send_status(200);
    }
};

std::string dispatch(Dispatcher &dispatcher, const std::string &method, const std::string &path)
{
    std::istringstream rfile;
    std::ostringstream wfile;
    HttpRequest request(method, path, HttpHeaders(), rfile, wfile);
    dispatcher.dispatch(request);
    return wfile.str();
}

} // namespace

/**
 * @test RoutesByPathAndMethod
 */
TEST(Dispatcher, RoutesByPathAndMethod)
{
    Dispatcher dispatcher;
    CountingHandler handler;
    dispatcher.register_path("/x", &handler);

    dispatch(dispatcher, "GET", "/x");
    dispatch(dispatcher, "POST", "/x");
    dispatch(dispatcher, "POST", "/x");

    EXPECT_EQ(handler.gets, 1);
    EXPECT_EQ(handler.posts, 2);
}

/**
 * @test UnknownPath_404
 */
TEST(Dispatcher, UnknownPath_404)
{
    Dispatcher dispatcher;
    std::string response = dispatch(dispatcher, "GET", "/missing");
    EXPECT_EQ(response.rfind("HTTP/1.0 404 Not Found\r\n", 0), 0u);
}

/**
 * @test UnsupportedMethod_501
 */
TEST(Dispatcher, UnsupportedMethod_501)
{
    Dispatcher dispatcher;
    CountingHandler handler;
    dispatcher.register_path("/x", &handler);

    std::string response = dispatch(dispatcher, "PUT", "/x");
    EXPECT_EQ(response.rfind("HTTP/1.0 501 Not Implemented\r\n", 0), 0u);
    EXPECT_EQ(handler.gets + handler.posts, 0);
}

/**
 * @test UnregisterAndRebind
 */
TEST(Dispatcher, UnregisterAndRebind)
{
    Dispatcher dispatcher;
    CountingHandler handler;
    dispatcher.register_path("/old", &handler);

    dispatcher.rebind("/old", "/new", &handler);
    EXPECT_EQ(dispatcher.lookup("/old"), nullptr);
    EXPECT_EQ(dispatcher.lookup("/new"), &handler);

    EXPECT_TRUE(dispatcher.unregister_path("/new"));
    EXPECT_FALSE(dispatcher.unregister_path("/new"));
    EXPECT_TRUE(dispatcher.paths().empty());
}

/**
 * @test RebindKeepsForeignOwner
 * @brief Rebinding does not remove a path now owned by another handler.
 */
TEST(Dispatcher, RebindKeepsForeignOwner)
{
    Dispatcher dispatcher;
    CountingHandler first, second;
    dispatcher.register_path("/shared", &second);

    dispatcher.rebind("/shared", "/mine", &first);
    EXPECT_EQ(dispatcher.lookup("/shared"), &second);
    EXPECT_EQ(dispatcher.lookup("/mine"), &first);

    auto paths = dispatcher.paths();
    std::sort(paths.begin(), paths.end());
    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(paths[0], "/mine");
}

/**
 * @test HeadersCaseInsensitive
 */
TEST(HttpRequest, HeadersCaseInsensitive)
{
    HttpHeaders headers;
    headers["CONTENT-LENGTH"] = "12";
    std::istringstream rfile;
    std::ostringstream wfile;
    HttpRequest request("POST", "/", headers, rfile, wfile);

    ASSERT_TRUE(request.header("content-length").has_value());
    EXPECT_EQ(*request.content_length(), 12u);
}

/**
 * @test ContentLength_Malformed
 */
TEST(HttpRequest, ContentLength_Malformed)
{
    for (const char *value : {"", "-1", "12a", " 3", "99999999999999999999999999"})
    {
        HttpHeaders headers;
        headers["Content-Length"] = value;
        std::istringstream rfile;
        std::ostringstream wfile;
        HttpRequest request("POST", "/", headers, rfile, wfile);
        EXPECT_FALSE(request.content_length().has_value()) << value;
    }
}

/**
 * @test ReadBody_Short
 */
TEST(HttpRequest, ReadBody_Short)
{
    std::istringstream rfile("abc");
    std::ostringstream wfile;
    HttpRequest request("POST", "/", HttpHeaders(), rfile, wfile);

    auto body = request.read_body(10);
    EXPECT_EQ(std::string(body.begin(), body.end()), "abc");
}
