/**
 * @file test_http_headers.cpp
 * @brief Unit tests for Headers and request helpers
 */

#include <gtest/gtest.h>
#include "core/net/http_headers.h"
#include "core/net/http_request.h"
#include "core/net/exchange_error.h"

using namespace restkit::nethttp;

TEST(HttpHeaders, CanonicalKey) {
    EXPECT_EQ(canonical_header_key("content-type"), "Content-Type");
    EXPECT_EQ(canonical_header_key("X-CSRF-TOKEN"), "X-Csrf-Token");
    EXPECT_EQ(canonical_header_key("allow"), "Allow");
    // Not a token: left alone
    EXPECT_EQ(canonical_header_key("bad key"), "bad key");
    EXPECT_EQ(canonical_header_key(""), "");
}

TEST(HttpHeaders, LookupIsCaseInsensitive) {
    Headers h;
    h.add("content-type", "application/json");

    EXPECT_TRUE(h.contains("Content-Type"));
    EXPECT_TRUE(h.contains("CONTENT-TYPE"));
    EXPECT_EQ(h.get("Content-type"), "application/json");
    EXPECT_EQ(h.begin()->first, "Content-Type");
}

TEST(HttpHeaders, AddKeepsEveryValueSetReplaces) {
    Headers h;
    h.add("Accept", "text/plain");
    h.add("accept", "application/json");
    EXPECT_EQ(h.size(), 1u);
    EXPECT_EQ(h.values("Accept"), (std::vector<std::string>{"text/plain", "application/json"}));
    EXPECT_EQ(h.get("Accept"), "text/plain");

    h.set("ACCEPT", "*/*");
    EXPECT_EQ(h.values("Accept"), std::vector<std::string>{"*/*"});
}

TEST(HttpHeaders, MissingKey) {
    Headers h;
    EXPECT_TRUE(h.empty());
    EXPECT_EQ(h.get("Allow"), "");
    EXPECT_TRUE(h.values("Allow").empty());
    EXPECT_FALSE(h.contains("Allow"));
}

TEST(HttpHeaders, EraseAndClear) {
    Headers h;
    h.add("A", "1");
    h.add("B", "2");
    h.erase("a");
    EXPECT_FALSE(h.contains("A"));
    EXPECT_TRUE(h.contains("B"));
    h.erase("missing");
    h.clear();
    EXPECT_TRUE(h.empty());
}

TEST(HttpHeaders, AddLineParsesWireFormat) {
    Headers h;
    EXPECT_TRUE(h.add_line("Allow: POST, GET\r\n"));
    EXPECT_TRUE(h.add_line("x-empty:\r\n"));
    EXPECT_FALSE(h.add_line("no colon here\r\n"));
    EXPECT_FALSE(h.add_line(": value"));

    EXPECT_EQ(h.get("Allow"), "POST, GET");
    EXPECT_TRUE(h.contains("X-Empty"));
    EXPECT_EQ(h.get("X-Empty"), "");
    EXPECT_EQ(h.size(), 2u);
}

TEST(HttpHeaders, AddLineJoinsFoldedContinuation) {
    Headers h;
    EXPECT_TRUE(h.add_line("X-Long: part1\r\n"));
    EXPECT_TRUE(h.add_line("   part2\r\n"));
    EXPECT_TRUE(h.add_line("\tpart3\r\n"));
    EXPECT_TRUE(h.add_line("Allow: GET\r\n"));

    EXPECT_EQ(h.get("X-Long"), "part1 part2 part3");
    EXPECT_EQ(h.get("Allow"), "GET");
    EXPECT_EQ(h.size(), 2u);
}

TEST(HttpHeaders, FoldedLineWithoutPreviousHeaderIsIgnored) {
    Headers h;
    EXPECT_FALSE(h.add_line(" orphan: value\r\n"));
    EXPECT_TRUE(h.empty());

    h.add_line("A: 1\r\n");
    h.clear();
    EXPECT_FALSE(h.add_line("\tcontinued\r\n"));
    EXPECT_TRUE(h.empty());
}

TEST(HttpHeaders, ToLinesInKeyOrder) {
    Headers h;
    h.add("b-header", "2");
    h.add("A-Header", "1");
    h.add("b-header", "3");

    const std::vector<std::string> expected{"A-Header: 1", "B-Header: 2", "B-Header: 3"};
    EXPECT_EQ(h.to_lines(), expected);
}

TEST(HttpRequest, MethodTokenValidation) {
    EXPECT_TRUE(is_valid_method(method::kGet));
    EXPECT_TRUE(is_valid_method(method::kOptions));
    EXPECT_TRUE(is_valid_method("PROPFIND"));
    EXPECT_TRUE(is_valid_method("M-SEARCH"));
    EXPECT_FALSE(is_valid_method(""));
    EXPECT_FALSE(is_valid_method("GET "));
    EXPECT_FALSE(is_valid_method("BAD METHOD"));
    EXPECT_FALSE(is_valid_method("GET\r\n"));
}

TEST(ExchangeErrorTest, KindNamesAndTimeout) {
    EXPECT_EQ(to_string(ErrorKind::Construction), "construction");
    EXPECT_EQ(to_string(ErrorKind::Transport), "transport");
    EXPECT_EQ(to_string(ErrorKind::BodyRead), "body_read");

    ExchangeError timeout{ErrorKind::Transport, 28, "Operation timed out"};
    EXPECT_TRUE(timeout.timed_out());
    EXPECT_EQ(timeout.describe(), "[transport] Operation timed out (curl code 28)");

    ExchangeError refused{ErrorKind::Transport, 7, "Couldn't connect to server"};
    EXPECT_FALSE(refused.timed_out());

    ExchangeError bad_url{ErrorKind::Construction, 0, "bad url"};
    EXPECT_EQ(bad_url.describe(), "[construction] bad url");
}
