#include <gtest/gtest.h>

#include <string>

#include "myhttp/outtake.hpp"
#include "test_support.hpp"

using namespace ShelfHttpd;

namespace {

auto serialize_text(const Http::Response& res) -> std::string {
    Http::HttpOuttake outtake;
    auto bytes = outtake.serialize(res);

    EXPECT_TRUE(bytes.has_value());

    return bytes ? std::string(bytes->begin(), bytes->end()) : std::string {};
}

} // namespace

// NOLINTNEXTLINE
TEST(mime_table, known_and_fallback_types) {
    EXPECT_EQ(Http::content_type_for("index.html"), "text/html; charset=UTF-8");
    EXPECT_EQ(Http::content_type_for("site.css"), "text/css");
    EXPECT_EQ(Http::content_type_for("app.js"), "application/javascript");
    EXPECT_EQ(Http::content_type_for("a.png"), "image/png");
    EXPECT_EQ(Http::content_type_for("a.jpg"), "image/jpeg");
    EXPECT_EQ(Http::content_type_for("a.jpeg"), "image/jpeg");
    EXPECT_EQ(Http::content_type_for("a.gif"), "image/gif");
    EXPECT_EQ(Http::content_type_for("doc.pdf"), "application/pdf");
    EXPECT_EQ(Http::content_type_for("data.json"), "application/json");
    EXPECT_EQ(Http::content_type_for("note.txt"), "text/plain");
    EXPECT_EQ(Http::content_type_for("archive.tar.gz"), "application/octet-stream");
    EXPECT_EQ(Http::content_type_for("README"), "application/octet-stream");
    EXPECT_EQ(Http::content_type_for(".hidden"), "application/octet-stream");
}

// NOLINTNEXTLINE
TEST(http_outtake, empty_body) {
    auto wire = serialize_text(Http::ResponseBuilder {}
        .status(Http::Status::http_see_other)
        .header("Location", "/")
        .build());

    EXPECT_EQ(wire, "HTTP/1.1 303 See Other\r\nContent-Length: 0\r\nLocation: /\r\n\r\n");
}

// NOLINTNEXTLINE
TEST(http_outtake, text_body_is_inline_html) {
    auto wire = serialize_text(Http::ResponseBuilder {}
        .body(Http::TextBody {"<p>hi</p>"})
        .build());

    EXPECT_EQ(wire, "HTTP/1.1 200 OK\r\nContent-Length: 9\r\nContent-Type: text/html; charset=UTF-8\r\n\r\n<p>hi</p>");
    EXPECT_EQ(wire.find("Content-Disposition"), std::string::npos);
}

// NOLINTNEXTLINE
TEST(http_outtake, file_body_round_trip) {
    Testing::ScratchDir scratch;
    scratch.write_file(scratch.uploads() / "a.txt", "hello");

    auto wire = serialize_text(Http::ResponseBuilder {}
        .body(Http::FileBody {scratch.uploads() / "a.txt"})
        .build());

    EXPECT_EQ(wire,
        "HTTP/1.1 200 OK\r\n"
        "Content-Disposition: inline; filename=\"a.txt\"\r\n"
        "Content-Length: 5\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "hello");
}

// NOLINTNEXTLINE
TEST(http_outtake, binary_file_body_keeps_every_byte) {
    Testing::ScratchDir scratch;
    const std::string payload {"\x89PNG\r\n\x1A\n\0\0\xFF", 11};
    scratch.write_file(scratch.uploads() / "pic.png", payload);

    auto wire = serialize_text(Http::ResponseBuilder {}
        .body(Http::FileBody {scratch.uploads() / "pic.png"})
        .build());

    EXPECT_NE(wire.find("Content-Type: image/png\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Content-Length: 11\r\n"), std::string::npos);
    EXPECT_TRUE(wire.ends_with(payload));
}

// NOLINTNEXTLINE
TEST(http_outtake, computed_headers_override_caller_values) {
    auto wire = serialize_text(Http::ResponseBuilder {}
        .header("Content-Length", "999")
        .header("Content-Type", "application/json")
        .body(Http::TextBody {"ok"})
        .build());

    EXPECT_NE(wire.find("Content-Length: 2\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Content-Type: text/html; charset=UTF-8\r\n"), std::string::npos);
    EXPECT_EQ(wire.find("999"), std::string::npos);
    EXPECT_EQ(wire.find("application/json"), std::string::npos);
}

// NOLINTNEXTLINE
TEST(http_outtake, missing_file_or_directory_is_not_found) {
    Testing::ScratchDir scratch;
    Http::HttpOuttake outtake;

    auto missing = outtake.serialize(Http::ResponseBuilder {}.body(Http::FileBody {scratch.uploads() / "nope.txt"}).build());
    auto directory = outtake.serialize(Http::ResponseBuilder {}.body(Http::FileBody {scratch.uploads()}).build());

    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().kind, Core::ErrorKind::not_found);
    ASSERT_FALSE(directory.has_value());
    EXPECT_EQ(directory.error().kind, Core::ErrorKind::not_found);
}

// NOLINTNEXTLINE
TEST(http_outtake, writes_to_socket) {
    Testing::SocketPair sockets;
    Http::HttpOuttake outtake;

    auto bytes = outtake.serialize(Http::ResponseBuilder {}.build());
    ASSERT_TRUE(bytes.has_value());

    auto written = outtake(sockets.server_fd(), bytes.value());
    ASSERT_TRUE(written.has_value());
    EXPECT_EQ(written.value(), bytes->size());

    sockets.close_server();
    EXPECT_EQ(sockets.drain_client(), "HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");
}

// NOLINTNEXTLINE
TEST(http_outtake, write_to_closed_peer_is_io) {
    Testing::SocketPair sockets;
    Http::HttpOuttake outtake;

    // Closing the client end makes every server-side send fail with EPIPE.
    sockets.close_client();

    auto written = outtake(sockets.server_fd(), Http::Blob(64, 'x'));

    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().kind, Core::ErrorKind::io);
}
