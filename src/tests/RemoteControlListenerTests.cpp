// SPDX-License-Identifier: Apache-2.0
#include <llmtui/EventBus.hpp>
#include <remote/RemoteControlListener.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <sys/socket.h>
#include <sys/time.h>

#include <array>
#include <format>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <unistd.h>

using namespace llmtui;
using namespace std::chrono_literals;

namespace
{
/// Minimal blocking TCP client for talking to the listener.
class TestClient
{
  public:
    explicit TestClient(std::uint16_t port)
    {
        _fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        auto addr = sockaddr_in {};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        _connected = ::connect(_fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0;

        auto timeout = timeval { .tv_sec = 5, .tv_usec = 0 };
        setsockopt(_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
    }

    ~TestClient()
    {
        if (_fd >= 0)
            ::close(_fd);
    }

    TestClient(const TestClient&) = delete;
    TestClient& operator=(const TestClient&) = delete;

    [[nodiscard]] auto connected() const noexcept -> bool { return _connected; }

    void send(std::string_view text) const
    {
        auto const sent = ::send(_fd, text.data(), text.size(), MSG_NOSIGNAL);
        REQUIRE(sent == static_cast<ssize_t>(text.size()));
    }

    /// Reads one reply line without its newline. Empty on timeout or EOF.
    [[nodiscard]] auto readLine() -> std::string
    {
        while (_buffer.find('\n') == std::string::npos)
        {
            auto chunk = std::array<char, 512> {};
            auto const received = ::recv(_fd, chunk.data(), chunk.size(), 0);
            if (received <= 0)
                return {};
            _buffer.append(chunk.data(), static_cast<std::size_t>(received));
        }
        auto const newline = _buffer.find('\n');
        auto line = _buffer.substr(0, newline);
        _buffer.erase(0, newline + 1);
        return line;
    }

  private:
    int _fd = -1;
    bool _connected = false;
    std::string _buffer;
};

/// Plays the orchestrator: answers every remote request with the command name.
auto startResponder(EventBus& bus) -> std::jthread
{
    return std::jthread([&bus](std::stop_token stopToken) {
        while (!stopToken.stop_requested())
        {
            auto event = bus.waitPop(20ms);
            if (!event)
                continue;
            auto* request = std::get_if<RemoteRequest>(&*event);
            if (!request || !request->reply)
                continue;
            auto answer = std::format("OK {}", remote::commandName(request->command));
            if (auto const* send = std::get_if<remote::SendText>(&request->command))
                answer += " " + send->text;
            request->reply->set_value(std::move(answer));
        }
    });
}
} // namespace

TEST_CASE("Listener binds an ephemeral loopback port", "[remote]")
{
    auto bus = EventBus {};
    auto listener = RemoteControlListener(RemoteControlConfig { .host = "127.0.0.1", .port = 0 }, bus);

    REQUIRE(listener.start().has_value());
    CHECK(listener.isRunning());
    CHECK(listener.port() != 0);
    CHECK(listener.address() == std::format("127.0.0.1:{}", listener.port()));

    listener.stop();
    CHECK_FALSE(listener.isRunning());
}

TEST_CASE("Listener forwards commands and writes replies", "[remote]")
{
    auto bus = EventBus {};
    auto listener = RemoteControlListener(RemoteControlConfig { .port = 0 }, bus);
    REQUIRE(listener.start().has_value());
    auto responder = startResponder(bus);

    auto client = TestClient(listener.port());
    REQUIRE(client.connected());

    client.send("STATUS\n");
    CHECK(client.readLine() == "OK STATUS");

    SECTION("malformed lines are skipped without closing the connection")
    {
        client.send("FOO bar\nSEND hello world\n");
        CHECK(client.readLine() == "OK SEND hello world");
    }

    SECTION("commands split across packets are reassembled")
    {
        client.send("SEN");
        std::this_thread::sleep_for(20ms);
        client.send("D split\r\nNEW\n");
        CHECK(client.readLine() == "OK SEND split");
        CHECK(client.readLine() == "OK NEW");
    }

    listener.stop();
}

TEST_CASE("Listener serves several clients at once", "[remote]")
{
    auto bus = EventBus {};
    auto listener = RemoteControlListener(RemoteControlConfig { .port = 0 }, bus);
    REQUIRE(listener.start().has_value());
    auto responder = startResponder(bus);

    auto first = TestClient(listener.port());
    auto second = TestClient(listener.port());
    REQUIRE(first.connected());
    REQUIRE(second.connected());

    second.send("MODEL 4o\n");
    first.send("NEW\n");
    CHECK(first.readLine() == "OK NEW");
    CHECK(second.readLine() == "OK MODEL");
}

TEST_CASE("Listener answers with an error when nobody replies", "[remote]")
{
    auto bus = EventBus {};
    auto listener = RemoteControlListener(RemoteControlConfig { .port = 0, .replyTimeout = 200ms }, bus);
    REQUIRE(listener.start().has_value());

    auto client = TestClient(listener.port());
    REQUIRE(client.connected());
    client.send("STATUS\n");
    CHECK(client.readLine().starts_with("ERROR"));
    CHECK(bus.size() == 1);
}

TEST_CASE("Listener reports a port that is already in use", "[remote]")
{
    auto bus = EventBus {};
    auto first = RemoteControlListener(RemoteControlConfig { .port = 0 }, bus);
    REQUIRE(first.start().has_value());

    auto second = RemoteControlListener(RemoteControlConfig { .port = first.port() }, bus);
    auto const result = second.start();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::ListenerBindFailure);
    CHECK_FALSE(second.isRunning());
}

TEST_CASE("Listener rejects an invalid host", "[remote]")
{
    auto bus = EventBus {};
    auto const host = GENERATE(std::string("not-an-address"), std::string("0.0.0.0"), std::string("192.168.1.10"));
    auto listener = RemoteControlListener(RemoteControlConfig { .host = host, .port = 0 }, bus);
    auto const result = listener.start();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == ErrorCode::ListenerBindFailure);
    CHECK_FALSE(listener.isRunning());
}

TEST_CASE("isLoopbackAddress accepts only 127.0.0.0/8", "[remote]")
{
    CHECK(isLoopbackAddress("127.0.0.1"));
    CHECK(isLoopbackAddress("127.255.0.9"));
    CHECK_FALSE(isLoopbackAddress("0.0.0.0"));
    CHECK_FALSE(isLoopbackAddress("128.0.0.1"));
    CHECK_FALSE(isLoopbackAddress("localhost"));
    CHECK_FALSE(isLoopbackAddress(""));
}
