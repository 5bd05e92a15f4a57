#include "qlink/net/TcpClient.hpp"

#include "support/Check.hpp"
#include "support/FakeController.hpp"

#include <chrono>
#include <string>
#include <vector>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace std::chrono_literals;
using namespace qlink;
using qlink::net::TcpClient;
using qlink::test::FakeController;
using qlink::test::Reply;

namespace {

// A listener that never accepts, its single backlog slot already taken, so
// further connects stay unanswered until the caller gives up.
class StalledListener {
public:
    StalledListener() {
        listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(listenFd_, 0);
        socklen_t len = sizeof(addr);
        ::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        for (int i = 0; i < 4; ++i) {
            int fd = ::socket(AF_INET, SOCK_STREAM, 0);
            ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL, 0) | O_NONBLOCK);
            ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)); // EINPROGRESS expected
            fillers_.push_back(fd);
        }
    }

    ~StalledListener() {
        for (int fd : fillers_) ::close(fd);
        ::close(listenFd_);
    }

    StalledListener(const StalledListener&) = delete;
    StalledListener& operator=(const StalledListener&) = delete;

    unsigned short port() const { return port_; }

private:
    int listenFd_ = -1;
    unsigned short port_ = 0;
    std::vector<int> fillers_;
};

Reply silentOn(const std::string& request, const char* trigger) {
    if (request == trigger) {
        Reply reply;
        reply.silent = true;
        return reply;
    }
    return qlink::test::echo(request);
}

} // namespace

static void testNeverOpened() {
    TcpClient client("127.0.0.1", FakeController::unusedPort());
    ASSERT_TRUE(client.closed(), "closed before the first open");

    client.close();
    ASSERT_TRUE(client.closed(), "close on a never-opened client is harmless");

    auto written = client.write("VGL 1\r\n");
    ASSERT_TRUE(!written && written.error().is(ErrorKind::Connection), "write needs a connection");

    auto read = client.read_until("\n", 200ms);
    ASSERT_TRUE(!read && read.error().is(ErrorKind::Connection), "read needs a connection");
}

static void testConnectTimeout() {
    StalledListener listener;
    TcpClient client("127.0.0.1", listener.port());
    client.setConnectTimeout(300ms);

    const auto start = std::chrono::steady_clock::now();
    auto opened = client.open();
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(!opened && opened.error().is(ErrorKind::Timeout), "unanswered connect times out");
    ASSERT_TRUE(elapsed < 2000ms, "connect timeout honoured");
    ASSERT_TRUE(client.closed(), "still closed after a failed connect");
}

static void testConnectionRefused() {
    TcpClient client("127.0.0.1", FakeController::unusedPort());
    client.setConnectTimeout(2000ms);

    auto opened = client.open();
    ASSERT_TRUE(!opened && opened.error().is(ErrorKind::Connection), "refused is a connection error");
    ASSERT_TRUE(client.closed(), "still closed");
}

static void testOpenIsIdempotent() {
    FakeController server(qlink::test::echo);
    TcpClient client("127.0.0.1", server.port());

    ASSERT_TRUE(client.open().has_value(), "first open");
    ASSERT_TRUE(client.open().has_value(), "second open is a no-op");
    ASSERT_TRUE(!client.closed(), "open");

    ASSERT_TRUE(client.write("PING\r\n").has_value(), "write");
    auto line = client.read_until("\n", 2000ms);
    ASSERT_TRUE(line && *line == "R:PING\r\n", "round trip");
    ASSERT_EQ(server.connectionsAccepted(), 1, "one connection");

    client.close();
    client.close();
    ASSERT_TRUE(client.closed(), "closed");
}

static void testReadKeepsRemainder() {
    FakeController server([](const std::string&) {
        return Reply{{"R:ONE", "R:TWO"}};
    });
    TcpClient client("127.0.0.1", server.port());
    ASSERT_TRUE(client.open().has_value(), "open");
    ASSERT_TRUE(client.write("TWICE\r\n").has_value(), "write");

    auto first = client.read_until("\r\n", 2000ms);
    ASSERT_TRUE(first && *first == "R:ONE\r\n", "first line with its delimiter");

    auto second = client.read_until("\r\n", 2000ms);
    ASSERT_TRUE(second && *second == "R:TWO\r\n", "second line from the buffered remainder");
}

static void testBufferLimit() {
    FakeController server([](const std::string&) {
        return Reply{{std::string(512, 'x')}};
    });
    TcpClient client("127.0.0.1", server.port());
    client.setBufferLimit(128);
    ASSERT_TRUE(client.open().has_value(), "open");
    ASSERT_TRUE(client.write("BIG\r\n").has_value(), "write");

    auto line = client.read_until("\n", 2000ms);
    ASSERT_TRUE(!line && line.error().is(ErrorKind::Malformed), "line over the limit is malformed");
}

static void testCancelBeforeReadStarts() {
    FakeController server([](const std::string& request) { return silentOn(request, "HANG"); });
    TcpClient client("127.0.0.1", server.port());
    ASSERT_TRUE(client.open().has_value(), "open");
    ASSERT_TRUE(client.write("HANG\r\n").has_value(), "write");

    const auto ticket = client.newTicket();
    client.cancel(ticket);

    const auto start = std::chrono::steady_clock::now();
    auto read = client.read_until("\n", 5000ms);
    ASSERT_TRUE(!read && read.error().is(ErrorKind::Cancelled), "cancel issued before the read is honoured");
    ASSERT_TRUE(std::chrono::steady_clock::now() - start < 1000ms, "no wait for the read timeout");

    auto written = client.write("PING\r\n");
    ASSERT_TRUE(!written && written.error().is(ErrorKind::Cancelled), "ticket stays cancelled for writes");
}

static void testStaleTicketIgnored() {
    FakeController server([](const std::string& request) { return silentOn(request, "HANG"); });
    TcpClient client("127.0.0.1", server.port());
    ASSERT_TRUE(client.open().has_value(), "open");

    const auto finished = client.newTicket();
    client.newTicket();
    client.cancel(finished);

    ASSERT_TRUE(client.write("PING\r\n").has_value(), "write under the new ticket");
    auto line = client.read_until("\n", 2000ms);
    ASSERT_TRUE(line && *line == "R:PING\r\n", "stale cancel does not touch the new ticket");

    ASSERT_TRUE(client.write("HANG\r\n").has_value(), "write");
    auto read = client.read_until("\n", 200ms);
    ASSERT_TRUE(!read && read.error().is(ErrorKind::Timeout), "read ends on its own deadline");
}

int main() {
    testNeverOpened();
    testConnectTimeout();
    testConnectionRefused();
    testOpenIsIdempotent();
    testReadKeepsRemainder();
    testBufferLimit();
    testCancelBeforeReadStarts();
    testStaleTicketIgnored();
    return finish("TcpClient");
}
