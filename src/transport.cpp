#include "transport.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <unistd.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>

static std::string errno_text(const char *what) {
    return std::string(what) + ": " + std::strerror(errno);
}

TcpTransport::~TcpTransport() {
    close();
}

void TcpTransport::open(const std::string &host, uint16_t port) {
    close();

    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo *res = nullptr;
    const std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0) {
        throw TransportError("resolve " + host + ": " + gai_strerror(rc));
    }

    std::string last_error = "no addresses for " + host;
    for (addrinfo *ai = res; ai != nullptr; ai = ai->ai_next) {
        int s = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (s < 0) {
            last_error = errno_text("socket()");
            continue;
        }
        if (::connect(s, ai->ai_addr, ai->ai_addrlen) == 0) {
            int one = 1;
            setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
            sock_ = s;
            break;
        }
        last_error = errno_text("connect()");
        ::close(s);
    }
    freeaddrinfo(res);

    if (sock_ < 0) {
        throw TransportError(host + ":" + service + ": " + last_error);
    }
}

void TcpTransport::send_all(const std::string &bytes) {
    if (sock_ < 0) throw TransportError("send on closed socket");
    size_t sent = 0;
    while (sent < bytes.size()) {
        ssize_t n = ::send(sock_, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TransportError(errno_text("send()"));
        }
        sent += static_cast<size_t>(n);
    }
}

size_t TcpTransport::receive(char *buf, size_t cap) {
    if (sock_ < 0) throw TransportError("receive on closed socket");
    while (true) {
        ssize_t n = ::recv(sock_, buf, cap, 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TransportError(errno_text("recv()"));
        }
        return static_cast<size_t>(n);
    }
}

void TcpTransport::close() noexcept {
    if (sock_ >= 0) {
        ::close(sock_);
        sock_ = -1;
    }
}
