#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string &what) : std::runtime_error(what) {}
};

// Byte stream under the bus client. Every failure surfaces as TransportError.
class Transport {
public:
    virtual ~Transport() = default;

    virtual void open(const std::string &host, uint16_t port) = 0;
    virtual void send_all(const std::string &bytes) = 0;

    // Blocks until bytes arrive; returns 0 when the peer closed the stream.
    virtual size_t receive(char *buf, size_t cap) = 0;

    // Pollable descriptor, -1 when not open or not pollable.
    virtual int fd() const = 0;

    virtual void close() noexcept = 0;
};

// Blocking BSD-socket TCP stream. connect() has no timeout.
class TcpTransport : public Transport {
public:
    TcpTransport() = default;
    ~TcpTransport() override;
    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    void open(const std::string &host, uint16_t port) override;
    void send_all(const std::string &bytes) override;
    size_t receive(char *buf, size_t cap) override;
    int fd() const override { return sock_; }
    void close() noexcept override;

private:
    int sock_ = -1;
};
