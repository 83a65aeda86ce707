#pragma once

#include <string>
#include <stdexcept>
#include <platform/socket_util.hpp>

// I/O failure on an instrument link (connect, send, receive, timeout).
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A line-oriented command channel to one instrument: commands go out as
// strings terminated by '\n', responses come back as one line.
class Transport {
public:
    virtual ~Transport() = default;

    virtual void write(const std::string& command) = 0;
    virtual std::string read() = 0;

    // write() then read(). Throws TransportError.
    virtual std::string query(const std::string& command) {
        write(command);
        return read();
    }

    // VISA-style resource string this link was opened from.
    virtual const std::string& resource() const = 0;
};

// Raw SCPI socket (LXI, port 5025).
class TcpTransport : public Transport {
public:
    // Connects immediately; throws TransportError if the host does not answer.
    // A read timeout closes the link, and later calls throw TransportError.
    TcpTransport(const std::string& resource, const std::string& host, int port,
                 int connect_timeout_ms, int io_timeout_ms);
    ~TcpTransport() override;

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    void write(const std::string& command) override;
    std::string read() override;
    const std::string& resource() const override { return resource_; }

private:
    std::string resource_;
    socket_t sock_ = MRILABS_INVALID_SOCKET;
    int io_timeout_ms_;
    std::string pending_;  // bytes received past the last newline

    // Drop unread bytes left over from earlier exchanges.
    void discard_input();
};

// USB Test & Measurement Class character device (/dev/usbtmcN).
class UsbtmcTransport : public Transport {
public:
    UsbtmcTransport(const std::string& resource, const std::string& device_path,
                    int io_timeout_ms);
    ~UsbtmcTransport() override;

    UsbtmcTransport(const UsbtmcTransport&) = delete;
    UsbtmcTransport& operator=(const UsbtmcTransport&) = delete;

    void write(const std::string& command) override;
    std::string read() override;
    const std::string& resource() const override { return resource_; }

private:
    std::string resource_;
    std::string device_path_;
    int fd_ = -1;
    int io_timeout_ms_;
};
