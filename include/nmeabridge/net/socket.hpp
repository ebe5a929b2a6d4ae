#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace nmeabridge::net {

    inline dp::String errno_string(const char *what) { return dp::String(what) + ": " + std::strerror(errno); }

    // ─── RAII TCP socket ────────────────────────────────────────────────────────
    class Socket {
        int fd_ = -1;

      public:
        Socket() = default;
        explicit Socket(int fd) : fd_(fd) {}
        ~Socket() { close(); }

        Socket(const Socket &) = delete;
        Socket &operator=(const Socket &) = delete;
        Socket(Socket &&o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
        Socket &operator=(Socket &&o) noexcept {
            if (this != &o) {
                close();
                fd_ = o.fd_;
                o.fd_ = -1;
            }
            return *this;
        }

        int fd() const noexcept { return fd_; }
        bool valid() const noexcept { return fd_ >= 0; }

        void close() noexcept {
            if (fd_ >= 0) {
                ::close(fd_);
                fd_ = -1;
            }
        }

        // Unblocks readers and writers on other threads; the fd stays owned
        void shutdown() noexcept {
            if (fd_ >= 0)
                ::shutdown(fd_, SHUT_RDWR);
        }

        // ─── Server side ────────────────────────────────────────────────────────
        static Result<Socket> listen(const dp::String &bind_addr, u16 port, int backlog = 16) {
            int fd = ::socket(AF_INET, SOCK_STREAM, 0);
            if (fd < 0)
                return Result<Socket>::err(Error::bind_failed(port, errno_string("socket")));
            Socket s(fd);
            int opt = 1;
            ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

            sockaddr_in addr{};
            addr.sin_family = AF_INET;
            addr.sin_port = htons(port);
            if (bind_addr.empty() || bind_addr == "0.0.0.0") {
                addr.sin_addr.s_addr = INADDR_ANY;
            } else if (::inet_pton(AF_INET, bind_addr.c_str(), &addr.sin_addr) != 1) {
                return Result<Socket>::err(Error::bind_failed(port, "invalid bind address " + bind_addr));
            }
            if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0)
                return Result<Socket>::err(Error::bind_failed(port, errno_string("bind")));
            if (::listen(fd, backlog) < 0)
                return Result<Socket>::err(Error::bind_failed(port, errno_string("listen")));
            return Result<Socket>::ok(std::move(s));
        }

        // Invalid socket on timeout
        Result<Socket> accept(int timeout_ms, dp::String *peer = nullptr) const {
            pollfd pfd{fd_, POLLIN, 0};
            int r = ::poll(&pfd, 1, timeout_ms);
            if (r < 0) {
                if (errno == EINTR)
                    return Result<Socket>::ok(Socket());
                return Result<Socket>::err(Error::socket_error(errno_string("poll")));
            }
            if (r == 0)
                return Result<Socket>::ok(Socket());
            if (pfd.revents & (POLLERR | POLLNVAL))
                return Result<Socket>::err(Error::socket_error("listener closed"));

            sockaddr_in addr{};
            socklen_t len = sizeof(addr);
            int cfd = ::accept(fd_, reinterpret_cast<sockaddr *>(&addr), &len);
            if (cfd < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR || errno == ECONNABORTED)
                    return Result<Socket>::ok(Socket());
                return Result<Socket>::err(Error::socket_error(errno_string("accept")));
            }
            if (peer) {
                char buf[INET_ADDRSTRLEN] = {};
                ::inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf));
                *peer = dp::String(buf) + ":" + dp::String(std::to_string(ntohs(addr.sin_port)));
            }
            Socket s(cfd);
            s.set_nodelay();
            return Result<Socket>::ok(std::move(s));
        }

        u16 local_port() const {
            sockaddr_in addr{};
            socklen_t len = sizeof(addr);
            if (::getsockname(fd_, reinterpret_cast<sockaddr *>(&addr), &len) < 0)
                return 0;
            return ntohs(addr.sin_port);
        }

        // ─── Client side ────────────────────────────────────────────────────────
        static Result<Socket> connect(const dp::String &host, u16 port) {
            addrinfo hints{};
            hints.ai_family = AF_INET;
            hints.ai_socktype = SOCK_STREAM;
            addrinfo *res = nullptr;
            dp::String service = dp::String(std::to_string(port));
            int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
            if (rc != 0 || !res)
                return Result<Socket>::err(Error::socket_error("resolve " + host + ": " + ::gai_strerror(rc)));

            Socket s(::socket(res->ai_family, res->ai_socktype, res->ai_protocol));
            if (!s.valid()) {
                ::freeaddrinfo(res);
                return Result<Socket>::err(Error::socket_error(errno_string("socket")));
            }
            int c = ::connect(s.fd(), res->ai_addr, res->ai_addrlen);
            ::freeaddrinfo(res);
            if (c < 0)
                return Result<Socket>::err(
                    Error::socket_error(errno_string(("connect " + host + ":" + service).c_str())));
            s.set_nodelay();
            return Result<Socket>::ok(std::move(s));
        }

        void set_nodelay() noexcept {
            int opt = 1;
            ::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
        }

        // ─── I/O ────────────────────────────────────────────────────────────────
        Result<void> send_all(const u8 *data, usize len) const {
            usize sent = 0;
            while (sent < len) {
                ssize_t n = ::send(fd_, data + sent, len - sent, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EINTR)
                        continue;
                    if (errno == EPIPE || errno == ECONNRESET)
                        return Result<void>::err(Error::disconnected());
                    return Result<void>::err(Error::socket_error(errno_string("send")));
                }
                sent += static_cast<usize>(n);
            }
            return {};
        }

        Result<void> send_all(const Bytes &data) const { return send_all(data.data(), data.size()); }
        Result<void> send_all(const dp::String &s) const {
            return send_all(reinterpret_cast<const u8 *>(s.data()), s.size());
        }

        // Error::timeout when nothing arrived, Error::disconnected on orderly close
        Result<usize> recv(u8 *buf, usize cap, int timeout_ms) const {
            pollfd pfd{fd_, POLLIN, 0};
            int r = ::poll(&pfd, 1, timeout_ms);
            if (r < 0) {
                if (errno == EINTR)
                    return Result<usize>::err(Error::timeout());
                return Result<usize>::err(Error::socket_error(errno_string("poll")));
            }
            if (r == 0)
                return Result<usize>::err(Error::timeout());
            ssize_t n = ::recv(fd_, buf, cap, 0);
            if (n == 0)
                return Result<usize>::err(Error::disconnected());
            if (n < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                    return Result<usize>::err(Error::timeout());
                if (errno == ECONNRESET)
                    return Result<usize>::err(Error::disconnected());
                return Result<usize>::err(Error::socket_error(errno_string("recv")));
            }
            return Result<usize>::ok(static_cast<usize>(n));
        }
    };

} // namespace nmeabridge::net
