#pragma once

#include "server.hpp"

namespace nmeabridge::net {

    // ─── TCP server ─────────────────────────────────────────────────────────────
    // Raw NMEA 0183 text and NMEA 2000 wire frames as produced. Inbound bytes are
    // split into CR/LF terminated lines for the command channel.
    class TcpServer : public StreamServer {
      protected:
        ConnectionKind kind() const noexcept override { return ConnectionKind::Tcp; }
        const char *log_category() const noexcept override { return "nmeabridge.tcp"; }

        void serve(ClientConnection &conn) override {
            conn.set_filter(PayloadFilter::All, "raw");
            conn.mark_ready();

            dp::String line;
            bool overlong = false;
            u8 buf[1024];
            while (running_ && !conn.closed()) {
                auto r = conn.socket().recv(buf, sizeof(buf), 200);
                if (r.is_err()) {
                    if (r.error().code == ErrorCode::Timeout)
                        continue;
                    if (r.error().code != ErrorCode::Disconnected)
                        echo::category("nmeabridge.tcp").warn("client ", conn.id(), ": ", r.error().message);
                    return;
                }
                conn.touch();
                for (usize i = 0; i < r.value(); ++i) {
                    char c = static_cast<char>(buf[i]);
                    if (c == '\n' || c == '\r') {
                        if (!line.empty() && !overlong && on_line_)
                            on_line_(conn, line);
                        line.clear();
                        overlong = false;
                        continue;
                    }
                    if (line.size() >= MAX_LINE_LENGTH) {
                        if (!overlong)
                            echo::category("nmeabridge.tcp").warn("client ", conn.id(), ": line too long, discarded");
                        overlong = true;
                        continue;
                    }
                    line += c;
                }
            }
        }

      public:
        using StreamServer::StreamServer;
        ~TcpServer() override { stop(); }
    };

} // namespace nmeabridge::net
