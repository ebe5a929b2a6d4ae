#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "socket.hpp"
#include <cctype>
#include <cstdlib>
#include <datapod/datapod.hpp>
#include <nlohmann/json.hpp>

namespace nmeabridge::net {

    // ─── Minimal HTTP/1.1 ───────────────────────────────────────────────────────
    // Enough for the control API and the WebSocket upgrade: one request per
    // connection, Content-Length bodies only.
    struct HttpRequest {
        dp::String method;
        dp::String target;
        dp::String path;
        dp::Map<dp::String, dp::String> query;
        dp::Map<dp::String, dp::String> headers; // lower-case names
        dp::String body;

        dp::Optional<dp::String> header(const dp::String &name) const {
            auto it = headers.find(name);
            if (it == headers.end())
                return dp::nullopt;
            return it->second;
        }

        dp::Optional<dp::String> param(const dp::String &name) const {
            auto it = query.find(name);
            if (it == query.end())
                return dp::nullopt;
            return it->second;
        }
    };

    struct HttpResponse {
        u16 status = 200;
        dp::String content_type = "application/json";
        dp::String body;
        dp::Vector<std::pair<dp::String, dp::String>> headers;

        static HttpResponse raw(u16 status, dp::String body) {
            HttpResponse r;
            r.status = status;
            r.body = std::move(body);
            return r;
        }

        static HttpResponse json(u16 status, const nlohmann::json &body) { return raw(status, dp::String(body.dump())); }

        // {"error": message}
        static HttpResponse error(u16 status, const dp::String &message) {
            return raw(status, dp::String(nlohmann::json{{"error", std::string(message.c_str())}}.dump()));
        }
    };

    inline const char *status_text(u16 status) noexcept {
        switch (status) {
        case 101:
            return "Switching Protocols";
        case 200:
            return "OK";
        case 201:
            return "Created";
        case 204:
            return "No Content";
        case 400:
            return "Bad Request";
        case 404:
            return "Not Found";
        case 405:
            return "Method Not Allowed";
        case 409:
            return "Conflict";
        case 413:
            return "Payload Too Large";
        case 500:
            return "Internal Server Error";
        default:
            return "Unknown";
        }
    }

    inline dp::String to_lower(dp::String s) {
        for (auto &c : s)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return s;
    }

    inline dp::String trim(const dp::String &s) {
        usize b = 0, e = s.size();
        while (b < e && (s[b] == ' ' || s[b] == '\t'))
            ++b;
        while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r'))
            --e;
        return s.substr(b, e - b);
    }

    inline dp::String url_decode(const dp::String &s) {
        dp::String out;
        for (usize i = 0; i < s.size(); ++i) {
            if (s[i] == '%' && i + 2 < s.size() && std::isxdigit(static_cast<unsigned char>(s[i + 1])) &&
                std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
                out += static_cast<char>(std::strtol(s.substr(i + 1, 2).c_str(), nullptr, 16));
                i += 2;
            } else if (s[i] == '+') {
                out += ' ';
            } else {
                out += s[i];
            }
        }
        return out;
    }

    // Empty optional while the request is still incomplete
    inline Result<dp::Optional<HttpRequest>> parse_request(const dp::String &buf) {
        usize head_end = buf.find("\r\n\r\n");
        if (head_end == dp::String::npos) {
            if (buf.size() > MAX_HTTP_REQUEST)
                return Result<dp::Optional<HttpRequest>>::err(Error::invalid_argument("request header too large"));
            return Result<dp::Optional<HttpRequest>>::ok(dp::nullopt);
        }

        HttpRequest req;
        usize line_end = buf.find("\r\n");
        dp::String start_line = buf.substr(0, line_end);
        usize sp1 = start_line.find(' ');
        usize sp2 = start_line.find(' ', sp1 == dp::String::npos ? 0 : sp1 + 1);
        if (sp1 == dp::String::npos || sp2 == dp::String::npos)
            return Result<dp::Optional<HttpRequest>>::err(Error::invalid_argument("malformed request line"));
        req.method = start_line.substr(0, sp1);
        req.target = start_line.substr(sp1 + 1, sp2 - sp1 - 1);

        usize q = req.target.find('?');
        req.path = url_decode(req.target.substr(0, q));
        if (q != dp::String::npos) {
            dp::String qs = req.target.substr(q + 1);
            usize pos = 0;
            while (pos <= qs.size()) {
                usize amp = qs.find('&', pos);
                if (amp == dp::String::npos)
                    amp = qs.size();
                dp::String pair = qs.substr(pos, amp - pos);
                if (!pair.empty()) {
                    usize eq = pair.find('=');
                    if (eq == dp::String::npos)
                        req.query[url_decode(pair)] = "";
                    else
                        req.query[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
                }
                pos = amp + 1;
            }
        }

        usize pos = line_end + 2;
        while (pos < head_end) {
            usize eol = buf.find("\r\n", pos);
            dp::String line = buf.substr(pos, eol - pos);
            pos = eol + 2;
            usize colon = line.find(':');
            if (colon == dp::String::npos)
                continue;
            req.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
        }

        usize body_len = 0;
        if (auto cl = req.header("content-length")) {
            char *end = nullptr;
            unsigned long long n = std::strtoull(cl->c_str(), &end, 10);
            if (end == cl->c_str() || *end != '\0')
                return Result<dp::Optional<HttpRequest>>::err(Error::invalid_argument("bad content-length"));
            if (n > MAX_HTTP_REQUEST)
                return Result<dp::Optional<HttpRequest>>::err(Error::invalid_argument("request body too large"));
            body_len = static_cast<usize>(n);
        }
        usize body_start = head_end + 4;
        if (buf.size() < body_start + body_len)
            return Result<dp::Optional<HttpRequest>>::ok(dp::nullopt);
        req.body = buf.substr(body_start, body_len);
        return Result<dp::Optional<HttpRequest>>::ok(std::move(req));
    }

    inline dp::String serialize(const HttpResponse &r) {
        dp::String out = "HTTP/1.1 " + dp::String(std::to_string(r.status)) + " " + status_text(r.status) + "\r\n";
        if (!r.content_type.empty())
            out += "Content-Type: " + r.content_type + "\r\n";
        out += "Content-Length: " + dp::String(std::to_string(r.body.size())) + "\r\n";
        for (const auto &[k, v] : r.headers)
            out += k + ": " + v + "\r\n";
        out += "Connection: close\r\n\r\n";
        out += r.body;
        return out;
    }

    // Reads one complete request; gives up after timeout_ms without progress
    inline Result<HttpRequest> read_request(const Socket &sock, int timeout_ms, dp::String *leftover = nullptr) {
        dp::String buf;
        u8 chunk[2048];
        while (true) {
            auto r = sock.recv(chunk, sizeof(chunk), timeout_ms);
            if (r.is_err())
                return Result<HttpRequest>::err(r.error());
            buf.append(reinterpret_cast<const char *>(chunk), r.value());
            auto parsed = parse_request(buf);
            if (parsed.is_err())
                return Result<HttpRequest>::err(parsed.error());
            if (parsed.value()) {
                HttpRequest req = std::move(*parsed.value());
                if (leftover) {
                    usize used = buf.find("\r\n\r\n") + 4 + req.body.size();
                    *leftover = buf.substr(used);
                }
                return Result<HttpRequest>::ok(std::move(req));
            }
        }
    }

} // namespace nmeabridge::net
