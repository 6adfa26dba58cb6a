#include "http_message.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <sstream>

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

// ── Request ─────────────────────────────────────────────────

HttpRequest HttpRequest::get(const std::string& path) {
    HttpRequest r;
    r.method = "GET";
    r.path = path;
    return r;
}

HttpRequest HttpRequest::post(const std::string& path, std::string body,
                              const std::string& content_type, bool idempotent) {
    HttpRequest r;
    r.method = "POST";
    r.path = path;
    r.body = std::move(body);
    r.headers["Content-Type"] = content_type;
    r.idempotent = idempotent;
    return r;
}

std::string serialize_request(const HttpRequest& req, const std::string& host_header) {
    std::string out = fmt::format("{} {} HTTP/1.1\r\n", req.method,
                                  req.path.empty() ? "/" : req.path);
    out += "Host: " + host_header + "\r\n";

    bool has_conn = false;
    for (const auto& [k, v] : req.headers) {
        std::string lk = lower(k);
        if (lk == "host" || lk == "content-length") continue;
        if (lk == "connection") has_conn = true;
        out += k + ": " + v + "\r\n";
    }
    if (!has_conn) out += "Connection: keep-alive\r\n";
    if (!req.body.empty() || req.method == "POST" || req.method == "PUT") {
        out += fmt::format("Content-Length: {}\r\n", req.body.size());
    }
    out += "\r\n";
    out += req.body;
    return out;
}

// ── Response ────────────────────────────────────────────────

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(lower(name));
    return it == headers.end() ? "" : it->second;
}

void HttpResponseParser::fail(const std::string& msg) {
    state_ = State::Error;
    error_ = msg;
}

bool HttpResponseParser::feed(const char* data, size_t len) {
    if (state_ == State::Done || state_ == State::Error) return complete();
    buf_.append(data, len);
    while (advance()) {}
    return complete();
}

void HttpResponseParser::on_eof() {
    if (state_ == State::CloseBody) {
        response_.body += buf_;
        buf_.clear();
        response_.keep_alive = false;
        state_ = State::Done;
    } else if (state_ != State::Done && state_ != State::Error) {
        fail("connection closed mid-response");
    }
}

HttpResponse HttpResponseParser::take() {
    return std::move(response_);
}

bool HttpResponseParser::parse_headers() {
    auto end = buf_.find("\r\n\r\n");
    if (end == std::string::npos) {
        if (buf_.size() > HTTP_MAX_HEADER_BYTES) fail("response headers too large");
        return false;
    }

    std::istringstream in(buf_.substr(0, end));
    std::string status_line;
    std::getline(in, status_line);
    if (!status_line.empty() && status_line.back() == '\r') status_line.pop_back();

    // "HTTP/1.1 200 OK"
    if (status_line.compare(0, 5, "HTTP/") != 0) {
        fail("malformed status line: " + status_line.substr(0, 64));
        return false;
    }
    auto sp = status_line.find(' ');
    response_.status_code = (sp == std::string::npos) ? 0 : safe_stoi(status_line.substr(sp + 1, 3), 0);
    if (response_.status_code < 100) {
        fail("malformed status line: " + status_line.substr(0, 64));
        return false;
    }
    bool http10 = status_line.compare(0, 8, "HTTP/1.0") == 0;

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string key = lower(line.substr(0, colon));
        std::string value = line.substr(colon + 1);
        trim(value);
        response_.headers[key] = value;
    }
    buf_.erase(0, end + 4);

    std::string conn = lower(response_.header("connection"));
    response_.keep_alive = http10 ? (conn == "keep-alive") : (conn != "close");

    int code = response_.status_code;
    if ((code >= 100 && code < 200) || code == 204 || code == 304) {
        state_ = State::Done;
    } else if (lower(response_.header("transfer-encoding")).find("chunked") != std::string::npos) {
        state_ = State::ChunkSize;
    } else if (!response_.header("content-length").empty()) {
        try {
            remaining_ = static_cast<size_t>(std::stoull(response_.header("content-length")));
        } catch (const std::exception&) {
            fail("invalid Content-Length");
            return false;
        }
        state_ = remaining_ == 0 ? State::Done : State::FixedBody;
    } else {
        state_ = State::CloseBody;
    }
    return true;
}

// One parsing step. Returns true if progress was made and more may follow.
bool HttpResponseParser::advance() {
    switch (state_) {
        case State::Headers:
            return parse_headers();

        case State::FixedBody: {
            size_t n = std::min(remaining_, buf_.size());
            response_.body.append(buf_, 0, n);
            buf_.erase(0, n);
            remaining_ -= n;
            if (remaining_ == 0) {
                state_ = State::Done;
                return false;
            }
            return false;
        }

        case State::ChunkSize: {
            auto eol = buf_.find("\r\n");
            if (eol == std::string::npos) return false;
            std::string size_line = buf_.substr(0, eol);
            auto semi = size_line.find(';');
            if (semi != std::string::npos) size_line.erase(semi);
            trim(size_line);
            try {
                remaining_ = static_cast<size_t>(std::stoull(size_line, nullptr, 16));
            } catch (const std::exception&) {
                fail("invalid chunk size");
                return false;
            }
            buf_.erase(0, eol + 2);
            state_ = remaining_ == 0 ? State::ChunkTrailer : State::ChunkData;
            return true;
        }

        case State::ChunkData: {
            if (buf_.size() < remaining_ + 2) return false;
            response_.body.append(buf_, 0, remaining_);
            buf_.erase(0, remaining_ + 2);  // data + CRLF
            state_ = State::ChunkSize;
            return true;
        }

        case State::ChunkTrailer: {
            auto eol = buf_.find("\r\n");
            if (eol == std::string::npos) return false;
            buf_.erase(0, eol + 2);
            if (eol == 0) {
                state_ = State::Done;
                return false;
            }
            return true;  // skip trailer header
        }

        case State::CloseBody:
            response_.body += buf_;
            buf_.clear();
            return false;

        case State::Done:
        case State::Error:
            return false;
    }
    return false;
}

// ── Form encoding ───────────────────────────────────────────

std::string url_encode(const std::string& s) {
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += fmt::format("%{:02X}", c);
        }
    }
    return out;
}

std::string form_encode(const std::map<std::string, std::string>& fields) {
    std::string out;
    for (const auto& [k, v] : fields) {
        if (!out.empty()) out += "&";
        out += url_encode(k) + "=" + url_encode(v);
    }
    return out;
}
