#pragma once

#include <map>
#include <optional>
#include <string>
#include <core/types.hpp>

// HTTP request as seen by the transport. `path` is relative to the host
// the transport is bound to.
struct HttpRequest {
    std::string method = "GET";
    std::string path = "/";
    std::map<std::string, std::string> headers;
    std::string body;
    std::optional<Millis> timeout;   // per-call override of Settings::timeout
    bool idempotent = true;          // false = state-changing (upload, trigger)

    static HttpRequest get(const std::string& path);
    static HttpRequest post(const std::string& path, std::string body,
                            const std::string& content_type, bool idempotent = false);
};

struct HttpResponse {
    int status_code = 0;
    std::map<std::string, std::string> headers;  // keys lower-cased
    std::string body;
    bool keep_alive = true;

    bool ok() const { return status_code >= 200 && status_code < 300; }
    bool server_error() const { return status_code >= 500 && status_code < 600; }

    // Case-insensitive lookup; empty string if absent.
    std::string header(const std::string& name) const;
};

// Serialize the request line, headers and body for the wire.
std::string serialize_request(const HttpRequest& req, const std::string& host_header);

// Incremental HTTP/1.1 response parser. Understands Content-Length,
// chunked transfer encoding and close-delimited bodies.
class HttpResponseParser {
public:
    // Feed raw bytes. Returns true once a full response has been parsed.
    bool feed(const char* data, size_t len);

    // Peer closed the connection. Completes a close-delimited body;
    // anything else mid-message becomes an error.
    void on_eof();

    bool complete() const { return state_ == State::Done; }
    bool failed() const { return state_ == State::Error; }
    bool headers_done() const { return state_ != State::Headers && state_ != State::Error; }
    const std::string& error() const { return error_; }

    HttpResponse take();

private:
    enum class State { Headers, FixedBody, ChunkSize, ChunkData, ChunkTrailer, CloseBody, Done, Error };

    State state_ = State::Headers;
    std::string buf_;
    size_t remaining_ = 0;
    HttpResponse response_;
    std::string error_;

    bool parse_headers();
    bool advance();
    void fail(const std::string& msg);
};

// application/x-www-form-urlencoded helpers
std::string url_encode(const std::string& s);
std::string form_encode(const std::map<std::string, std::string>& fields);
