#pragma once

#include <string>
#include <functional>
#include <map>
#include <vector>
#include <thread>
#include <atomic>

namespace mockrun {

// Simple HTTP request
struct HttpRequest {
    std::string method;
    std::string path;                                   // Without the query string
    std::map<std::string, std::string> query;           // Decoded query parameters
    std::map<std::string, std::string> headers;         // Keys lower-cased
    std::map<std::string, std::string> path_params;     // Filled from {name} route segments
    std::string body;
    std::string client_ip;

    // Empty when absent; name is matched case-insensitively
    std::string header(const std::string& name) const;
};

// Simple HTTP response
struct HttpResponse {
    int status_code = 200;
    std::map<std::string, std::string> headers;
    std::string body;

    HttpResponse() {
        headers["Content-Type"] = "application/json";
    }
};

// Request handler function type
using HandlerFunc = std::function<HttpResponse(const HttpRequest&)>;

// Minimal blocking HTTP/1.1 server, one thread per connection
class HttpServer {
public:
    explicit HttpServer(int port = 8443);
    ~HttpServer();

    // Path patterns may contain {name} segments, e.g. /endpoints/{id}/execute
    void route(const std::string& method, const std::string& pattern, HandlerFunc handler);

    // Start server (blocks)
    void start();

    // Stop server
    void stop();

    // Bound port once listening (resolves port 0), otherwise 0
    int port() const { return bound_port_.load(); }

    // Dispatch without a socket
    HttpResponse dispatch(HttpRequest& req) const;

    static HttpRequest parse_request(const std::string& raw);
    static std::string build_response(const HttpResponse& resp);
    static std::map<std::string, std::string> parse_query(const std::string& query);
    static std::string url_decode(const std::string& text);
    static bool match_route(const std::string& pattern, const std::string& path,
                            std::map<std::string, std::string>& params);
    static const char* status_text(int status_code);

private:
    struct Route {
        std::string method;
        std::string pattern;
        HandlerFunc handler;
    };

    int port_;
    int server_fd_;
    std::atomic<bool> running_;
    std::atomic<int> bound_port_{0};
    std::vector<Route> routes_;

    void handle_client(int client_fd, const std::string& client_ip);
};

} // namespace mockrun
