#include "http_server.h"
#include "constants.h"
#include "errors.h"
#include "json_utils.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cstring>
#include <cctype>
#include <cerrno>
#include <sstream>
#include <iostream>
#include <algorithm>

namespace mockrun {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), ::tolower);
    return text;
}

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> segments;
    std::istringstream stream(path);
    std::string segment;
    while (std::getline(stream, segment, '/')) {
        if (!segment.empty()) {
            segments.push_back(segment);
        }
    }
    return segments;
}

HttpResponse error_response(int status, const std::string& code, const std::string& message) {
    HttpResponse resp;
    resp.status_code = status;
    Json::Value body(Json::objectValue);
    body["success"] = false;
    body["error"] = code;
    body["message"] = message;
    resp.body = JsonUtils::to_compact(body);
    return resp;
}

void write_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = write(fd, data.data() + sent, data.size() - sent);
        if (n <= 0) {
            if (n < 0 && errno == EINTR) continue;
            return;
        }
        sent += static_cast<size_t>(n);
    }
}

// Content-Length from a raw header block, or -1
long content_length_of(const std::string& head) {
    std::string lowered = to_lower(head);
    size_t pos = lowered.find("\r\ncontent-length:");
    if (pos == std::string::npos) {
        return -1;
    }
    pos += 17;
    size_t line_end = lowered.find("\r\n", pos);
    std::string value = head.substr(pos, line_end == std::string::npos ? std::string::npos : line_end - pos);
    try {
        return std::stol(value);
    } catch (const std::exception&) {
        return -1;
    }
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? "" : it->second;
}

HttpServer::HttpServer(int port) : port_(port), server_fd_(-1), running_(false) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::route(const std::string& method, const std::string& pattern, HandlerFunc handler) {
    routes_.push_back(Route{method, pattern, handler});
}

void HttpServer::start() {
    // Create socket
    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        throw InternalError("Failed to create socket");
    }

    // Allow reuse
    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    // Bind
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port_);

    if (bind(server_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(server_fd_);
        server_fd_ = -1;
        throw InternalError("Failed to bind to port " + std::to_string(port_));
    }

    // Listen
    if (listen(server_fd_, LISTEN_BACKLOG) < 0) {
        close(server_fd_);
        server_fd_ = -1;
        throw InternalError("Failed to listen");
    }

    socklen_t addr_len = sizeof(addr);
    getsockname(server_fd_, (struct sockaddr*)&addr, &addr_len);
    bound_port_ = ntohs(addr.sin_port);

    running_ = true;
    std::cout << "[Server] Listening on port " << bound_port_ << std::endl;

    // Accept connections
    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(server_fd_, (struct sockaddr*)&client_addr, &client_len);
        if (client_fd < 0) {
            if (running_) continue;
            break;
        }

        // Get client IP
        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
        std::string client_ip = ip;

        // Handle in new thread (simple concurrency)
        std::thread([this, client_fd, client_ip]() {
            handle_client(client_fd, client_ip);
            close(client_fd);
        }).detach();
    }
}

void HttpServer::stop() {
    running_ = false;
    if (server_fd_ >= 0) {
        shutdown(server_fd_, SHUT_RDWR);
        close(server_fd_);
        server_fd_ = -1;
    }
    bound_port_ = 0;
}

void HttpServer::handle_client(int client_fd, const std::string& client_ip) {
    // Read request with size limit
    std::string request_data;
    request_data.reserve(INITIAL_HTTP_BUFFER);

    char buffer[PIPE_BUFFER_SIZE];
    ssize_t bytes_read;

    while ((bytes_read = read(client_fd, buffer, sizeof(buffer))) > 0) {
        request_data.append(buffer, bytes_read);
        if (request_data.size() > MAX_REQUEST_SIZE) {
            write_all(client_fd, build_response(error_response(413, "PAYLOAD_TOO_LARGE",
                                                               "Request exceeds size limit")));
            return;
        }

        size_t header_end = request_data.find("\r\n\r\n");
        if (header_end == std::string::npos) {
            continue;
        }

        long content_length = content_length_of(request_data.substr(0, header_end + 2));
        if (content_length < 0) {
            break;
        }

        size_t expected_size = header_end + 4 + static_cast<size_t>(content_length);
        if (expected_size > MAX_REQUEST_SIZE) {
            write_all(client_fd, build_response(error_response(413, "PAYLOAD_TOO_LARGE",
                                                               "Request exceeds size limit")));
            return;
        }

        // Read remaining body if needed
        while (request_data.size() < expected_size) {
            bytes_read = read(client_fd, buffer,
                std::min(sizeof(buffer), expected_size - request_data.size()));
            if (bytes_read <= 0) break;
            request_data.append(buffer, bytes_read);
        }
        break;
    }

    if (request_data.empty()) return;

    HttpRequest req = parse_request(request_data);
    req.client_ip = client_ip;

    HttpResponse resp = dispatch(req);
    write_all(client_fd, build_response(resp));
}

HttpResponse HttpServer::dispatch(HttpRequest& req) const {
    bool path_matched = false;
    for (const auto& route : routes_) {
        std::map<std::string, std::string> params;
        if (!match_route(route.pattern, req.path, params)) {
            continue;
        }
        path_matched = true;
        if (route.method != req.method) {
            continue;
        }

        req.path_params = params;
        try {
            return route.handler(req);
        } catch (const ExecutionError& e) {
            return error_response(e.status(), e.code(), e.what());
        } catch (const std::exception& e) {
            std::cerr << "[Server] Unhandled error on " << req.method << " " << req.path
                      << ": " << e.what() << std::endl;
            return error_response(500, "INTERNAL_ERROR", e.what());
        }
    }

    if (path_matched) {
        return error_response(405, "METHOD_NOT_ALLOWED", "Method not allowed: " + req.method);
    }
    return error_response(404, "NOT_FOUND", "Not found: " + req.path);
}

HttpRequest HttpServer::parse_request(const std::string& raw) {
    HttpRequest req;

    size_t header_end = raw.find("\r\n\r\n");
    std::string head = header_end == std::string::npos ? raw : raw.substr(0, header_end);
    req.body = header_end == std::string::npos ? "" : raw.substr(header_end + 4);

    std::istringstream stream(head);

    // Parse request line
    std::string line;
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    size_t space1 = line.find(' ');
    size_t space2 = line.find(' ', space1 + 1);

    if (space1 != std::string::npos && space2 != std::string::npos) {
        req.method = line.substr(0, space1);
        std::string target = line.substr(space1 + 1, space2 - space1 - 1);
        size_t question = target.find('?');
        req.path = url_decode(target.substr(0, question));
        if (question != std::string::npos) {
            req.query = parse_query(target.substr(question + 1));
        }
    }

    // Parse headers
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            std::string key = to_lower(line.substr(0, colon));
            size_t value_start = line.find_first_not_of(' ', colon + 1);
            req.headers[key] = value_start == std::string::npos ? "" : line.substr(value_start);
        }
    }

    return req;
}

std::map<std::string, std::string> HttpServer::parse_query(const std::string& query) {
    std::map<std::string, std::string> params;
    std::istringstream stream(query);
    std::string pair;
    while (std::getline(stream, pair, '&')) {
        if (pair.empty()) continue;
        size_t eq = pair.find('=');
        std::string key = url_decode(pair.substr(0, eq));
        std::string value = eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1));
        params[key] = value;
    }
    return params;
}

std::string HttpServer::url_decode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '+') {
            out += ' ';
        } else if (text[i] == '%' && i + 2 < text.size() &&
                   std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            out += static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += text[i];
        }
    }
    return out;
}

bool HttpServer::match_route(const std::string& pattern, const std::string& path,
                             std::map<std::string, std::string>& params) {
    auto pattern_segments = split_path(pattern);
    auto path_segments = split_path(path);
    if (pattern_segments.size() != path_segments.size()) {
        return false;
    }

    for (size_t i = 0; i < pattern_segments.size(); ++i) {
        const std::string& expected = pattern_segments[i];
        if (expected.size() > 2 && expected.front() == '{' && expected.back() == '}') {
            params[expected.substr(1, expected.size() - 2)] = path_segments[i];
        } else if (expected != path_segments[i]) {
            return false;
        }
    }
    return true;
}

const char* HttpServer::status_text(int status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "Unknown";
    }
}

std::string HttpServer::build_response(const HttpResponse& resp) {
    std::ostringstream out;

    // Status line
    out << "HTTP/1.1 " << resp.status_code << " " << status_text(resp.status_code) << "\r\n";

    // Headers
    for (const auto& [key, value] : resp.headers) {
        out << key << ": " << value << "\r\n";
    }

    out << "Content-Length: " << resp.body.length() << "\r\n";
    out << "Connection: close\r\n";
    out << "\r\n";

    // Body
    out << resp.body;

    return out.str();
}

} // namespace mockrun
