#pragma once
#include <string>
#include <vector>
#include <optional>

struct GHConfig {
    std::string owner;
    std::string repo;
    std::string token;
    std::string api_base = "https://api.github.com";
};

struct GHResult { int code; std::string body; };

struct HttpRequest {
    std::string method;
    std::string url;
    std::vector<std::string> headers;
    std::string body;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    // Throws RemoteUnavailable when no HTTP status was obtained.
    virtual GHResult send(const HttpRequest& req) = 0;
};

class CurlTransport : public HttpTransport {
public:
    // 0 disables the whole-request timeout.
    explicit CurlTransport(long timeout_seconds);
    GHResult send(const HttpRequest& req) override;
private:
    long timeout_seconds_;
};

// Contents API: GET /repos/{owner}/{repo}/contents/{path}?ref={branch}
// and PUT of {message, content, branch, sha?}.
class GitHubClient {
public:
    GitHubClient(GHConfig cfg, HttpTransport& transport);
    GHResult get_contents(const std::string& path, const std::string& branch);
    GHResult put_contents(const std::string& path,
                          const std::string& message,
                          const std::string& base64_content,
                          const std::string& branch,
                          const std::optional<std::string>& sha);
private:
    std::string contents_url(const std::string& path) const;
    std::vector<std::string> headers(bool with_body) const;

    GHConfig cfg_;
    HttpTransport& transport_;
};

struct ContentsEntry {
    std::string sha;
    std::string content;  // base64, possibly with line breaks
    bool has_content = false;
    std::string encoding; // "base64" for inline files, "none" above 1 MB
};

// Parses a 200 contents response. nullopt if the body is not a JSON object
// carrying a string "sha".
std::optional<ContentsEntry> parse_contents_response(const std::string& body);
