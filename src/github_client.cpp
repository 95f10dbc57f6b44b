#include "github_client.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "util.hpp"
#include <curl/curl.h>
#include <json-c/json.h>
#include <memory>
#include <new>
#include <sstream>

static size_t wr(void* c, size_t s, size_t n, void* u) {
    ((std::string*)u)->append((char*)c, s*n); return s*n;
}

CurlTransport::CurlTransport(long timeout_seconds): timeout_seconds_(timeout_seconds) {}

GHResult CurlTransport::send(const HttpRequest& req){
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> h(curl_easy_init(), &curl_easy_cleanup);
    if (!h) throw RemoteUnavailable("curl init failed");

    struct curl_slist* raw = nullptr;
    for (const auto& hdr: req.headers) raw = curl_slist_append(raw, hdr.c_str());
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> hdrs(raw, &curl_slist_free_all);

    std::string resp; long code=0;
    curl_easy_setopt(h.get(), CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(h.get(), CURLOPT_HTTPHEADER, hdrs.get());
    curl_easy_setopt(h.get(), CURLOPT_WRITEFUNCTION, wr);
    curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, &resp);
    curl_easy_setopt(h.get(), CURLOPT_CUSTOMREQUEST, req.method.c_str());
    curl_easy_setopt(h.get(), CURLOPT_NOSIGNAL, 1L);
    if (timeout_seconds_ > 0) curl_easy_setopt(h.get(), CURLOPT_TIMEOUT, timeout_seconds_);
    if (!req.body.empty()) {
        curl_easy_setopt(h.get(), CURLOPT_POSTFIELDS, req.body.c_str());
        curl_easy_setopt(h.get(), CURLOPT_POSTFIELDSIZE, (long)req.body.size());
    }

    CURLcode rc = curl_easy_perform(h.get());
    if (rc != CURLE_OK) {
        if (rc == CURLE_OPERATION_TIMEDOUT)
            throw RemoteUnavailable("request timed out after " + std::to_string(timeout_seconds_) + "s");
        throw RemoteUnavailable(std::string("request failed: ") + curl_easy_strerror(rc));
    }
    curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, &code);
    log_msg(LogLevel::Debug, "%s %s -> %ld", req.method.c_str(), req.url.c_str(), code);
    return {(int)code, resp};
}

GitHubClient::GitHubClient(GHConfig cfg, HttpTransport& transport)
    : cfg_(std::move(cfg)), transport_(transport) {}

// Percent-encodes everything outside the unreserved set.
static std::string url_escape(const std::string& s){
    std::unique_ptr<char, decltype(&curl_free)> e(
        curl_easy_escape(nullptr, s.c_str(), (int)s.size()), &curl_free);
    if (!e) throw std::bad_alloc();
    return e.get();
}

// Escapes each segment and keeps the slashes between them.
static std::string escape_path(const std::string& path){
    std::string out;
    size_t start = 0;
    while (true) {
        size_t slash = path.find('/', start);
        out += url_escape(path.substr(start, slash == std::string::npos ? std::string::npos : slash - start));
        if (slash == std::string::npos) break;
        out += '/';
        start = slash + 1;
    }
    return out;
}

std::string GitHubClient::contents_url(const std::string& path) const {
    std::ostringstream u;
    u << cfg_.api_base << "/repos/" << url_escape(cfg_.owner) << "/" << url_escape(cfg_.repo)
      << "/contents/" << escape_path(path);
    return u.str();
}

std::vector<std::string> GitHubClient::headers(bool with_body) const {
    std::vector<std::string> h;
    h.push_back("User-Agent: tosk");
    h.push_back("Accept: application/vnd.github+json");
    h.push_back("Authorization: Bearer " + cfg_.token);
    if (with_body) h.push_back("Content-Type: application/json");
    return h;
}

GHResult GitHubClient::get_contents(const std::string& path, const std::string& branch){
    HttpRequest req;
    req.method = "GET";
    req.url = contents_url(path) + "?ref=" + url_escape(branch);
    req.headers = headers(false);
    return transport_.send(req);
}

GHResult GitHubClient::put_contents(const std::string& path,
    const std::string& msg, const std::string& b64,
    const std::string& branch, const std::optional<std::string>& sha){
    std::ostringstream body;
    body << "{\"message\":\"" << escape_json(msg) << "\",\"content\":\"" << b64 << "\"";
    if (sha) body << ",\"sha\":\"" << escape_json(*sha) << "\"";
    body << ",\"branch\":\"" << escape_json(branch) << "\"}";

    HttpRequest req;
    req.method = "PUT";
    req.url = contents_url(path);
    req.headers = headers(true);
    req.body = body.str();
    return transport_.send(req);
}

std::optional<ContentsEntry> parse_contents_response(const std::string& body){
    json_object* root = json_tokener_parse(body.c_str());
    if (!root) return std::nullopt;
    std::unique_ptr<json_object, decltype(&json_object_put)> guard(root, &json_object_put);
    if (!json_object_is_type(root, json_type_object)) return std::nullopt;

    json_object* jsha=nullptr; json_object* jcontent=nullptr; json_object* jenc=nullptr;
    if (!json_object_object_get_ex(root, "sha", &jsha) || !json_object_is_type(jsha, json_type_string))
        return std::nullopt;
    ContentsEntry e;
    e.sha = json_object_get_string(jsha);
    if (json_object_object_get_ex(root, "content", &jcontent) && json_object_is_type(jcontent, json_type_string)) {
        e.content = json_object_get_string(jcontent);
        e.has_content = true;
    }
    if (json_object_object_get_ex(root, "encoding", &jenc) && json_object_is_type(jenc, json_type_string))
        e.encoding = json_object_get_string(jenc);
    return e;
}
