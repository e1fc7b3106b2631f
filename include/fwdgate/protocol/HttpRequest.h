#pragma once

#include <string>
#include <vector>
#include <utility>
#include <cctype>
#include <cstddef>

namespace fwdgate {
namespace protocol {

// One parsed HTTP/1.x request. Header lines are kept in arrival order, duplicates included.
class HttpRequest {
public:
    enum Method {
        kInvalid, kGet, kPost, kHead, kPut, kDelete, kPatch, kOptions
    };

    enum Version {
        kUnknown, kHttp10, kHttp11
    };

    using Header = std::pair<std::string, std::string>;
    using HeaderList = std::vector<Header>;

    HttpRequest() : method_(kInvalid), version_(kUnknown) {}

    void setVersion(Version v) { version_ = v; }
    Version getVersion() const { return version_; }
    const char* versionString() const {
        switch (version_) {
            case kHttp10: return "HTTP/1.0";
            case kHttp11: return "HTTP/1.1";
            default: return "HTTP/?";
        }
    }

    bool setMethod(const char* start, const char* end) {
        std::string m(start, end);
        if (m == "GET") method_ = kGet;
        else if (m == "POST") method_ = kPost;
        else if (m == "HEAD") method_ = kHead;
        else if (m == "PUT") method_ = kPut;
        else if (m == "DELETE") method_ = kDelete;
        else if (m == "PATCH") method_ = kPatch;
        else if (m == "OPTIONS") method_ = kOptions;
        else method_ = kInvalid;
        return method_ != kInvalid;
    }
    void setMethod(Method m) { method_ = m; }

    Method getMethod() const { return method_; }
    const char* methodString() const {
        switch (method_) {
            case kGet: return "GET";
            case kPost: return "POST";
            case kHead: return "HEAD";
            case kPut: return "PUT";
            case kDelete: return "DELETE";
            case kPatch: return "PATCH";
            case kOptions: return "OPTIONS";
            default: return "UNKNOWN";
        }
    }

    void setPath(const char* start, const char* end) {
        path_.assign(start, end);
    }
    void setPath(const std::string& path) { path_ = path; }
    const std::string& path() const { return path_; }

    // Includes the leading '?' when present.
    void setQuery(const char* start, const char* end) {
        query_.assign(start, end);
    }
    const std::string& query() const { return query_; }

    void addHeader(const char* start, const char* colon, const char* end) {
        std::string field(start, colon);
        ++colon;
        while (colon < end && isspace(static_cast<unsigned char>(*colon))) {
            ++colon;
        }
        std::string value(colon, end);
        while (!value.empty() && isspace(static_cast<unsigned char>(value[value.size() - 1]))) {
            value.resize(value.size() - 1);
        }
        headers_.emplace_back(std::move(field), std::move(value));
    }

    void addHeader(const std::string& field, const std::string& value) {
        headers_.emplace_back(field, value);
    }

    // First value of the header, matched case-insensitively; empty if absent.
    std::string getHeader(const std::string& field) const {
        for (const auto& h : headers_) {
            if (iequals(h.first, field)) {
                return h.second;
            }
        }
        return std::string();
    }

    bool hasHeader(const std::string& field) const {
        for (const auto& h : headers_) {
            if (iequals(h.first, field)) return true;
        }
        return false;
    }

    // Every value of the header in arrival order.
    std::vector<std::string> getHeaderValues(const std::string& field) const {
        std::vector<std::string> values;
        for (const auto& h : headers_) {
            if (iequals(h.first, field)) {
                values.push_back(h.second);
            }
        }
        return values;
    }

    const HeaderList& headers() const { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    void appendBody(const char* data, size_t len) { body_.append(data, len); }
    const std::string& body() const { return body_; }

    void swap(HttpRequest& that) {
        std::swap(method_, that.method_);
        std::swap(version_, that.version_);
        path_.swap(that.path_);
        query_.swap(that.query_);
        headers_.swap(that.headers_);
        body_.swap(that.body_);
    }

    static bool iequals(const std::string& a, const std::string& b) {
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) !=
                std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }

private:
    Method method_;
    Version version_;
    std::string path_;
    std::string query_;
    HeaderList headers_;
    std::string body_;
};

} // namespace protocol
} // namespace fwdgate
