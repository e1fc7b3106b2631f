#pragma once

#include <string>
#include <vector>
#include <utility>
#include <stdio.h>
#include <cstring>

#include "fwdgate/network/Buffer.h"
#include "fwdgate/protocol/HttpRequest.h"

namespace fwdgate {
namespace protocol {

class HttpResponse {
public:
    enum HttpStatusCode {
        kUnknown,
        k200Ok = 200,
        k204NoContent = 204,
        k301MovedPermanently = 301,
        k400BadRequest = 400,
        k404NotFound = 404,
        k405MethodNotAllowed = 405,
        k408RequestTimeout = 408,
        k413PayloadTooLarge = 413,
        k500InternalServerError = 500,
        k503ServiceUnavailable = 503,
    };

    explicit HttpResponse(bool close)
        : statusCode_(k200Ok), closeConnection_(close) {}

    // Also resets the status message to the standard reason phrase.
    void setStatusCode(HttpStatusCode code) {
        statusCode_ = code;
        statusMessage_ = ReasonPhrase(code);
    }
    HttpStatusCode statusCode() const { return statusCode_; }
    void setStatusMessage(const std::string& message) { statusMessage_ = message; }
    const std::string& statusMessage() const { return statusMessage_; }
    void setCloseConnection(bool on) { closeConnection_ = on; }
    bool closeConnection() const { return closeConnection_; }
    void setContentType(const std::string& contentType) { addHeader("Content-Type", contentType); }

    // Content-Length and Connection are always generated and cannot be overridden.
    void addHeader(const std::string& key, const std::string& value) {
        if (HttpRequest::iequals(key, "Content-Length") || HttpRequest::iequals(key, "Connection")) {
            return;
        }
        headers_.emplace_back(key, value);
    }
    const std::vector<std::pair<std::string, std::string>>& headers() const { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    const std::string& body() const { return body_; }

    // A response to HEAD carries the headers of the GET response and no body.
    void appendToBuffer(fwdgate::network::Buffer* output, bool omitBody = false) const {
        char buf[64];
        snprintf(buf, sizeof buf, "HTTP/1.1 %d ", static_cast<int>(statusCode_));
        output->Append(buf, strlen(buf));
        output->Append(statusMessage_.empty() ? std::string(ReasonPhrase(statusCode_)) : statusMessage_);
        output->Append("\r\n");

        snprintf(buf, sizeof buf, "Content-Length: %zu\r\n", body_.size());
        output->Append(buf, strlen(buf));
        if (closeConnection_) {
            output->Append("Connection: close\r\n");
        } else {
            output->Append("Connection: keep-alive\r\n");
        }

        for (const auto& header : headers_) {
            output->Append(header.first);
            output->Append(": ");
            output->Append(header.second);
            output->Append("\r\n");
        }

        output->Append("\r\n");
        if (!omitBody) {
            output->Append(body_);
        }
    }

    static const char* ReasonPhrase(HttpStatusCode code) {
        switch (code) {
            case k200Ok: return "OK";
            case k204NoContent: return "No Content";
            case k301MovedPermanently: return "Moved Permanently";
            case k400BadRequest: return "Bad Request";
            case k404NotFound: return "Not Found";
            case k405MethodNotAllowed: return "Method Not Allowed";
            case k408RequestTimeout: return "Request Timeout";
            case k413PayloadTooLarge: return "Payload Too Large";
            case k500InternalServerError: return "Internal Server Error";
            case k503ServiceUnavailable: return "Service Unavailable";
            default: return "Unknown";
        }
    }

private:
    HttpStatusCode statusCode_;
    std::string statusMessage_;
    bool closeConnection_;
    std::vector<std::pair<std::string, std::string>> headers_;
    std::string body_;
};

} // namespace protocol
} // namespace fwdgate
