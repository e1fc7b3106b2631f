#pragma once

#include "fwdgate/protocol/HttpRequest.h"
#include "fwdgate/network/Buffer.h"

#include <chrono>

namespace fwdgate {
namespace protocol {

// Incremental HTTP/1.x request parser; one per connection.
class HttpContext {
public:
    enum HttpRequestParseState {
        kExpectRequestLine,
        kExpectHeaders,
        kExpectBody,
        kGotAll,
    };

    enum ParseError {
        kNoError,
        kBadRequest,
        kTooLarge,
    };

    explicit HttpContext(size_t maxRequestBytes = 1024 * 1024)
        : state_(kExpectRequestLine), maxRequestBytes_(maxRequestBytes) {}

    // return false if some error; error() tells which
    bool parseRequest(fwdgate::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime);

    bool gotAll() const { return state_ == kGotAll; }
    // True once any part of the current request has been consumed.
    bool inProgress() const { return state_ != kExpectRequestLine; }
    ParseError error() const { return error_; }

    void reset() {
        state_ = kExpectRequestLine;
        HttpRequest dummy;
        request_.swap(dummy);
        error_ = kNoError;
        consumed_ = 0;
        chunked_ = false;
        bodyRemaining_ = 0;
        chunkSize_ = 0;
        expectingChunkSize_ = true;
        inTrailers_ = false;
    }

    const HttpRequest& request() const { return request_; }
    HttpRequest& request() { return request_; }

private:
    bool processRequestLine(const char* begin, const char* end);
    bool processHeadersEnd();
    bool parseChunkedBody(fwdgate::network::Buffer* buf, bool* hasMore);
    void consume(fwdgate::network::Buffer* buf, size_t n);
    bool fail(ParseError e) { error_ = e; return false; }

    HttpRequestParseState state_;
    HttpRequest request_;
    size_t maxRequestBytes_;
    size_t consumed_{0};
    ParseError error_{kNoError};

    // Body parsing state
    bool chunked_{false};
    size_t bodyRemaining_{0};
    size_t chunkSize_{0};
    bool expectingChunkSize_{true};
    bool inTrailers_{false};
};

} // namespace protocol
} // namespace fwdgate
