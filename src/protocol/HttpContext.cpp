#include "fwdgate/protocol/HttpContext.h"
#include "fwdgate/network/Buffer.h"
#include "fwdgate/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace fwdgate {
namespace protocol {

static std::string ToLowerCopy(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

static std::string TrimCopy(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

static bool IsDigits(const std::string& s) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
    }
    return true;
}

void HttpContext::consume(fwdgate::network::Buffer* buf, size_t n) {
    buf->Retrieve(n);
    consumed_ += n;
}

bool HttpContext::processRequestLine(const char* begin, const char* end) {
    bool succeed = false;
    const char* start = begin;
    const char* space = std::find(start, end, ' ');
    if (space != end && request_.setMethod(start, space)) {
        start = space + 1;
        space = std::find(start, end, ' ');
        if (space != end && space != start) {
            const char* question = std::find(start, space, '?');
            if (question != space) {
                request_.setPath(start, question);
                request_.setQuery(question, space);
            } else {
                request_.setPath(start, space);
            }
            start = space + 1;
            succeed = end - start == 8 && std::equal(start, end - 1, "HTTP/1.");
            if (succeed) {
                if (*(end - 1) == '1') {
                    request_.setVersion(HttpRequest::kHttp11);
                } else if (*(end - 1) == '0') {
                    request_.setVersion(HttpRequest::kHttp10);
                } else {
                    succeed = false;
                }
            }
        }
    }
    return succeed;
}

// Decides how the body is framed once the blank line after the headers is seen.
bool HttpContext::processHeadersEnd() {
    chunked_ = false;
    bodyRemaining_ = 0;
    chunkSize_ = 0;
    expectingChunkSize_ = true;

    const std::string te = request_.getHeader("Transfer-Encoding");
    if (!te.empty()) {
        if (ToLowerCopy(TrimCopy(te)).find("chunked") == std::string::npos) {
            return fail(kBadRequest);
        }
        chunked_ = true;
    } else {
        const std::vector<std::string> lengths = request_.getHeaderValues("Content-Length");
        if (!lengths.empty()) {
            const std::string cl = TrimCopy(lengths.front());
            for (const auto& other : lengths) {
                if (TrimCopy(other) != cl) return fail(kBadRequest);
            }
            if (!IsDigits(cl) || cl.size() > 18) {
                return fail(kBadRequest);
            }
            unsigned long long v = std::strtoull(cl.c_str(), nullptr, 10);
            if (v > maxRequestBytes_ || consumed_ + v > maxRequestBytes_) {
                return fail(kTooLarge);
            }
            bodyRemaining_ = static_cast<size_t>(v);
        }
    }

    state_ = (chunked_ || bodyRemaining_ > 0) ? kExpectBody : kGotAll;
    return true;
}

bool HttpContext::parseChunkedBody(fwdgate::network::Buffer* buf, bool* hasMore) {
    while (true) {
        if (expectingChunkSize_) {
            const char* crlf = buf->FindCRLF();
            if (crlf == nullptr) {
                *hasMore = false;
                if (consumed_ + buf->ReadableBytes() > maxRequestBytes_) return fail(kTooLarge);
                return true;
            }
            std::string line(buf->Peek(), crlf);
            consume(buf, static_cast<size_t>(crlf + 2 - buf->Peek()));

            // Strip chunk extensions.
            auto semi = line.find(';');
            if (semi != std::string::npos) line = line.substr(0, semi);
            line = TrimCopy(line);
            if (line.empty()) return fail(kBadRequest);

            char* endp = nullptr;
            long long sz = std::strtoll(line.c_str(), &endp, 16);
            if (*endp != '\0' || sz < 0) return fail(kBadRequest);
            if (static_cast<unsigned long long>(sz) > maxRequestBytes_ ||
                consumed_ + static_cast<size_t>(sz) > maxRequestBytes_) {
                return fail(kTooLarge);
            }
            chunkSize_ = static_cast<size_t>(sz);
            expectingChunkSize_ = false;

            if (chunkSize_ == 0) {
                inTrailers_ = true;
            }
        }

        if (inTrailers_) {
            // Trailer fields are discarded; an empty line ends the body.
            const char* crlf = buf->FindCRLF();
            if (crlf == nullptr) {
                *hasMore = false;
                if (consumed_ + buf->ReadableBytes() > maxRequestBytes_) return fail(kTooLarge);
                return true;
            }
            const bool last = crlf == buf->Peek();
            consume(buf, static_cast<size_t>(crlf + 2 - buf->Peek()));
            if (consumed_ > maxRequestBytes_) return fail(kTooLarge);
            if (last) {
                inTrailers_ = false;
                state_ = kGotAll;
                *hasMore = false;
                return true;
            }
            continue;
        }

        // Need chunkSize_ bytes + CRLF.
        if (buf->ReadableBytes() < chunkSize_ + 2) {
            *hasMore = false;
            return true;
        }
        request_.appendBody(buf->Peek(), chunkSize_);
        consume(buf, chunkSize_);
        const char* p = buf->Peek();
        if (p[0] != '\r' || p[1] != '\n') return fail(kBadRequest);
        consume(buf, 2);
        expectingChunkSize_ = true;
    }
}

// return false if any error
bool HttpContext::parseRequest(fwdgate::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime) {
    (void)receiveTime;
    bool hasMore = true;
    while (hasMore) {
        if (state_ == kExpectRequestLine || state_ == kExpectHeaders) {
            const char* crlf = buf->FindCRLF();
            if (crlf == nullptr) {
                if (consumed_ + buf->ReadableBytes() > maxRequestBytes_) return fail(kTooLarge);
                hasMore = false;
                continue;
            }
            if (consumed_ + static_cast<size_t>(crlf + 2 - buf->Peek()) > maxRequestBytes_) {
                return fail(kTooLarge);
            }

            if (state_ == kExpectRequestLine) {
                if (!processRequestLine(buf->Peek(), crlf)) {
                    return fail(kBadRequest);
                }
                consume(buf, static_cast<size_t>(crlf + 2 - buf->Peek()));
                state_ = kExpectHeaders;
                continue;
            }

            if (crlf == buf->Peek()) {
                // empty line, end of headers
                consume(buf, 2);
                if (!processHeadersEnd()) return false;
                hasMore = (state_ != kGotAll);
                continue;
            }

            const char* colon = std::find(buf->Peek(), crlf, ':');
            // Folded continuation lines and lines without a field name are rejected.
            if (colon == crlf || colon == buf->Peek() ||
                std::isspace(static_cast<unsigned char>(*buf->Peek()))) {
                return fail(kBadRequest);
            }
            request_.addHeader(buf->Peek(), colon, crlf);
            consume(buf, static_cast<size_t>(crlf + 2 - buf->Peek()));
        } else if (state_ == kExpectBody) {
            if (chunked_) {
                if (!parseChunkedBody(buf, &hasMore)) return false;
            } else {
                const size_t n = std::min(bodyRemaining_, buf->ReadableBytes());
                if (n > 0) {
                    request_.appendBody(buf->Peek(), n);
                    consume(buf, n);
                    bodyRemaining_ -= n;
                }
                if (bodyRemaining_ == 0) {
                    state_ = kGotAll;
                }
                hasMore = false;
            }
        } else {
            hasMore = false;
        }
    }
    return true;
}

} // namespace protocol
} // namespace fwdgate
