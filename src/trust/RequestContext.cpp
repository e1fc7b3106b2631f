#include "fwdgate/trust/RequestContext.h"
#include "fwdgate/protocol/HttpRequest.h"

namespace fwdgate {
namespace trust {

const char* SchemeToString(Scheme scheme) {
    return scheme == Scheme::kHttps ? "https" : "http";
}

std::string RequestContext::header(const std::string& name) const {
    for (const auto& h : headers_) {
        if (protocol::HttpRequest::iequals(h.first, name)) {
            return h.second;
        }
    }
    return std::string();
}

bool RequestContext::operator==(const RequestContext& other) const {
    return clientAddress_ == other.clientAddress_ &&
           clientPort_ == other.clientPort_ &&
           scheme_ == other.scheme_ &&
           host_ == other.host_ &&
           transportAddress_ == other.transportAddress_ &&
           transportPort_ == other.transportPort_ &&
           transportScheme_ == other.transportScheme_ &&
           forwarded_ == other.forwarded_ &&
           method_ == other.method_ &&
           path_ == other.path_ &&
           query_ == other.query_ &&
           httpVersion_ == other.httpVersion_ &&
           headers_ == other.headers_ &&
           body_ == other.body_;
}

} // namespace trust
} // namespace fwdgate
