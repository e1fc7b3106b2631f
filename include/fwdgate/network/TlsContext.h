#pragma once

#include "fwdgate/common/noncopyable.h"

#include <string>

struct ssl_ctx_st;
struct ssl_st;

namespace fwdgate {
namespace network {

// Server-side OpenSSL context of one listener. Connections hold it through a
// shared_ptr, so it outlives every session created from it.
class TlsContext : fwdgate::common::noncopyable {
public:
    TlsContext();
    ~TlsContext();

    // Loads a PEM certificate chain and private key. On failure *err says which step failed.
    // Only HTTP/1.1 is offered through ALPN.
    bool InitServer(const std::string& certPemPath, const std::string& keyPemPath, std::string* err = nullptr);
    bool ok() const { return ctx_ != nullptr; }

    // A server-side session in accept state bound to fd, or nullptr. The caller frees it
    // with SSL_free.
    ssl_st* NewSession(int fd) const;

    // Drains the OpenSSL error queue of the calling thread into one line.
    static std::string LastError();

private:
    ssl_ctx_st* ctx_{nullptr};
    std::string certPath_;
};

} // namespace network
} // namespace fwdgate
