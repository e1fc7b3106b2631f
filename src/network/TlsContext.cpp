#include "fwdgate/network/TlsContext.h"
#include "fwdgate/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <mutex>

namespace fwdgate {
namespace network {

namespace {

// ALPN wire format: length-prefixed protocol names.
const unsigned char kAlpnHttp11[] = {8, 'h', 't', 't', 'p', '/', '1', '.', '1'};

int SelectAlpn(SSL* ssl, const unsigned char** out, unsigned char* outlen,
               const unsigned char* in, unsigned int inlen, void* arg) {
    (void)ssl;
    (void)arg;
    unsigned char* selected = nullptr;
    if (SSL_select_next_proto(&selected, outlen, kAlpnHttp11, sizeof(kAlpnHttp11), in, inlen) !=
        OPENSSL_NPN_NEGOTIATED) {
        // No overlap: continue without ALPN rather than failing the handshake.
        return SSL_TLSEXT_ERR_NOACK;
    }
    *out = selected;
    return SSL_TLSEXT_ERR_OK;
}

} // namespace

std::string TlsContext::LastError() {
    std::string msg;
    unsigned long e;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        if (!msg.empty()) msg += "; ";
        msg += buf;
    }
    return msg.empty() ? "unknown error" : msg;
}

TlsContext::TlsContext() {
    static std::once_flag once;
    std::call_once(once, []() {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
    });
}

TlsContext::~TlsContext() {
    SSL_CTX_free(reinterpret_cast<SSL_CTX*>(ctx_));
}

bool TlsContext::InitServer(const std::string& certPemPath, const std::string& keyPemPath, std::string* err) {
    auto fail = [err](const std::string& msg) {
        if (err) *err = msg;
        return false;
    };
    if (certPemPath.empty() || keyPemPath.empty()) {
        return fail("cert_path and key_path are required");
    }

    SSL_CTX* c = SSL_CTX_new(TLS_server_method());
    if (!c) {
        return fail("SSL_CTX_new: " + LastError());
    }
    SSL_CTX_set_min_proto_version(c, TLS1_2_VERSION);
    SSL_CTX_set_options(c, SSL_OP_NO_COMPRESSION | SSL_OP_NO_RENEGOTIATION);
    SSL_CTX_set_mode(c, SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER | SSL_MODE_ENABLE_PARTIAL_WRITE);
    SSL_CTX_set_alpn_select_cb(c, SelectAlpn, nullptr);

    std::string why;
    if (SSL_CTX_use_certificate_chain_file(c, certPemPath.c_str()) != 1) {
        why = "load cert " + certPemPath + ": " + LastError();
    } else if (SSL_CTX_use_PrivateKey_file(c, keyPemPath.c_str(), SSL_FILETYPE_PEM) != 1) {
        why = "load key " + keyPemPath + ": " + LastError();
    } else if (SSL_CTX_check_private_key(c) != 1) {
        why = "key " + keyPemPath + " does not match cert " + certPemPath;
    }
    if (!why.empty()) {
        SSL_CTX_free(c);
        return fail(why);
    }

    SSL_CTX_free(reinterpret_cast<SSL_CTX*>(ctx_));
    ctx_ = reinterpret_cast<ssl_ctx_st*>(c);
    certPath_ = certPemPath;
    LOG_INFO << "TLS termination enabled, cert " << certPath_;
    return true;
}

ssl_st* TlsContext::NewSession(int fd) const {
    if (!ctx_) {
        return nullptr;
    }
    SSL* s = SSL_new(reinterpret_cast<SSL_CTX*>(ctx_));
    if (!s) {
        LOG_WARN << "TLS: SSL_new failed: " << LastError();
        return nullptr;
    }
    if (SSL_set_fd(s, fd) != 1) {
        LOG_WARN << "TLS: SSL_set_fd failed: " << LastError();
        SSL_free(s);
        return nullptr;
    }
    SSL_set_accept_state(s);
    return reinterpret_cast<ssl_st*>(s);
}

} // namespace network
} // namespace fwdgate
