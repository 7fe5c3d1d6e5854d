/*
 * Part of the HmacGate (HG) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacGate (HG). See LICENSE for details.
 */

#include "hg/hmac.hpp"
#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/params.h>

namespace hg {

namespace {

// Drain OpenSSL error stack into one message.
std::string openssl_errors(const char* where) {
    std::string msg = std::string("[HMAC] ") + where;
    unsigned long e = 0;
    while ((e = ::ERR_get_error()) != 0) {
        char buf[256];
        ::ERR_error_string_n(e, buf, sizeof(buf));
        msg += ": ";
        msg += buf;
    }
    return msg;
}

using MacCtxPtr = std::unique_ptr<EVP_MAC_CTX, void(*)(EVP_MAC_CTX*)>;

class OpensslHmacStream final : public HmacStream {
public:
    OpensslHmacStream(EVP_MAC* mac, const SecretKey& key)
        : _ctx(EVP_MAC_CTX_new(mac), EVP_MAC_CTX_free)
    {
        if (!_ctx) throw CryptoError(openssl_errors("EVP_MAC_CTX_new failed"));

        char digest[] = "SHA256";
        OSSL_PARAM params[] = {
            OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest, 0),
            OSSL_PARAM_construct_end()
        };
        // EVP_MAC_init treats a null key as "reuse the previous key", so an
        // empty secret still needs a valid pointer.
        static const unsigned char kEmpty[1] = {0};
        const unsigned char* k = key.empty() ? kEmpty : key.data();
        if (EVP_MAC_init(_ctx.get(), k, key.size(), params) != 1) {
            throw CryptoError(openssl_errors("EVP_MAC_init failed"));
        }
    }

    void update(const void* data, std::size_t len) override {
        if (_done) throw CryptoError("[HMAC] update after finish");
        if (len == 0) return;
        if (EVP_MAC_update(_ctx.get(), static_cast<const unsigned char*>(data), len) != 1) {
            throw CryptoError(openssl_errors("EVP_MAC_update failed"));
        }
    }

    Digest finish() override {
        if (_done) throw CryptoError("[HMAC] finish called twice");
        Digest out{};
        std::size_t out_len = 0;
        if (EVP_MAC_final(_ctx.get(), out.data(), &out_len, out.size()) != 1) {
            throw CryptoError(openssl_errors("EVP_MAC_final failed"));
        }
        if (out_len != kDigestSize) {
            throw CryptoError("[HMAC] unexpected digest length " + std::to_string(out_len));
        }
        _done = true;
        return out;
    }

private:
    MacCtxPtr _ctx;
    bool _done = false;
};

} // namespace

Digest HmacEngine::compute(const SecretKey& key, const void* data, std::size_t len) const {
    auto s = start(key);
    s->update(data, len);
    return s->finish();
}

Digest HmacEngine::compute(const SecretKey& key, const std::string& data) const {
    return compute(key, data.data(), data.size());
}

struct OpensslHmacEngine::Impl {
    EVP_MAC* mac = nullptr;
};

OpensslHmacEngine::OpensslHmacEngine()
    : _p(std::make_unique<Impl>())
{
    _p->mac = EVP_MAC_fetch(nullptr, "HMAC", nullptr);
    if (!_p->mac) {
        throw CryptoError(openssl_errors("EVP_MAC_fetch(HMAC) failed"));
    }
}

OpensslHmacEngine::~OpensslHmacEngine() {
    if (_p && _p->mac) {
        EVP_MAC_free(_p->mac);
        _p->mac = nullptr;
    }
}

std::unique_ptr<HmacStream> OpensslHmacEngine::start(const SecretKey& key) const {
    return std::make_unique<OpensslHmacStream>(_p->mac, key);
}

const HmacEngine& default_hmac_engine() {
    static const OpensslHmacEngine engine;
    return engine;
}

} // namespace hg
