/*
 * Part of the HmacGate (HG) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacGate (HG). See LICENSE for details.
 */

#pragma once
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include "hg/types.hpp"
#include "hg/secret_key.hpp"

namespace hg {

// Raised when the crypto backend itself fails. Never an auth outcome.
class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& what) : std::runtime_error(what) {}
};

// One keyed-digest computation. Feed any number of chunks, then finish once.
class HmacStream {
public:
    virtual ~HmacStream() = default;

    virtual void update(const void* data, std::size_t len) = 0;
    void update(const std::string& s) { update(s.data(), s.size()); }
    void update(const Digest& d) { update(d.data(), d.size()); }

    virtual Digest finish() = 0;
};

// HMAC-SHA256 capability. Implementations must be safe to share between
// threads; streams are not.
class HmacEngine {
public:
    virtual ~HmacEngine() = default;

    virtual std::unique_ptr<HmacStream> start(const SecretKey& key) const = 0;

    Digest compute(const SecretKey& key, const void* data, std::size_t len) const;
    Digest compute(const SecretKey& key, const std::string& data) const;
};

// OpenSSL 3 EVP_MAC backed engine.
class OpensslHmacEngine final : public HmacEngine {
public:
    OpensslHmacEngine();
    ~OpensslHmacEngine() override;

    OpensslHmacEngine(const OpensslHmacEngine&) = delete;
    OpensslHmacEngine& operator=(const OpensslHmacEngine&) = delete;

    std::unique_ptr<HmacStream> start(const SecretKey& key) const override;

private:
    struct Impl;
    std::unique_ptr<Impl> _p;
};

// Process-wide default engine (lazily constructed, thread-safe).
const HmacEngine& default_hmac_engine();

} // namespace hg
