/*
 * Part of the HmacGate (HG) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacGate (HG). See LICENSE for details.
 */

#include "hg/secret_key.hpp"
#include "hg/internal/utils.hpp"

#include <openssl/crypto.h>

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace hg {

// Owner of the key bytes; wipes them on release.
struct SecretKey::Buffer {
    std::string bytes;

    explicit Buffer(std::string b) : bytes(std::move(b)) {}
    ~Buffer() { internal::secure_wipe(bytes); }

    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;
};

SecretKey::SecretKey()
    : _bytes(std::make_shared<const Buffer>(std::string()))
{}

SecretKey::SecretKey(std::string bytes)
    : _bytes(std::make_shared<const Buffer>(std::move(bytes)))
{}

SecretKey SecretKey::from_bytes(const void* data, std::size_t len) {
    if (!data || len == 0) return SecretKey();
    return SecretKey(std::string(static_cast<const char*>(data), len));
}

SecretKey SecretKey::from_string(const std::string& utf8) {
    return SecretKey(utf8);
}

bool SecretKey::from_hex(const std::string& hex, SecretKey& out) {
    std::string bin;
    if (!internal::hex_to_bytes(hex, bin)) return false;
    out = SecretKey(std::move(bin));
    return true;
}

SecretKey SecretKey::from_file(const std::string& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.good()) {
        throw std::runtime_error("SecretKey: failed to open secret file: " + path);
    }
    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
    if (in.bad()) {
        internal::secure_wipe(content);
        throw std::runtime_error("SecretKey: failed to read secret file: " + path);
    }
    // editors leave a trailing newline behind
    std::size_t end = content.size();
    while (end > 0 && (content[end-1] == '\n' || content[end-1] == '\r' ||
                       content[end-1] == ' '  || content[end-1] == '\t')) {
        --end;
    }
    OPENSSL_cleanse(&content[0] + end, content.size() - end);
    content.resize(end);
    return SecretKey(std::move(content));
}

const unsigned char* SecretKey::data() const noexcept {
    return reinterpret_cast<const unsigned char*>(_bytes->bytes.data());
}

std::size_t SecretKey::size() const noexcept {
    return _bytes->bytes.size();
}

} // namespace hg
