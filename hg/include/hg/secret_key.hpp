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
#include <string>

namespace hg {

/**
 * Shared HMAC secret.
 *
 * Immutable after construction. Copies share one buffer, so handing the same
 * key to the request and response stages (and to every connection thread)
 * needs no locking. The buffer is wiped when the last copy goes away.
 * No length restriction is enforced here.
 */
class SecretKey {
public:
    SecretKey();

    static SecretKey from_bytes(const void* data, std::size_t len);
    static SecretKey from_string(const std::string& utf8);

    // Operator-supplied hex. Returns false on malformed hex.
    static bool from_hex(const std::string& hex, SecretKey& out);

    // Whole file content, trailing whitespace trimmed. Throws std::runtime_error
    // when the file cannot be read.
    static SecretKey from_file(const std::string& path);

    const unsigned char* data() const noexcept;
    std::size_t size() const noexcept;
    bool empty() const noexcept { return size() == 0; }

private:
    explicit SecretKey(std::string bytes);

    struct Buffer;
    std::shared_ptr<const Buffer> _bytes;
};

} // namespace hg
