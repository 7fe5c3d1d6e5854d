/*
 * Part of the HmacGate (HG) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacGate (HG). See LICENSE for details.
 */

#include "hg/internal/utils.hpp"
#include <cctype>
#include <strings.h> // strcasecmp
#include <openssl/crypto.h>

namespace hg::internal {

void trim_inplace(std::string& s) {
    std::size_t a = 0;
    while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    std::size_t b = s.size();
    while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    if (a > 0 || b < s.size()) s.assign(s.begin()+a, s.begin()+b);
}

int hexval(char c){
    if(c>='0'&&c<='9')return c-'0';
    if(c>='a'&&c<='f')return 10+(c-'a');
    if(c>='A'&&c<='F')return 10+(c-'A');
    return -1;
}

bool hex_to_bytes(const std::string& hex, std::string& out){
    if(hex.size() % 2) return false;
    std::string tmp; tmp.reserve(hex.size()/2);
    for(std::size_t i=0;i<hex.size(); i+=2){
        int h=hexval(hex[i]); int l=hexval(hex[i+1]);
        if(h<0 || l<0) return false;
        tmp.push_back((char)((h<<4)|l));
    }
    out.swap(tmp);
    return true;
}

std::string bytes_to_hex(const unsigned char* p, std::size_t n){
    static const char* H="0123456789abcdef";
    std::string s; s.resize(n*2);
    for(std::size_t i=0;i<n;++i){ s[2*i]=H[p[i]>>4]; s[2*i+1]=H[p[i]&0xF]; }
    return s;
}

std::string bytes_to_hex(const std::string& bytes){
    return bytes_to_hex(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size());
}

std::string digest_to_hex(const Digest& d){
    return bytes_to_hex(d.data(), d.size());
}

bool is_lower_hex(const std::string& s){
    if(s.empty()) return false;
    for(char c: s){
        const bool digit = (c>='0' && c<='9');
        const bool lower = (c>='a' && c<='f');
        if(!digit && !lower) return false;
    }
    return true;
}

bool ct_equal(const void* a, std::size_t na, const void* b, std::size_t nb){
    if(na!=nb) return false;
    if(na==0) return true;
    return CRYPTO_memcmp(a, b, na)==0;
}

bool ct_equal(const std::string& a, const std::string& b){
    return ct_equal(a.data(), a.size(), b.data(), b.size());
}

std::string lower_copy(std::string s){
    for(char& c: s) c = (char)std::tolower((unsigned char)c);
    return s;
}

const std::string* find_header_ci(const HeaderMap& H, const std::string& name){
    for (const auto& kv : H){
        if (strcasecmp(kv.first.c_str(), name.c_str())==0) return &kv.second;
    }
    return nullptr;
}

std::string hdr_ci(const HeaderMap& H, const std::string& name){
    const std::string* v = find_header_ci(H, name);
    return v ? *v : std::string();
}

void set_header_ci(HeaderMap& H, const std::string& name, const std::string& value){
    for (auto it = H.begin(); it != H.end(); ) {
        if (strcasecmp(it->first.c_str(), name.c_str())==0) it = H.erase(it);
        else ++it;
    }
    H.emplace(name, value);
}

bool parse_port(const std::string& s, bool allow_zero, std::uint16_t& out){
    if(s.empty() || s.size() > 5) return false;
    unsigned long v = 0;
    for(char c: s){
        if(c<'0' || c>'9') return false;
        v = v*10 + (unsigned long)(c-'0');
    }
    if(v > 65535 || (v == 0 && !allow_zero)) return false;
    out = (std::uint16_t)v;
    return true;
}

void secure_wipe(std::string& s){
    if(!s.empty()){
        OPENSSL_cleanse(s.data(), s.size());
        s.clear();
        s.shrink_to_fit();
    }
}

} // namespace hg::internal
