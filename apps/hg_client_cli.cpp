// SPDX-License-Identifier: MIT
// Part of HmacGate (HG) project.
// apps/hg_client_cli.cpp

#include "hg/client.hpp"
#include "hg/http_response.hpp"
#include "hg/secret_key.hpp"
#include "hg/log.hpp"
#include "hg/internal/utils.hpp"

#include <algorithm>
#include <iostream>
#include <string>

static void usage(const char* argv0){
    std::cerr <<
      "Usage:\n"
      "  " << argv0 << " (--secret <text> | --secret_hex <hex> | --secret_file <path>)\n"
      "    [--host 127.0.0.1] [--port 8080] [--header x-hmac]\n"
      "    [--method GET] [--path /] [--query a=1&b=2] [--data STRING]\n"
      "\n"
      "Timeouts:\n"
      "  --connect_timeout <sec>   TCP connect timeout in seconds (default 2)\n"
      "  --io_timeout <sec>        per-op I/O timeout in seconds (default 2)\n"
      "\n"
      "  --print_signature 1       only print the header value for the request\n";
}

int main(int argc, char** argv){
    hg::ClientConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = 8080;

    // Reasonable defaults to guarantee termination under network stalls:
    cfg.connect_timeout_sec = 2; // seconds
    cfg.io_timeout_sec      = 2; // seconds

    std::string method = "GET";
    std::string path = "/";
    std::string query;
    std::string data;
    bool print_signature = false;

    std::string secretS, secretHex, secretFile;
    int secret_sources = 0;

    try {
        for(int i=1;i<argc;++i){
            std::string a=argv[i];
            if(a=="--host" && i+1<argc) cfg.host = argv[++i];
            else if(a=="--port" && i+1<argc){
                if(!hg::internal::parse_port(argv[++i], false, cfg.port)){ usage(argv[0]); return 2; }
            }
            else if(a=="--header" && i+1<argc) cfg.header_name = argv[++i];
            else if(a=="--secret" && i+1<argc) { secretS = argv[++i]; ++secret_sources; }
            else if(a=="--secret_hex" && i+1<argc) { secretHex = argv[++i]; ++secret_sources; }
            else if(a=="--secret_file" && i+1<argc) { secretFile = argv[++i]; ++secret_sources; }
            else if(a=="--method" && i+1<argc) method = argv[++i];
            else if(a=="--path" && i+1<argc) path = argv[++i];
            else if(a=="--query" && i+1<argc) query = argv[++i];
            else if(a=="--data" && i+1<argc) data = argv[++i];
            else if(a=="--print_signature" && i+1<argc) print_signature = (std::stoi(argv[++i])!=0);
            else if(a=="--connect_timeout" && i+1<argc) cfg.connect_timeout_sec = std::max(1, std::stoi(argv[++i]));
            else if(a=="--io_timeout" && i+1<argc)      cfg.io_timeout_sec      = std::max(1, std::stoi(argv[++i]));
            else { usage(argv[0]); return 2; }
        }
    } catch (const std::logic_error&) {
        usage(argv[0]);
        return 2;
    }

    if(secret_sources!=1){
        std::cerr<<"Exactly one of --secret, --secret_hex, --secret_file must be provided\n";
        return 2;
    }
    if(path.empty() || path[0]!='/'){
        std::cerr<<"Bad --path: must start with '/'\n";
        return 2;
    }

    try {
        if(!secretHex.empty()){
            if(!hg::SecretKey::from_hex(secretHex, cfg.secret)){
                std::cerr<<"Bad --secret_hex: not a valid hex string\n";
                return 2;
            }
        } else if(!secretFile.empty()){
            cfg.secret = hg::SecretKey::from_file(secretFile);
        } else {
            cfg.secret = hg::SecretKey::from_string(secretS);
        }

        hg::Client cli(cfg);
        if(print_signature){
            std::cout<<cli.signature_for(method, path, data)<<"\n";
            return 0;
        }

        hg::HttpResponse resp;
        if(!cli.request(method, path, query, data, hg::HeaderMap{}, resp)){
            std::cerr<<"request() failed\n";
            return 1;
        }
        std::cout<<"HTTP "<<resp.status_code<<" "<<resp.status_text<<"\n";
        for (auto& kv: resp.headers){
            std::cout<<kv.first<<": "<<kv.second<<"\n";
        }
        std::cout<<"\n"<<resp.body<<"\n";

        if(resp.signature.allowed()){
            std::cout<<"[signature] OK\n";
        } else if(resp.signature.state==hg::AuthState::NotYetChecked){
            std::cout<<"[signature] not checked (no body received)\n";
        } else {
            std::cout<<"[signature] "<<hg::to_string(resp.signature.reason);
            if(!resp.signature.detail.empty()) std::cout<<" ("<<resp.signature.detail<<")";
            std::cout<<"\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] exception: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
