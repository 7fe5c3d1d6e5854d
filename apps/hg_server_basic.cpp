// SPDX-License-Identifier: MIT
// Part of HmacGate (HG) project.
// apps/hg_server_basic.cpp

#include "hg/server.hpp"
#include "hg/server_config.hpp"
#include "hg/status_policy.hpp"
#include "hg/secret_key.hpp"
#include "hg/log.hpp"
#include "hg/internal/utils.hpp"

#include <iostream>
#include <string>
#include <unistd.h>   // dup2, STDOUT_FILENO, STDERR_FILENO
#include <fcntl.h>    // open

// Silences all console output by redirecting stdout/stderr to /dev/null.
// This is process-wide and affects all library logs printing to stdio.
static void make_process_quiet() {
    int nullfd = ::open("/dev/null", O_WRONLY);
    if (nullfd >= 0) {
        (void)::dup2(nullfd, STDOUT_FILENO);
        (void)::dup2(nullfd, STDERR_FILENO);
        ::close(nullfd);
    }
}

static void usage(const char* argv0) {
    std::cerr <<
      "Usage:\n  " << argv0
      << " (--secret <text> | --secret_hex <hex> | --secret_file <path>)\n"
         "  [--port 8080 (0 = any free port)] [--bind 0.0.0.0] [--header x-hmac]\n"
         "  [--status_policy standard|forbidden]\n"
         "  [--max_body <bytes>]             (default 10485760)\n"
         "  [--redact_errors 0|1]\n"
         "  [--ka_timeout <sec>] [--ka_max <n>]\n"
         "  [--log_file <path>] [--log_level debug|info|warn|error]\n"
         "  [--quiet 0|1]                    (suppress all console logs when 1)\n";
}

int main(int argc, char** argv) {
    hg::ServerConfig cfg;
    std::string secretS, secretHex, secretFile, policyS, logFile, levelS;
    int secret_sources = 0;
    bool quiet = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--port" && i+1 < argc) {
                if (!hg::internal::parse_port(argv[++i], true, cfg.port)) { usage(argv[0]); return 2; }
            }
            else if (a == "--bind" && i+1 < argc) cfg.bind_addr = argv[++i];
            else if (a == "--header" && i+1 < argc) cfg.header_name = argv[++i];
            else if (a == "--secret" && i+1 < argc) { secretS = argv[++i]; ++secret_sources; }
            else if (a == "--secret_hex" && i+1 < argc) { secretHex = argv[++i]; ++secret_sources; }
            else if (a == "--secret_file" && i+1 < argc) { secretFile = argv[++i]; ++secret_sources; }
            else if (a == "--status_policy" && i+1 < argc) policyS = argv[++i];
            else if (a == "--max_body" && i+1 < argc) cfg.max_body = (std::size_t)std::stoull(argv[++i]);
            else if (a == "--redact_errors" && i+1 < argc) cfg.redact_errors = (std::stoi(argv[++i]) != 0);
            else if (a == "--ka_timeout" && i+1 < argc) cfg.ka_timeout_sec = std::stoi(argv[++i]);
            else if (a == "--ka_max" && i+1 < argc) cfg.ka_max = std::stoi(argv[++i]);
            else if (a == "--log_file" && i+1 < argc) logFile = argv[++i];
            else if (a == "--log_level" && i+1 < argc) levelS = argv[++i];
            else if (a == "--quiet" && i+1 < argc) quiet = (std::stoi(argv[++i]) != 0);
            else { usage(argv[0]); return 2; }
        }
    } catch (const std::logic_error&) {
        // std::stoi / std::stoull on a non-numeric or out-of-range value
        usage(argv[0]);
        return 2;
    }

    // Apply quiet mode before any logging can occur.
    if (quiet) {
        make_process_quiet();
        hg::set_log_stdout(false);
    }

    if (!levelS.empty()) {
        hg::LogLevel lvl;
        if (!hg::parse_log_level(levelS, lvl)) { usage(argv[0]); return 2; }
        hg::set_log_level(lvl);
    }

    if (!policyS.empty() && !hg::parse_status_policy(policyS, cfg.status)) {
        std::cerr << "Unknown --status_policy: " << policyS << "\n";
        return 2;
    }

    if (secret_sources != 1) {
        std::cerr << "Exactly one of --secret, --secret_hex, --secret_file must be provided\n";
        return 2;
    }

    try {
        if (!logFile.empty()) hg::set_log_file(logFile);

        if (!secretHex.empty()) {
            if (!hg::SecretKey::from_hex(secretHex, cfg.secret)) {
                std::cerr << "Bad --secret_hex: not a valid hex string\n";
                return 2;
            }
        } else if (!secretFile.empty()) {
            cfg.secret = hg::SecretKey::from_file(secretFile);
        } else {
            cfg.secret = hg::SecretKey::from_string(secretS);
        }

        const std::string problem = hg::validate(cfg);
        if (!problem.empty()) {
            std::cerr << "Invalid configuration: " << problem << "\n";
            return 2;
        }

        hg::Server srv(cfg, [](const hg::HttpRequest&) {
            hg::HttpResponse res;
            res.headers.emplace("Content-Type", "text/plain");
            res.body = "Hello, world!";
            return res;
        });
        srv.run();  // blocking
    } catch (const std::exception& e) {
        // Note: if --quiet 1 is used, this message is suppressed as well.
        std::cerr << "[FATAL] exception: " << e.what() << "\n";
        hg::log_error(std::string("[FATAL] ") + e.what());
        return 1;
    }
    return 0;
}
