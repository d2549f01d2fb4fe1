#pragma once

#include <string>
#include <string_view>
#include <cstdlib>
#include <cstddef>

#include "arbwire/core/transport/error.hpp"


namespace arbwire::core::transport {

    // Contains parsed URL components
    struct ParsedUrl {
        bool secure{false};   // true = wss, false = ws
        std::string host;
        std::string port;
        std::string target;   // path plus query, as sent in the upgrade request
    };


    // ---------------------------------------------------------------------
    // Minimal invariant-validated URL parser supporting ws:// and wss://.
    // Rejects malformed inputs without attempting full RFC compliance.
    // A fragment (#...) is dropped; a query (?...) is kept in the target.
    //
    // Example inputs:
    //   ws://localhost:3002
    //   wss://feed.example.com/v1/stream?token=abc
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error parse_url(std::string_view url, ParsedUrl& out) noexcept {
        out = ParsedUrl{};
        // 1) Extract scheme
        constexpr std::string_view ws  = "ws://";
        constexpr std::string_view wss = "wss://";
        std::size_t pos = 0;
        if (url.substr(0, ws.size()) == ws) {
            out.secure = false;
            pos = ws.size();
        }
        else if (url.substr(0, wss.size()) == wss) {
            out.secure = true;
            pos = wss.size();
        }
        else {
            return Error::InvalidUrl;
        }
        // 2) Strip fragment
        const std::size_t hash = url.find('#', pos);
        if (hash != std::string_view::npos) {
            url = url.substr(0, hash);
        }
        // 3) Extract host[:port] (authority ends at '/', '?' or end of input)
        const std::size_t end = url.find_first_of("/?", pos);
        const std::string_view hostport = (end == std::string_view::npos) ? url.substr(pos) : url.substr(pos, end - pos);
        if (hostport.empty()) {
            return Error::InvalidUrl;
        }
        // 4) Split host and port
        const std::size_t colon = hostport.find(':');
        if (colon != std::string_view::npos) {
            out.host = std::string(hostport.substr(0, colon));
            out.port = std::string(hostport.substr(colon + 1));
        } else {
            out.host = std::string(hostport);
            out.port = (out.secure) ? "443" : "80";
        }
        // 5) Target (default "/" if missing, query without path gets "/" prepended)
        if (end == std::string_view::npos) {
            out.target = "/";
        }
        else if (url[end] == '?') {
            out.target = "/";
            out.target.append(url.substr(end));
        }
        else {
            out.target = std::string(url.substr(end));
        }

        // Invariants check --------------------------------

        // Validate host
        if (out.host.empty() || out.port.empty()) {
            return Error::InvalidUrl;
        }
        for (char c : out.host) {
            if (c == ' ' || c == '@') {
                return Error::InvalidUrl;
            }
        }
        // Validate port - must be numeric and in range
        if (out.port.size() > 5) {
            return Error::InvalidUrl;
        }
        for (char c : out.port) {
            if (c < '0' || c > '9') {
                return Error::InvalidUrl;
            }
        }
        const unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
        if (p == 0 || p > 65535) {
            return Error::InvalidUrl;
        }
        // ---------------------------------------------------

        return Error::None;
    }

} // namespace arbwire::core::transport
