#pragma once

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

// Loads KEY=VALUE lines from a .env file into the environment.
// Variables that are already set are left alone.
inline void load_env_file(const std::string& filepath = ".env") {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        // Try in backend directory if not found
        file.open("backend/" + filepath);
        if (!file.is_open()) {
            return; // .env file not found, will use system env vars
        }
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') continue;

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);

        // Trim whitespace
        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t") + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t") + 1);
        if (key.empty()) continue;

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.length() - 2);
        }

        setenv(key.c_str(), value.c_str(), 0); // 0 = don't overwrite existing
    }
}

// Splits "ETHBTC, xrpbtc,," into {"ETHBTC","XRPBTC"}
inline std::vector<std::string> split_symbol_list(const std::string& raw) {
    std::vector<std::string> out;
    std::string cur;
    auto flush = [&] {
        cur.erase(0, cur.find_first_not_of(" \t"));
        cur.erase(cur.find_last_not_of(" \t") + 1);
        if (!cur.empty()) out.push_back(cur);
        cur.clear();
    };
    for (char c : raw) {
        if (c == ',') {
            flush();
        } else {
            cur += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    flush();
    return out;
}

struct AppConfig {
    std::string http_address{"0.0.0.0"};
    unsigned short http_port{8080};

    std::string rest_url{"https://api.hitbtc.com/api/2"};
    std::string ws_host{"api.hitbtc.com"};
    std::string ws_path{"/api/2/ws"};
    unsigned short ws_port{443};
    std::chrono::milliseconds timeout{10000};

    // Empty = every listed symbol. Each supported symbol costs one listener thread
    // polling its channel (1 ms idle backoff) and a 64-slot update channel.
    std::vector<std::string> symbols;
    bool coalesce_misses{false};

    // Unset variables keep their defaults; malformed numbers warn and keep them too.
    static AppConfig from_env() {
        AppConfig cfg;
        if (const char* v = std::getenv("SUMMARY_HTTP_ADDRESS"); v && *v) cfg.http_address = v;
        cfg.http_port = env_port("SUMMARY_HTTP_PORT", cfg.http_port);

        if (const char* v = std::getenv("HITBTC_REST_URL"); v && *v) cfg.rest_url = v;
        if (const char* v = std::getenv("HITBTC_WS_HOST"); v && *v) cfg.ws_host = v;
        if (const char* v = std::getenv("HITBTC_WS_PATH"); v && *v) cfg.ws_path = v;
        cfg.ws_port = env_port("HITBTC_WS_PORT", cfg.ws_port);

        if (const char* v = std::getenv("HITBTC_TIMEOUT_MS"); v && *v) {
            long ms = 0;
            if (parse_long(v, ms) && ms > 0) {
                cfg.timeout = std::chrono::milliseconds(ms);
            } else {
                std::cerr << "[setup] Ignoring invalid HITBTC_TIMEOUT_MS='" << v << "'" << std::endl;
            }
        }

        if (const char* v = std::getenv("SUMMARY_SYMBOLS")) cfg.symbols = split_symbol_list(v);

        if (const char* v = std::getenv("SUMMARY_COALESCE_MISSES")) {
            const std::string s(v);
            cfg.coalesce_misses = (s == "1" || s == "true" || s == "TRUE" || s == "yes");
        }
        return cfg;
    }

private:
    static bool parse_long(const char* s, long& out) {
        char* end = nullptr;
        errno = 0;
        const long v = std::strtol(s, &end, 10);
        if (end == s || *end != '\0' || errno == ERANGE) return false;
        out = v;
        return true;
    }

    static unsigned short env_port(const char* name, unsigned short fallback) {
        const char* v = std::getenv(name);
        if (!v || !*v) return fallback;
        long port = 0;
        if (!parse_long(v, port) || port <= 0 || port > 65535) {
            std::cerr << "[setup] Ignoring invalid " << name << "='" << v << "'" << std::endl;
            return fallback;
        }
        return static_cast<unsigned short>(port);
    }
};
