#include "config.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <map>
#include <sstream>

namespace csw {

namespace {

void trim(std::string& s) {
    const char* ws = " \t\r\n";
    s.erase(0, s.find_first_not_of(ws));
    s.erase(s.find_last_not_of(ws) + 1);
}

//strict unsigned parse, rejects signs, trailing junk and out of range values
template <typename T>
int parseUnsigned(const std::string& text, T& dest) {
    if (text.empty() || text[0] == '-' || text[0] == '+')
        return EXIT_FAILURE;

    errno = 0;
    char* end = nullptr;
    unsigned long long val = std::strtoull(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0' || errno == ERANGE)
        return EXIT_FAILURE;
    if (val > std::numeric_limits<T>::max())
        return EXIT_FAILURE;

    dest = static_cast<T>(val);
    return EXIT_SUCCESS;
}

bool validIpv4(const std::string& ip) {
    in_addr tmp;
    return inet_pton(AF_INET, ip.c_str(), &tmp) == 1;
}

int parseTargets(const std::string& text, std::vector<PeerAddress>& dest) {
    dest.clear();
    std::istringstream iss(text);
    std::string item;
    while (std::getline(iss, item, ',')) {
        trim(item);
        if (item.empty())
            continue;
        PeerAddress addr;
        if (EXIT_SUCCESS != parsePeerAddress(item, addr))
            return EXIT_FAILURE;
        dest.push_back(addr);
    }
    return EXIT_SUCCESS;
}

} //anon

int parsePeerAddress(const std::string& text, PeerAddress& dest) {
    size_t colon = text.rfind(':');
    if (colon == std::string::npos)
        return EXIT_FAILURE;

    std::string ip   = text.substr(0, colon);
    std::string port = text.substr(colon + 1);
    trim(ip);
    trim(port);
    if (ip == "localhost")
        ip = "127.0.0.1";

    uint16_t port_val = 0;
    if (!validIpv4(ip) || EXIT_SUCCESS != parseUnsigned(port, port_val) || port_val == 0)
        return EXIT_FAILURE;

    dest.ip_addr = ip;
    dest.port    = port_val;
    return EXIT_SUCCESS;
}

int loadConfig(const std::string& config_path, Config& dest) {
    std::ifstream input_file(config_path);
    if (!input_file) {
        std::cerr << "[loadConfig] Could not open " << config_path << std::endl;
        return EXIT_FAILURE;
    }

    //every key maps to a setter that parses the raw value into dest
    using Setter = std::function<int(const std::string&)>;
    const std::map<std::string, Setter> setters = {
        {"CHUNK_SIZE",             [&](const std::string& v) { return parseUnsigned(v, dest.chunk_size); }},
        {"BROADCAST_PORT",         [&](const std::string& v) { return parseUnsigned(v, dest.broadcast_port); }},
        {"PEER_PORT",              [&](const std::string& v) { return parseUnsigned(v, dest.peer_port); }},
        {"ANNOUNCE_INTERVAL",      [&](const std::string& v) { return parseUnsigned(v, dest.announce_interval); }},
        {"STALE_AFTER",            [&](const std::string& v) { return parseUnsigned(v, dest.stale_after); }},
        {"SWEEP_INTERVAL",         [&](const std::string& v) { return parseUnsigned(v, dest.sweep_interval); }},
        {"IDLE_TIMEOUT",           [&](const std::string& v) { return parseUnsigned(v, dest.idle_timeout); }},
        {"POOL_IDLE_THRESHOLD",    [&](const std::string& v) { return parseUnsigned(v, dest.pool_idle_threshold); }},
        {"POOL_CLEAN_INTERVAL",    [&](const std::string& v) { return parseUnsigned(v, dest.pool_clean_interval); }},
        {"POOL_MAX_IDLE_PER_PEER", [&](const std::string& v) { return parseUnsigned(v, dest.pool_max_idle_per_peer); }},
        {"CONNECT_TIMEOUT_MS",     [&](const std::string& v) { return parseUnsigned(v, dest.connect_timeout_ms); }},
        {"REQUEST_TIMEOUT_MS",     [&](const std::string& v) { return parseUnsigned(v, dest.request_timeout_ms); }},
        {"MAX_WORKERS",            [&](const std::string& v) { return parseUnsigned(v, dest.max_workers); }},
        {"RETRY_ATTEMPTS",         [&](const std::string& v) { return parseUnsigned(v, dest.retry_attempts); }},
        {"RETRY_BACKOFF_MS",       [&](const std::string& v) { return parseUnsigned(v, dest.retry_backoff_ms); }},
        {"ANNOUNCE_TARGETS",       [&](const std::string& v) { return parseTargets(v, dest.announce_targets); }},
        {"BROADCAST_ADDR",         [&](const std::string& v) {
            if (!v.empty() && !validIpv4(v))
                return EXIT_FAILURE;
            dest.broadcast_addr = v;
            return EXIT_SUCCESS;
        }},
        {"CHUNK_DIR",              [&](const std::string& v) { dest.chunk_dir = v;     return v.empty() ? EXIT_FAILURE : EXIT_SUCCESS; }},
        {"DOWNLOADS_DIR",          [&](const std::string& v) { dest.downloads_dir = v; return v.empty() ? EXIT_FAILURE : EXIT_SUCCESS; }},
        {"CONTENT_DB",             [&](const std::string& v) { dest.content_db = v;    return EXIT_SUCCESS; }},
    };

    std::string line;
    size_t      line_no = 0;
    while (std::getline(input_file, line)) {
        ++line_no;
        trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            std::cerr << "[loadConfig] line " << line_no << ": expected KEY=VALUE" << std::endl;
            return EXIT_FAILURE;
        }

        std::string key   = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        trim(key);
        trim(value);

        auto it = setters.find(key);
        if (it == setters.end()) {
            std::cerr << "[loadConfig] line " << line_no << ": unknown key " << key << std::endl;
            return EXIT_FAILURE;
        }

        if (EXIT_SUCCESS != it->second(value)) {
            std::cerr << "[loadConfig] line " << line_no << ": bad value for " << key << std::endl;
            return EXIT_FAILURE;
        }
    }

    return validateConfig(dest);
}

int validateConfig(const Config& config) {
    if (config.chunk_size == 0) {
        std::cerr << "[validateConfig] CHUNK_SIZE must be positive." << std::endl;
        return EXIT_FAILURE;
    }

    if (config.announce_interval == 0 || config.sweep_interval == 0 || config.pool_clean_interval == 0) {
        std::cerr << "[validateConfig] Intervals must be positive." << std::endl;
        return EXIT_FAILURE;
    }

    if (config.stale_after <= config.announce_interval) {
        std::cerr << "[validateConfig] STALE_AFTER must be greater than ANNOUNCE_INTERVAL." << std::endl;
        return EXIT_FAILURE;
    }

    if (config.max_workers == 0) {
        std::cerr << "[validateConfig] MAX_WORKERS must be at least 1." << std::endl;
        return EXIT_FAILURE;
    }

    if (config.request_timeout_ms == 0 || config.connect_timeout_ms == 0 || config.idle_timeout == 0) {
        std::cerr << "[validateConfig] Timeouts must be positive." << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

int applyPeerId(Config& config, uint16_t peer_id) {
    if (uint32_t(config.broadcast_port) + peer_id > 65535 ||
        uint32_t(config.peer_port)      + peer_id > 65535)
        return EXIT_FAILURE;

    config.broadcast_port += peer_id;
    config.peer_port      += peer_id;
    return EXIT_SUCCESS;
}

} //csw
