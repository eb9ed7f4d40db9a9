#include "ConfigLoader.h"

#include <fstream>
#include <map>
#include <stdexcept>
#include <string>

#include "memo/base/InetAddress.h"

namespace {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

bool load_kv_config(const std::string& filename, std::map<std::string, std::string>& outConfig) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        size_t commentPos = line.find('#');
        if (commentPos != std::string::npos) {
            line = line.substr(0, commentPos);
        }
        line = trim(line);
        if (line.empty()) continue;

        size_t delimiterPos = line.find('=');
        if (delimiterPos == std::string::npos) continue;

        std::string key = trim(line.substr(0, delimiterPos));
        std::string value = trim(line.substr(delimiterPos + 1));
        outConfig[key] = value;
    }
    return true;
}

std::string get_string_or(const std::map<std::string, std::string>& cfg,
    const std::string& key,
    const std::string& defaultValue) {
    auto it = cfg.find(key);
    if (it == cfg.end()) {
        return defaultValue;
    }
    return it->second;
}

// 非负整数：必须整串都是数字，否则使用默认值
bool parse_unsigned(const std::string& s, unsigned long long& out) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        out = std::stoull(s);
    }
    catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

int get_int_or(const std::map<std::string, std::string>& cfg,
    const std::string& key,
    int defaultValue) {
    auto it = cfg.find(key);
    if (it == cfg.end()) {
        return defaultValue;
    }
    unsigned long long v = 0;
    if (!parse_unsigned(it->second, v) || v > 1024) {
        return defaultValue;
    }
    return static_cast<int>(v);
}

uint16_t get_u16_or(const std::map<std::string, std::string>& cfg,
    const std::string& key,
    uint16_t defaultValue) {
    auto it = cfg.find(key);
    if (it == cfg.end()) {
        return defaultValue;
    }
    unsigned long long v = 0;
    if (!parse_unsigned(it->second, v) || v > 65535) {
        return defaultValue;
    }
    return static_cast<uint16_t>(v);
}

size_t get_size_or(const std::map<std::string, std::string>& cfg,
    const std::string& key,
    size_t defaultValue) {
    auto it = cfg.find(key);
    if (it == cfg.end()) {
        return defaultValue;
    }
    unsigned long long v = 0;
    if (!parse_unsigned(it->second, v) || v == 0) {
        return defaultValue;
    }
    return static_cast<size_t>(v);
}

std::string get_log_level_or(const std::map<std::string, std::string>& cfg,
    const std::string& key,
    const std::string& defaultValue) {
    std::string v = get_string_or(cfg, key, defaultValue);
    for (size_t i = 0; i < v.size(); ++i) {
        if (v[i] >= 'A' && v[i] <= 'Z') v[i] = static_cast<char>(v[i] - 'A' + 'a');
    }
    static const char* kLevels[] = { "trace", "debug", "info", "warn", "error", "critical", "off" };
    for (const char* level : kLevels) {
        if (v == level) {
            return v;
        }
    }
    return defaultValue;
}

bool parse_args(int argc, char* argv[], NotesServerBootstrap& out, std::string& outError) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = (argv[i] ? std::string(argv[i]) : std::string());

        if (a == "-h" || a == "--help") {
            out.showHelp = true;
            return true;
        }

        if (a == "-c" || a == "--config") {
            if (i + 1 >= argc || argv[i + 1] == nullptr) {
                outError = "Missing value for " + a + ". Usage: notes_server -c <file>";
                return false;
            }
            out.configPath = argv[++i];
            continue;
        }

        const std::string c1 = "--config=";
        if (a.rfind(c1, 0) == 0) {
            out.configPath = a.substr(c1.size());
            continue;
        }

        outError = "Unknown argument: " + a;
        return false;
    }
    return true;
}

} // namespace

bool load_notes_server_bootstrap(int argc, char* argv[], NotesServerBootstrap& out, std::string& outError) {
    outError.clear();
    out = NotesServerBootstrap{};

    if (!parse_args(argc, argv, out, outError)) {
        return false;
    }
    if (out.showHelp) {
        return true;
    }

    std::map<std::string, std::string> config;
    if (!out.configPath.empty() && !load_kv_config(out.configPath, config)) {
        outError = "Could not open config file: " + out.configPath;
        return false;
    }

    NotesServerConfig cfg;
    cfg.ip = get_string_or(config, "ip", cfg.ip);
    if (!InetAddress::is_valid_ipv4(cfg.ip)) {
        outError = "Invalid ip '" + cfg.ip + "' in " + out.configPath + ": expected a dotted IPv4 address such as 127.0.0.1";
        return false;
    }
    cfg.port = get_u16_or(config, "port", cfg.port);
    cfg.threadNum = get_int_or(config, "threadNum", cfg.threadNum);
    cfg.maxBodyBytes = get_size_or(config, "http.max_body_bytes", cfg.maxBodyBytes);
    cfg.maxRequestBytes = get_size_or(config, "notes.max_request_bytes", cfg.maxRequestBytes);

    out.cfg = std::move(cfg);
    out.logLevel = get_log_level_or(config, "log.level", "info");
    out.logFile = get_string_or(config, "log.file", "");
    return true;
}

std::string notes_server_usage(const std::string& prog) {
    return "Usage: " + prog + " [-c|--config <file>] [-h|--help]\n"
        "Config keys (key = value):\n"
        "  ip                       bind address (default 127.0.0.1)\n"
        "  port                     bind port, 0 for ephemeral (default 8080)\n"
        "  threadNum                IO loop threads (default 0)\n"
        "  log.level                trace|debug|info|warn|error|critical|off (default info)\n"
        "  log.file                 optional log file\n"
        "  http.max_body_bytes      HTTP body limit (default 1048576)\n"
        "  notes.max_request_bytes  create/update body limit (default 16384)\n";
}
