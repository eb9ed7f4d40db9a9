#pragma once

#include <string>

#include "NotesServer.h"

struct NotesServerBootstrap {
    NotesServerConfig cfg;
    std::string configPath; // 为空表示未指定配置文件，使用内置默认值
    std::string logLevel = "info";
    std::string logFile;    // 为空表示只输出到终端
    bool showHelp = false;
};

// Parses the command line and the optional key=value config file, filling out.
// - "-c <file>", "--config <file>" or "--config=<file>" names the config file.
// - "-h" / "--help" sets showHelp and returns true without reading any file.
// - Without a config file the built-in defaults apply.
// - Missing keys and invalid numbers fall back to defaults; unknown log levels fall back to "info".
// - An ip that is not a dotted IPv4 address is an error (never silently widened to 0.0.0.0).
// Returns true on success; on failure (bad arguments, unreadable config file, invalid ip) returns false and sets outError.
bool load_notes_server_bootstrap(int argc, char* argv[], NotesServerBootstrap& out, std::string& outError);

std::string notes_server_usage(const std::string& prog);
