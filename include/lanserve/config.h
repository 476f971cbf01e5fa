#pragma once
// ═══════════════════════════════════════════════════════════════════
//  lanserve/config.h — Command-line and config-file options
// ═══════════════════════════════════════════════════════════════════
//
//  lanserve [options] <file|directory>
//
//    -p, --port <n>        port to listen on (default 8080)
//    -i, --ip <addr>       address to bind to (default: all interfaces)
//    -c, --count <n>       downloads allowed, 0 for unlimited (default 1)
//    -a, --archive <fmt>   directory archive format: tar.gz, zip, tar
//    -t, --timeout <sec>   drain timeout on shutdown (default 30)
//    -f, --config <file>   JSON file with defaults for the options above
//    -v, --verbose         debug logging
//    -h, --help            usage
//
//  Values from --config are applied first; explicit flags win.
//
// ═══════════════════════════════════════════════════════════════════

#include "archive.h"
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace lanserve::config {

// ── Raised for anything the operator got wrong before serving starts ──
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

inline constexpr int DefaultPort = 8080;
inline constexpr int DefaultCount = 1;
inline constexpr std::chrono::seconds DefaultDrainTimeout{30};

struct Options {
    std::string target;                 // file or directory to serve
    std::string bindAddress;            // empty = all interfaces
    int port = DefaultPort;
    int count = DefaultCount;           // 0 = unlimited
    archive::Kind archiveKind = archive::Kind::TarGz;
    std::chrono::seconds drainTimeout = DefaultDrainTimeout;
    bool verbose = false;
    bool showHelp = false;

    // Address handed to the listener
    std::string listenAddress() const {
        return bindAddress.empty() ? "0.0.0.0" : bindAddress;
    }
};

// ── Parse argv (getopt_long). Throws ConfigError. ──
Options parseArgs(int argc, char* argv[]);
Options parseArgs(const std::vector<std::string>& args);

// ── Apply a JSON object's keys on top of `base`. Throws ConfigError. ──
Options applyJson(const nlohmann::json& j, Options base);
Options loadFile(const std::string& file, Options base);

// ── Range checks shared by both sources ──
void validate(const Options& options);

std::string usage(const std::string& program = "lanserve");

void to_json(nlohmann::json& j, const Options& options);

} // namespace lanserve::config
