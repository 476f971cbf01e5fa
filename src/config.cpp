// ═══════════════════════════════════════════════════════════════════
//  src/config.cpp — getopt_long parsing, JSON config file, usage text
// ═══════════════════════════════════════════════════════════════════

#include "lanserve/config.h"

#include <getopt.h>

#include <fstream>
#include <sstream>
#include <utility>

namespace lanserve::config {

namespace {

const option LongOptions[] = {
    {"port",    required_argument, nullptr, 'p'},
    {"ip",      required_argument, nullptr, 'i'},
    {"count",   required_argument, nullptr, 'c'},
    {"archive", required_argument, nullptr, 'a'},
    {"timeout", required_argument, nullptr, 't'},
    {"config",  required_argument, nullptr, 'f'},
    {"verbose", no_argument,       nullptr, 'v'},
    {"help",    no_argument,       nullptr, 'h'},
    {nullptr,   0,                 nullptr, 0},
};

// Leading ':' makes getopt report a missing argument as ':' instead of '?'
constexpr const char* ShortOptions = ":p:i:c:a:t:f:vh";

int parseInt(const std::string& flag, const std::string& value) {
    std::size_t consumed = 0;
    int result = 0;
    try {
        result = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError("invalid value \"" + value + "\" for " + flag);
    }
    if (consumed != value.size()) {
        throw ConfigError("invalid value \"" + value + "\" for " + flag);
    }
    return result;
}

std::string flagName(int opt) {
    for (const auto& o : LongOptions) {
        if (o.val == opt && o.name) return "--" + std::string(o.name);
    }
    return std::string("-") + static_cast<char>(opt);
}

} // namespace

Options parseArgs(int argc, char* argv[]) {
    // Flags are collected first so a --config file can be applied
    // underneath them regardless of where it appears on the line.
    std::vector<std::pair<int, std::string>> flags;
    std::string configFile;

    opterr = 0;
    optind = 0;  // glibc: full re-initialisation, makes repeated calls safe
    int opt;
    while ((opt = getopt_long(argc, argv, ShortOptions, LongOptions, nullptr)) != -1) {
        switch (opt) {
            case 'f':
                configFile = optarg;
                break;
            case ':':
                throw ConfigError("option " + flagName(optopt) + " requires an argument");
            case '?':
                if (optopt != 0) {
                    throw ConfigError(std::string("unknown option -") + static_cast<char>(optopt));
                }
                throw ConfigError("unknown option " + std::string(argv[optind - 1]));
            default:
                flags.emplace_back(opt, optarg ? optarg : "");
                break;
        }
    }

    Options options;
    if (!configFile.empty()) {
        options = loadFile(configFile, options);
    }

    for (const auto& [flag, value] : flags) {
        switch (flag) {
            case 'p': options.port = parseInt(flagName(flag), value); break;
            case 'i': options.bindAddress = value; break;
            case 'c': options.count = parseInt(flagName(flag), value); break;
            case 'a': options.archiveKind = archive::parseKind(value); break;
            case 't': options.drainTimeout = std::chrono::seconds(parseInt(flagName(flag), value)); break;
            case 'v': options.verbose = true; break;
            case 'h': options.showHelp = true; break;
            default: break;
        }
    }

    if (options.showHelp) {
        return options;
    }

    int positional = argc - optind;
    if (positional < 1) {
        throw ConfigError("file path required");
    }
    if (positional > 1) {
        throw ConfigError("unexpected argument \"" + std::string(argv[optind + 1]) + "\"");
    }
    options.target = argv[optind];

    validate(options);
    return options;
}

Options parseArgs(const std::vector<std::string>& args) {
    std::vector<std::string> storage;
    storage.reserve(args.size() + 1);
    storage.emplace_back("lanserve");
    storage.insert(storage.end(), args.begin(), args.end());

    std::vector<char*> argv;
    argv.reserve(storage.size() + 1);
    for (auto& s : storage) argv.push_back(s.data());
    argv.push_back(nullptr);

    return parseArgs(static_cast<int>(storage.size()), argv.data());
}

Options applyJson(const nlohmann::json& j, Options base) {
    if (!j.is_object()) {
        throw ConfigError("config file must contain a JSON object");
    }
    try {
        for (const auto& [key, value] : j.items()) {
            if (key == "port") {
                base.port = value.get<int>();
            } else if (key == "ip") {
                base.bindAddress = value.get<std::string>();
            } else if (key == "count") {
                base.count = value.get<int>();
            } else if (key == "archive") {
                base.archiveKind = archive::parseKind(value.get<std::string>());
            } else if (key == "timeout") {
                base.drainTimeout = std::chrono::seconds(value.get<int>());
            } else if (key == "verbose") {
                base.verbose = value.get<bool>();
            } else {
                throw ConfigError("unknown config key \"" + key + "\"");
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid config value: ") + e.what());
    }
    validate(base);
    return base;
}

Options loadFile(const std::string& file, Options base) {
    std::ifstream in(file);
    if (!in.is_open()) {
        throw ConfigError("cannot open config file '" + file + "'");
    }
    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("cannot parse config file '" + file + "': " + e.what());
    }
    return applyJson(j, std::move(base));
}

void validate(const Options& options) {
    if (options.port < 0 || options.port > 65535) {
        throw ConfigError("port must be between 0 and 65535, got " + std::to_string(options.port));
    }
    if (options.count < 0) {
        throw ConfigError("count must be 0 (unlimited) or positive, got " + std::to_string(options.count));
    }
    if (options.drainTimeout.count() < 0) {
        throw ConfigError("timeout must not be negative");
    }
}

std::string usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options] <file|directory>\n\n"
        << "Serve a file or directory over HTTP on your local network.\n\n"
        << "Options:\n"
        << "  -p, --port <n>        port to listen on (default " << DefaultPort << ")\n"
        << "  -i, --ip <addr>       IP address to bind to (default: all interfaces)\n"
        << "  -c, --count <n>       number of downloads allowed, 0 for unlimited (default "
        << DefaultCount << ")\n"
        << "  -a, --archive <fmt>   archive format for directories: tar.gz, zip, tar (default tar.gz)\n"
        << "  -t, --timeout <sec>   seconds to wait for active downloads on shutdown (default "
        << DefaultDrainTimeout.count() << ")\n"
        << "  -f, --config <file>   JSON file providing defaults for the options above\n"
        << "  -v, --verbose         print debug output\n"
        << "  -h, --help            show this help\n";
    return oss.str();
}

void to_json(nlohmann::json& j, const Options& options) {
    j = nlohmann::json{
        {"target",  options.target},
        {"ip",      options.listenAddress()},
        {"port",    options.port},
        {"count",   options.count},
        {"archive", archive::kindName(options.archiveKind)},
        {"timeout", options.drainTimeout.count()},
        {"verbose", options.verbose},
    };
}

} // namespace lanserve::config
