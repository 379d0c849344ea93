#include "chunkvault/engine_config.hpp"
#include "chunkvault/core/constants.hpp"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace chunkvault {

namespace {

bool has_param(const BackendConfig& bc, const char* key) {
    auto it = bc.params.find(key);
    return it != bc.params.end() && !it->second.empty();
}

// Set params[key] from the environment when not given explicitly
void param_from_env(BackendConfig& bc, const char* key, const char* env) {
    if (has_param(bc, key)) return;
    if (const char* v = std::getenv(env)) {
        if (*v) bc.params[key] = v;
    }
}

bool parse_uint(const char* name, const std::string& text, uint64_t& out) {
    try {
        size_t consumed = 0;
        uint64_t value = std::stoull(text, &consumed);
        if (consumed == text.size()) {
            out = value;
            return true;
        }
    } catch (const std::exception&) {
        // reported below
    }
    std::cerr << "Error: " << name << " expects a non-negative integer, got '" << text << "'\n";
    return false;
}

// JSON scalars become strings for the backend parameter map
std::string param_string(const nlohmann::json& val) {
    if (val.is_string()) return val.get<std::string>();
    if (val.is_boolean()) return val.get<bool>() ? "true" : "false";
    return val.dump();
}

BackendConfig backend_from_json(const nlohmann::json& jb) {
    BackendConfig bc;
    if (jb.contains("type")) bc.type = jb["type"].get<std::string>();
    for (auto& [key, val] : jb.items()) {
        if (key == "type" || val.is_null()) continue;
        if (key == "credentials") {
            if (val.is_object()) {
                for (auto& [ck, cv] : val.items()) bc.params[ck] = param_string(cv);
            } else if (bc.type == "dropbox") {
                bc.params["access_token"] = param_string(val);
            } else {
                bc.params["credentials"] = param_string(val);
            }
            continue;
        }
        bc.params[key] = param_string(val);
    }
    return bc;
}

}  // namespace

// --- BackendConfig ---

std::string BackendConfig::validate() const {
    if (type.empty()) return "backend type is required";
    if (type == "local" || type == "nfs") {
        if (!has_param(*this, "path"))
            return type + " backend requires 'path'";
        if (type == "nfs" && !std::filesystem::exists(params.at("path")))
            return "nfs backend path does not exist: " + params.at("path");
    } else if (type == "s3") {
        if (!has_param(*this, "bucket"))
            return "s3 backend requires 'bucket'";
    } else if (type == "dropbox") {
        if (!has_param(*this, "access_token"))
            return std::string("dropbox backend requires 'access_token' (or ") +
                   constants::DROPBOX_TOKEN_ENV + ")";
    } else {
        return "unknown backend type: " + type;
    }
    return {};
}

std::optional<BackendConfig> BackendConfig::parse(const std::string& text) {
    BackendConfig bc;
    auto colon = text.find(':');
    bc.type = text.substr(0, colon);
    if (bc.type.empty()) return std::nullopt;
    if (colon == std::string::npos) return bc;

    std::string rest = text.substr(colon + 1);
    if ((bc.type == "local" || bc.type == "nfs") && rest.find('=') == std::string::npos) {
        bc.params["path"] = rest;
        return bc;
    }

    size_t pos = 0;
    while (pos <= rest.size()) {
        auto comma = rest.find(',', pos);
        std::string item = rest.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos);
        if (!item.empty()) {
            auto eq = item.find('=');
            if (eq == std::string::npos || eq == 0) return std::nullopt;
            bc.params[item.substr(0, eq)] = item.substr(eq + 1);
        }
        if (comma == std::string::npos) break;
        pos = comma + 1;
    }
    return bc;
}

// --- EngineConfig ---

const char* usage_text() {
    return
        "Usage: chunkvault [options] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  upload <path> [--file-id ID] [--notes TEXT] [--name NAME]\n"
        "                                   Store a file (new version if --file-id exists)\n"
        "  download <file_id> <output>      Reassemble the current version into <output>\n"
        "  delete <file_id>                 Remove all versions and their chunks\n"
        "  list                             List stored files\n"
        "  versions <file_id>               Show version history\n"
        "  restore <file_id> <version_id>   Make an earlier version current\n"
        "  backends                         Show backend capacity and health\n"
        "\n"
        "Options:\n"
        "  --config <path>                  JSON config file\n"
        "  --backend <type>[:k=v,...]       Add a backend (repeatable, order matters)\n"
        "                                   e.g. local:/srv/chunks\n"
        "                                        s3:bucket=b,region=us-west-2\n"
        "                                        dropbox:folder_path=/vault\n"
        "  --chunk-size <bytes>             Chunk size (default: 5242880)\n"
        "  --metadata-dir <path>            Manifest directory (default: ./metadata)\n"
        "  --manifest-store <json|sqlite>   Manifest store (default: json)\n"
        "  --verbose                        Verbose output\n"
        "  --log-file <path>                Append log output to file\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --help                           Show this help\n"
        "\n"
        "Environment:\n"
        "  AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY   S3 credentials\n"
        "  DROPBOX_ACCESS_TOKEN                       Dropbox token\n"
        "  CHUNKVAULT_ENCRYPTION_KEY                  Encryption key\n";
}

std::optional<EngineConfig> EngineConfig::from_args(int argc, char* argv[], int& command_index) {
    EngineConfig config;
    command_index = argc;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.empty() || arg[0] != '-') {
            command_index = i;
            break;
        }

        if (arg == "--config") {
            auto* v = next_arg(i, "--config");
            if (!v) return std::nullopt;
            if (!config.load_json(v)) return std::nullopt;
        } else if (arg == "--backend") {
            auto* v = next_arg(i, "--backend");
            if (!v) return std::nullopt;
            auto bc = BackendConfig::parse(v);
            if (!bc) {
                std::cerr << "Error: malformed --backend value: " << v << "\n";
                return std::nullopt;
            }
            config.backends.push_back(std::move(*bc));
        } else if (arg == "--chunk-size") {
            auto* v = next_arg(i, "--chunk-size");
            if (!v) return std::nullopt;
            if (!parse_uint("--chunk-size", v, config.chunk_size)) return std::nullopt;
        } else if (arg == "--metadata-dir") {
            auto* v = next_arg(i, "--metadata-dir");
            if (!v) return std::nullopt;
            config.metadata_dir = v;
        } else if (arg == "--manifest-store") {
            auto* v = next_arg(i, "--manifest-store");
            if (!v) return std::nullopt;
            config.manifest_store = v;
        } else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        } else if (arg == "--log-file") {
            auto* v = next_arg(i, "--log-file");
            if (!v) return std::nullopt;
            config.log_file = v;
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, "--metrics-file");
            if (!v) return std::nullopt;
            config.metrics_file = v;
        } else if (arg == "--metrics-interval") {
            auto* v = next_arg(i, "--metrics-interval");
            if (!v) return std::nullopt;
            uint64_t secs = 0;
            if (!parse_uint("--metrics-interval", v, secs)) return std::nullopt;
            config.metrics_interval_secs = secs;
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << usage_text();
            return std::nullopt;
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        }
    }

    config.apply_defaults();
    return config;
}

bool EngineConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        // "buckets" is the older name for the backend list
        for (const char* key : {"backends", "buckets"}) {
            if (j.contains(key) && j[key].is_array()) {
                for (const auto& jb : j[key]) {
                    backends.push_back(backend_from_json(jb));
                }
            }
        }

        if (j.contains("chunk_size")) chunk_size = j["chunk_size"].get<uint64_t>();
        if (j.contains("metadata_dir")) metadata_dir = j["metadata_dir"].get<std::string>();
        if (j.contains("manifest_store")) manifest_store = j["manifest_store"].get<std::string>();
        if (j.contains("encryption_enabled")) encryption_enabled = j["encryption_enabled"].get<bool>();
        if (j.contains("encryption_key") && j["encryption_key"].is_string())
            encryption_key = j["encryption_key"].get<std::string>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void EngineConfig::apply_defaults() {
    if (metadata_dir.empty()) {
        metadata_dir = constants::DEFAULT_METADATA_DIR;
    }

    for (auto& bc : backends) {
        if (bc.type == "s3") {
            param_from_env(bc, "access_key", "AWS_ACCESS_KEY_ID");
            param_from_env(bc, "secret_key", "AWS_SECRET_ACCESS_KEY");
            param_from_env(bc, "session_token", "AWS_SESSION_TOKEN");
        } else if (bc.type == "dropbox") {
            param_from_env(bc, "access_token", constants::DROPBOX_TOKEN_ENV);
        }
    }

    // Environment wins over the config file for the key
    if (const char* v = std::getenv(constants::ENCRYPTION_KEY_ENV)) {
        if (*v) encryption_key = v;
    }
}

std::string EngineConfig::validate() const {
    if (backends.empty()) return "at least one backend is required (--backend or \"backends\" in --config)";
    for (size_t i = 0; i < backends.size(); ++i) {
        auto err = backends[i].validate();
        if (!err.empty()) return "backend[" + std::to_string(i) + "]: " + err;
    }
    if (chunk_size == 0) return "chunk_size must be > 0";
    if (manifest_store != "json" && manifest_store != "sqlite")
        return "manifest_store must be 'json' or 'sqlite', got '" + manifest_store + "'";
    if (metadata_dir.empty()) return "metadata_dir is required";
    if (metrics_interval_secs == 0) return "metrics_interval must be > 0";
    return {};
}

std::filesystem::path EngineConfig::sqlite_path() const {
    return metadata_dir / constants::SQLITE_MANIFEST_FILE;
}

}  // namespace chunkvault
