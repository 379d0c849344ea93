#include "chunkvault/chunk_engine.hpp"
#include "chunkvault/engine_config.hpp"
#include "chunkvault/errors.hpp"
#include "chunkvault/log.hpp"
#include "chunkvault/metrics.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

using namespace chunkvault;

constexpr int EXIT_PARTIAL = 2;

bool is_secret(const std::string& key) {
    return key.find("key") != std::string::npos || key.find("secret") != std::string::npos ||
           key.find("token") != std::string::npos || key.find("credential") != std::string::npos;
}

void print_config(const EngineConfig& config) {
    log_info("chunkvault configuration:");
    log_info("  chunk-size: %lu", static_cast<unsigned long>(config.chunk_size));
    log_info("  metadata-dir: %s", config.metadata_dir.c_str());
    log_info("  manifest-store: %s", config.manifest_store.c_str());
    for (size_t i = 0; i < config.backends.size(); ++i) {
        const auto& bc = config.backends[i];
        log_info("  backend[%zu]: %s", i, bc.type.c_str());
        for (const auto& [k, v] : bc.params) {
            // Mask secrets in log output
            log_info("    %s: %s", k.c_str(), is_secret(k) ? "****" : v.c_str());
        }
    }
    log_info("  encryption: %s", config.encryption_enabled ? "enabled" : "disabled");
    if (!config.metrics_file.empty()) {
        log_info("  metrics-file: %s (every %zus)", config.metrics_file.c_str(),
                 config.metrics_interval_secs);
    }
}

std::string human_size(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    char buf[32];
    if (unit == 0) {
        snprintf(buf, sizeof(buf), "%lu B", static_cast<unsigned long>(bytes));
    } else {
        snprintf(buf, sizeof(buf), "%.2f %s", value, units[unit]);
    }
    return buf;
}

// --- Commands ---

int cmd_upload(ChunkEngine& engine, const std::vector<std::string>& args) {
    std::string path;
    std::string name;
    UploadOptions options;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        auto value = [&](const char* flag) -> const std::string* {
            if (i + 1 >= args.size()) {
                std::cerr << "Error: " << flag << " requires an argument\n";
                return nullptr;
            }
            return &args[++i];
        };

        if (arg == "--file-id") {
            auto* v = value("--file-id");
            if (!v) return 1;
            options.file_id = *v;
        } else if (arg == "--notes") {
            auto* v = value("--notes");
            if (!v) return 1;
            options.notes = *v;
        } else if (arg == "--name") {
            auto* v = value("--name");
            if (!v) return 1;
            name = *v;
        } else if (path.empty() && !arg.starts_with("--")) {
            path = arg;
        } else {
            std::cerr << "Error: unexpected argument to upload: " << arg << "\n";
            return 1;
        }
    }

    if (path.empty()) {
        std::cerr << "Usage: chunkvault upload <path> [--file-id ID] [--notes TEXT] [--name NAME]\n";
        return 1;
    }

    auto file_id = engine.upload_file(path, name, options);
    std::cout << file_id << std::endl;
    return 0;
}

int cmd_download(ChunkEngine& engine, const std::vector<std::string>& args) {
    if (args.size() != 2) {
        std::cerr << "Usage: chunkvault download <file_id> <output>\n";
        return 1;
    }
    engine.download_file(args[0], args[1]);
    log_info("Downloaded %s to %s", args[0].c_str(), args[1].c_str());
    return 0;
}

int cmd_delete(ChunkEngine& engine, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << "Usage: chunkvault delete <file_id>\n";
        return 1;
    }

    auto result = engine.remove_file(args[0]);
    std::cout << args[0] << ": " << to_string(result.status)
              << " (" << result.chunks_deleted << " chunks removed)" << std::endl;
    for (const auto& f : result.failures) {
        std::cout << "  stranded: version " << f.version_id << " chunk " << f.chunk_index
                  << " on backend " << f.backend_index << " (" << f.remote_id << "): "
                  << f.error << std::endl;
    }
    if (!result.manifest_error.empty()) {
        std::cout << "  manifest: " << result.manifest_error << std::endl;
    }
    return result.ok() ? 0 : EXIT_PARTIAL;
}

int cmd_list(ChunkEngine& engine, const std::vector<std::string>& args) {
    if (!args.empty()) {
        std::cerr << "Usage: chunkvault list\n";
        return 1;
    }

    auto files = engine.list();
    if (files.empty()) {
        std::cout << "No files stored." << std::endl;
        return 0;
    }
    printf("%-36s  %12s  %8s  %-19s  %s\n", "FILE ID", "SIZE", "VERSIONS", "UPDATED", "NAME");
    for (const auto& f : files) {
        printf("%-36s  %12s  %8zu  %-19s  %s\n",
               f.file_id.c_str(), human_size(f.total_size).c_str(), f.version_count,
               format_timestamp(f.updated_at).c_str(), f.original_filename.c_str());
    }
    fflush(stdout);
    return 0;
}

int cmd_versions(ChunkEngine& engine, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << "Usage: chunkvault versions <file_id>\n";
        return 1;
    }

    for (const auto& v : engine.list_versions(args[0])) {
        printf("%s %-36s  %-19s  %12s  %6zu chunks  %s\n",
               v.is_current ? "*" : " ", v.version_id.c_str(),
               format_timestamp(v.created_at).c_str(), human_size(v.size_bytes).c_str(),
               v.chunk_count, v.notes.c_str());
    }
    fflush(stdout);
    return 0;
}

int cmd_restore(ChunkEngine& engine, const std::vector<std::string>& args) {
    if (args.size() != 2) {
        std::cerr << "Usage: chunkvault restore <file_id> <version_id>\n";
        return 1;
    }

    auto result = engine.restore_version(args[0], args[1]);
    std::cout << args[0] << ": " << to_string(result) << std::endl;
    return result == RestoreResult::Restored ? 0 : 1;
}

int cmd_backends(ChunkEngine& engine, const std::vector<std::string>& args) {
    if (!args.empty()) {
        std::cerr << "Usage: chunkvault backends\n";
        return 1;
    }

    for (const auto& usage : engine.backend_usage()) {
        if (!usage.size.success) {
            printf("[%zu] %-8s %-9s  size unavailable: %s\n", usage.backend_index,
                   usage.type_name.c_str(), usage.healthy ? "healthy" : "UNHEALTHY",
                   usage.size.error_message.c_str());
            continue;
        }
        printf("[%zu] %-8s %-9s  used %s of %s\n", usage.backend_index,
               usage.type_name.c_str(), usage.healthy ? "healthy" : "UNHEALTHY",
               human_size(usage.size.used_bytes).c_str(),
               usage.size.total_bytes ? human_size(usage.size.total_bytes).c_str() : "unknown");
    }
    fflush(stdout);
    return 0;
}

int run_command(ChunkEngine& engine, const std::string& command,
                const std::vector<std::string>& args) {
    if (command == "upload") return cmd_upload(engine, args);
    if (command == "download") return cmd_download(engine, args);
    if (command == "delete") return cmd_delete(engine, args);
    if (command == "list") return cmd_list(engine, args);
    if (command == "versions") return cmd_versions(engine, args);
    if (command == "restore") return cmd_restore(engine, args);
    if (command == "backends") return cmd_backends(engine, args);

    std::cerr << "Error: unknown command: " << command << "\n\n" << usage_text();
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    int command_index = argc;
    auto config_opt = EngineConfig::from_args(argc, argv, command_index);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    if (command_index >= argc) {
        std::cerr << "Error: no command given\n\n" << usage_text();
        return 1;
    }
    std::string command = argv[command_index];
    std::vector<std::string> args(argv + command_index + 1, argv + argc);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    // Redirect log output if log file specified
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(
            std::filesystem::path(config.log_file).parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (!log) {
            std::cerr << "Error: cannot open log file: " << config.log_file << "\n";
            return 1;
        }
        dup2(fileno(log), STDOUT_FILENO);
        dup2(fileno(log), STDERR_FILENO);
        fclose(log);
    }

    set_log_verbose(config.verbose);
    if (config.verbose) {
        print_config(config);
    }
    if (config.encryption_enabled && config.encryption_key.empty()) {
        log_warn("Encryption is enabled but no encryption key found (set %s)",
                 constants::ENCRYPTION_KEY_ENV);
    }

    std::unique_ptr<ChunkEngine> engine;
    std::unique_ptr<MetricsExporter> metrics;
    try {
        engine = ChunkEngine::from_config(config);
    } catch (const std::exception& e) {
        log_error("Failed to initialize storage: %s", e.what());
        return 1;
    }

    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<MetricsExporter>(
            config.metrics_file,
            std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{});
        metrics->set_engine(engine.get());
        engine->set_metrics(metrics.get());
        metrics->start();
    }

    int rc = 1;
    try {
        rc = run_command(*engine, command, args);
    } catch (const IntegrityError& e) {
        log_error("Integrity check failed: %s", e.what());
    } catch (const NotFoundError& e) {
        log_error("Not found: %s", e.what());
    } catch (const BackendError& e) {
        log_error("Storage backend %zu: %s", e.backend_index(), e.what());
    } catch (const std::exception& e) {
        log_error("%s failed: %s", command.c_str(), e.what());
    }

    if (metrics) {
        metrics->stop();
        metrics->set_engine(nullptr);
        engine->set_metrics(nullptr);
    }
    return rc;
}
