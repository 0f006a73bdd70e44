#include "s3backup/backup_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace s3backup {

// --- StoreConfig ---

std::string StoreConfig::validate() const {
    if (type.empty()) return "store type is required";
    if (type == "s3") {
        if (bucket.empty()) return "s3 store requires 'bucket'";
        if (access_key.empty())
            return "s3 store requires 'access_key' (or AWS_ACCESS_KEY_ID)";
        if (secret_key.empty())
            return "s3 store requires 'secret_key' (or AWS_SECRET_ACCESS_KEY)";
        if (!endpoint.empty() && endpoint.find("://") == std::string::npos)
            return "s3 endpoint must be a URL: " + endpoint;
    } else if (type == "local") {
        if (path.empty()) return "local store requires 'path'";
    } else {
        return "unknown store type: " + type;
    }
    return {};
}

std::string StoreConfig::describe() const {
    if (type == "local") {
        return "local:" + path.string() + (path_prefix.empty() ? "" : " prefix=" + path_prefix);
    }
    std::string target = endpoint.empty() ? "https://s3." + region + ".amazonaws.com" : endpoint;
    return target + " bucket=" + bucket;
}

// --- RunConfig ---

std::set<std::string> parse_extension_list(const std::string& list) {
    std::set<std::string> result;
    size_t pos = 0;
    while (pos <= list.size()) {
        size_t comma = list.find(',', pos);
        if (comma == std::string::npos) comma = list.size();

        std::string item = list.substr(pos, comma - pos);
        size_t start = item.find_first_not_of(" \t");
        size_t end = item.find_last_not_of(" \t");
        if (start != std::string::npos) {
            result.insert(item.substr(start, end - start + 1));
        }
        pos = comma + 1;
    }
    return result;
}

bool RunConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("backup") && j["backup"].is_object()) {
            auto& jb = j["backup"];
            if (jb.contains("directory")) backup_dir = jb["directory"].get<std::string>();
            if (jb.contains("extensions")) {
                auto& je = jb["extensions"];
                if (je.is_string()) {
                    extensions = parse_extension_list(je.get<std::string>());
                } else {
                    extensions.clear();
                    for (auto& ext : je) {
                        extensions.insert(ext.get<std::string>());
                    }
                }
            }
            if (jb.contains("day_delta")) day_delta = jb["day_delta"].get<int>();
            if (jb.contains("delete_after_upload"))
                delete_after_upload = jb["delete_after_upload"].get<bool>();
            if (jb.contains("max_workers")) max_workers = jb["max_workers"].get<int>();
            if (jb.contains("multipart_threshold"))
                multipart_threshold = jb["multipart_threshold"].get<int64_t>();
            if (jb.contains("multipart_chunk_size"))
                multipart_chunk_size = jb["multipart_chunk_size"].get<int64_t>();
            if (jb.contains("max_retries")) max_retries = jb["max_retries"].get<int>();
        }

        if (j.contains("s3") && j["s3"].is_object()) {
            auto& js = j["s3"];
            if (js.contains("type")) store.type = js["type"].get<std::string>();
            if (js.contains("endpoint")) store.endpoint = js["endpoint"].get<std::string>();
            if (js.contains("bucket")) store.bucket = js["bucket"].get<std::string>();
            if (js.contains("region")) store.region = js["region"].get<std::string>();
            if (js.contains("access_key")) store.access_key = js["access_key"].get<std::string>();
            if (js.contains("secret_key")) store.secret_key = js["secret_key"].get<std::string>();
            if (js.contains("verify_ssl")) store.verify_ssl = js["verify_ssl"].get<bool>();
            if (js.contains("use_path_style")) store.use_path_style = js["use_path_style"].get<bool>();
            if (js.contains("storage_class")) store.storage_class = js["storage_class"].get<std::string>();
            if (js.contains("path_prefix")) store.path_prefix = js["path_prefix"].get<std::string>();
            if (js.contains("path")) store.path = js["path"].get<std::string>();
        }

        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("lock_file")) lock_file = j["lock_file"].get<std::string>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void RunConfig::apply_env_credentials() {
    if (store.type != "s3") return;
    if (store.access_key.empty()) {
        if (const char* v = std::getenv("AWS_ACCESS_KEY_ID")) {
            store.access_key = v;
        }
    }
    if (store.secret_key.empty()) {
        if (const char* v = std::getenv("AWS_SECRET_ACCESS_KEY")) {
            store.secret_key = v;
        }
    }
}

std::string RunConfig::validate() const {
    if (backup_dir.empty()) return "backup directory is required (backup.directory)";
    if (extensions.empty()) return "at least one extension is required (backup.extensions)";
    for (const auto& ext : extensions) {
        if (ext.size() < 2 || ext.front() != '.')
            return "extension must start with '.': \"" + ext + "\"";
    }
    if (day_delta < 0 || day_delta > constants::MAX_DAY_DELTA)
        return "day_delta must be between 0 and " + std::to_string(constants::MAX_DAY_DELTA);
    if (max_workers < 1 || max_workers > static_cast<int>(constants::MAX_WORKERS_LIMIT))
        return "max_workers must be between 1 and " + std::to_string(constants::MAX_WORKERS_LIMIT);
    if (multipart_threshold < static_cast<int64_t>(constants::MIN_MULTIPART_PART_SIZE))
        return "multipart_threshold must be >= 5 MiB";
    if (multipart_chunk_size < static_cast<int64_t>(constants::MIN_MULTIPART_PART_SIZE))
        return "multipart_chunk_size must be >= 5 MiB";
    if (max_retries < 0) return "max_retries must be >= 0";
    auto err = store.validate();
    if (!err.empty()) return "s3: " + err;
    return {};
}

TransferSettings RunConfig::transfer() const {
    TransferSettings t;
    t.multipart_threshold = static_cast<uint64_t>(multipart_threshold);
    t.multipart_chunk_size = static_cast<uint64_t>(multipart_chunk_size);
    t.max_retries = static_cast<uint32_t>(max_retries);
    return t;
}

namespace {

std::string mask_secret(const std::string& s) {
    if (s.empty()) return "";
    if (s.size() <= 8) return "****";
    return s.substr(0, 3) + "****" + s.substr(s.size() - 4);
}

}  // namespace

std::string RunConfig::masked_dump() const {
    nlohmann::json j;
    j["backup"]["directory"] = backup_dir.string();
    j["backup"]["extensions"] = extensions;
    j["backup"]["day_delta"] = day_delta;
    j["backup"]["delete_after_upload"] = delete_after_upload;
    j["backup"]["max_workers"] = max_workers;
    j["backup"]["multipart_threshold"] = multipart_threshold;
    j["backup"]["multipart_chunk_size"] = multipart_chunk_size;
    j["backup"]["max_retries"] = max_retries;
    j["s3"]["type"] = store.type;
    if (store.type == "local") {
        j["s3"]["path"] = store.path.string();
    } else {
        j["s3"]["endpoint"] = store.endpoint;
        j["s3"]["bucket"] = store.bucket;
        j["s3"]["region"] = store.region;
        j["s3"]["access_key"] = mask_secret(store.access_key);
        j["s3"]["secret_key"] = mask_secret(store.secret_key);
        j["s3"]["verify_ssl"] = store.verify_ssl;
        j["s3"]["use_path_style"] = store.use_path_style;
    }
    j["s3"]["storage_class"] = store.storage_class;
    j["s3"]["path_prefix"] = store.path_prefix;
    j["log_file"] = log_file.string();
    j["metrics_file"] = metrics_file.string();
    j["lock_file"] = lock_file.string();
    j["verbose"] = verbose;
    return j.dump(2);
}

// --- CliOptions ---

std::optional<CliOptions> CliOptions::from_args(int argc, char* argv[]) {
    CliOptions options;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config") {
            auto* v = next_arg(i, "--config");
            if (!v) return std::nullopt;
            options.config_path = v;
        } else if (arg == "--dry-run") {
            options.dry_run = true;
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else if (arg == "--log-file") {
            auto* v = next_arg(i, "--log-file");
            if (!v) return std::nullopt;
            options.log_file = v;
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, "--metrics-file");
            if (!v) return std::nullopt;
            options.metrics_file = v;
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        }
    }

    return options;
}

void CliOptions::print_usage(std::ostream& out) {
    out <<
        "Usage: s3-backup [--config <path>] [--dry-run] [options]\n"
        "\n"
        "Uploads recent backup archives to an S3-compatible object store,\n"
        "verifies each upload and optionally removes the local copy.\n"
        "\n"
        "Options:\n"
        "  --config <path>                  JSON config file (default: "
        << constants::DEFAULT_CONFIG_PATH << ")\n"
        "  --dry-run                        Report what would be uploaded, change nothing\n"
        "  --verbose                        Verbose output\n"
        "  --log-file <path>                Append log output to this file\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --help                           Show this help\n"
        "\n"
        "Exit status is 0 when no file failed, 1 otherwise.\n";
}

std::optional<RunConfig> CliOptions::load_run_config() const {
    RunConfig config;
    if (!config.load_json(config_path)) return std::nullopt;

    if (verbose) config.verbose = true;
    if (!log_file.empty()) config.log_file = log_file;
    if (!metrics_file.empty()) config.metrics_file = metrics_file;
    config.apply_env_credentials();

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Error: invalid configuration: " << err << "\n";
        return std::nullopt;
    }
    return config;
}

}  // namespace s3backup
