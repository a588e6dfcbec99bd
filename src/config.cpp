#include "ferry/config.hpp"

#include "ferry/errors.hpp"
#include "ferry/logger.hpp"

#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <set>
#include <sstream>

namespace ferry {

namespace {

bool IsAbsolute(const std::string& p) {
    return !p.empty() && p.front() == '/';
}

const std::set<std::string>& KnownKeys() {
    static const std::set<std::string> keys = {
        "src", "dst", "src_port", "dst_port", "src_tmp_path", "dst_tmp_path",
        "src_docker_become", "dst_docker_become", "chunk_size_gb", "chunk_size_bytes",
        "retry", "delete", "local_src", "local_dst", "workdir", "helper_image", "report",
    };
    return keys;
}

std::uint16_t PortFromJson(const nlohmann::json& j, const char* key) {
    const auto v = j.at(key).get<std::int64_t>();
    if (v < 1 || v > 65535) {
        throw ConfigError(std::string(key) + " must be an integer between 1 and 65535");
    }
    return static_cast<std::uint16_t>(v);
}

std::uint64_t PositiveFromJson(const nlohmann::json& j, const char* key) {
    const auto v = j.at(key).get<std::int64_t>();
    if (v <= 0) {
        throw ConfigError(std::string(key) + " must be a positive integer");
    }
    return static_cast<std::uint64_t>(v);
}

void ApplyJson(const nlohmann::json& j, TransferConfig& cfg) {
    if (!j.is_object()) {
        throw ConfigError("config root must be a JSON object");
    }

    for (const auto& [key, value] : j.items()) {
        (void)value;
        if (KnownKeys().count(key) == 0) {
            LogWarn("Ignoring unknown config key: %s", key.c_str());
        }
    }

    if (j.contains("src")) cfg.source.host = j.at("src").get<std::string>();
    if (j.contains("dst")) cfg.destination.host = j.at("dst").get<std::string>();
    if (j.contains("src_port")) cfg.source.port = PortFromJson(j, "src_port");
    if (j.contains("dst_port")) cfg.destination.port = PortFromJson(j, "dst_port");
    if (j.contains("src_tmp_path")) cfg.source.tmp_path = j.at("src_tmp_path").get<std::string>();
    if (j.contains("dst_tmp_path")) cfg.destination.tmp_path = j.at("dst_tmp_path").get<std::string>();
    if (j.contains("src_docker_become")) cfg.source.docker_become = j.at("src_docker_become").get<bool>();
    if (j.contains("dst_docker_become")) cfg.destination.docker_become = j.at("dst_docker_become").get<bool>();
    if (j.contains("local_src")) cfg.source.local = j.at("local_src").get<bool>();
    if (j.contains("local_dst")) cfg.destination.local = j.at("local_dst").get<bool>();

    if (j.contains("chunk_size_gb")) {
        const std::uint64_t gb = PositiveFromJson(j, "chunk_size_gb");
        if (gb > std::numeric_limits<std::uint64_t>::max() / kGiB) {
            throw ConfigError("chunk_size_gb is too large");
        }
        cfg.chunk_size_bytes = gb * kGiB;
    }
    if (j.contains("chunk_size_bytes")) cfg.chunk_size_bytes = PositiveFromJson(j, "chunk_size_bytes");

    if (j.contains("retry")) {
        const std::uint64_t n = PositiveFromJson(j, "retry");
        if (n > std::numeric_limits<unsigned>::max()) throw ConfigError("retry is too large");
        cfg.retry_attempts = static_cast<unsigned>(n);
    }

    if (j.contains("delete")) {
        const auto& d = j.at("delete");
        if (d.is_boolean()) {
            cfg.delete_policy = d.get<bool>() ? DeletePolicy::Always : DeletePolicy::Ask;
        } else {
            const auto s = d.get<std::string>();
            auto policy = ParseDeletePolicy(s);
            if (!policy) throw ConfigError("delete must be one of ask|always|never, got '" + s + "'");
            cfg.delete_policy = *policy;
        }
    }

    if (j.contains("workdir")) cfg.workdir = j.at("workdir").get<std::string>();
    if (j.contains("helper_image")) cfg.helper_image = j.at("helper_image").get<std::string>();
    if (j.contains("report")) cfg.report_path = j.at("report").get<std::string>();
}

} // namespace

void ValidateConfig(const TransferConfig& cfg) {
    if (cfg.name.empty()) {
        throw ConfigError("Object name must not be empty.");
    }
    if (cfg.source.local && cfg.destination.local) {
        throw ConfigError("--local-src and --local-dst cannot both be used.");
    }
    if (cfg.destination.local) {
        throw ConfigError("--local-dst is not implemented yet.");
    }
    if (!cfg.source.local && cfg.source.host.empty()) {
        throw ConfigError("--src must be specified unless --local-src is used.");
    }
    if (!cfg.destination.local && cfg.destination.host.empty()) {
        throw ConfigError("--dst must be specified unless --local-dst is used.");
    }
    // ssh and rsync would read a leading '-' as an option.
    if (!cfg.source.local && cfg.source.host.front() == '-') {
        throw ConfigError("--src must not start with '-': '" + cfg.source.host + "'");
    }
    if (!cfg.destination.local && cfg.destination.host.front() == '-') {
        throw ConfigError("--dst must not start with '-': '" + cfg.destination.host + "'");
    }
    if (cfg.source.port == 0 || cfg.destination.port == 0) {
        throw ConfigError("SSH ports must be integers between 1 and 65535.");
    }
    if (cfg.retry_attempts == 0) {
        throw ConfigError("--retry must be a positive integer.");
    }
    if (!IsAbsolute(cfg.source.tmp_path)) {
        throw ConfigError("--src-tmp-path must be an absolute path: '" + cfg.source.tmp_path + "'");
    }
    if (!IsAbsolute(cfg.destination.tmp_path)) {
        throw ConfigError("--dst-tmp-path must be an absolute path: '" + cfg.destination.tmp_path + "'");
    }
    if (!IsAbsolute(cfg.workdir)) {
        throw ConfigError("Local working directory must be an absolute path: '" + cfg.workdir + "'");
    }
    if (cfg.helper_image.empty()) {
        throw ConfigError("Helper image name must not be empty.");
    }
}

void ApplyConfigJson(std::string_view json_text, TransferConfig& cfg) {
    try {
        const auto j = nlohmann::json::parse(json_text.begin(), json_text.end());
        ApplyJson(j, cfg);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid config: ") + e.what());
    }
}

void ApplyConfigFile(const std::string& path, TransferConfig& cfg) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Config file not found: " + path);
    }
    std::stringstream ss;
    ss << file.rdbuf();

    LogDebug("Loading config file: %s", path.c_str());
    ApplyConfigJson(ss.str(), cfg);
}

} // namespace ferry
