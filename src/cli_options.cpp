#include "ferry/cli_options.hpp"

#include "ferry/errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <getopt.h>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace ferry {

namespace {

enum OptionCode {
    kOptSrc = 1000,
    kOptDst,
    kOptSrcPort,
    kOptDstPort,
    kOptSrcTmp,
    kOptDstTmp,
    kOptSrcBecome,
    kOptDstBecome,
    kOptChunkSizeGb,
    kOptRetry,
    kOptDelete,
    kOptKeep,
    kOptLocalSrc,
    kOptLocalDst,
    kOptWorkdir,
    kOptHelperImage,
    kOptConfig,
    kOptReport,
};

// Flags seen on the command line; applied on top of the config file.
struct Overrides {
    std::optional<std::string> src, dst, src_tmp, dst_tmp, workdir, helper_image, report;
    std::optional<std::uint16_t> src_port, dst_port;
    std::optional<std::uint64_t> chunk_size_gb;
    std::optional<unsigned> retry;
    bool src_become{false}, dst_become{false};
    bool local_src{false}, local_dst{false};
    bool delete_always{false}, keep{false};
    bool verbose{false};
};

std::uint64_t ParsePositive(const char* flag, const char* value, std::uint64_t max) {
    char* end = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(value, &end, 10);
    if (!end || *end != '\0' || *value == '\0' || *value == '-' || errno == ERANGE || v == 0 || v > max) {
        throw ConfigError(std::string(flag) + " must be a positive integer" +
                          (max < std::numeric_limits<std::uint64_t>::max()
                               ? " no greater than " + std::to_string(max)
                               : std::string()) +
                          ", got '" + value + "'.");
    }
    return static_cast<std::uint64_t>(v);
}

std::uint16_t ParsePort(const char* flag, const char* value) {
    try {
        return static_cast<std::uint16_t>(ParsePositive(flag, value, 65535));
    } catch (const ConfigError&) {
        throw ConfigError(std::string(flag) + " must be an integer between 1 and 65535.");
    }
}

void Apply(const Overrides& o, TransferConfig& cfg) {
    if (o.src) cfg.source.host = *o.src;
    if (o.dst) cfg.destination.host = *o.dst;
    if (o.src_port) cfg.source.port = *o.src_port;
    if (o.dst_port) cfg.destination.port = *o.dst_port;
    if (o.src_tmp) cfg.source.tmp_path = *o.src_tmp;
    if (o.dst_tmp) cfg.destination.tmp_path = *o.dst_tmp;
    if (o.src_become) cfg.source.docker_become = true;
    if (o.dst_become) cfg.destination.docker_become = true;
    if (o.local_src) cfg.source.local = true;
    if (o.local_dst) cfg.destination.local = true;
    if (o.chunk_size_gb) cfg.chunk_size_bytes = *o.chunk_size_gb * kGiB;
    if (o.retry) cfg.retry_attempts = *o.retry;
    if (o.delete_always) cfg.delete_policy = DeletePolicy::Always;
    if (o.keep) cfg.delete_policy = DeletePolicy::Never;
    if (o.workdir) cfg.workdir = *o.workdir;
    if (o.helper_image) cfg.helper_image = *o.helper_image;
    if (o.report) cfg.report_path = *o.report;
    if (o.verbose) cfg.verbose = true;
}

} // namespace

void PrintUsage(const char* argv0, std::FILE* out) {
    std::fprintf(out,
        "Usage:\n"
        "  %s <image|volume> <name> --src <user@src-host> --dst <user@dst-host> \\\n"
        "     [--src-tmp-path <path>] [--dst-tmp-path <path>] \\\n"
        "     [--src-docker-become] [--dst-docker-become] \\\n"
        "     [--src-port <port>] [--dst-port <port>] \\\n"
        "     [--chunk-size-gb <N>] [--retry <N>] [--delete|--keep] [--local-src] [--local-dst] \\\n"
        "     [--workdir <path>] [--helper-image <name>] [--config <file>] [--report <file>] [-v]\n"
        "\n"
        "Arguments:\n"
        "  <image|volume>         What to transfer: a Docker image or a Docker volume.\n"
        "  <name>                 Image name (e.g. my-app:latest) or volume name (e.g. my_volume).\n"
        "\n"
        "  --src <user@host>      Source SSH/rsync endpoint (NOT required if --local-src).\n"
        "  --dst <user@host>      Destination SSH/rsync endpoint (NOT required if --local-dst).\n"
        "  --src-port <port>      SSH port for source host (default: 22).\n"
        "  --dst-port <port>      SSH port for destination host (default: 22).\n"
        "\n"
        "  --src-tmp-path <path>  Temporary path on source host (default: %s).\n"
        "  --dst-tmp-path <path>  Temporary path on destination host (default: %s).\n"
        "\n"
        "  --src-docker-become    Use sudo for Docker commands on the source.\n"
        "  --dst-docker-become    Use sudo for Docker commands on the destination.\n"
        "\n"
        "  --chunk-size-gb <N>    Split exported tar into N GiB chunks (rsync directories of chunks).\n"
        "  --retry <N>            Max attempts for failed ssh/rsync commands (default: 1 = no retries).\n"
        "  --delete               Delete temporary artifacts on src/dst/local without asking.\n"
        "  --keep                 Never delete temporary artifacts and do not ask.\n"
        "  --local-src            Treat this machine as the source (no SSH/rsync from src).\n"
        "  --local-dst            NOT IMPLEMENTED YET (will cause an error if used).\n"
        "\n"
        "  --workdir <path>       Local staging directory (default: current directory).\n"
        "  --helper-image <name>  Helper image holding tar/xz (default: %s).\n"
        "  --config <file>        JSON file with defaults for the options above.\n"
        "  --report <file>        Write a JSON report of created artifacts.\n"
        "  -v, --verbose          Debug logging.\n"
        "  -h, --help             Show this help.\n"
        "\n"
        "Notes:\n"
        "  --local-src and --local-dst cannot be used together.\n",
        argv0, kDefaultTmpPath, kDefaultTmpPath, kDefaultHelperImage);
}

CliParse ParseCommandLine(int argc, char** argv) {
    static option long_opts[] = {
        {"src", required_argument, nullptr, kOptSrc},
        {"dst", required_argument, nullptr, kOptDst},
        {"src-port", required_argument, nullptr, kOptSrcPort},
        {"dst-port", required_argument, nullptr, kOptDstPort},
        {"src-tmp-path", required_argument, nullptr, kOptSrcTmp},
        {"dst-tmp-path", required_argument, nullptr, kOptDstTmp},
        {"src-docker-become", no_argument, nullptr, kOptSrcBecome},
        {"dst-docker-become", no_argument, nullptr, kOptDstBecome},
        {"chunk-size-gb", required_argument, nullptr, kOptChunkSizeGb},
        {"retry", required_argument, nullptr, kOptRetry},
        {"delete", no_argument, nullptr, kOptDelete},
        {"keep", no_argument, nullptr, kOptKeep},
        {"local-src", no_argument, nullptr, kOptLocalSrc},
        {"local-dst", no_argument, nullptr, kOptLocalDst},
        {"workdir", required_argument, nullptr, kOptWorkdir},
        {"helper-image", required_argument, nullptr, kOptHelperImage},
        {"config", required_argument, nullptr, kOptConfig},
        {"report", required_argument, nullptr, kOptReport},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    CliParse out;
    Overrides o;
    std::optional<std::string> config_file;

    optind = 0;   // full re-initialisation, parse may run more than once
    opterr = 0;

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, ":hv", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                out.show_help = true;
                return out;
            case 'v':
                o.verbose = true;
                break;
            case kOptSrc: o.src = optarg; break;
            case kOptDst: o.dst = optarg; break;
            case kOptSrcPort: o.src_port = ParsePort("--src-port", optarg); break;
            case kOptDstPort: o.dst_port = ParsePort("--dst-port", optarg); break;
            case kOptSrcTmp: o.src_tmp = optarg; break;
            case kOptDstTmp: o.dst_tmp = optarg; break;
            case kOptSrcBecome: o.src_become = true; break;
            case kOptDstBecome: o.dst_become = true; break;
            case kOptChunkSizeGb:
                o.chunk_size_gb = ParsePositive("--chunk-size-gb", optarg,
                                                std::numeric_limits<std::uint64_t>::max() / kGiB);
                break;
            case kOptRetry:
                o.retry = static_cast<unsigned>(
                    ParsePositive("--retry", optarg, std::numeric_limits<unsigned>::max()));
                break;
            case kOptDelete: o.delete_always = true; break;
            case kOptKeep: o.keep = true; break;
            case kOptLocalSrc: o.local_src = true; break;
            case kOptLocalDst: o.local_dst = true; break;
            case kOptWorkdir: o.workdir = optarg; break;
            case kOptHelperImage: o.helper_image = optarg; break;
            case kOptConfig: config_file = optarg; break;
            case kOptReport: o.report = optarg; break;
            case ':':
                throw ConfigError(std::string(argv[optind - 1]) + " requires an argument.");
            default:
                throw ConfigError("Unknown argument: " + std::string(argv[optind - 1]));
        }
    }

    std::vector<std::string> positional(argv + optind, argv + argc);
    if (positional.size() != 2) {
        throw ConfigError("Expected <image|volume> <name>, got " + std::to_string(positional.size()) +
                          " positional argument(s).");
    }

    auto kind = ParseArtifactKind(positional[0]);
    if (!kind) {
        throw ConfigError("First argument must be 'image' or 'volume', got '" + positional[0] + "'.");
    }
    if (o.delete_always && o.keep) {
        throw ConfigError("--delete and --keep cannot both be used.");
    }

    TransferConfig& cfg = out.config;
    cfg.kind = *kind;
    cfg.name = positional[1];

    if (config_file) ApplyConfigFile(*config_file, cfg);
    Apply(o, cfg);

    if (cfg.workdir.empty()) {
        std::error_code ec;
        const auto cwd = std::filesystem::current_path(ec);
        if (ec) throw ConfigError("Cannot determine current directory: " + ec.message());
        cfg.workdir = cwd.string();
    } else {
        cfg.workdir = std::filesystem::absolute(cfg.workdir).lexically_normal().string();
    }

    ValidateConfig(cfg);
    return out;
}

} // namespace ferry
