#include "ferry/command.hpp"

#include "ferry/file_chunker.hpp"

namespace ferry {

namespace {

bool IsShellSafe(char c) {
    if (c >= 'a' && c <= 'z') return true;
    if (c >= 'A' && c <= 'Z') return true;
    if (c >= '0' && c <= '9') return true;
    switch (c) {
        case '_': case '-': case '.': case '/': case ':':
        case '@': case '%': case '+': case '=': case ',':
            return true;
        default:
            return false;
    }
}

const std::vector<std::string>& HelperDockerfile() {
    static const std::vector<std::string> lines = {
        "FROM ubuntu:25.04",
        "RUN apt-get update && DEBIAN_FRONTEND=noninteractive apt-get install -y "
        "--no-install-recommends xz-utils tar ca-certificates && rm -rf /var/lib/apt/lists/*",
        "WORKDIR /work",
    };
    return lines;
}

Command Make(std::vector<std::string> argv, bool elevated = false) {
    Command c;
    c.argv = std::move(argv);
    c.elevated = elevated;
    return c;
}

} // namespace

std::vector<std::string> Command::FullArgv() const {
    if (!elevated) return argv;
    std::vector<std::string> out;
    out.reserve(argv.size() + 1);
    out.emplace_back("sudo");
    out.insert(out.end(), argv.begin(), argv.end());
    return out;
}

std::string Command::ToString() const { return RenderShell(FullArgv()); }

std::string ShellQuote(std::string_view s) {
    if (s.empty()) return "''";

    bool safe = true;
    for (char c : s) {
        if (!IsShellSafe(c)) {
            safe = false;
            break;
        }
    }
    if (safe) return std::string(s);

    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

std::string RenderShell(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& a : argv) {
        if (!line.empty()) line.push_back(' ');
        line += ShellQuote(a);
    }
    return line;
}

namespace cmd {

Command MakeDirectories(const std::string& path) {
    return Make({"mkdir", "-p", "--", path});
}

Command TestExists(const std::string& path) {
    return Make({"test", "-e", path});
}

Command MakeWorldReadable(const std::string& path, bool try_sudo) {
    static const char* kPlain = "chmod 644 -- \"$1\" 2>/dev/null || true";
    static const char* kWithSudo =
        "sudo -n chmod 644 -- \"$1\" 2>/dev/null || chmod 644 -- \"$1\" 2>/dev/null || true";
    return Make({"sh", "-c", try_sudo ? kWithSudo : kPlain, "ferry-chmod", path});
}

Command Remove(const std::string& path, PathKind kind) {
    if (kind == PathKind::ChunkDir) {
        return Make({"rm", "-rf", "--", path});
    }
    return Make({"rm", "-f", "--", path});
}

Command Split(std::uint64_t chunk_bytes, const std::string& file, const std::string& chunk_dir) {
    return Make({"split", "-b", std::to_string(chunk_bytes), "-d", "-a",
                 std::to_string(kChunkSuffixDigits), file,
                 chunk_dir + "/" + kChunkPrefix});
}

Command JoinChunks(const std::string& chunk_dir, const std::string& out_file) {
    const std::string script = std::string("cat \"$1\"/") + kChunkPrefix + "* > \"$2\"";
    return Make({"sh", "-c", script, "ferry-join", chunk_dir, out_file});
}

Command DockerSave(const std::string& image, const std::string& out_file, bool elevated) {
    return Make({"docker", "save", "-o", out_file, image}, elevated);
}

Command DockerLoad(const std::string& in_file, bool elevated) {
    return Make({"docker", "load", "-i", in_file}, elevated);
}

Command DockerVolumeCreate(const std::string& volume, bool elevated) {
    return Make({"docker", "volume", "create", volume}, elevated);
}

Command DockerVolumeExport(const std::string& helper_image,
                           const std::string& volume,
                           const std::string& backup_dir,
                           const std::string& file_name,
                           bool elevated) {
    return Make({"docker", "run", "--rm",
                 "-v", volume + ":/source:ro",
                 "-v", backup_dir + ":/backup",
                 helper_image,
                 "tar", "cJvf", "/backup/" + file_name, "-C", "/source", "."},
                elevated);
}

Command DockerVolumeImport(const std::string& helper_image,
                           const std::string& volume,
                           const std::string& backup_dir,
                           const std::string& file_name,
                           bool elevated) {
    return Make({"docker", "run", "--rm",
                 "-v", volume + ":/dest",
                 "-v", backup_dir + ":/backup",
                 helper_image,
                 "tar", "xJvf", "/backup/" + file_name, "-C", "/dest"},
                elevated);
}

Command EnsureHelperImage(const std::string& helper_image, bool elevated) {
    static const char* kScript =
        "img=\"$1\"; shift; "
        "if docker image inspect \"$img\" >/dev/null 2>&1; then exit 0; fi; "
        "echo \">>> Building helper image $img ...\" >&2; "
        "printf '%s\\n' \"$@\" | docker build -t \"$img\" -";

    std::vector<std::string> argv = {"sh", "-c", kScript, "ferry-helper", helper_image};
    for (const auto& line : HelperDockerfile()) argv.push_back(line);
    return Make(std::move(argv), elevated);
}

} // namespace cmd

} // namespace ferry
