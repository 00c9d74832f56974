#include "engine/CloneTransport.hpp"

#include <atomic>
#include <random>
#include <sstream>

#include <unistd.h>

#include "util/Logger.hpp"
#include "util/Process.hpp"

namespace fs = std::filesystem;

namespace gitpulse {

namespace {
    // Last lines of git's stderr make a readable error
    std::string tail(const std::string& text, size_t maxLines) {
        std::vector<std::string> lines;
        std::istringstream in(text);
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (!line.empty()) lines.push_back(line);
        }
        std::string out;
        size_t start = lines.size() > maxLines ? lines.size() - maxLines : 0;
        for (size_t i = start; i < lines.size(); ++i) {
            if (!out.empty()) out += "; ";
            out += lines[i];
        }
        return out;
    }

    bool validName(const std::string& name) {
        if (name.empty() || name[0] == '-' || name[0] == '.') return false;
        if (name.find("..") != std::string::npos) return false;
        for (char c : name) {
            if (c == '/' || c == '\\' || static_cast<unsigned char>(c) < 0x20) return false;
        }
        return true;
    }
}

Expected<std::unique_ptr<ScratchDirectory>> ScratchDirectory::create(const fs::path& root) {
    static std::atomic<unsigned> counter{0};
    std::error_code ec;
    fs::path base = root.empty() ? fs::temp_directory_path(ec) : root;
    if (ec) {
        return Error{ErrorCode::IoError, "No temp directory: " + ec.message()};
    }

    std::random_device rd;
    for (int attempt = 0; attempt < 16; ++attempt) {
        std::ostringstream name;
        name << "gitpulse-" << ::getpid() << "-" << counter++ << "-" << std::hex << rd();
        fs::path dir = base / name.str();
        if (fs::create_directories(dir, ec)) {
            return std::unique_ptr<ScratchDirectory>(new ScratchDirectory(dir));
        }
        if (ec) {
            return Error{ErrorCode::IoError, "Failed to create scratch directory: " + ec.message()};
        }
    }
    return Error{ErrorCode::IoError, "Failed to create a unique scratch directory under " + base.string()};
}

ScratchDirectory::~ScratchDirectory() {
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        Logger::instance().warn("Failed to remove scratch directory " + dir.string() + ": " + ec.message());
    }
}

Expected<void> ICloneTransport::validateName(const std::string& owner, const std::string& repo) {
    if (!validName(owner) || !validName(repo)) {
        return Error{ErrorCode::InvalidArgs, "Invalid repository name: " + owner + "/" + repo};
    }
    return {};
}

std::unique_ptr<ICloneTransport> ICloneTransport::create(const EngineOptions& options, const std::string& proxyUrl) {
    if (!options.mirrorRoot.empty()) {
        return std::make_unique<LocalTransport>(options.mirrorRoot);
    }
    return std::make_unique<GitCliTransport>(options.gitExecutable, proxyUrl, options.maxCommits,
                                             options.cloneTimeout);
}

GitCliTransport::GitCliTransport(std::string gitExecutable, std::string proxyUrl, size_t depth,
                                 std::chrono::seconds timeout)
    : git(std::move(gitExecutable)), proxy(std::move(proxyUrl)), depth(depth), timeout(timeout) {}

std::string GitCliTransport::remoteUrl(const std::string& owner, const std::string& repo) {
    return "https://github.com/" + owner + "/" + repo + ".git";
}

std::vector<std::string> GitCliTransport::buildArgs(const std::string& owner, const std::string& repo,
                                                    const fs::path& destination) const {
    std::vector<std::string> args{git};
    if (!proxy.empty()) {
        args.push_back("-c");
        args.push_back("http.proxy=" + proxy);
    }
    args.insert(args.end(), {"clone", "--bare", "--no-checkout", "--single-branch", "--quiet"});
    if (depth > 0) {
        args.push_back("--depth");
        args.push_back(std::to_string(depth));
    }
    args.push_back("--");
    args.push_back(remoteUrl(owner, repo));
    args.push_back(destination.string());
    return args;
}

Expected<void> GitCliTransport::fetch(const std::string& owner, const std::string& repo,
                                      const fs::path& destination) {
    auto valid = validateName(owner, repo);
    if (!valid) return valid.error();

    auto args = buildArgs(owner, repo, destination);
    Logger::instance().debug("Running " + git + " clone of " + remoteUrl(owner, repo));

    auto result = runProcess(args, destination.parent_path(),
                             std::chrono::duration_cast<std::chrono::milliseconds>(timeout));
    if (!result) {
        if (result.error().code == ErrorCode::Timeout) {
            return Error{ErrorCode::Timeout, "Clone timed out after " + std::to_string(timeout.count()) + "s"};
        }
        return Error{ErrorCode::TransportError, "Failed to run " + git + ": " + result.error().message};
    }
    if (result.value().exitCode != 0) {
        std::string reason = tail(result.value().stderrText, 3);
        return Error{ErrorCode::TransportError,
                     "Clone failed (exit " + std::to_string(result.value().exitCode) + ")" +
                         (reason.empty() ? std::string() : ": " + reason)};
    }
    Logger::instance().debug("Clone finished in " + std::to_string(result.value().elapsed.count()) + "ms");
    return {};
}

Expected<void> LocalTransport::fetch(const std::string& owner, const std::string& repo,
                                     const fs::path& destination) {
    auto valid = validateName(owner, repo);
    if (!valid) return valid.error();

    std::error_code ec;
    fs::path source;
    for (const fs::path& candidate : {root / owner / (repo + ".git"), root / owner / repo}) {
        if (fs::is_directory(candidate, ec)) {
            source = candidate;
            break;
        }
    }
    if (source.empty()) {
        return Error{ErrorCode::TransportError, "Repository not found in mirror: " + owner + "/" + repo};
    }
    if (fs::is_directory(source / ".git", ec)) {
        source /= ".git";
    }

    fs::copy(source, destination, fs::copy_options::recursive, ec);
    if (ec) {
        return Error{ErrorCode::TransportError, "Failed to copy mirror: " + ec.message()};
    }
    return {};
}

}
