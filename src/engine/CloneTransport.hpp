#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "engine/EngineOptions.hpp"
#include "util/Expected.hpp"

namespace gitpulse {

/**
 * @brief Private scratch directory for one run's object store
 *
 * Created unique under the temp (or given) root and removed recursively on
 * destruction. A failed removal is logged at warn and otherwise ignored.
 */
class ScratchDirectory {
public:
    static Expected<std::unique_ptr<ScratchDirectory>> create(const std::filesystem::path& root);
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const std::filesystem::path& path() const { return dir; }

private:
    explicit ScratchDirectory(std::filesystem::path dir) : dir(std::move(dir)) {}
    std::filesystem::path dir;
};

/**
 * @brief Materializes a remote repository's object store locally
 *
 * fetch() leaves a bare repository at @p destination (objects, refs, HEAD),
 * without a working tree.
 */
class ICloneTransport {
public:
    virtual ~ICloneTransport() = default;
    virtual Expected<void> fetch(const std::string& owner, const std::string& repo,
                                 const std::filesystem::path& destination) = 0;
    virtual std::string describe() const = 0;

    /// Rejects names that are empty, contain '/', start with '-' or '.', or contain ".."
    static Expected<void> validateName(const std::string& owner, const std::string& repo);

    /// Transport for a run: a local mirror when options.mirrorRoot is set, git otherwise
    static std::unique_ptr<ICloneTransport> create(const EngineOptions& options, const std::string& proxyUrl);
};

/**
 * @brief Clones with the git command line
 *
 *   git [-c http.proxy=<proxy>] clone --bare --no-checkout --single-branch
 *       --depth <n> https://github.com/<owner>/<repo>.git <destination>
 */
class GitCliTransport : public ICloneTransport {
public:
    GitCliTransport(std::string gitExecutable, std::string proxyUrl, size_t depth, std::chrono::seconds timeout);

    Expected<void> fetch(const std::string& owner, const std::string& repo,
                         const std::filesystem::path& destination) override;
    std::string describe() const override { return "git " + git; }

    std::vector<std::string> buildArgs(const std::string& owner, const std::string& repo,
                                       const std::filesystem::path& destination) const;

    static std::string remoteUrl(const std::string& owner, const std::string& repo);

private:
    std::string git;
    std::string proxy;
    size_t depth;
    std::chrono::seconds timeout;
};

/**
 * @brief Copies a repository from a local mirror tree
 *
 * Looks for <root>/<owner>/<repo>.git, then <root>/<owner>/<repo>. A
 * worktree's .git directory is copied in place of the worktree.
 */
class LocalTransport : public ICloneTransport {
public:
    explicit LocalTransport(std::filesystem::path root) : root(std::move(root)) {}

    Expected<void> fetch(const std::string& owner, const std::string& repo,
                         const std::filesystem::path& destination) override;
    std::string describe() const override { return "mirror " + root.string(); }

private:
    std::filesystem::path root;
};

}
