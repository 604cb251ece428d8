#pragma once

#include <qbroker/core/types.h>

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace qbroker::process {

/**
 * @brief Creates and removes the uniquely named files used to hand binary payloads
 * (images) to the CLI.
 *
 * Files are created with O_CREAT|O_EXCL so two requests can never end up sharing
 * one, and every live file is tracked with its owning request so shutdown can
 * sweep whatever is left.
 *
 * Thread-safe.
 */
class TempArtifactManager {
public:
    explicit TempArtifactManager(std::filesystem::path directory,
                                 std::string prefix = "qbroker-image-");
    ~TempArtifactManager();

    TempArtifactManager(const TempArtifactManager&) = delete;
    TempArtifactManager& operator=(const TempArtifactManager&) = delete;

    /**
     * @brief Write @p payload to a fresh file.
     * @param owner Request the artifact belongs to
     * @param extension Suffix including the dot (".png")
     * @return Path of the new file, or ArtifactIOFailure
     */
    Result<std::filesystem::path> acquire(const RequestId& owner, ByteSpan payload,
                                          std::string_view extension = ".png");

    /**
     * @brief Delete an artifact. A file that is already gone counts as success.
     */
    Result<void> release(const std::filesystem::path& path);

    /**
     * @brief Delete every tracked artifact; returns how many could not be removed.
     */
    std::size_t releaseAll();

    std::size_t liveCount() const;
    const std::filesystem::path& directory() const noexcept { return directory_; }

private:
    std::filesystem::path directory_;
    std::string prefix_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RequestId> live_;
};

/**
 * @brief RAII ownership of one acquired artifact; releases on destruction.
 *
 * Release failures are logged, never thrown.
 */
class ScopedArtifact {
public:
    ScopedArtifact() = default;
    ScopedArtifact(TempArtifactManager& manager, std::filesystem::path path)
        : manager_(&manager), path_(std::move(path)) {}
    ~ScopedArtifact() { reset(); }

    ScopedArtifact(ScopedArtifact&& other) noexcept
        : manager_(other.manager_), path_(std::move(other.path_)) {
        other.manager_ = nullptr;
        other.path_.clear();
    }
    ScopedArtifact& operator=(ScopedArtifact&& other) noexcept {
        if (this != &other) {
            reset();
            manager_ = other.manager_;
            path_ = std::move(other.path_);
            other.manager_ = nullptr;
            other.path_.clear();
        }
        return *this;
    }

    ScopedArtifact(const ScopedArtifact&) = delete;
    ScopedArtifact& operator=(const ScopedArtifact&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }
    explicit operator bool() const noexcept { return manager_ != nullptr && !path_.empty(); }

    void reset();

private:
    TempArtifactManager* manager_ = nullptr;
    std::filesystem::path path_;
};

/**
 * @brief File extension for an image payload by magic bytes (".png" when unknown).
 */
std::string_view sniffImageExtension(ByteSpan payload) noexcept;

} // namespace qbroker::process
