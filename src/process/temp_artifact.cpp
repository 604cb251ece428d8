#include <qbroker/core/uuid.h>
#include <qbroker/process/temp_artifact.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

namespace qbroker::process {

TempArtifactManager::TempArtifactManager(std::filesystem::path directory, std::string prefix)
    : directory_(std::move(directory)), prefix_(std::move(prefix)) {}

TempArtifactManager::~TempArtifactManager() {
    if (auto failed = releaseAll(); failed > 0) {
        spdlog::warn("[TempArtifactManager] {} artifact(s) could not be removed", failed);
    }
}

Result<std::filesystem::path> TempArtifactManager::acquire(const RequestId& owner, ByteSpan payload,
                                                           std::string_view extension) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return Error{ErrorCode::ArtifactIOFailure,
                     "Cannot create artifact directory " + directory_.string() + ": " +
                         ec.message()};
    }

    auto path = directory_ / (prefix_ + core::generateUUID() + std::string(extension));

    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
        return Error{ErrorCode::ArtifactIOFailure,
                     "Cannot create " + path.string() + ": " + std::strerror(errno)};
    }

    const auto* data = reinterpret_cast<const char*>(payload.data());
    size_t remaining = payload.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            ::close(fd);
            ::unlink(path.c_str());
            return Error{ErrorCode::ArtifactIOFailure,
                         "Write to " + path.string() + " failed: " + std::strerror(err)};
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }

    if (::close(fd) != 0) {
        int err = errno;
        ::unlink(path.c_str());
        return Error{ErrorCode::ArtifactIOFailure,
                     "Close of " + path.string() + " failed: " + std::strerror(err)};
    }

    {
        std::lock_guard lock{mutex_};
        live_.emplace(path.string(), owner);
    }
    spdlog::debug("[TempArtifactManager] Acquired {} ({} bytes) for {}", path.filename().string(),
                  payload.size(), owner);
    return path;
}

Result<void> TempArtifactManager::release(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    {
        std::lock_guard lock{mutex_};
        live_.erase(path.string());
    }
    // remove() reports success for a missing file; anything else is a real failure
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return Error{ErrorCode::ArtifactIOFailure,
                     "Cannot remove " + path.string() + ": " + ec.message()};
    }
    return {};
}

std::size_t TempArtifactManager::releaseAll() {
    std::unordered_map<std::string, RequestId> pending;
    {
        std::lock_guard lock{mutex_};
        pending.swap(live_);
    }

    std::size_t failed = 0;
    for (const auto& [path, owner] : pending) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            spdlog::warn("[TempArtifactManager] Cannot remove {} (owner {}): {}", path, owner,
                         ec.message());
            ++failed;
        }
    }
    return failed;
}

std::size_t TempArtifactManager::liveCount() const {
    std::lock_guard lock{mutex_};
    return live_.size();
}

void ScopedArtifact::reset() {
    if (!manager_ || path_.empty()) {
        return;
    }
    if (auto r = manager_->release(path_); !r) {
        spdlog::warn("[TempArtifactManager] Cleanup failed: {}", r.error().message);
    }
    manager_ = nullptr;
    path_.clear();
}

std::string_view sniffImageExtension(ByteSpan payload) noexcept {
    auto at = [&](size_t i) { return std::to_integer<unsigned char>(payload[i]); };
    if (payload.size() >= 8 && at(0) == 0x89 && at(1) == 'P' && at(2) == 'N' && at(3) == 'G') {
        return ".png";
    }
    if (payload.size() >= 3 && at(0) == 0xFF && at(1) == 0xD8 && at(2) == 0xFF) {
        return ".jpg";
    }
    if (payload.size() >= 6 && at(0) == 'G' && at(1) == 'I' && at(2) == 'F' && at(3) == '8') {
        return ".gif";
    }
    if (payload.size() >= 12 && at(0) == 'R' && at(1) == 'I' && at(2) == 'F' && at(3) == 'F' &&
        at(8) == 'W' && at(9) == 'E' && at(10) == 'B' && at(11) == 'P') {
        return ".webp";
    }
    return ".png";
}

} // namespace qbroker::process
