#include "relay/transfer/staging.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <iomanip>
#include <sstream>

#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

namespace relay::transfer {
namespace fs = std::filesystem;

namespace {

constexpr int kMaxCreateAttempts = 16;

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool process_alive(pid_t pid) {
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

} // namespace

// ──────────────────────────────────────────────────────────
// StagedObject
// ──────────────────────────────────────────────────────────

StagedObject::StagedObject(fs::path path)
    : path_(std::move(path)),
      released_(false) {
}

StagedObject::~StagedObject() {
    if (released_) {
        return;
    }
    auto result = release();
    if (result.is_error()) {
        spdlog::warn("Failed to remove staged file {}: {}", path_.string(), result.error().message);
    }
}

StagedObject::StagedObject(StagedObject&& other) noexcept
    : path_(std::move(other.path_)),
      size_(other.size_),
      complete_(other.complete_),
      released_(other.released_) {
    other.released_ = true;
    other.size_ = 0;
    other.complete_ = false;
}

StagedObject& StagedObject::operator=(StagedObject&& other) noexcept {
    if (this != &other) {
        if (!released_) {
            auto result = release();
            if (result.is_error()) {
                spdlog::warn("Failed to remove staged file {}: {}", path_.string(), result.error().message);
            }
        }
        path_ = std::move(other.path_);
        size_ = other.size_;
        complete_ = other.complete_;
        released_ = other.released_;
        other.released_ = true;
        other.size_ = 0;
        other.complete_ = false;
    }
    return *this;
}

relay::Result<void, relay::TransferError> StagedObject::release() {
    if (released_) {
        return relay::Ok();
    }

    std::error_code ec;
    fs::remove(path_, ec);
    if (ec && fs::exists(path_)) {
        return relay::Err(relay::TransferError::staging(
            "Failed to remove staged file " + path_.string() + ": " + ec.message()));
    }

    released_ = true;
    spdlog::debug("Released staged file {}", path_.string());
    return relay::Ok();
}

// ──────────────────────────────────────────────────────────
// StagingStore
// ──────────────────────────────────────────────────────────

StagingStore::StagingStore(fs::path root)
    : root_(std::move(root)),
      rng_(std::random_device{}()) {
}

relay::Result<StagedObject, relay::TransferError> StagingStore::acquire() {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec && !fs::is_directory(root_)) {
        return relay::Err(relay::TransferError::staging(
            "Failed to create staging directory " + root_.string() + ": " + ec.message()));
    }

    for (int attempt = 0; attempt < kMaxCreateAttempts; ++attempt) {
        const fs::path candidate = root_ / make_name();
        const int fd = ::open(candidate.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0600);
        if (fd < 0) {
            const int err = errno;
            if (err == EEXIST) {
                continue;
            }
            return relay::Err(relay::TransferError::staging(
                "Failed to create staged file " + candidate.string() + ": " + std::strerror(err)));
        }
        ::close(fd);

        spdlog::debug("Acquired staged file {}", candidate.string());
        return relay::Ok(StagedObject(candidate));
    }

    return relay::Err(relay::TransferError::staging(
        "Could not allocate a unique staged file in " + root_.string()));
}

std::size_t StagingStore::purge_orphans() {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return 0;
    }

    const std::string prefix = kFilePrefix;
    const std::string suffix = kFileSuffix;
    const pid_t self = ::getpid();
    std::size_t removed = 0;

    for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (!starts_with(name, prefix) || !ends_with(name, suffix)) {
            continue;
        }

        const auto dash = name.find('-', prefix.size());
        if (dash == std::string::npos) {
            continue;
        }

        pid_t owner = 0;
        try {
            owner = static_cast<pid_t>(std::stol(name.substr(prefix.size(), dash - prefix.size())));
        } catch (const std::exception&) {
            continue;
        }

        if (owner == self || process_alive(owner)) {
            continue;
        }

        std::error_code remove_ec;
        if (fs::remove(it->path(), remove_ec)) {
            spdlog::info("Removed orphaned staged file {}", it->path().string());
            ++removed;
        } else if (remove_ec) {
            spdlog::warn("Failed to remove orphaned staged file {}: {}", it->path().string(), remove_ec.message());
        }
    }

    if (ec) {
        spdlog::warn("Stopped scanning staging directory {}: {}", root_.string(), ec.message());
    }
    return removed;
}

std::string StagingStore::make_name() {
    std::uint64_t token = 0;
    {
        std::lock_guard lock(rng_mutex_);
        token = rng_();
    }

    std::ostringstream oss;
    oss << kFilePrefix << ::getpid() << "-" << ++counter_ << "-"
        << std::hex << std::setw(16) << std::setfill('0') << token << kFileSuffix;
    return oss.str();
}

} // namespace relay::transfer
