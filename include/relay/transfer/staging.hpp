#pragma once

#include "relay/core/error.hpp"
#include "relay/core/result.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <random>
#include <string>

namespace relay::transfer {

/**
 * @brief Scoped handle to one staged file
 *
 * Owns the file at path(): destroying or releasing the handle removes it.
 * Move-only so exactly one owner is responsible for the removal.
 */
class StagedObject {
public:
    StagedObject() = default;
    explicit StagedObject(std::filesystem::path path);
    ~StagedObject();

    StagedObject(const StagedObject&) = delete;
    StagedObject& operator=(const StagedObject&) = delete;

    StagedObject(StagedObject&& other) noexcept;
    StagedObject& operator=(StagedObject&& other) noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t size() const noexcept { return size_; }
    [[nodiscard]] bool complete() const noexcept { return complete_; }
    [[nodiscard]] bool released() const noexcept { return released_; }

    void record_written(std::uint64_t bytes) noexcept { size_ += bytes; }
    void mark_complete() noexcept { complete_ = true; }

    /**
     * @brief Delete the backing file
     *
     * Idempotent: a second call, or a call after the file vanished, succeeds.
     */
    relay::Result<void, relay::TransferError> release();

private:
    std::filesystem::path path_;
    std::uint64_t size_ = 0;
    bool complete_ = false;
    bool released_ = true;
};

/**
 * @brief Allocates uniquely named scratch files under one directory
 *
 * File names are relay-<pid>-<counter>-<random>.part and never derive from
 * caller-supplied names. Safe to use from several transfers at once.
 */
class StagingStore {
public:
    static constexpr const char* kFilePrefix = "relay-";
    static constexpr const char* kFileSuffix = ".part";

    explicit StagingStore(std::filesystem::path root);

    relay::Result<StagedObject, relay::TransferError> acquire();

    relay::Result<void, relay::TransferError> release(StagedObject& object) { return object.release(); }

    /**
     * @brief Remove staged files whose owning process no longer exists
     *
     * RETURNS: number of files removed
     */
    std::size_t purge_orphans();

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::string make_name();

    std::filesystem::path root_;
    std::atomic<std::uint64_t> counter_{0};
    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};

} // namespace relay::transfer
