#pragma once

#include "relay/core/cancellation.hpp"
#include "relay/core/result.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <optional>
#include <string>

namespace relay::transfer {

/**
 * ByteSource models a finite, non-rewindable inbound byte stream.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /**
     * Reads up to max_len bytes into buffer.
     * Returns 0 at end of data, an error message on I/O failure.
     * A source that can block waiting for data returns early once
     * `cancel` fires.
     */
    virtual relay::Result<std::size_t> read(std::uint8_t* buffer,
                                            std::size_t max_len,
                                            const relay::CancellationToken& cancel) = 0;

    /// Total length when the producer knows it up front.
    virtual std::optional<std::uint64_t> size_hint() const { return std::nullopt; }
};

/**
 * Reads a local file to the end.
 */
class FileSource : public ByteSource {
public:
    explicit FileSource(std::filesystem::path path);

    relay::Result<std::size_t> read(std::uint8_t* buffer,
                                    std::size_t max_len,
                                    const relay::CancellationToken& cancel) override;
    std::optional<std::uint64_t> size_hint() const override { return size_; }

private:
    std::filesystem::path path_;
    std::ifstream input_;
    std::optional<std::uint64_t> size_;
};

/**
 * Adapts any std::istream (stdin, a socket stream, a string stream).
 * The stream must outlive the source.
 */
class StreamSource : public ByteSource {
public:
    explicit StreamSource(std::istream& input, std::optional<std::uint64_t> size = std::nullopt);

    relay::Result<std::size_t> read(std::uint8_t* buffer,
                                    std::size_t max_len,
                                    const relay::CancellationToken& cancel) override;
    std::optional<std::uint64_t> size_hint() const override { return size_; }

private:
    std::istream& input_;
    std::optional<std::uint64_t> size_;
};

/**
 * Reads a pipe, terminal or socket descriptor (stdin for `relay_cli -`).
 *
 * Waits for data in short slices so a cancelled transfer is not held by an
 * idle producer. The descriptor is borrowed: it stays open, and its blocking
 * mode is restored, when the source is destroyed.
 */
class DescriptorSource : public ByteSource {
public:
    explicit DescriptorSource(int fd, std::optional<std::uint64_t> size = std::nullopt);
    ~DescriptorSource() override;

    DescriptorSource(const DescriptorSource&) = delete;
    DescriptorSource& operator=(const DescriptorSource&) = delete;

    relay::Result<std::size_t> read(std::uint8_t* buffer,
                                    std::size_t max_len,
                                    const relay::CancellationToken& cancel) override;
    std::optional<std::uint64_t> size_hint() const override { return size_; }

private:
    boost::asio::io_context io_;
    boost::asio::posix::stream_descriptor descriptor_;
    int original_flags_ = -1;
    bool eof_ = false;
    std::optional<std::uint64_t> size_;
};

} // namespace relay::transfer
