#include "relay/transfer/source.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>

#include <stdexcept>
#include <string>

#include <fcntl.h>

namespace relay::transfer {
namespace fs = std::filesystem;
namespace asio = boost::asio;

namespace {

constexpr std::chrono::milliseconds kPollInterval{20};

relay::Result<std::size_t> read_stream(std::istream& input, std::uint8_t* buffer, std::size_t max_len) {
    if (max_len == 0 || input.eof()) {
        return relay::Ok(std::size_t{0});
    }

    input.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(max_len));
    const auto count = static_cast<std::size_t>(input.gcount());
    if (input.bad()) {
        return relay::Err(std::string("Read from inbound stream failed"));
    }
    return relay::Ok(count);
}

} // namespace

FileSource::FileSource(fs::path path)
    : path_(std::move(path)),
      input_(path_, std::ios::binary) {
    std::error_code ec;
    const auto size = fs::file_size(path_, ec);
    if (!ec) {
        size_ = size;
    }
}

relay::Result<std::size_t> FileSource::read(std::uint8_t* buffer,
                                            std::size_t max_len,
                                            const relay::CancellationToken&) {
    if (!input_.is_open()) {
        return relay::Err(std::string("Failed to open source file: ") + path_.string());
    }
    return read_stream(input_, buffer, max_len);
}

StreamSource::StreamSource(std::istream& input, std::optional<std::uint64_t> size)
    : input_(input),
      size_(size) {
}

relay::Result<std::size_t> StreamSource::read(std::uint8_t* buffer,
                                              std::size_t max_len,
                                              const relay::CancellationToken&) {
    return read_stream(input_, buffer, max_len);
}

DescriptorSource::DescriptorSource(int fd, std::optional<std::uint64_t> size)
    : descriptor_(io_),
      size_(size) {
    original_flags_ = ::fcntl(fd, F_GETFL);
    boost::system::error_code ec;
    descriptor_.assign(fd, ec);
    if (ec) {
        throw std::runtime_error("Cannot watch descriptor " + std::to_string(fd) + ": " + ec.message());
    }
}

DescriptorSource::~DescriptorSource() {
    const int fd = descriptor_.release();
    if (original_flags_ != -1) {
        ::fcntl(fd, F_SETFL, original_flags_);
    }
}

relay::Result<std::size_t> DescriptorSource::read(std::uint8_t* buffer,
                                                  std::size_t max_len,
                                                  const relay::CancellationToken& cancel) {
    if (max_len == 0 || eof_) {
        return relay::Ok(std::size_t{0});
    }

    bool done = false;
    boost::system::error_code result;
    std::size_t count = 0;

    io_.restart();
    descriptor_.async_read_some(asio::buffer(buffer, max_len),
        [&](const boost::system::error_code& ec, std::size_t transferred) {
            done = true;
            result = ec;
            count = transferred;
        });

    while (!done) {
        if (cancel.is_cancelled()) {
            boost::system::error_code ignored;
            descriptor_.cancel(ignored);
            // Let the aborted handler run before its captures go away.
            io_.run();
            break;
        }
        io_.run_for(kPollInterval);
    }

    if (result == asio::error::eof) {
        eof_ = true;
        return relay::Ok(count);
    }
    if (result == asio::error::operation_aborted) {
        return relay::Err(std::string("Read from inbound stream cancelled"));
    }
    if (result) {
        return relay::Err("Read from inbound stream failed: " + result.message());
    }
    return relay::Ok(count);
}

} // namespace relay::transfer
