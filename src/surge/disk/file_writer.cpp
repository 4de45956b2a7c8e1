// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/disk/file_writer.hpp>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace surge::disk {

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : fd_(other.fd_)
    , path_(std::move(other.path_)) {
    other.fd_ = -1;
}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

std::error_code FileWriter::open(std::string_view path, std::uint64_t size) noexcept {
    if (fd_ >= 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    path_ = path;

    int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return from_errno(errno);
    }

    // Pre-size so every chunk can write at its final offset
    if (size > 0 && ::ftruncate(fd, static_cast<off_t>(size)) != 0) {
        int err = errno;
        ::close(fd);
        return from_errno(err);
    }

    fd_ = fd;
    return {};
}

std::error_code FileWriter::write(std::uint64_t offset,
                                  const void* data,
                                  std::size_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* bytes = static_cast<const char*>(data);
    while (size > 0) {
        ssize_t n = ::pwrite(fd_, bytes, size, static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) continue;
            return from_errno(errno);
        }
        if (n == 0) {
            return make_error_code(DiskErrc::write_error);
        }
        bytes += n;
        size -= static_cast<std::size_t>(n);
        offset += static_cast<std::uint64_t>(n);
    }
    return {};
}

std::error_code FileWriter::flush() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fdatasync(fd_) != 0) {
        return from_errno(errno);
    }
    return {};
}

std::error_code FileWriter::close() noexcept {
    if (fd_ < 0) {
        return {};
    }
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0 && errno != EINTR) {
        return from_errno(errno);
    }
    return {};
}

//=============================================================================
// BufferedWriter
//=============================================================================

BufferedWriter::BufferedWriter(FileWriter& file, std::size_t capacity)
    : file_(file)
    , capacity_(capacity == 0 ? 1 : capacity) {
    buffer_.reserve(capacity_);
}

std::error_code BufferedWriter::append(const void* data, std::size_t size) noexcept {
    const auto* bytes = static_cast<const std::byte*>(data);

    while (size > 0) {
        if (buffer_.empty() && size >= capacity_) {
            // Large write with an empty buffer: skip the copy
            if (auto ec = file_.write(flushed_, bytes, size)) {
                return ec;
            }
            flushed_ += size;
            return {};
        }

        std::size_t room = capacity_ - buffer_.size();
        std::size_t take = size < room ? size : room;
        buffer_.insert(buffer_.end(), bytes, bytes + take);
        bytes += take;
        size -= take;

        if (buffer_.size() == capacity_) {
            if (auto ec = flush()) {
                return ec;
            }
        }
    }
    return {};
}

std::error_code BufferedWriter::flush() noexcept {
    if (buffer_.empty()) {
        return {};
    }
    if (auto ec = file_.write(flushed_, buffer_.data(), buffer_.size())) {
        return ec;
    }
    flushed_ += buffer_.size();
    buffer_.clear();
    return {};
}

} // namespace surge::disk
