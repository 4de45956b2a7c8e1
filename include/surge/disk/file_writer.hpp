// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace surge::disk {

// Output file shared by concurrent chunk workers.
//
// write() is a positioned write (pwrite) and never moves a shared cursor, so
// workers writing disjoint ranges need no lock around the descriptor.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    // Non-copyable, movable
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    // Create or truncate the file and size it to `size` bytes (sparse)
    [[nodiscard]] std::error_code open(std::string_view path, std::uint64_t size) noexcept;

    // Write all of [data, data + size) at offset (thread-safe for disjoint ranges)
    [[nodiscard]] std::error_code write(std::uint64_t offset,
                                        const void* data,
                                        std::size_t size) noexcept;

    // Flush file data to the device
    [[nodiscard]] std::error_code flush() noexcept;

    // Close the descriptor; reports errors from close(2)
    [[nodiscard]] std::error_code close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    int fd_{-1};
    std::string path_;
};

// Sequential writer with a fixed-size buffer in front of a FileWriter, for the
// single-stream path where there is exactly one writer.
class BufferedWriter {
public:
    BufferedWriter(FileWriter& file, std::size_t capacity);

    BufferedWriter(const BufferedWriter&) = delete;
    BufferedWriter& operator=(const BufferedWriter&) = delete;

    [[nodiscard]] std::error_code append(const void* data, std::size_t size) noexcept;
    [[nodiscard]] std::error_code flush() noexcept;

    // Bytes accepted so far, buffered or written
    [[nodiscard]] std::uint64_t size() const noexcept { return flushed_ + buffer_.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    FileWriter& file_;
    std::vector<std::byte> buffer_;
    std::size_t capacity_;
    std::uint64_t flushed_{0};
};

} // namespace surge::disk
