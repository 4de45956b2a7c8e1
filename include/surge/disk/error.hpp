// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>

namespace surge::disk {

// Local file failures. Every value classifies as ErrorKind::write and is
// never retried.
enum class DiskErrc {
    success = 0,
    file_not_found,     // Parent directory missing
    access_denied,
    disk_full,          // Includes quota and file-size limits
    invalid_path,
    write_error,
    seek_error,
    allocation_failed,
    handle_invalid,     // Writer used before open() or after close()
    rename_failed,      // Temp file could not be moved onto the destination
};

[[nodiscard]] const std::error_category& disk_errc_category() noexcept;

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

// Translate an errno value from open/pwrite/ftruncate/fdatasync into a DiskErrc
[[nodiscard]] std::error_code from_errno(int err) noexcept;

} // namespace surge::disk

namespace std {

template<>
struct is_error_code_enum<surge::disk::DiskErrc> : true_type {};

} // namespace std
