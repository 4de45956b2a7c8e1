// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/disk/error.hpp>
#include <cerrno>
#include <string>

namespace surge::disk {

namespace {

class DiskCategory final : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "surge::disk"; }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:           return "Success";
            case DiskErrc::file_not_found:    return "Directory or file not found";
            case DiskErrc::access_denied:     return "Permission denied";
            case DiskErrc::disk_full:         return "No space left for the download";
            case DiskErrc::invalid_path:      return "Invalid destination path";
            case DiskErrc::write_error:       return "Write to disk failed";
            case DiskErrc::seek_error:        return "Destination is not seekable";
            case DiskErrc::allocation_failed: return "Out of memory";
            case DiskErrc::handle_invalid:    return "File is not open";
            case DiskErrc::rename_failed:     return "Could not move file into place";
        }
        return "Unknown disk error";
    }
};

} // namespace

const std::error_category& disk_errc_category() noexcept {
    static const DiskCategory category;
    return category;
}

std::error_code from_errno(int err) noexcept {
    switch (err) {
        case 0:             return {};
        case ENOENT:
        case ENOTDIR:       return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:         return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:
        case EFBIG:         return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case EISDIR:
        case EINVAL:        return make_error_code(DiskErrc::invalid_path);
        case ESPIPE:        return make_error_code(DiskErrc::seek_error);
        case ENOMEM:        return make_error_code(DiskErrc::allocation_failed);
        case EBADF:         return make_error_code(DiskErrc::handle_invalid);
        default:            return make_error_code(DiskErrc::write_error);
    }
}

} // namespace surge::disk
