#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file file_io.h
 * \brief Whole-file read and write helpers used by sources, save, and tools.
 */

namespace plistemit {

/// Status code for \ref read_file_bytes.
enum class ReadFileStatus : uint8_t {
    Ok,
    OpenFailed,
    IoFailed,
    /// The file is larger than the caller's cap.
    TooLarge,
};

/// Status code for \ref write_file_bytes.
enum class WriteFileStatus : uint8_t {
    Ok,
    OpenFailed,
    /// Short write, flush, or close failure. The file may be partially written.
    IoFailed,
};

/**
 * \brief Reads all of \p path into \p out.
 *
 * \param max_file_bytes hard cap (0 = unlimited).
 * \param out_size if non-null, receives the file size when it was determined.
 *
 * On failure \p out is left empty. The file handle is released on every path.
 */
ReadFileStatus
read_file_bytes(const char* path, std::vector<std::byte>* out,
                uint64_t max_file_bytes, uint64_t* out_size) noexcept;

/**
 * \brief Creates or truncates \p path and writes \p bytes to it (binary mode).
 *
 * The file handle is released on every path, including write failures.
 */
WriteFileStatus
write_file_bytes(const char* path, std::span<const std::byte> bytes) noexcept;

const char*
read_file_status_name(ReadFileStatus status) noexcept;
const char*
write_file_status_name(WriteFileStatus status) noexcept;

}  // namespace plistemit
