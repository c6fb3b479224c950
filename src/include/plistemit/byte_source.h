#pragma once

#include "plistemit/file_io.h"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file byte_source.h
 * \brief Rewindable byte sources emitted as `<data>` elements.
 */

namespace plistemit {

/**
 * \brief A readable byte source with a resettable read position.
 *
 * The emitter calls \ref rewind once and then \ref read_all once per
 * encoding, so any earlier read position is ignored.
 */
class PlistByteSource {
public:
    virtual ~PlistByteSource() = default;

    /// Resets the read position to the first byte.
    virtual bool rewind() = 0;

    /// Reads from the current position to the end, replacing \p out.
    virtual bool read_all(std::vector<std::byte>* out) = 0;
};


/// Byte source over an owned in-memory buffer.
class MemoryByteSource final : public PlistByteSource {
public:
    MemoryByteSource() = default;
    explicit MemoryByteSource(std::vector<std::byte> bytes);
    explicit MemoryByteSource(std::string_view text);

    bool rewind() override;
    bool read_all(std::vector<std::byte>* out) override;

    /// Copies up to `dst.size()` bytes and advances. Returns the count.
    size_t read(std::span<std::byte> dst) noexcept;

    size_t position() const noexcept { return pos_; }
    size_t size() const noexcept { return bytes_.size(); }

private:
    std::vector<std::byte> bytes_;
    size_t pos_ = 0;
};


/**
 * \brief Byte source adapting a seekable `std::istream`.
 *
 * The stream is borrowed and must outlive the source.
 */
class StreamByteSource final : public PlistByteSource {
public:
    explicit StreamByteSource(std::istream& in) noexcept;

    bool rewind() override;
    bool read_all(std::vector<std::byte>* out) override;

private:
    std::istream* in_ = nullptr;
};


/// Byte source reading a whole file by path on each \ref read_all.
class FileByteSource final : public PlistByteSource {
public:
    explicit FileByteSource(std::string path, uint64_t max_file_bytes = 0);

    bool rewind() override;
    bool read_all(std::vector<std::byte>* out) override;

    const std::string& path() const noexcept { return path_; }
    /// Status of the most recent \ref read_all.
    ReadFileStatus last_status() const noexcept { return last_status_; }

private:
    std::string path_;
    uint64_t max_file_bytes_    = 0;
    ReadFileStatus last_status_ = ReadFileStatus::Ok;
};

}  // namespace plistemit
