#include "plistemit/file_io.h"

#include <cstdio>
#include <new>

namespace plistemit {
namespace {

    // Owns a stdio handle; closes it on scope exit unless already closed.
    class ScopedFile final {
    public:
        ScopedFile(const char* path, const char* mode) noexcept
            : f_(std::fopen(path, mode))
        {
        }

        ~ScopedFile() noexcept
        {
            if (f_) {
                (void)std::fclose(f_);
            }
        }

        ScopedFile(const ScopedFile&)            = delete;
        ScopedFile& operator=(const ScopedFile&) = delete;

        std::FILE* get() const noexcept { return f_; }

        /// Closes now and reports whether buffered data reached the file.
        bool close() noexcept
        {
            if (!f_) {
                return true;
            }
            const int rc = std::fclose(f_);
            f_           = nullptr;
            return rc == 0;
        }

    private:
        std::FILE* f_ = nullptr;
    };

}  // namespace


ReadFileStatus
read_file_bytes(const char* path, std::vector<std::byte>* out,
                uint64_t max_file_bytes, uint64_t* out_size) noexcept
{
    if (out_size) {
        *out_size = 0;
    }
    if (!out) {
        return ReadFileStatus::IoFailed;
    }
    out->clear();
    if (!path || !*path) {
        return ReadFileStatus::OpenFailed;
    }

    ScopedFile f(path, "rb");
    if (!f.get()) {
        return ReadFileStatus::OpenFailed;
    }

    if (std::fseek(f.get(), 0, SEEK_END) != 0) {
        return ReadFileStatus::IoFailed;
    }
    const long end = std::ftell(f.get());
    if (end < 0) {
        return ReadFileStatus::IoFailed;
    }
    if (std::fseek(f.get(), 0, SEEK_SET) != 0) {
        return ReadFileStatus::IoFailed;
    }

    const uint64_t size_u64 = static_cast<uint64_t>(end);
    if (out_size) {
        *out_size = size_u64;
    }
    if (max_file_bytes != 0U && size_u64 > max_file_bytes) {
        return ReadFileStatus::TooLarge;
    }

    const size_t size = static_cast<size_t>(size_u64);
    try {
        out->resize(size);
    } catch (const std::bad_alloc&) {
        return ReadFileStatus::TooLarge;
    }
    if (size != 0U) {
        const size_t read = std::fread(out->data(), 1, size, f.get());
        if (read != size) {
            out->clear();
            return ReadFileStatus::IoFailed;
        }
    }
    return ReadFileStatus::Ok;
}


WriteFileStatus
write_file_bytes(const char* path, std::span<const std::byte> bytes) noexcept
{
    if (!path || !*path) {
        return WriteFileStatus::OpenFailed;
    }

    ScopedFile f(path, "wb");
    if (!f.get()) {
        return WriteFileStatus::OpenFailed;
    }

    if (!bytes.empty()) {
        const size_t wrote = std::fwrite(bytes.data(), 1, bytes.size(),
                                         f.get());
        if (wrote != bytes.size()) {
            return WriteFileStatus::IoFailed;
        }
    }
    if (std::fflush(f.get()) != 0) {
        return WriteFileStatus::IoFailed;
    }
    if (!f.close()) {
        return WriteFileStatus::IoFailed;
    }
    return WriteFileStatus::Ok;
}


const char*
read_file_status_name(ReadFileStatus status) noexcept
{
    switch (status) {
    case ReadFileStatus::Ok: return "ok";
    case ReadFileStatus::OpenFailed: return "open_failed";
    case ReadFileStatus::IoFailed: return "io_failed";
    case ReadFileStatus::TooLarge: return "too_large";
    }
    return "unknown";
}


const char*
write_file_status_name(WriteFileStatus status) noexcept
{
    switch (status) {
    case WriteFileStatus::Ok: return "ok";
    case WriteFileStatus::OpenFailed: return "open_failed";
    case WriteFileStatus::IoFailed: return "io_failed";
    }
    return "unknown";
}

}  // namespace plistemit
