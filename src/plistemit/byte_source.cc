#include "plistemit/byte_source.h"

#include <cstring>
#include <utility>

namespace plistemit {

MemoryByteSource::MemoryByteSource(std::vector<std::byte> bytes)
    : bytes_(std::move(bytes))
{
}


MemoryByteSource::MemoryByteSource(std::string_view text)
{
    const std::byte* p = reinterpret_cast<const std::byte*>(text.data());
    bytes_.assign(p, p + text.size());
}


bool
MemoryByteSource::rewind()
{
    pos_ = 0;
    return true;
}


bool
MemoryByteSource::read_all(std::vector<std::byte>* out)
{
    if (!out) {
        return false;
    }
    out->assign(bytes_.begin() + static_cast<ptrdiff_t>(pos_), bytes_.end());
    pos_ = bytes_.size();
    return true;
}


size_t
MemoryByteSource::read(std::span<std::byte> dst) noexcept
{
    const size_t avail = bytes_.size() - pos_;
    const size_t take  = (dst.size() < avail) ? dst.size() : avail;
    if (take != 0U) {
        std::memcpy(dst.data(), bytes_.data() + pos_, take);
    }
    pos_ += take;
    return take;
}


StreamByteSource::StreamByteSource(std::istream& in) noexcept
    : in_(&in)
{
}


bool
StreamByteSource::rewind()
{
    in_->clear();
    in_->seekg(0, std::ios::beg);
    return !in_->fail();
}


bool
StreamByteSource::read_all(std::vector<std::byte>* out)
{
    if (!out) {
        return false;
    }
    out->clear();

    char buf[4096];
    for (;;) {
        in_->read(buf, sizeof(buf));
        const std::streamsize got = in_->gcount();
        if (got > 0) {
            const std::byte* p = reinterpret_cast<const std::byte*>(buf);
            out->insert(out->end(), p, p + got);
        }
        if (in_->bad()) {
            out->clear();
            return false;
        }
        if (in_->eof()) {
            break;
        }
        if (in_->fail()) {
            out->clear();
            return false;
        }
    }
    in_->clear();
    return true;
}


FileByteSource::FileByteSource(std::string path, uint64_t max_file_bytes)
    : path_(std::move(path))
    , max_file_bytes_(max_file_bytes)
{
}


bool
FileByteSource::rewind()
{
    // Every read reopens the file at offset 0.
    return true;
}


bool
FileByteSource::read_all(std::vector<std::byte>* out)
{
    last_status_ = read_file_bytes(path_.c_str(), out, max_file_bytes_,
                                   nullptr);
    return last_status_ == ReadFileStatus::Ok;
}

}  // namespace plistemit
