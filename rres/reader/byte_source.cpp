#include "byte_source.hpp"

#include "rres/core/error.hpp"

#include <cstring>
#include <limits>
#include <system_error>
#include <string>

namespace rres::reader {

// ----------------------------------------------------------------------------
// ByteSource
// ----------------------------------------------------------------------------

void ByteSource::require(std::uint64_t count, const char* what) const {
    if (count > remaining()) {
        throw Error(ErrorCode::InsufficientData,
                    std::string(what) + " needs " + std::to_string(count) + " bytes at offset " +
                        std::to_string(position_) + ", only " + std::to_string(remaining()) + " left");
    }
}

void ByteSource::read_into(std::span<std::uint8_t> out) {
    require(out.size(), "read");
    if (out.empty()) {
        return;
    }
    do_read(out);
    position_ += out.size();
}

std::vector<std::uint8_t> ByteSource::read_exact(std::uint64_t count) {
    // Bounds check precedes the allocation.
    require(count, "read");
    std::vector<std::uint8_t> data(static_cast<std::size_t>(count));
    read_into(data);
    return data;
}

void ByteSource::skip(std::uint64_t count) {
    require(count, "skip");
    if (count == 0) {
        return;
    }
    do_seek(position_ + count);
    position_ += count;
}

void ByteSource::seek_to(std::uint64_t offset) {
    if (offset > size_) {
        throw Error(ErrorCode::InsufficientData,
                    "seek to offset " + std::to_string(offset) + " past end of source (" +
                        std::to_string(size_) + " bytes)");
    }
    do_seek(offset);
    position_ = offset;
}

// ----------------------------------------------------------------------------
// FileSource
// ----------------------------------------------------------------------------

FILE* FileSource::open_file(const std::filesystem::path& path) {
    const std::string pathStr = path.string();
    FILE* file = std::fopen(pathStr.c_str(), "rb");
    if (!file) {
        throw Error(ErrorCode::OpenFailed, "cannot open " + pathStr);
    }
    return file;
}

std::uint64_t FileSource::file_size(FILE* file, const std::filesystem::path& path) {
    std::error_code ec;
    const std::uintmax_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        std::fclose(file);
        throw Error(ErrorCode::OpenFailed, "cannot determine size of " + path.string() + ": " + ec.message());
    }
    return static_cast<std::uint64_t>(size);
}

FileSource::FileSource(const std::filesystem::path& path)
    : FileSource(path, open_file(path)) {}

FileSource::FileSource(const std::filesystem::path& path, FILE* file)
    : ByteSource(file_size(file, path))
    , path_(path)
    , file_(file) {}

FileSource::~FileSource() {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
}

void FileSource::do_read(std::span<std::uint8_t> out) {
    if (std::fread(out.data(), 1, out.size(), file_) != out.size()) {
        throw Error(ErrorCode::InsufficientData, "short read from " + path_.string());
    }
}

void FileSource::do_seek(std::uint64_t offset) {
    // std::fseek takes a long; 32-bit long platforms cap files at 2 GiB.
    if (offset > static_cast<std::uint64_t>(std::numeric_limits<long>::max())) {
        throw Error(ErrorCode::InsufficientData,
                    "offset " + std::to_string(offset) + " beyond the seekable range of " + path_.string());
    }
    if (std::fseek(file_, static_cast<long>(offset), SEEK_SET) != 0) {
        throw Error(ErrorCode::InsufficientData,
                    "cannot seek to offset " + std::to_string(offset) + " in " + path_.string());
    }
}

// ----------------------------------------------------------------------------
// MemorySource
// ----------------------------------------------------------------------------

MemorySource::MemorySource(std::span<const std::uint8_t> data)
    : ByteSource(data.size())
    , data_(data) {}

void MemorySource::do_read(std::span<std::uint8_t> out) {
    std::memcpy(out.data(), data_.data() + cursor_, out.size());
    cursor_ += out.size();
}

void MemorySource::do_seek(std::uint64_t offset) {
    cursor_ = static_cast<std::size_t>(offset);
}

} // namespace rres::reader
