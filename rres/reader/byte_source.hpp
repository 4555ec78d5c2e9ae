#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <span>
#include <vector>

namespace rres::reader {

// Sequential read / bounded seek capability over a container.
// Every read and seek is checked against size() first and throws
// Error(InsufficientData) instead of running past the end.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Fill `out` completely from the current position.
    void read_into(std::span<std::uint8_t> out);

    // Read exactly `count` bytes.
    std::vector<std::uint8_t> read_exact(std::uint64_t count);

    // Advance the position by `count` bytes without reading them.
    void skip(std::uint64_t count);

    // Move to an absolute offset (0 <= offset <= size()).
    void seek_to(std::uint64_t offset);

    std::uint64_t position() const { return position_; }
    std::uint64_t size() const { return size_; }
    std::uint64_t remaining() const { return size_ - position_; }

protected:
    explicit ByteSource(std::uint64_t size) : size_(size) {}

    // Backend hooks. Bounds are already checked when these are called.
    virtual void do_read(std::span<std::uint8_t> out) = 0;
    virtual void do_seek(std::uint64_t offset) = 0;

private:
    void require(std::uint64_t count, const char* what) const;

    std::uint64_t size_{0};
    std::uint64_t position_{0};
};

// Container file opened read-only for the lifetime of the object.
class FileSource final : public ByteSource {
public:
    // Throws Error(OpenFailed) when the file cannot be opened or sized.
    explicit FileSource(const std::filesystem::path& path);
    ~FileSource() override;

    // Non-copyable, non-movable (owns the handle for one operation).
    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    const std::filesystem::path& path() const { return path_; }

protected:
    void do_read(std::span<std::uint8_t> out) override;
    void do_seek(std::uint64_t offset) override;

private:
    FileSource(const std::filesystem::path& path, FILE* file);

    static FILE* open_file(const std::filesystem::path& path);
    static std::uint64_t file_size(FILE* file, const std::filesystem::path& path);

    std::filesystem::path path_;
    FILE* file_{nullptr};
};

// Non-owning view over an in-memory container.
class MemorySource final : public ByteSource {
public:
    explicit MemorySource(std::span<const std::uint8_t> data);

protected:
    void do_read(std::span<std::uint8_t> out) override;
    void do_seek(std::uint64_t offset) override;

private:
    std::span<const std::uint8_t> data_;
    std::size_t cursor_{0};
};

} // namespace rres::reader
