#pragma once

#include "error.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rres {

// ============================================================================
// ByteWriter - Serialize little-endian data to bytes
// ============================================================================

class ByteWriter {
public:
    ByteWriter() = default;
    explicit ByteWriter(std::size_t reserve) { data_.reserve(reserve); }

    // --- Primitives ---

    void write_u8(std::uint8_t v) {
        data_.push_back(v);
    }

    void write_u16(std::uint16_t v) {
        data_.push_back(static_cast<std::uint8_t>(v & 0xFF));
        data_.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    }

    void write_u32(std::uint32_t v) {
        data_.push_back(static_cast<std::uint8_t>(v & 0xFF));
        data_.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
        data_.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
        data_.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
    }

    // Four-character code, written byte for byte.
    void write_fourcc(const std::array<std::uint8_t, 4>& code) {
        data_.insert(data_.end(), code.begin(), code.end());
    }

    // --- Raw bytes ---

    void write_bytes(std::span<const std::uint8_t> bytes) {
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    }

    void write_bytes(std::string_view s) {
        data_.insert(data_.end(), s.begin(), s.end());
    }

    void write_zeros(std::size_t count) {
        data_.insert(data_.end(), count, 0);
    }

    // --- Access ---

    std::span<const std::uint8_t> data() const { return data_; }
    std::size_t size() const { return data_.size(); }
    std::vector<std::uint8_t> take() { return std::move(data_); }
    void clear() { data_.clear(); }

private:
    std::vector<std::uint8_t> data_;
};

// ============================================================================
// ByteReader - Deserialize little-endian data from bytes
// ============================================================================

class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> data)
        : data_(data), pos_(0) {}

    // --- Primitives ---

    std::uint8_t read_u8() {
        check_remaining(1);
        return data_[pos_++];
    }

    std::uint16_t read_u16() {
        check_remaining(2);
        std::uint16_t v = static_cast<std::uint16_t>(data_[pos_])
                       | static_cast<std::uint16_t>(static_cast<std::uint16_t>(data_[pos_ + 1]) << 8);
        pos_ += 2;
        return v;
    }

    std::uint32_t read_u32() {
        check_remaining(4);
        std::uint32_t v = static_cast<std::uint32_t>(data_[pos_])
                       | (static_cast<std::uint32_t>(data_[pos_ + 1]) << 8)
                       | (static_cast<std::uint32_t>(data_[pos_ + 2]) << 16)
                       | (static_cast<std::uint32_t>(data_[pos_ + 3]) << 24);
        pos_ += 4;
        return v;
    }

    std::array<std::uint8_t, 4> read_fourcc() {
        check_remaining(4);
        std::array<std::uint8_t, 4> code{data_[pos_], data_[pos_ + 1], data_[pos_ + 2], data_[pos_ + 3]};
        pos_ += 4;
        return code;
    }

    // --- Raw bytes ---

    std::span<const std::uint8_t> read_bytes(std::size_t count) {
        check_remaining(count);
        auto span = data_.subspan(pos_, count);
        pos_ += count;
        return span;
    }

    void skip(std::size_t count) {
        check_remaining(count);
        pos_ += count;
    }

    // --- State ---

    std::size_t position() const { return pos_; }
    std::size_t remaining() const { return data_.size() - pos_; }
    bool at_end() const { return pos_ >= data_.size(); }

private:
    void check_remaining(std::size_t need) const {
        if (need > data_.size() - pos_) {
            throw Error(ErrorCode::InsufficientData, "ByteReader: not enough data");
        }
    }

    std::span<const std::uint8_t> data_;
    std::size_t pos_;
};

} // namespace rres
