#pragma once

#include <cstdint>
#include <cstring>
#include <string>

namespace clipstash {

/**
 * BinaryWriter - Append-only buffer for fixed binary layouts.
 *
 * Used for the encrypted history envelope. Fixed-width integers are
 * written little-endian regardless of host order.
 */
class BinaryWriter {
public:
    BinaryWriter() = default;

    void reserve(size_t size) { buffer_.reserve(size); }

    void write_uint8(uint8_t v) {
        buffer_.push_back(static_cast<char>(v));
    }

    void write_uint32(uint32_t v) {
        for (int shift = 0; shift < 32; shift += 8) {
            buffer_.push_back(static_cast<char>((v >> shift) & 0xFF));
        }
    }

    void write_raw(const void* data, size_t size) {
        buffer_.append(reinterpret_cast<const char*>(data), size);
    }

    void write_raw(const std::string& bytes) { buffer_.append(bytes); }

    const std::string& data() const { return buffer_; }
    std::string release() { return std::move(buffer_); }

    size_t size() const { return buffer_.size(); }

private:
    std::string buffer_;
};

/**
 * BinaryReader - Bounds-checked cursor over a byte buffer.
 *
 * Every read returns false instead of running past the end.
 */
class BinaryReader {
public:
    explicit BinaryReader(const std::string& data)
        : ptr_(data.data())
        , end_(data.data() + data.size())
    {}

    bool has_remaining(size_t size) const {
        return static_cast<size_t>(end_ - ptr_) >= size;
    }

    size_t remaining() const {
        return static_cast<size_t>(end_ - ptr_);
    }

    bool read_uint8(uint8_t* v) {
        if (!has_remaining(1)) return false;
        *v = static_cast<uint8_t>(*ptr_++);
        return true;
    }

    bool read_uint32(uint32_t* v) {
        if (!has_remaining(4)) return false;
        uint32_t result = 0;
        for (int shift = 0; shift < 32; shift += 8) {
            result |= static_cast<uint32_t>(static_cast<uint8_t>(*ptr_++)) << shift;
        }
        *v = result;
        return true;
    }

    bool read_raw(void* data, size_t size) {
        if (!has_remaining(size)) return false;
        std::memcpy(data, ptr_, size);
        ptr_ += size;
        return true;
    }

    // Consume everything that is left
    std::string read_rest() {
        std::string rest(ptr_, end_);
        ptr_ = end_;
        return rest;
    }

private:
    const char* ptr_;
    const char* end_;
};

}  // namespace clipstash
