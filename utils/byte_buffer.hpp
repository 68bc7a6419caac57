// utils/byte_buffer.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace utils
{

    // Byte order convention: all multi-byte fields little-endian (Intel),
    // floating point as IEEE754 bit patterns.

    class ByteWriter
    {
    public:
        ByteWriter() = default;

        void put_u8(uint8_t v);
        void put_u16(uint16_t v);
        void put_u32(uint32_t v);
        void put_u64(uint64_t v);
        void put_i64(int64_t v) { put_u64(static_cast<uint64_t>(v)); }
        void put_f32(float v);
        void put_f64(double v);

        // u16 length prefix, then raw bytes
        void put_string(const std::string &s);
        void put_bytes(const uint8_t *data, size_t len);

        const std::vector<uint8_t> &bytes() const { return buf_; }
        std::vector<uint8_t> take() { return std::move(buf_); }
        size_t size() const { return buf_.size(); }

    private:
        std::vector<uint8_t> buf_;
    };

    /**
     * Bounds-checked reader over a byte span.
     * Every get_* returns false (and leaves the output untouched) when the
     * remaining length is too short; the reader stays failed after that.
     */
    class ByteReader
    {
    public:
        ByteReader(const uint8_t *data, size_t len) : data_(data), len_(len) {}
        explicit ByteReader(const std::vector<uint8_t> &v) : data_(v.data()), len_(v.size()) {}

        bool get_u8(uint8_t &out);
        bool get_u16(uint16_t &out);
        bool get_u32(uint32_t &out);
        bool get_u64(uint64_t &out);
        bool get_i64(int64_t &out);
        bool get_f32(float &out);
        bool get_f64(double &out);
        bool get_string(std::string &out);
        bool get_bytes(uint8_t *out, size_t len);

        size_t remaining() const { return ok_ ? len_ - pos_ : 0; }
        bool ok() const { return ok_; }

    private:
        bool need(size_t n);

        const uint8_t *data_;
        size_t len_;
        size_t pos_ = 0;
        bool ok_ = true;
    };

} // namespace utils
