// utils/byte_buffer.cpp
#include "utils/byte_buffer.hpp"

#include <cstring>

namespace utils
{

    void ByteWriter::put_u8(uint8_t v)
    {
        buf_.push_back(v);
    }

    void ByteWriter::put_u16(uint16_t v)
    {
        buf_.push_back(static_cast<uint8_t>(v & 0xFF));
        buf_.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    }

    void ByteWriter::put_u32(uint32_t v)
    {
        for (int i = 0; i < 4; ++i)
        {
            buf_.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
        }
    }

    void ByteWriter::put_u64(uint64_t v)
    {
        for (int i = 0; i < 8; ++i)
        {
            buf_.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
        }
    }

    void ByteWriter::put_f32(float v)
    {
        uint32_t bits = 0;
        std::memcpy(&bits, &v, sizeof(bits));
        put_u32(bits);
    }

    void ByteWriter::put_f64(double v)
    {
        uint64_t bits = 0;
        std::memcpy(&bits, &v, sizeof(bits));
        put_u64(bits);
    }

    void ByteWriter::put_string(const std::string &s)
    {
        const size_t n = s.size() > 0xFFFF ? 0xFFFF : s.size();
        put_u16(static_cast<uint16_t>(n));
        buf_.insert(buf_.end(), s.begin(), s.begin() + static_cast<std::ptrdiff_t>(n));
    }

    void ByteWriter::put_bytes(const uint8_t *data, size_t len)
    {
        buf_.insert(buf_.end(), data, data + len);
    }

    bool ByteReader::need(size_t n)
    {
        if (!ok_ || len_ - pos_ < n)
        {
            ok_ = false;
            return false;
        }
        return true;
    }

    bool ByteReader::get_u8(uint8_t &out)
    {
        if (!need(1))
            return false;
        out = data_[pos_++];
        return true;
    }

    bool ByteReader::get_u16(uint16_t &out)
    {
        if (!need(2))
            return false;
        out = static_cast<uint16_t>(data_[pos_] | (data_[pos_ + 1] << 8));
        pos_ += 2;
        return true;
    }

    bool ByteReader::get_u32(uint32_t &out)
    {
        if (!need(4))
            return false;
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i)
        {
            v |= static_cast<uint32_t>(data_[pos_ + i]) << (8 * i);
        }
        pos_ += 4;
        out = v;
        return true;
    }

    bool ByteReader::get_u64(uint64_t &out)
    {
        if (!need(8))
            return false;
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i)
        {
            v |= static_cast<uint64_t>(data_[pos_ + i]) << (8 * i);
        }
        pos_ += 8;
        out = v;
        return true;
    }

    bool ByteReader::get_i64(int64_t &out)
    {
        uint64_t v = 0;
        if (!get_u64(v))
            return false;
        out = static_cast<int64_t>(v);
        return true;
    }

    bool ByteReader::get_f32(float &out)
    {
        uint32_t bits = 0;
        if (!get_u32(bits))
            return false;
        std::memcpy(&out, &bits, sizeof(out));
        return true;
    }

    bool ByteReader::get_f64(double &out)
    {
        uint64_t bits = 0;
        if (!get_u64(bits))
            return false;
        std::memcpy(&out, &bits, sizeof(out));
        return true;
    }

    bool ByteReader::get_string(std::string &out)
    {
        uint16_t n = 0;
        if (!get_u16(n))
            return false;
        if (!need(n))
            return false;
        out.assign(reinterpret_cast<const char *>(data_ + pos_), n);
        pos_ += n;
        return true;
    }

    bool ByteReader::get_bytes(uint8_t *out, size_t len)
    {
        if (!need(len))
            return false;
        std::memcpy(out, data_ + pos_, len);
        pos_ += len;
        return true;
    }

} // namespace utils
