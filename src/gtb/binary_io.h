#ifndef GRAPHTRANSLITERATOR_GTB_BINARY_IO_H
#define GRAPHTRANSLITERATOR_GTB_BINARY_IO_H

#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace graphtransliterator {
namespace gtb {

// Little-endian output buffer
class ByteWriter {
public:
    void writeU8(uint8_t value) { bytes_.push_back(value); }

    void writeU32(uint32_t value) {
        for (int i = 0; i < 4; ++i) {
            bytes_.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
        }
    }

    void writeU64(uint64_t value) {
        for (int i = 0; i < 8; ++i) {
            bytes_.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
        }
    }

    void writeF64(double value) {
        uint64_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        writeU64(bits);
    }

    void writeBytes(const void* data, size_t length) {
        const uint8_t* p = static_cast<const uint8_t*>(data);
        bytes_.insert(bytes_.end(), p, p + length);
    }

    void writeU32List(const std::vector<uint32_t>& values) {
        writeU32(static_cast<uint32_t>(values.size()));
        for (uint32_t v : values) {
            writeU32(v);
        }
    }

    const std::vector<uint8_t>& bytes() const { return bytes_; }
    std::vector<uint8_t> release() { return std::move(bytes_); }

private:
    std::vector<uint8_t> bytes_;
};

// Bounds-checked little-endian input. Every read returns false once the
// data runs out; the offset is left unchanged on failure.
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t length) : data_(data), length_(length), offset_(0) {}

    bool readU8(uint8_t& value) {
        if (remaining() < 1) return false;
        value = data_[offset_++];
        return true;
    }

    bool readU32(uint32_t& value) {
        if (remaining() < 4) return false;
        value = static_cast<uint32_t>(data_[offset_]) |
                (static_cast<uint32_t>(data_[offset_ + 1]) << 8) |
                (static_cast<uint32_t>(data_[offset_ + 2]) << 16) |
                (static_cast<uint32_t>(data_[offset_ + 3]) << 24);
        offset_ += 4;
        return true;
    }

    bool readU64(uint64_t& value) {
        if (remaining() < 8) return false;
        value = 0;
        for (int i = 0; i < 8; ++i) {
            value |= static_cast<uint64_t>(data_[offset_ + i]) << (8 * i);
        }
        offset_ += 8;
        return true;
    }

    bool readF64(double& value) {
        uint64_t bits;
        if (!readU64(bits)) return false;
        std::memcpy(&value, &bits, sizeof(value));
        return true;
    }

    bool readBytes(void* out, size_t length) {
        if (remaining() < length) return false;
        std::memcpy(out, data_ + offset_, length);
        offset_ += length;
        return true;
    }

    bool readString(std::string& value) {
        uint32_t length;
        size_t start = offset_;
        if (!readU32(length)) return false;
        if (remaining() < length) {
            offset_ = start;
            return false;
        }
        value.assign(reinterpret_cast<const char*>(data_ + offset_), length);
        offset_ += length;
        return true;
    }

    // Lists are length-prefixed; a length that cannot fit in the rest of the
    // data is rejected before allocating
    bool readU32List(std::vector<uint32_t>& values) {
        uint32_t count;
        size_t start = offset_;
        if (!readU32(count)) return false;
        if (remaining() / 4 < count) {
            offset_ = start;
            return false;
        }
        values.resize(count);
        for (uint32_t i = 0; i < count; ++i) {
            if (!readU32(values[i])) return false;
        }
        return true;
    }

    size_t offset() const { return offset_; }
    size_t remaining() const { return length_ - offset_; }
    bool atEnd() const { return offset_ == length_; }

private:
    const uint8_t* data_;
    size_t length_;
    size_t offset_;
};

} // namespace gtb
} // namespace graphtransliterator

#endif // GRAPHTRANSLITERATOR_GTB_BINARY_IO_H
