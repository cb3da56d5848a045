// CHAMA - Serialization Header
// Copyright (c) 2024 CHAMA Developers
// MIT License
//
// Compact little-endian binary encoding used for journal records and
// storage values.

#ifndef CHAMA_CORE_SERIALIZE_H
#define CHAMA_CORE_SERIALIZE_H

#include "chama/core/types.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <string>
#include <vector>

namespace chama {

// ============================================================================
// Constants
// ============================================================================

/// Maximum size for serialized objects to prevent memory exhaustion
static constexpr uint64_t MAX_SIZE = 0x02000000;  // 32 MB

/// Maximum vector allocation size
static constexpr unsigned int MAX_VECTOR_ALLOCATE = 5000000;

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    DataStream() = default;

    explicit DataStream(const std::vector<uint8_t>& data) : data_(data) {}

    DataStream(const uint8_t* data, size_t len) : data_(data, data + len) {}

    /// Unread bytes remaining
    size_t size() const noexcept { return data_.size() - read_pos_; }

    bool empty() const noexcept { return size() == 0; }

    /// Pointer to unread data
    const uint8_t* data() const noexcept { return data_.data() + read_pos_; }

    /// Whole buffer, read or not
    const std::vector<uint8_t>& Data() const noexcept { return data_; }

    void clear() {
        data_.clear();
        read_pos_ = 0;
    }

    void Write(const uint8_t* src, size_t len) {
        data_.insert(data_.end(), src, src + len);
    }

    void Write(const char* src, size_t len) {
        Write(reinterpret_cast<const uint8_t*>(src), len);
    }

    /// Throws std::ios_base::failure when fewer than len bytes remain
    void Read(uint8_t* dst, size_t len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        if (len > 0) {
            std::memcpy(dst, data_.data() + read_pos_, len);
        }
        read_pos_ += len;
    }

    void Read(char* dst, size_t len) {
        Read(reinterpret_cast<uint8_t*>(dst), len);
    }

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);

private:
    std::vector<uint8_t> data_;
    size_t read_pos_ = 0;
};

// ============================================================================
// Low-Level Serialization Functions
// ============================================================================

template<typename Stream>
inline void ser_writedata8(Stream& s, uint8_t obj) {
    s.Write(&obj, 1);
}

template<typename Stream>
inline void ser_writedata32(Stream& s, uint32_t obj) {
    uint8_t buf[4];
    for (int i = 0; i < 4; ++i) buf[i] = static_cast<uint8_t>(obj >> (8 * i));
    s.Write(buf, 4);
}

template<typename Stream>
inline void ser_writedata64(Stream& s, uint64_t obj) {
    uint8_t buf[8];
    for (int i = 0; i < 8; ++i) buf[i] = static_cast<uint8_t>(obj >> (8 * i));
    s.Write(buf, 8);
}

template<typename Stream>
inline uint8_t ser_readdata8(Stream& s) {
    uint8_t obj;
    s.Read(&obj, 1);
    return obj;
}

template<typename Stream>
inline uint32_t ser_readdata32(Stream& s) {
    uint8_t buf[4];
    s.Read(buf, 4);
    uint32_t obj = 0;
    for (int i = 3; i >= 0; --i) obj = (obj << 8) | buf[i];
    return obj;
}

template<typename Stream>
inline uint64_t ser_readdata64(Stream& s) {
    uint8_t buf[8];
    s.Read(buf, 8);
    uint64_t obj = 0;
    for (int i = 7; i >= 0; --i) obj = (obj << 8) | buf[i];
    return obj;
}

// ============================================================================
// CompactSize Encoding
// ============================================================================
//   size <  253        -- 1 byte
//   size <= 0xFFFFFFFF -- 5 bytes (0xFE + 4 bytes little-endian)
//   size >  0xFFFFFFFF -- 9 bytes (0xFF + 8 bytes little-endian)

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 253) {
        ser_writedata8(s, static_cast<uint8_t>(size));
    } else if (size <= 0xFFFFFFFF) {
        ser_writedata8(s, 0xFE);
        ser_writedata32(s, static_cast<uint32_t>(size));
    } else {
        ser_writedata8(s, 0xFF);
        ser_writedata64(s, size);
    }
}

template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    uint8_t marker = ser_readdata8(s);
    uint64_t size = 0;

    if (marker < 253) {
        size = marker;
    } else if (marker == 254) {
        size = ser_readdata32(s);
        if (size < 253) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else if (marker == 255) {
        size = ser_readdata64(s);
        if (size <= 0xFFFFFFFFULL) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else {
        throw std::ios_base::failure("ReadCompactSize(): bad marker");
    }

    if (size > MAX_SIZE) {
        throw std::ios_base::failure("ReadCompactSize(): size too large");
    }
    return size;
}

// ============================================================================
// Serialize/Unserialize for Basic Types
// ============================================================================

template<typename Stream>
inline void Serialize(Stream& s, uint8_t a) { ser_writedata8(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint8_t& a) { a = ser_readdata8(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint32_t a) { ser_writedata32(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint32_t& a) { a = ser_readdata32(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) { ser_writedata64(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) { a = ser_readdata64(s); }

template<typename Stream>
inline void Serialize(Stream& s, int64_t a) { ser_writedata64(s, static_cast<uint64_t>(a)); }

template<typename Stream>
inline void Unserialize(Stream& s, int64_t& a) { a = static_cast<int64_t>(ser_readdata64(s)); }

template<typename Stream>
inline void Serialize(Stream& s, bool a) { ser_writedata8(s, a ? 1 : 0); }

template<typename Stream>
inline void Unserialize(Stream& s, bool& a) { a = (ser_readdata8(s) != 0); }

// ============================================================================
// Strings and Vectors
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    if (!str.empty()) {
        s.Write(str.data(), str.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    uint64_t size = ReadCompactSize(s);
    str.resize(size);
    if (size > 0) {
        s.Read(&str[0], size);
    }
}

template<typename Stream, typename T>
void Serialize(Stream& s, const std::vector<T>& v) {
    WriteCompactSize(s, v.size());
    for (const auto& item : v) {
        Serialize(s, item);
    }
}

template<typename Stream, typename T>
void Unserialize(Stream& s, std::vector<T>& v) {
    uint64_t size = ReadCompactSize(s);
    v.clear();
    v.reserve(std::min(size, static_cast<uint64_t>(MAX_VECTOR_ALLOCATE / sizeof(T))));
    for (uint64_t i = 0; i < size; ++i) {
        T item;
        Unserialize(s, item);
        v.push_back(std::move(item));
    }
}

// ============================================================================
// Hash Types
// ============================================================================

template<typename Stream, size_t BITS>
void Serialize(Stream& s, const BaseHash<BITS>& hash) {
    s.Write(hash.data(), BaseHash<BITS>::SIZE);
}

template<typename Stream, size_t BITS>
void Unserialize(Stream& s, BaseHash<BITS>& hash) {
    s.Read(hash.data(), BaseHash<BITS>::SIZE);
}

template<typename Stream>
void Serialize(Stream& s, const Address& addr) {
    s.Write(addr.data(), Address::SIZE);
}

template<typename Stream>
void Unserialize(Stream& s, Address& addr) {
    s.Read(addr.data(), Address::SIZE);
}

// ============================================================================
// DataStream Stream Operators Implementation
// ============================================================================

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

} // namespace chama

#endif // CHAMA_CORE_SERIALIZE_H
