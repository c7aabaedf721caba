// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SOLAR_SERIALIZE_H
#define SOLAR_SERIALIZE_H

#include "amount.h"

#include <algorithm>
#include <endian.h>
#include <ios>
#include <iterator>
#include <map>
#include <set>
#include <stdint.h>
#include <string>
#include <utility>
#include <vector>

static const unsigned int MAX_SIZE = 0x02000000;

/*
 * Lowest-level serialization and conversion.
 * Integers are little endian, amounts are 32 bytes big endian so that
 * serialized keys sort numerically.
 */
template <typename Stream>
inline void ser_writedata8(Stream& s, uint8_t obj)
{
    s.write((char*)&obj, 1);
}
template <typename Stream>
inline void ser_writedata16(Stream& s, uint16_t obj)
{
    obj = htole16(obj);
    s.write((char*)&obj, 2);
}
template <typename Stream>
inline void ser_writedata32(Stream& s, uint32_t obj)
{
    obj = htole32(obj);
    s.write((char*)&obj, 4);
}
template <typename Stream>
inline void ser_writedata64(Stream& s, uint64_t obj)
{
    obj = htole64(obj);
    s.write((char*)&obj, 8);
}
template <typename Stream>
inline uint8_t ser_readdata8(Stream& s)
{
    uint8_t obj;
    s.read((char*)&obj, 1);
    return obj;
}
template <typename Stream>
inline uint16_t ser_readdata16(Stream& s)
{
    uint16_t obj;
    s.read((char*)&obj, 2);
    return le16toh(obj);
}
template <typename Stream>
inline uint32_t ser_readdata32(Stream& s)
{
    uint32_t obj;
    s.read((char*)&obj, 4);
    return le32toh(obj);
}
template <typename Stream>
inline uint64_t ser_readdata64(Stream& s)
{
    uint64_t obj;
    s.read((char*)&obj, 8);
    return le64toh(obj);
}

/**
 * Support for SERIALIZE_METHODS and READWRITE macro.
 */
struct CSerActionSerialize {
    constexpr bool ForRead() const { return false; }
};
struct CSerActionUnserialize {
    constexpr bool ForRead() const { return true; }
};

/**
 * Implement the Serialize and Unserialize methods by delegating to a single
 * templated static method that takes the to-be-(de)serialized object as a
 * parameter. Write "READWRITE(obj.a, obj.b);" inside it.
 */
#define SERIALIZE_METHODS(cls, obj)                                                  \
    template <typename Stream>                                                       \
    void Serialize(Stream& s) const                                                  \
    {                                                                                \
        SerializationOps(*this, s, CSerActionSerialize());                           \
    }                                                                                \
    template <typename Stream>                                                       \
    void Unserialize(Stream& s)                                                      \
    {                                                                                \
        SerializationOps(*this, s, CSerActionUnserialize());                         \
    }                                                                                \
    template <typename Stream, typename Type, typename Operation>                     \
    static void SerializationOps(Type& obj, Stream& s, Operation ser_action)

#define READWRITE(...) (::SerReadWriteMany(s, ser_action, __VA_ARGS__))

/*
 * Compact size
 *  size <  253        -- 1 byte
 *  size <= USHRT_MAX  -- 3 bytes  (253 + 2 bytes)
 *  size <= UINT_MAX   -- 5 bytes  (254 + 4 bytes)
 *  size >  UINT_MAX   -- 9 bytes  (255 + 8 bytes)
 */
template <typename Stream>
void WriteCompactSize(Stream& os, uint64_t nSize)
{
    if (nSize < 253) {
        ser_writedata8(os, nSize);
    } else if (nSize <= 0xffffu) {
        ser_writedata8(os, 253);
        ser_writedata16(os, nSize);
    } else if (nSize <= 0xffffffffu) {
        ser_writedata8(os, 254);
        ser_writedata32(os, nSize);
    } else {
        ser_writedata8(os, 255);
        ser_writedata64(os, nSize);
    }
}

template <typename Stream>
uint64_t ReadCompactSize(Stream& is)
{
    uint8_t chSize = ser_readdata8(is);
    uint64_t nSizeRet = 0;
    if (chSize < 253) {
        nSizeRet = chSize;
    } else if (chSize == 253) {
        nSizeRet = ser_readdata16(is);
        if (nSizeRet < 253)
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
    } else if (chSize == 254) {
        nSizeRet = ser_readdata32(is);
        if (nSizeRet <= 0xffffu)
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
    } else {
        nSizeRet = ser_readdata64(is);
        if (nSizeRet <= 0xffffffffu)
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
    }
    if (nSizeRet > (uint64_t)MAX_SIZE)
        throw std::ios_base::failure("ReadCompactSize(): size too large");
    return nSizeRet;
}

// clang-format off
template<typename Stream> inline void Serialize(Stream& s, char a    ) { ser_writedata8(s, a); }
template<typename Stream> inline void Serialize(Stream& s, uint8_t a ) { ser_writedata8(s, a); }
template<typename Stream> inline void Serialize(Stream& s, uint32_t a) { ser_writedata32(s, a); }
template<typename Stream> inline void Serialize(Stream& s, int64_t a ) { ser_writedata64(s, a); }
template<typename Stream> inline void Serialize(Stream& s, uint64_t a) { ser_writedata64(s, a); }
template<typename Stream> inline void Serialize(Stream& s, bool a    ) { char f=a; ser_writedata8(s, f); }

template<typename Stream> inline void Unserialize(Stream& s, char& a    ) { a = ser_readdata8(s); }
template<typename Stream> inline void Unserialize(Stream& s, uint8_t& a ) { a = ser_readdata8(s); }
template<typename Stream> inline void Unserialize(Stream& s, uint32_t& a) { a = ser_readdata32(s); }
template<typename Stream> inline void Unserialize(Stream& s, int64_t& a ) { a = ser_readdata64(s); }
template<typename Stream> inline void Unserialize(Stream& s, uint64_t& a) { a = ser_readdata64(s); }
template<typename Stream> inline void Unserialize(Stream& s, bool& a    ) { char f=ser_readdata8(s); a=f; }
// clang-format on

/**
 * Amounts: fixed 32 bytes, most significant byte first
 */
template <typename Stream>
void Serialize(Stream& s, const CAmount& a)
{
    unsigned char vch[32] = {};
    std::vector<unsigned char> vchBits;
    boost::multiprecision::export_bits(a, std::back_inserter(vchBits), 8);
    std::copy(vchBits.begin(), vchBits.end(), vch + (sizeof(vch) - vchBits.size()));
    s.write((char*)vch, sizeof(vch));
}

template <typename Stream>
void Unserialize(Stream& s, CAmount& a)
{
    unsigned char vch[32];
    s.read((char*)vch, sizeof(vch));
    a = 0;
    boost::multiprecision::import_bits(a, vch, vch + sizeof(vch), 8);
}

/**
 * Forward declarations
 */
template <typename Stream>
void Serialize(Stream& os, const std::string& str);
template <typename Stream>
void Unserialize(Stream& is, std::string& str);

template <typename Stream, typename T, typename A>
void Serialize(Stream& os, const std::vector<T, A>& v);
template <typename Stream, typename T, typename A>
void Unserialize(Stream& is, std::vector<T, A>& v);

template <typename Stream, typename K, typename T>
void Serialize(Stream& os, const std::pair<K, T>& item);
template <typename Stream, typename K, typename T>
void Unserialize(Stream& is, std::pair<K, T>& item);

template <typename Stream, typename K, typename T, typename Pred, typename A>
void Serialize(Stream& os, const std::map<K, T, Pred, A>& m);
template <typename Stream, typename K, typename T, typename Pred, typename A>
void Unserialize(Stream& is, std::map<K, T, Pred, A>& m);

template <typename Stream, typename K, typename Pred, typename A>
void Serialize(Stream& os, const std::set<K, Pred, A>& m);
template <typename Stream, typename K, typename Pred, typename A>
void Unserialize(Stream& is, std::set<K, Pred, A>& m);

/**
 * If none of the specialized versions above matched, default to calling member function.
 */
template <typename Stream, typename T>
inline void Serialize(Stream& os, const T& a)
{
    a.Serialize(os);
}

template <typename Stream, typename T>
inline void Unserialize(Stream& is, T&& a)
{
    a.Unserialize(is);
}

/**
 * string
 */
template <typename Stream>
void Serialize(Stream& os, const std::string& str)
{
    WriteCompactSize(os, str.size());
    if (!str.empty())
        os.write((char*)str.data(), str.size());
}

template <typename Stream>
void Unserialize(Stream& is, std::string& str)
{
    uint64_t nSize = ReadCompactSize(is);
    str.resize(nSize);
    if (nSize != 0)
        is.read((char*)&str[0], nSize);
}

/**
 * vector
 */
template <typename Stream, typename T, typename A>
void Serialize(Stream& os, const std::vector<T, A>& v)
{
    WriteCompactSize(os, v.size());
    for (const T& item : v) {
        ::Serialize(os, item);
    }
}

template <typename Stream, typename T, typename A>
void Unserialize(Stream& is, std::vector<T, A>& v)
{
    v.clear();
    uint64_t nSize = ReadCompactSize(is);
    for (uint64_t i = 0; i < nSize; i++) {
        T item;
        ::Unserialize(is, item);
        v.push_back(item);
    }
}

/**
 * pair
 */
template <typename Stream, typename K, typename T>
void Serialize(Stream& os, const std::pair<K, T>& item)
{
    ::Serialize(os, item.first);
    ::Serialize(os, item.second);
}

template <typename Stream, typename K, typename T>
void Unserialize(Stream& is, std::pair<K, T>& item)
{
    ::Unserialize(is, item.first);
    ::Unserialize(is, item.second);
}

/**
 * map
 */
template <typename Stream, typename K, typename T, typename Pred, typename A>
void Serialize(Stream& os, const std::map<K, T, Pred, A>& m)
{
    WriteCompactSize(os, m.size());
    for (const auto& entry : m)
        ::Serialize(os, entry);
}

template <typename Stream, typename K, typename T, typename Pred, typename A>
void Unserialize(Stream& is, std::map<K, T, Pred, A>& m)
{
    m.clear();
    uint64_t nSize = ReadCompactSize(is);
    auto mi = m.begin();
    for (uint64_t i = 0; i < nSize; i++) {
        std::pair<K, T> item;
        ::Unserialize(is, item);
        mi = m.insert(mi, item);
    }
}

/**
 * set
 */
template <typename Stream, typename K, typename Pred, typename A>
void Serialize(Stream& os, const std::set<K, Pred, A>& m)
{
    WriteCompactSize(os, m.size());
    for (const K& item : m)
        ::Serialize(os, item);
}

template <typename Stream, typename K, typename Pred, typename A>
void Unserialize(Stream& is, std::set<K, Pred, A>& m)
{
    m.clear();
    uint64_t nSize = ReadCompactSize(is);
    auto it = m.begin();
    for (uint64_t i = 0; i < nSize; i++) {
        K key;
        ::Unserialize(is, key);
        it = m.insert(it, key);
    }
}

/**
 * Variadic helpers behind READWRITE
 */
template <typename Stream>
void SerializeMany(Stream& s)
{
}

template <typename Stream, typename Arg, typename... Args>
void SerializeMany(Stream& s, const Arg& arg, const Args&... args)
{
    ::Serialize(s, arg);
    ::SerializeMany(s, args...);
}

template <typename Stream>
inline void UnserializeMany(Stream& s)
{
}

template <typename Stream, typename Arg, typename... Args>
inline void UnserializeMany(Stream& s, Arg&& arg, Args&&... args)
{
    ::Unserialize(s, arg);
    ::UnserializeMany(s, args...);
}

template <typename Stream, typename... Args>
inline void SerReadWriteMany(Stream& s, CSerActionSerialize ser_action, const Args&... args)
{
    ::SerializeMany(s, args...);
}

template <typename Stream, typename... Args>
inline void SerReadWriteMany(Stream& s, CSerActionUnserialize ser_action, Args&&... args)
{
    ::UnserializeMany(s, args...);
}

#endif // SOLAR_SERIALIZE_H
