// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SOLAR_STREAMS_H
#define SOLAR_STREAMS_H

#include "serialize.h"

#include <cstring>
#include <ios>
#include <string>
#include <vector>

/**
 * Double ended buffer combining vector and stream-like interfaces.
 *
 * >> and << read and write unformatted data using the above serialization templates.
 */
class CDataStream
{
protected:
    typedef std::vector<char> vector_type;
    vector_type vch;
    unsigned int nReadPos;

public:
    typedef vector_type::size_type size_type;
    typedef vector_type::const_iterator const_iterator;

    CDataStream() : nReadPos(0) {}

    CDataStream(const char* pbegin, const char* pend) : vch(pbegin, pend), nReadPos(0) {}

    std::string str() const
    {
        return (std::string(begin(), end()));
    }

    const_iterator begin() const { return vch.begin() + nReadPos; }
    const_iterator end() const { return vch.end(); }
    size_type size() const { return vch.size() - nReadPos; }
    bool empty() const { return vch.size() == nReadPos; }
    const char* data() const { return vch.data() + nReadPos; }
    void clear() { vch.clear(); nReadPos = 0; }
    void reserve(size_type n) { vch.reserve(n + nReadPos); }

    bool eof() const { return size() == 0; }

    void read(char* pch, size_t nSize)
    {
        if (nSize == 0) return;

        // Read from the beginning of the buffer
        unsigned int nReadPosNext = nReadPos + nSize;
        if (nReadPosNext > vch.size()) {
            throw std::ios_base::failure("CDataStream::read(): end of data");
        }
        memcpy(pch, &vch[nReadPos], nSize);
        if (nReadPosNext == vch.size()) {
            nReadPos = 0;
            vch.clear();
            return;
        }
        nReadPos = nReadPosNext;
    }

    void write(const char* pch, size_t nSize)
    {
        vch.insert(vch.end(), pch, pch + nSize);
    }

    template <typename T>
    CDataStream& operator<<(const T& obj)
    {
        ::Serialize(*this, obj);
        return (*this);
    }

    template <typename T>
    CDataStream& operator>>(T&& obj)
    {
        ::Unserialize(*this, obj);
        return (*this);
    }
};

#endif // SOLAR_STREAMS_H
