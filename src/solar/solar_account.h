// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SOLAR_SOLAR_ACCOUNT_H
#define SOLAR_SOLAR_ACCOUNT_H

#include <cstring>
#include <stdint.h>
#include <string>
#include <vector>

/**
 * CAccountID - 20 byte account identifier (holder, creator, administrator,
 * operator or payout recipient).
 *
 * The all-zero value is the null account: it never owns units or projects
 * and is rejected wherever a recipient or creator is required.
 */
class CAccountID
{
public:
    static constexpr unsigned int WIDTH = 20;

private:
    uint8_t m_data[WIDTH];

public:
    CAccountID()
    {
        SetNull();
    }

    explicit CAccountID(const std::vector<unsigned char>& vch);

    void SetNull()
    {
        memset(m_data, 0, sizeof(m_data));
    }

    bool IsNull() const
    {
        for (unsigned int i = 0; i < WIDTH; i++) {
            if (m_data[i] != 0) return false;
        }
        return true;
    }

    /** Parse 40 hex characters, with or without a leading "0x" */
    bool SetHex(const std::string& str);
    std::string GetHex() const;
    std::string ToString() const;

    const uint8_t* begin() const { return m_data; }
    const uint8_t* end() const { return m_data + WIDTH; }

    friend inline bool operator==(const CAccountID& a, const CAccountID& b) { return memcmp(a.m_data, b.m_data, WIDTH) == 0; }
    friend inline bool operator!=(const CAccountID& a, const CAccountID& b) { return memcmp(a.m_data, b.m_data, WIDTH) != 0; }
    friend inline bool operator<(const CAccountID& a, const CAccountID& b) { return memcmp(a.m_data, b.m_data, WIDTH) < 0; }

    template <typename Stream>
    void Serialize(Stream& s) const
    {
        s.write((const char*)m_data, WIDTH);
    }

    template <typename Stream>
    void Unserialize(Stream& s)
    {
        s.read((char*)m_data, WIDTH);
    }
};

/** Parse an account id; returns a null account on malformed input */
CAccountID AccountIDFromHex(const std::string& str);

#endif // SOLAR_SOLAR_ACCOUNT_H
