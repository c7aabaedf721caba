// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SOLAR_DBWRAPPER_H
#define SOLAR_DBWRAPPER_H

#include "serialize.h"
#include "streams.h"

#include <memory>
#include <stdexcept>
#include <string>

#include <boost/filesystem/path.hpp>

#include <leveldb/db.h>
#include <leveldb/write_batch.h>

static const size_t DBWRAPPER_PREALLOC_KEY_SIZE = 64;
static const size_t DBWRAPPER_PREALLOC_VALUE_SIZE = 1024;

class dbwrapper_error : public std::runtime_error
{
public:
    explicit dbwrapper_error(const std::string& msg) : std::runtime_error(msg) {}
};

class CDBWrapper;

namespace dbwrapper_private {

/** Throws a dbwrapper_error if the status is not OK */
void HandleError(const leveldb::Status& status);

} // namespace dbwrapper_private

/** Batch of changes queued to be written to a CDBWrapper */
class CDBBatch
{
    friend class CDBWrapper;

private:
    leveldb::WriteBatch batch;
    CDataStream ssKey;
    CDataStream ssValue;
    size_t size_estimate;

public:
    CDBBatch() : size_estimate(0) {}

    void Clear()
    {
        batch.Clear();
        size_estimate = 0;
    }

    template <typename K, typename V>
    void Write(const K& key, const V& value)
    {
        ssKey.reserve(DBWRAPPER_PREALLOC_KEY_SIZE);
        ssKey << key;
        leveldb::Slice slKey(ssKey.data(), ssKey.size());

        ssValue.reserve(DBWRAPPER_PREALLOC_VALUE_SIZE);
        ssValue << value;
        leveldb::Slice slValue(ssValue.data(), ssValue.size());

        batch.Put(slKey, slValue);
        size_estimate += 3 + slKey.size() + slValue.size();
        ssKey.clear();
        ssValue.clear();
    }

    template <typename K>
    void Erase(const K& key)
    {
        ssKey.reserve(DBWRAPPER_PREALLOC_KEY_SIZE);
        ssKey << key;
        leveldb::Slice slKey(ssKey.data(), ssKey.size());

        batch.Delete(slKey);
        size_estimate += 2 + slKey.size();
        ssKey.clear();
    }

    size_t SizeEstimate() const { return size_estimate; }
};

class CDBIterator
{
private:
    std::unique_ptr<leveldb::Iterator> piter;

public:
    explicit CDBIterator(leveldb::Iterator* piterIn) : piter(piterIn) {}

    bool Valid() const { return piter->Valid(); }
    void SeekToFirst() { piter->SeekToFirst(); }
    void Next() { piter->Next(); }

    template <typename K>
    void Seek(const K& key)
    {
        CDataStream ssKey;
        ssKey.reserve(DBWRAPPER_PREALLOC_KEY_SIZE);
        ssKey << key;
        leveldb::Slice slKey(ssKey.data(), ssKey.size());
        piter->Seek(slKey);
    }

    /** Raw key bytes, used to erase keys of any type */
    std::string GetKeyBytes() const { return piter->key().ToString(); }

    template <typename K>
    bool GetKey(K& key)
    {
        leveldb::Slice slKey = piter->key();
        try {
            CDataStream ssKey(slKey.data(), slKey.data() + slKey.size());
            ssKey >> key;
        } catch (const std::exception&) {
            return false;
        }
        return true;
    }

    template <typename V>
    bool GetValue(V& value)
    {
        leveldb::Slice slValue = piter->value();
        try {
            CDataStream ssValue(slValue.data(), slValue.data() + slValue.size());
            ssValue >> value;
        } catch (const std::exception&) {
            return false;
        }
        return true;
    }
};

/**
 * CDBWrapper - thin typed wrapper around a LevelDB database
 *
 * Keys and values are serialized with CDataStream. Read errors caused by
 * corruption surface as false returns, I/O errors as dbwrapper_error.
 */
class CDBWrapper
{
private:
    leveldb::Options options;
    leveldb::ReadOptions readoptions;
    leveldb::ReadOptions iteroptions;
    leveldb::WriteOptions writeoptions;
    leveldb::WriteOptions syncoptions;
    leveldb::DB* pdb;

    std::string m_name;

public:
    /**
     * @param path     Location of the database directory
     * @param nCacheSize Block cache size in bytes
     * @param fWipe    Destroy any existing database first
     */
    CDBWrapper(const boost::filesystem::path& path, size_t nCacheSize, bool fWipe = false);
    ~CDBWrapper();

    CDBWrapper(const CDBWrapper&) = delete;
    CDBWrapper& operator=(const CDBWrapper&) = delete;

    template <typename K, typename V>
    bool Read(const K& key, V& value) const
    {
        CDataStream ssKey;
        ssKey.reserve(DBWRAPPER_PREALLOC_KEY_SIZE);
        ssKey << key;
        leveldb::Slice slKey(ssKey.data(), ssKey.size());

        std::string strValue;
        leveldb::Status status = pdb->Get(readoptions, slKey, &strValue);
        if (!status.ok()) {
            if (status.IsNotFound())
                return false;
            dbwrapper_private::HandleError(status);
        }
        try {
            CDataStream ssValue(strValue.data(), strValue.data() + strValue.size());
            ssValue >> value;
        } catch (const std::exception&) {
            return false;
        }
        return true;
    }

    template <typename K, typename V>
    bool Write(const K& key, const V& value, bool fSync = false)
    {
        CDBBatch batch;
        batch.Write(key, value);
        return WriteBatch(batch, fSync);
    }

    template <typename K>
    bool Exists(const K& key) const
    {
        CDataStream ssKey;
        ssKey.reserve(DBWRAPPER_PREALLOC_KEY_SIZE);
        ssKey << key;
        leveldb::Slice slKey(ssKey.data(), ssKey.size());

        std::string strValue;
        leveldb::Status status = pdb->Get(readoptions, slKey, &strValue);
        if (!status.ok()) {
            if (status.IsNotFound())
                return false;
            dbwrapper_private::HandleError(status);
        }
        return true;
    }

    template <typename K>
    bool Erase(const K& key, bool fSync = false)
    {
        CDBBatch batch;
        batch.Erase(key);
        return WriteBatch(batch, fSync);
    }

    /** Queue deletion of a key given as raw bytes (see CDBIterator::GetKeyBytes) */
    static void EraseRaw(CDBBatch& batch, const std::string& strKey);

    bool WriteBatch(CDBBatch& batch, bool fSync = false);

    CDBIterator* NewIterator()
    {
        return new CDBIterator(pdb->NewIterator(iteroptions));
    }

    /** Return true if the database contains no keys */
    bool IsEmpty();

    const std::string& GetName() const { return m_name; }
};

#endif // SOLAR_DBWRAPPER_H
