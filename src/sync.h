// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SOLAR_SYNC_H
#define SOLAR_SYNC_H

#include <mutex>
#include <type_traits>

#if defined(__clang__)
#define GUARDED_BY(x) __attribute__((guarded_by(x)))
#else
#define GUARDED_BY(x)
#endif

/**
 * Wrapped mutex: supports recursive locking, but no waiting.
 * Ledger entry points may call each other (queries from inside a mutation),
 * so the ledger lock is recursive.
 */
class RecursiveMutex : public std::recursive_mutex
{
};

/** Wrapper around std::unique_lock that remembers where it was taken */
template <typename Mutex>
class UniqueLock : public std::unique_lock<Mutex>
{
public:
    UniqueLock(Mutex& mutexIn, const char* pszName, const char* pszFile, int nLine)
        : std::unique_lock<Mutex>(mutexIn), m_name(pszName), m_file(pszFile), m_line(nLine)
    {
    }

    const char* Name() const { return m_name; }
    const char* File() const { return m_file; }
    int Line() const { return m_line; }

private:
    const char* m_name;
    const char* m_file;
    int m_line;
};

#define PASTE(x, y) x##y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) UniqueLock<typename std::remove_reference<decltype(cs)>::type> PASTE2(criticalblock, __COUNTER__)(cs, #cs, __FILE__, __LINE__)

#endif // SOLAR_SYNC_H
