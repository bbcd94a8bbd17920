// Copyright (c) 2026 The TeamBalance developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TEAMBALANCE_SYNC_H
#define TEAMBALANCE_SYNC_H

#include <mutex>

/////////////////////////////////////////////////
//                                             //
// THE SIMPLE DEFINITION, EXCLUDING DEBUG CODE //
//                                             //
/////////////////////////////////////////////////

/*
CCriticalSection mutex;
    std::recursive_mutex mutex;

LOCK(mutex);
    std::unique_lock<std::recursive_mutex> criticalblock(mutex);
 */

/**
 * Wrapped mutex: supports recursive locking.
 * A synchronous transfer callback may re-enter the ledger that started it.
 */
class CCriticalSection : public std::recursive_mutex
{
};

/** Wrapper around std::unique_lock<Mutex> */
template <typename Mutex>
class CMutexLock
{
private:
    std::unique_lock<Mutex> lock;

public:
    explicit CMutexLock(Mutex& mutexIn) : lock(mutexIn) {}
};

typedef CMutexLock<CCriticalSection> CCriticalBlock;

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) CCriticalBlock PASTE2(criticalblock, __COUNTER__)(cs)

#endif // TEAMBALANCE_SYNC_H
