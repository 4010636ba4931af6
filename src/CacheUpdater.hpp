#pragma once

#include "Logger.hpp"
#include "RecordCache.hpp"
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

// Applies cache updates on a single background thread so that neither the
// response path nor the next query waits for a persistence rewrite, and
// rewrites never overlap.
class CacheUpdater {
public:
    CacheUpdater(RecordCache& cache, const Logger& logger);
    ~CacheUpdater();

    CacheUpdater(const CacheUpdater&) = delete;
    CacheUpdater& operator=(const CacheUpdater&) = delete;

    // Queues an update and returns immediately. Empty lists are dropped.
    // onApplied runs on the writer thread once the update has been handled
    // (or discarded after a write failure).
    void submit(const std::string& name, const AddressList& addresses,
                std::function<void()> onApplied = nullptr);

    // Blocks until every update submitted so far has been applied.
    void flush();

    // Rethrows the error that stopped the writer, if any. A failed cache
    // write is fatal for the process.
    void rethrowIfFailed();

private:
    struct Update {
        std::string name;
        AddressList addresses;
        std::function<void()> onApplied;
    };

    void run();

    RecordCache& cache_;
    const Logger& logger_;

    std::mutex mutex_;
    std::condition_variable wakeup_;
    std::condition_variable drained_;
    std::deque<Update> pending_;
    bool busy_ = false;
    bool stopping_ = false;
    std::exception_ptr failure_;
    std::thread worker_;
};
