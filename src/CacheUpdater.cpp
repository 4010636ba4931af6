#include "CacheUpdater.hpp"
#include <utility>

CacheUpdater::CacheUpdater(RecordCache& cache, const Logger& logger)
    : cache_(cache), logger_(logger) {
    worker_ = std::thread(&CacheUpdater::run, this);
}

CacheUpdater::~CacheUpdater() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    wakeup_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void CacheUpdater::submit(const std::string& name, const AddressList& addresses,
                          std::function<void()> onApplied) {
    bool accepted = false;
    if (!addresses.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!failure_) {
            pending_.push_back(Update{name, addresses, std::move(onApplied)});
            accepted = true;
        }
    }

    if (accepted) {
        wakeup_.notify_one();
    } else if (onApplied) {
        onApplied();
    }
}

void CacheUpdater::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    drained_.wait(lock, [this]() {
        return !busy_ && (pending_.empty() || failure_);
    });
}

void CacheUpdater::rethrowIfFailed() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failure_) {
        std::rethrow_exception(failure_);
    }
}

void CacheUpdater::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        wakeup_.wait(lock, [this]() { return stopping_ || !pending_.empty(); });

        // Remaining updates are still written on shutdown
        if (pending_.empty()) {
            return;
        }

        Update update = std::move(pending_.front());
        pending_.pop_front();
        busy_ = true;
        lock.unlock();

        std::exception_ptr error;
        try {
            cache_.set(update.name, update.addresses);
        } catch (const std::exception& e) {
            logger_.error(e.what());
            error = std::current_exception();
        }
        if (update.onApplied) {
            update.onApplied();
        }

        lock.lock();
        if (error) {
            failure_ = error;
            std::deque<Update> dropped;
            dropped.swap(pending_);
            lock.unlock();
            // Callers of flush() wait until every dropped callback has run
            for (auto& item : dropped) {
                if (item.onApplied) {
                    item.onApplied();
                }
            }
            lock.lock();
            busy_ = false;
            drained_.notify_all();
            return;
        }
        busy_ = false;
        if (pending_.empty()) {
            drained_.notify_all();
        }
    }
}
