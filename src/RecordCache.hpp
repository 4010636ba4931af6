#pragma once

#include "Logger.hpp"
#include "types.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>

// Name -> IPv4 addresses. Entries never expire and are only replaced by a
// later successful resolution. All access goes through one mutex, file
// writes included.
class RecordCache {
public:
    explicit RecordCache(const Logger& logger, std::string persistPath = "");

    std::optional<AddressList> get(const std::string& name) const;

    // Empty lists are ignored. With a persist path the whole file is
    // rewritten before returning; throws std::runtime_error if that fails.
    void set(const std::string& name, const AddressList& addresses);

    // Merges "name addr1 addr2 ..." lines from path. A missing file is
    // created empty; any other I/O error throws std::runtime_error.
    void loadFrom(const std::string& path);

    // Overwrites path with the current contents. Throws on failure.
    void saveTo(const std::string& path) const;

    size_t size() const;
    std::map<std::string, AddressList> snapshot() const;
    const std::string& persistPath() const { return persistPath_; }

private:
    void writeLocked(const std::string& path) const;

    const Logger& logger_;
    std::string persistPath_;
    mutable std::mutex mutex_;
    std::map<std::string, AddressList> records_;
};
