#include "RecordCache.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <utility>

RecordCache::RecordCache(const Logger& logger, std::string persistPath)
    : logger_(logger), persistPath_(std::move(persistPath)) {}

std::optional<AddressList> RecordCache::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(name);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void RecordCache::set(const std::string& name, const AddressList& addresses) {
    if (addresses.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    records_[name] = addresses;
    if (!persistPath_.empty()) {
        writeLocked(persistPath_);
    }
}

void RecordCache::loadFrom(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        if (errno != ENOENT) {
            throw std::runtime_error("Failed to read cache file " + path + ": " + std::strerror(errno));
        }
        logger_.info("Cache file not found, creating " + path);
        std::ofstream created(path);
        if (!created.is_open()) {
            throw std::runtime_error("Failed to create cache file " + path + ": " + std::strerror(errno));
        }
        return;
    }
    if (S_ISDIR(st.st_mode)) {
        throw std::runtime_error("Failed to read cache file " + path + ": is a directory");
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to read cache file " + path + ": " + std::strerror(errno));
    }

    size_t loaded = 0;
    std::string line;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        while (std::getline(file, line)) {
            std::istringstream fields(line);
            std::string name;
            AddressList addresses;
            fields >> name;
            std::string address;
            while (fields >> address) {
                addresses.push_back(address);
            }
            if (name.empty() || addresses.empty()) {
                logger_.warn("Invalid line in cache file: " + line);
                continue;
            }
            records_[name] = addresses;
            loaded++;
        }
    }

    if (file.bad()) {
        throw std::runtime_error("Error reading cache file " + path);
    }

    logger_.info("Loaded " + std::to_string(loaded) + " cached records from " + path);
}

void RecordCache::saveTo(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    writeLocked(path);
}

void RecordCache::writeLocked(const std::string& path) const {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to write cache file " + path + ": " + std::strerror(errno));
    }

    for (const auto& entry : records_) {
        file << entry.first;
        for (const auto& address : entry.second) {
            file << ' ' << address;
        }
        file << '\n';
    }

    file.flush();
    if (!file) {
        throw std::runtime_error("Failed to write line to cache file " + path);
    }
}

size_t RecordCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::map<std::string, AddressList> RecordCache::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}
