#include "Logger.hpp"
#include <iostream>
#include <mutex>

namespace {
std::mutex outputMutex;
}

void Logger::info(const std::string& message) const {
    std::lock_guard<std::mutex> lock(outputMutex);
    std::cout << message << std::endl;
}

void Logger::warn(const std::string& message) const {
    std::lock_guard<std::mutex> lock(outputMutex);
    std::cerr << "Warning: " << message << std::endl;
}

void Logger::error(const std::string& message) const {
    std::lock_guard<std::mutex> lock(outputMutex);
    std::cerr << "Error: " << message << std::endl;
}

void Logger::debug(const std::string& message) const {
    if (!debug_) {
        return;
    }
    std::lock_guard<std::mutex> lock(outputMutex);
    std::cout << "[DEBUG] " << message << std::endl;
}
