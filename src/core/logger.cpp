/**
 * ============================================================================
 * SOFTWARE: SEL: Sweets Economy Ledger
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: logger.cpp
 * ============================================================================
 */

#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <deque>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace sel {

namespace {
    std::deque<std::string> system_logs;
    std::mutex log_mutex;
}

void sel_log(const std::string& level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);

    if (system_logs.size() >= LOG_RING_CAPACITY) {
        system_logs.pop_front();
    }

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local_tm{};
    localtime_r(&now, &local_tm);
    std::stringstream ss;
    ss << std::put_time(&local_tm, "%H:%M:%S");

    std::string log_entry = "[" + ss.str() + "] [" + level + "] " + message;
    system_logs.push_back(log_entry);

    std::cout << log_entry << std::endl;
}

std::vector<std::string> recent_logs() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return std::vector<std::string>(system_logs.begin(), system_logs.end());
}

} // namespace sel
