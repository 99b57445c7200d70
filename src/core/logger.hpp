/**
 * SEL: Sweets Economy Ledger - System Log
 * Purpose: In-process log ring shared by the engine, the batch jobs and the
 * API. The latest lines are kept in memory for /api/system/logs and every
 * line is echoed to stdout for the container log collector.
 */

#ifndef SEL_LOGGER_HPP
#define SEL_LOGGER_HPP

#include <string>
#include <vector>

namespace sel {

// Number of lines kept in the in-memory ring.
const std::size_t LOG_RING_CAPACITY = 200;

void sel_log(const std::string& level, const std::string& message);

// Snapshot of the ring, oldest first.
std::vector<std::string> recent_logs();

} // namespace sel

#endif // SEL_LOGGER_HPP
