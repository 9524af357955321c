#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace relay_cpp {

    /// @brief Metrics for monitoring connection pool behavior
    struct ConnectionPoolMetrics {
        // Gauges (current state)
        std::atomic<std::size_t> concurrent{0};  ///< Currently in use
        std::atomic<std::size_t> available{0};   ///< Currently idle
        std::atomic<std::size_t> waiters{0};  ///< Waiting for pool capacity

        // Counters (cumulative)
        std::atomic<std::uint64_t> acquire_success{0};  ///< Successful acquires
        std::atomic<std::uint64_t> acquire_timeout{0};  ///< Acquire timed out
        std::atomic<std::uint64_t> acquire_closed{0};   ///< Pool was closed
        std::atomic<std::uint64_t> connection_created{0};  ///< New connections
        std::atomic<std::uint64_t> connection_reused{0};   ///< Reused idle
        std::atomic<std::uint64_t> connection_dropped_stale{
            0};  ///< Idle sockets found closed at acquire
        std::atomic<std::uint64_t> connection_discarded{
            0};  ///< Released but not reusable
        std::atomic<std::uint64_t> connection_lost{0};  ///< Transport died
        std::atomic<std::uint64_t> reconnects_scheduled{
            0};  ///< Requests replayed on a new connection
        std::atomic<std::uint64_t> release_unknown{
            0};  ///< Released a connection the pool did not own
    };

}  // namespace relay_cpp
