#pragma once

#include <memory>
#include <string_view>

#include "error.hpp"

namespace relay_cpp {

    class Connection;

    /**
     * @brief Protocol handler attached to a Connection.
     *
     * A connection delivers everything it reads to exactly one consumer at a
     * time. HttpResponse parses a response, TunnelForwarder relays raw bytes.
     * All callbacks run on the connection's executor.
     */
    class ProtocolConsumer {
       public:
        virtual ~ProtocolConsumer() = default;

        /// @brief The consumer was attached to a live connection.
        virtual void connection_made(const std::shared_ptr<Connection>&) {}

        /// @brief Bytes read from the connection.
        virtual void data_received(std::string_view data) = 0;

        /// @brief The peer half-closed the connection.
        virtual void eof_received() {}

        /// @brief The connection is gone. Called at most once per attachment.
        virtual void connection_lost(const Error& error) = 0;

        /// @brief Complete or errored. A finished consumer accepts no more
        /// bytes and may be replaced on its connection.
        virtual bool finished() const noexcept = 0;
    };

}  // namespace relay_cpp
