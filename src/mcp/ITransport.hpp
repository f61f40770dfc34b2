#pragma once

#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace image_mcp {

using json = nlohmann::json;

/**
 * @brief The channel to the host is unusable (read or write failure)
 */
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A frame arrived but its body is not valid JSON
 *
 * Recoverable: the caller drops the frame and keeps reading.
 */
class MalformedMessage : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Abstract interface for MCP transport mechanisms
 *
 * Implementations handle reading/writing JSON-RPC messages via different
 * transport protocols (stdio, pipes, sockets, etc.)
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read next JSON-RPC message from transport
     * @return JSON message, or std::nullopt on clean end of input
     * @throws MalformedMessage if the frame is not valid JSON
     * @throws TransportError if the channel cannot be read
     */
    virtual std::optional<json> read_message() = 0;

    /**
     * @brief Write JSON-RPC message to transport
     * @param message JSON message to write
     * @throws TransportError if the channel cannot be written
     */
    virtual void write_message(const json& message) = 0;

    /**
     * @brief Check if transport is still open
     * @return true if transport can read/write, false otherwise
     */
    virtual bool is_open() const = 0;
};

} // namespace image_mcp
