#pragma once

#include <string>

namespace image_mcp {

/**
 * @brief Settings the server reports and enforces
 */
struct ServerConfig {
    std::string name = "image-mcp";
    std::string version = "1.0.0";

    // Reject everything but initialize until the handshake has completed
    bool require_initialize = true;
};

} // namespace image_mcp
