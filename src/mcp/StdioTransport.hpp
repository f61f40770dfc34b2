#pragma once

#include "ITransport.hpp"
#include <iostream>

namespace image_mcp {

/**
 * @brief Transport using standard input/output streams
 *
 * One JSON document per line in both directions. Blank lines are skipped.
 * Each written message is flushed immediately.
 */
class StdioTransport : public ITransport {
public:
    /**
     * @brief Construct stdio transport
     * @param in Input stream (default: std::cin)
     * @param out Output stream (default: std::cout)
     */
    explicit StdioTransport(std::istream& in = std::cin, std::ostream& out = std::cout);

    std::optional<json> read_message() override;
    void write_message(const json& message) override;
    bool is_open() const override;

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace image_mcp
