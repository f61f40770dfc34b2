#include "StdioTransport.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace image_mcp {

namespace {

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

} // namespace

StdioTransport::StdioTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {
    spdlog::debug("StdioTransport initialized");
}

std::optional<json> StdioTransport::read_message() {
    std::string line;

    while (true) {
        if (!std::getline(in_, line)) {
            if (in_.eof()) {
                spdlog::debug("Reached end of input stream");
                return std::nullopt;
            }
            throw TransportError("Error reading from input stream");
        }
        if (!is_blank(line)) {
            break;
        }
        spdlog::trace("Skipping blank line");
    }

    try {
        json message = json::parse(line);
        spdlog::debug("Read message: {}", line);
        return message;
    } catch (const json::parse_error& e) {
        throw MalformedMessage(e.what());
    }
}

void StdioTransport::write_message(const json& message) {
    std::string serialized = message.dump(-1, ' ', false, json::error_handler_t::replace);
    out_ << serialized << '\n';
    out_.flush();
    if (!out_) {
        throw TransportError("Error writing to output stream");
    }
    spdlog::debug("Wrote message: {}", serialized);
}

bool StdioTransport::is_open() const {
    return in_.good() && out_.good();
}

} // namespace image_mcp
