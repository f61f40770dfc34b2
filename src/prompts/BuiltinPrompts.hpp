#pragma once

#include "mcp/PromptRegistry.hpp"
#include <vector>

namespace image_mcp {

class MCPServer;

/**
 * @brief Prompts that walk a model through the image tools
 *
 * Covers a quick start, styled generation, generate-then-crop, high
 * quality generation, web optimization and troubleshooting.
 */
std::vector<Prompt> builtin_prompts();

/**
 * @brief Register every prompt from builtin_prompts() with the server
 *
 * The prompts direct the host to the image tools (generate_image,
 * resize_image, crop_image, convert_image and friends). Those tools are
 * registered by collaborators; this binary only registers server_metrics,
 * so a host following a prompt against a bare server gets ToolNotFound.
 */
void register_builtin_prompts(MCPServer& server);

} // namespace image_mcp
