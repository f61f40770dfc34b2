#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace image_mcp {

using json = nlohmann::json;

struct PromptArgument {
    std::string name;
    std::string description;
    bool required = false;
};

/**
 * @brief Parametrized text template retrievable through prompts/get
 *
 * Placeholders in template_text are written {{argument_name}}.
 */
struct Prompt {
    std::string name;
    std::string title;
    std::string description;
    std::vector<PromptArgument> arguments;
    std::string template_text;
};

/**
 * @brief Raised when a prompt cannot be rendered (unknown name, missing argument)
 */
class PromptError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class PromptRegistry {
public:
    /**
     * @throws std::invalid_argument on empty or duplicate name
     */
    void register_prompt(const Prompt& prompt);

    /**
     * @return nullptr if no prompt has this name
     */
    const Prompt* find(const std::string& name) const;

    size_t size() const { return prompts_.size(); }

    /**
     * @brief Descriptors for prompts/list, ordered by name
     */
    json list() const;

    /**
     * @brief Substitute arguments into the prompt's template
     *
     * Every supplied {{key}} is replaced. Placeholders of optional
     * arguments that were not supplied are removed.
     *
     * @throws PromptError if the prompt is unknown or a required argument is absent
     */
    std::string render(const std::string& name,
                       const std::map<std::string, std::string>& arguments) const;

private:
    std::map<std::string, Prompt> prompts_;
};

} // namespace image_mcp
