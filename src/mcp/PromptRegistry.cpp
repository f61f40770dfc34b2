#include "PromptRegistry.hpp"
#include <spdlog/spdlog.h>

namespace image_mcp {

namespace {

void replace_all(std::string& text, const std::string& from, const std::string& to) {
    if (from.empty()) {
        return;
    }
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string placeholder(const std::string& name) {
    return "{{" + name + "}}";
}

} // namespace

void PromptRegistry::register_prompt(const Prompt& prompt) {
    if (prompt.name.empty()) {
        throw std::invalid_argument("Prompt name cannot be empty");
    }
    if (prompts_.count(prompt.name) > 0) {
        throw std::invalid_argument("Prompt already registered: " + prompt.name);
    }

    prompts_.emplace(prompt.name, prompt);
    spdlog::debug("Registered prompt: {}", prompt.name);
}

const Prompt* PromptRegistry::find(const std::string& name) const {
    auto it = prompts_.find(name);
    return it == prompts_.end() ? nullptr : &it->second;
}

json PromptRegistry::list() const {
    json prompts_array = json::array();

    for (const auto& [name, prompt] : prompts_) {
        json descriptor = {
            {"name", prompt.name},
            {"title", prompt.title},
            {"description", prompt.description}
        };

        if (!prompt.arguments.empty()) {
            json args = json::array();
            for (const auto& arg : prompt.arguments) {
                args.push_back({
                    {"name", arg.name},
                    {"description", arg.description},
                    {"required", arg.required}
                });
            }
            descriptor["arguments"] = std::move(args);
        }

        prompts_array.push_back(std::move(descriptor));
    }

    return prompts_array;
}

std::string PromptRegistry::render(const std::string& name,
                                   const std::map<std::string, std::string>& arguments) const {
    const Prompt* prompt = find(name);
    if (!prompt) {
        throw PromptError("prompt not found: " + name);
    }

    for (const auto& arg : prompt->arguments) {
        if (arg.required && arguments.count(arg.name) == 0) {
            throw PromptError("missing required argument: " + arg.name);
        }
    }

    std::string text = prompt->template_text;
    for (const auto& [key, value] : arguments) {
        replace_all(text, placeholder(key), value);
    }

    // Optional arguments that were left out render as nothing
    for (const auto& arg : prompt->arguments) {
        if (!arg.required) {
            replace_all(text, placeholder(arg.name), "");
        }
    }

    return text;
}

} // namespace image_mcp
