#include "prompts/BuiltinPrompts.hpp"
#include "mcp/MCPServer.hpp"
#include "../mcp/MockTransport.hpp"
#include <gtest/gtest.h>
#include <regex>
#include <set>

using namespace image_mcp;

TEST(BuiltinPromptsTest, CatalogHasUniqueNamedPrompts) {
    auto prompts = builtin_prompts();
    ASSERT_EQ(prompts.size(), 6);

    std::set<std::string> names;
    for (const auto& prompt : prompts) {
        EXPECT_FALSE(prompt.name.empty());
        EXPECT_FALSE(prompt.title.empty());
        EXPECT_FALSE(prompt.description.empty());
        EXPECT_FALSE(prompt.template_text.empty());
        names.insert(prompt.name);
    }
    EXPECT_EQ(names.size(), prompts.size());
    EXPECT_EQ(names.count("image_quick_start"), 1);
    EXPECT_EQ(names.count("troubleshooting"), 1);
}

TEST(BuiltinPromptsTest, EveryPlaceholderIsDeclared) {
    const std::regex placeholder(R"(\{\{([a-z_]+)\}\})");

    for (const auto& prompt : builtin_prompts()) {
        std::set<std::string> declared;
        for (const auto& arg : prompt.arguments) {
            declared.insert(arg.name);
        }

        const std::string& text = prompt.template_text;
        for (auto it = std::sregex_iterator(text.begin(), text.end(), placeholder);
             it != std::sregex_iterator(); ++it) {
            EXPECT_EQ(declared.count((*it)[1].str()), 1)
                << prompt.name << " uses undeclared placeholder " << (*it)[0].str();
        }
    }
}

TEST(BuiltinPromptsTest, RenderWithRequiredArgumentsLeavesNoPlaceholders) {
    PromptRegistry registry;
    for (const auto& prompt : builtin_prompts()) {
        registry.register_prompt(prompt);
    }

    for (const auto& prompt : builtin_prompts()) {
        std::map<std::string, std::string> args;
        for (const auto& arg : prompt.arguments) {
            if (arg.required) {
                args[arg.name] = "value";
            }
        }
        std::string text = registry.render(prompt.name, args);
        EXPECT_EQ(text.find("{{"), std::string::npos) << prompt.name;
    }
}

TEST(BuiltinPromptsTest, StyledPromptRendersSubject) {
    PromptRegistry registry;
    for (const auto& prompt : builtin_prompts()) {
        registry.register_prompt(prompt);
    }

    std::string text = registry.render("generate_with_style", {{"subject", "a red fox"}, {"style", "anime"}});
    EXPECT_NE(text.find("I want to generate a red fox with a specific artistic style."), std::string::npos);
    EXPECT_NE(text.find("style=\"anime\""), std::string::npos);
}

TEST(BuiltinPromptsTest, WorkflowsNameTheImageTools) {
    std::string all_text;
    for (const auto& prompt : builtin_prompts()) {
        all_text += prompt.template_text;
    }

    for (const char* tool : {"generate_image", "resize_image", "crop_image", "convert_image"}) {
        EXPECT_NE(all_text.find(tool), std::string::npos) << tool;
    }
    EXPECT_EQ(all_text.find("server_metrics"), std::string::npos);
}

TEST(BuiltinPromptsTest, RegistersWithServer) {
    MCPServer server(std::make_unique<MockTransport>());
    register_builtin_prompts(server);

    EXPECT_EQ(server.prompts().size(), builtin_prompts().size());
    EXPECT_NE(server.prompts().find("generate_and_crop"), nullptr);
}
