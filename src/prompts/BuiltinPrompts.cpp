#include "BuiltinPrompts.hpp"
#include "mcp/MCPServer.hpp"

namespace image_mcp {

std::vector<Prompt> builtin_prompts() {
    std::vector<Prompt> prompts;

    prompts.push_back({
        "image_quick_start",
        "Get Started with Image Generation",
        "Generate a first AI image with the free default model",
        {},
        R"(I want to generate an AI image. Here is the shortest path:

STEP 1: Call generate_image with a prompt and an output path
generate_image(
  prompt="a sunset over mountains",
  output="~/Desktop/sunset.png"
)
The default model is free (daily quota applies).

STEP 2: Read the result
The tool returns the output path and the cost of the call.)"
    });

    prompts.push_back({
        "generate_with_style",
        "Generate Images with Artistic Styles",
        "Use the style parameter to control how a generated image is rendered",
        {
            {"subject", "What to generate (e.g. 'a cat', 'a landscape')", true},
            {"style", "photorealistic, artistic or anime", false}
        },
        R"(I want to generate {{subject}} with a specific artistic style.

RECOMMENDED CALL:
generate_image(
  prompt="{{subject}}, {{style}} style, high quality, detailed",
  style="{{style}}",
  output="~/Desktop/{{subject}}_{{style}}.png"
)

STYLE OPTIONS:
- photorealistic: realistic photos
- artistic: painterly renders
- anime: anime/manga look)"
    });

    prompts.push_back({
        "generate_and_crop",
        "Generate and Crop for Hero Images",
        "Generate an image, then crop it to banner or hero dimensions",
        {
            {"description", "What to generate", true},
            {"crop_width", "Desired crop width in pixels", true},
            {"crop_height", "Desired crop height in pixels", true}
        },
        R"(I want to generate {{description}} and crop it to {{crop_width}}x{{crop_height}}.

STEP 1: Generate the full image
generate_image(
  prompt="{{description}}",
  size="1024x1024",
  output="~/Desktop/full.png"
)

STEP 2: Crop to {{crop_width}}x{{crop_height}}
crop_image(
  input="~/Desktop/full.png",
  x=0,
  y=0,
  width={{crop_width}},
  height={{crop_height}},
  output="~/Desktop/cropped.png"
)

TIP: check the real dimensions of the generated image before cropping.)"
    });

    prompts.push_back({
        "high_quality_image",
        "Generate High-Quality Professional Images",
        "When and how to use the paid high-quality model",
        {
            {"subject", "What to generate", true}
        },
        R"(I want a high-quality image of {{subject}} for professional use.

generate_image(
  prompt="{{subject}}, ultra detailed, professional quality",
  model="imagen-4",
  size="2048x2048",
  output="~/Desktop/hq.png"
)

The free model tops out at 1024x1024 and is best for quick iterations.
The paid model reaches 2048x2048 and suits final production images.)"
    });

    prompts.push_back({
        "optimize_for_web",
        "Generate and Optimize Images for Web",
        "Generate images, resize them and convert them to WebP",
        {
            {"count", "Number of images to generate", false}
        },
        R"(I want to generate {{count}} images and optimize them for the web.

WORKFLOW:
1. generate_image(prompt="...", output="~/Desktop/raw.png")
2. resize_image(input="~/Desktop/raw.png", width=800, height=600, output="~/Desktop/resized.png")
3. convert_image(input="~/Desktop/resized.png", format="webp", output="~/Desktop/web.webp")

TIP: batch tools process many files in one call.)"
    });

    prompts.push_back({
        "troubleshooting",
        "Troubleshoot Common Errors",
        "Fixes for the errors the image tools report most often",
        {},
        R"(I hit an error while using the image tools. Common causes:

"Model not found": use an exact model name or a documented alias.
"API key not configured": set up credentials, then retry the call.
"crop region exceeds image width": read the real dimensions first; the free model
produces at most 1024x1024.
Wrong output size: each model has its own size limit.

GENERAL TIPS:
1. Always pass an explicit output path.
2. Start with the free model while iterating on a prompt.)"
    });

    return prompts;
}

void register_builtin_prompts(MCPServer& server) {
    for (const auto& prompt : builtin_prompts()) {
        server.register_prompt(prompt);
    }
}

} // namespace image_mcp
