#include "core/types.hpp"
#include "core/config.hpp"
#include "core/converter.hpp"
#include "core/options.hpp"
#include "glyph/font_loader.hpp"
#include "mapping/ascii_art_renderer.hpp"
#include "cli/args.hpp"

#include <iostream>
#include <string>

namespace {

void print_error(const imgii::Result& res) {
    std::cerr << "Error: " << res.describe() << " [" << imgii::error_code_name(res.error) << "]\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    imgii::Args args = imgii::parse_args(argc, argv);

    if (args.show_help) {
        imgii::print_help(argv[0]);
        return 0;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << "\n";
        std::cerr << "Try '" << argv[0] << " --help' for usage.\n";
        return 1;
    }

    imgii::Config config = imgii::Config::defaults();
    if (!args.config_path.empty()) {
        std::string load_error;
        auto loaded = imgii::Config::load(args.config_path, &load_error);
        if (!loaded) {
            std::cerr << "Error: Failed to load config file: " << load_error << "\n";
            return 1;
        }
        config = imgii::merge_config(config, *loaded);
    } else {
        if (auto loaded_default = imgii::Config::load_default()) {
            config = imgii::merge_config(config, *loaded_default);
        }
    }
    config = imgii::apply_cli_overrides(config, args);

    std::string config_error;
    if (!config.validate(config_error)) {
        std::cerr << "Error: Invalid config: " << config_error << "\n";
        return 1;
    }
    if (config.unknown_charset()) {
        std::cerr << "Warning: Unknown charset '" << config.ascii.charset << "', using minimal\n";
    }

    const bool batch = args.final_index > 0;
    const imgii::OutputKind kind = imgii::output_kind(args.output);
    if (kind == imgii::OutputKind::Unknown) {
        std::cerr << "Error: Unsupported output format: " << args.output << " (expected .png or .gif)\n";
        return 1;
    }
    if (batch && kind == imgii::OutputKind::Gif) {
        std::cerr << "Error: --final-index only works with PNG output\n";
        return 1;
    }

    imgii::RenderOptions options;
    imgii::Result res = config.to_render_options(options);
    if (res.failure()) {
        print_error(res);
        return 1;
    }

    imgii::FontLoader font_loader;
    const float pixel_height = static_cast<float>(options.font_size());
    if (!config.render.font_path.empty()) {
        res = font_loader.load(config.render.font_path, pixel_height);
    } else {
        res = font_loader.load_system_fallback(pixel_height);
    }
    if (res.failure()) {
        print_error(res);
        return 1;
    }

    imgii::LuminanceAsciiRenderer ascii_renderer;
    imgii::Converter converter(font_loader, options, ascii_renderer);
    converter.set_quiet(args.quiet);
    res = converter.init();
    if (res.failure()) {
        print_error(res);
        return 1;
    }

    if (batch) {
        imgii::BatchSummary summary;
        res = converter.convert_batch(args.input, args.output, args.final_index, summary);
    } else {
        res = converter.convert(args.input, args.output);
    }

    if (res.failure()) {
        print_error(res);
        return 1;
    }
    return 0;
}
