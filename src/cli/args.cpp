#include "args.hpp"
#include <cstring>
#include <cstdlib>
#include <cstdio>

namespace imgii {

static bool parse_int(const char* s, int min_val, int max_val, int& out) {
    char* end = nullptr;
    long val = std::strtol(s, &end, 10);
    if (end == s || *end != '\0') return false;
    if (val < min_val || val > max_val) return false;
    out = static_cast<int>(val);
    return true;
}

static bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    if (path.find('\0') != std::string::npos) return false;
    return true;
}

Args parse_args(int argc, char* argv[]) {
    Args args;

    auto need_value = [&](int& i, const char* name) -> const char* {
        if (i + 1 < argc) return argv[++i];
        args.error = std::string("missing value for ") + name;
        return nullptr;
    };
    auto int_option = [&](int& i, const char* name, int min_val, int max_val, int& out) {
        const char* v = need_value(i, name);
        if (v && !parse_int(v, min_val, max_val, out)) {
            args.error = std::string("invalid value for ") + name + ": " + v;
        }
    };

    for (int i = 1; i < argc && args.error.empty(); ++i) {
        const char* arg = argv[i];

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
            return args;
        }

        if (strcmp(arg, "-w") == 0 || strcmp(arg, "--width") == 0) {
            int_option(i, "--width", 1, 2000, args.width);
        }
        else if (strcmp(arg, "-H") == 0 || strcmp(arg, "--height") == 0) {
            int_option(i, "--height", 1, 2000, args.height);
        }
        else if (strcmp(arg, "-f") == 0 || strcmp(arg, "--font-size") == 0) {
            int_option(i, "--font-size", 2, 512, args.font_size);
        }
        else if (strcmp(arg, "-n") == 0 || strcmp(arg, "--final-index") == 0) {
            int_option(i, "--final-index", 1, 1000000, args.final_index);
        }
        else if (strcmp(arg, "-C") == 0 || strcmp(arg, "--charset") == 0) {
            if (const char* v = need_value(i, "--charset")) args.charset = v;
        }
        else if (strcmp(arg, "--chars") == 0) {
            if (const char* v = need_value(i, "--chars")) args.characters = v;
        }
        else if (strcmp(arg, "--font") == 0) {
            if (const char* v = need_value(i, "--font")) {
                args.font_path = v;
                if (!validate_path(args.font_path)) {
                    args.font_path.clear();
                }
            }
        }
        else if (strcmp(arg, "--config") == 0) {
            if (const char* v = need_value(i, "--config")) {
                args.config_path = v;
                if (!validate_path(args.config_path)) {
                    args.config_path.clear();
                }
            }
        }
        else if (strcmp(arg, "-i") == 0 || strcmp(arg, "--invert") == 0) {
            args.invert = true;
        }
        else if (strcmp(arg, "-b") == 0 || strcmp(arg, "--background") == 0) {
            args.background = true;
        }
        else if (strcmp(arg, "-q") == 0 || strcmp(arg, "--quiet") == 0) {
            args.quiet = true;
        }
        else if (arg[0] == '-' && arg[1] != '\0') {
            args.error = std::string("unknown option ") + arg;
        }
        else if (args.input.empty()) {
            args.input = arg;
        }
        else if (args.output.empty()) {
            args.output = arg;
        }
        else {
            args.error = std::string("unexpected argument ") + arg;
        }
    }

    if (args.error.empty() && (args.input.empty() || args.output.empty())) {
        args.error = "expected <INPUT> and <OUTPUT>";
    }

    return args;
}

void print_help(const char* prog) {
    printf("Usage: %s [OPTIONS] <INPUT> <OUTPUT>\n\n", prog);
    printf("INPUT:\n");
    printf("  Image or animated GIF. With --final-index, a path containing %%d\n\n");
    printf("OUTPUT:\n");
    printf("  .png for images, .gif for animations. With --final-index, a .png path containing %%d\n\n");
    printf("OPTIONS:\n");
    printf("  -w, --width <N>         ASCII width in characters (default: 128, range: 1-2000)\n");
    printf("  -H, --height <N>        ASCII height in characters (default: from aspect ratio)\n");
    printf("  -f, --font-size <N>     Glyph height in pixels; cells are N/2 x N (default: 16)\n");
    printf("  -i, --invert            Invert the brightness to character mapping\n");
    printf("  -b, --background        Draw on opaque black instead of transparency\n");
    printf("  -C, --charset <NAME>    Character set: minimal, default, slight,\n");
    printf("                          block, russian, emoji\n");
    printf("      --chars <STRING>    Characters repeated in order across the image (ignores --charset)\n");
    printf("      --font <PATH>       Font file to use (auto-detects system monospace font if not set)\n");
    printf("      --config <FILE>     Config file path (default: platform-specific)\n");
    printf("  -n, --final-index <N>   Batch mode: convert %%d = 1..N (PNG output only)\n");
    printf("  -q, --quiet             Suppress progress output\n");
    printf("  -h, --help              Show this help\n");
    printf("\nCONFIG FILE:\n");
    printf("  Default locations:\n");
    printf("    Linux:   ~/.config/imgii/config.toml\n");
    printf("    macOS:   ~/Library/Application Support/imgii/config.toml\n");
    printf("    Windows: %%APPDATA%%\\imgii\\config.toml\n");
}

}
