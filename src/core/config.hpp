#pragma once

#include "core/types.hpp"
#include "core/options.hpp"
#include <string>
#include <optional>

namespace imgii {

constexpr int CONFIG_VERSION = 1;

struct ConfigAscii {
    int width = 0;
    int height = 0;
    std::string charset = "minimal";
    std::string characters;
    bool invert = false;
};

struct ConfigRender {
    int font_size = DEFAULT_FONT_SIZE;
    bool background = false;
    std::string font_path;
    bool share_cache_across_frames = true;
};

struct Config {
    int version = CONFIG_VERSION;
    ConfigAscii ascii;
    ConfigRender render;

    std::string config_path;

    bool validate(std::string& error) const;
    // Named charset is not built in and no literal characters override it.
    bool unknown_charset() const;

    // Builds the immutable run options.
    Result to_render_options(RenderOptions& out) const;

    static Config defaults();
    // nullopt when the file is missing, unparsable or from another
    // config_version. `error` gets the reason when given.
    static std::optional<Config> load(const std::string& path, std::string* error = nullptr);
    static std::optional<Config> load_default();
    static std::string default_config_path();
    static std::string default_config_dir();
};

Config merge_config(Config base, const Config& override);
Config apply_cli_overrides(Config config, const struct Args& args);

}
