#include "core/config.hpp"
#include "cli/args.hpp"
#include "glyph/char_sets.hpp"
#include <toml++/toml.hpp>

#include <cstdlib>
#include <filesystem>
#include <sstream>

#ifdef _WIN32
    #include <shlobj.h>
#else
    #include <unistd.h>
    #include <pwd.h>
#endif

namespace imgii {

namespace {

std::string get_home_dir() {
#ifdef _WIN32
    char path[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(nullptr, CSIDL_PROFILE, nullptr, 0, path))) {
        return std::string(path);
    }
    const char* userprofile = std::getenv("USERPROFILE");
    if (userprofile) return std::string(userprofile);
    return ".";
#else
    const char* home = std::getenv("HOME");
    if (home) return std::string(home);
    struct passwd* pw = getpwuid(getuid());
    if (pw) return std::string(pw->pw_dir);
    return ".";
#endif
}

std::string get_app_data_dir() {
#ifdef _WIN32
    char path[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(nullptr, CSIDL_APPDATA, nullptr, 0, path))) {
        return std::string(path);
    }
    const char* appdata = std::getenv("APPDATA");
    if (appdata) return std::string(appdata);
    return get_home_dir();
#elif defined(__APPLE__)
    return get_home_dir() + "/Library/Application Support";
#else
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config && *xdg_config) return std::string(xdg_config);
    return get_home_dir() + "/.config";
#endif
}

}

Config Config::defaults() {
    Config cfg;
    cfg.version = CONFIG_VERSION;
    return cfg;
}

std::string Config::default_config_dir() {
    return get_app_data_dir() + "/imgii";
}

std::string Config::default_config_path() {
    return default_config_dir() + "/config.toml";
}

bool Config::validate(std::string& error) const {
    if (render.font_size < 2 || render.font_size > 512) {
        error = "render.font_size must be between 2 and 512";
        return false;
    }
    if (ascii.width < 0 || ascii.width > 2000) {
        error = "ascii.width must be between 0 and 2000";
        return false;
    }
    if (ascii.height < 0 || ascii.height > 2000) {
        error = "ascii.height must be between 0 and 2000";
        return false;
    }
    return true;
}

bool Config::unknown_charset() const {
    return ascii.characters.empty() && !CharSet::is_known(ascii.charset);
}

Result Config::to_render_options(RenderOptions& out) const {
    std::string error;
    if (!validate(error)) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, error);
    }
    return RenderOptions::Builder()
        .font_size(render.font_size)
        .background(render.background)
        .share_cache_across_frames(render.share_cache_across_frames)
        .width(ascii.width)
        .height(ascii.height)
        .charset(ascii.charset)
        .characters(ascii.characters)
        .invert(ascii.invert)
        .build(out);
}

std::optional<Config> Config::load(const std::string& path, std::string* error) {
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(path), ec) || ec) {
        if (error) *error = "config file not found: " + path;
        return std::nullopt;
    }

    try {
        auto tbl = toml::parse_file(path);

        Config cfg = defaults();
        cfg.config_path = path;

        if (auto v = tbl["config_version"].value<int>()) {
            if (*v != CONFIG_VERSION) {
                if (error) *error = "unsupported config_version " + std::to_string(*v);
                return std::nullopt;
            }
        }

        if (auto ascii = tbl["ascii"]) {
            if (auto v = ascii["width"].value<int>()) cfg.ascii.width = *v;
            if (auto v = ascii["height"].value<int>()) cfg.ascii.height = *v;
            if (auto v = ascii["charset"].value<std::string>()) cfg.ascii.charset = *v;
            if (auto v = ascii["characters"].value<std::string>()) cfg.ascii.characters = *v;
            if (auto v = ascii["invert"].value<bool>()) cfg.ascii.invert = *v;
        }

        if (auto render = tbl["render"]) {
            if (auto v = render["font_size"].value<int>()) cfg.render.font_size = *v;
            if (auto v = render["background"].value<bool>()) cfg.render.background = *v;
            if (auto v = render["font_path"].value<std::string>()) cfg.render.font_path = *v;
            if (auto v = render["share_cache_across_frames"].value<bool>()) cfg.render.share_cache_across_frames = *v;
        }

        return cfg;
    } catch (const toml::parse_error& e) {
        if (error) {
            std::ostringstream ss;
            ss << "cannot parse " << path << ": " << e.description() << " at line " << e.source().begin.line;
            *error = ss.str();
        }
        return std::nullopt;
    }
}

std::optional<Config> Config::load_default() {
    std::string path = default_config_path();
    return load(path);
}

Config merge_config(Config base, const Config& override) {
    Config result = base;
    const Config defaults = Config::defaults();

    if (override.ascii.width != defaults.ascii.width) result.ascii.width = override.ascii.width;
    if (override.ascii.height != defaults.ascii.height) result.ascii.height = override.ascii.height;
    if (override.ascii.charset != defaults.ascii.charset) result.ascii.charset = override.ascii.charset;
    if (!override.ascii.characters.empty()) result.ascii.characters = override.ascii.characters;
    result.ascii.invert = override.ascii.invert;

    if (override.render.font_size != defaults.render.font_size) result.render.font_size = override.render.font_size;
    result.render.background = override.render.background;
    if (!override.render.font_path.empty()) result.render.font_path = override.render.font_path;
    result.render.share_cache_across_frames = override.render.share_cache_across_frames;

    if (!override.config_path.empty()) result.config_path = override.config_path;

    return result;
}

Config apply_cli_overrides(Config config, const Args& args) {
    if (!args.config_path.empty()) config.config_path = args.config_path;
    if (!args.font_path.empty()) config.render.font_path = args.font_path;
    if (!args.charset.empty()) config.ascii.charset = args.charset;
    if (!args.characters.empty()) config.ascii.characters = args.characters;

    if (args.width > 0) config.ascii.width = args.width;
    if (args.height > 0) config.ascii.height = args.height;
    if (args.font_size > 0) config.render.font_size = args.font_size;

    if (args.invert) config.ascii.invert = true;
    if (args.background) config.render.background = true;

    return config;
}

}
