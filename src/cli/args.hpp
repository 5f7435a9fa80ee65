#pragma once

#include <string>

namespace imgii {

struct Args {
    std::string input;
    std::string output;
    std::string font_path;
    std::string config_path;
    std::string charset;
    std::string characters;

    int width = 0;
    int height = 0;
    int font_size = 0;
    int final_index = 0;

    bool invert = false;
    bool background = false;
    bool quiet = false;

    bool show_help = false;
    std::string error;
};

Args parse_args(int argc, char* argv[]);
void print_help(const char* prog);

}
