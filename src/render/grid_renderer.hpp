#pragma once

#include "core/types.hpp"
#include "mapping/ansi_token_parser.hpp"
#include "render/cell_renderer.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace imgii {

using CellPtr = std::shared_ptr<const FrameBuffer>;

// Row-major grid of rendered cells. Identical tokens point at the same
// shared cell.
struct CharacterGrid {
    std::vector<CellPtr> cells;
    int width = 0;
    int height = 0;

    bool empty() const { return cells.empty(); }
    const FrameBuffer& cell(int column, int row) const {
        return *cells[static_cast<size_t>(row) * width + column];
    }
};

// Token -> rendered cell memo. Safe for concurrent lookup and insert.
class CellCache {
public:
    CellPtr find(const ColorToken& token) const;
    // Returns the cell that ends up stored, which is the earlier one if
    // another thread inserted the same token first.
    CellPtr insert(const ColorToken& token, CellPtr cell);

    size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<ColorToken, CellPtr, ColorTokenHash> cells_;
};

// Turns a block of colored ASCII art into a validated CharacterGrid.
class GridRenderer {
public:
    GridRenderer(const CellRenderer& cells, const AnsiTokenParser& parser);

    // Uses a cache local to this call.
    Result render(const std::string& ascii_text, CharacterGrid& out) const;
    Result render(const std::string& ascii_text, CellCache& cache, CharacterGrid& out) const;

    const CellPtr& blank_cell() const { return blank_; }

private:
    const CellRenderer& cells_;
    const AnsiTokenParser& parser_;
    CellPtr blank_;

    Result render_row(const std::string& line, CellCache& cache, std::vector<CellPtr>& out) const;
};

std::vector<std::string> split_lines(const std::string& text);

}
