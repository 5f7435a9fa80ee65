#include "grid_renderer.hpp"

#include <exception>
#include <new>

#ifdef IMGII_HAS_OPENMP
#include <omp.h>
#endif

namespace imgii {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        size_t len = end - start;
        if (len > 0 && text[start + len - 1] == '\r') --len;
        lines.push_back(text.substr(start, len));
        start = end + 1;
    }
    return lines;
}

CellPtr CellCache::find(const ColorToken& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cells_.find(token);
    return it != cells_.end() ? it->second : nullptr;
}

CellPtr CellCache::insert(const ColorToken& token, CellPtr cell) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = cells_.emplace(token, std::move(cell));
    return it->second;
}

size_t CellCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cells_.size();
}

void CellCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cells_.clear();
}

GridRenderer::GridRenderer(const CellRenderer& cells, const AnsiTokenParser& parser)
    : cells_(cells), parser_(parser), blank_(std::make_shared<const FrameBuffer>(cells.render_blank())) {}

Result GridRenderer::render(const std::string& ascii_text, CharacterGrid& out) const {
    CellCache cache;
    return render(ascii_text, cache, out);
}

Result GridRenderer::render(const std::string& ascii_text, CellCache& cache, CharacterGrid& out) const {
    out = CharacterGrid();

    const std::vector<std::string> lines = split_lines(ascii_text);
    const int height = static_cast<int>(lines.size());

    std::vector<std::vector<CellPtr>> rows(lines.size());
    std::vector<Result> row_results(lines.size());

#ifdef IMGII_HAS_OPENMP
    #pragma omp parallel for schedule(dynamic)
#endif
    for (int i = 0; i < height; ++i) {
        try {
            row_results[i] = render_row(lines[i], cache, rows[i]);
        } catch (const std::bad_alloc&) {
            row_results[i] = Result::fail(ErrorCode::MEMORY_ERROR, "out of memory rendering line " + std::to_string(i));
        } catch (const std::exception& e) {
            row_results[i] = Result::fail(ErrorCode::PROCESSING_ERROR, e.what());
        }
    }

    // Report the first problem in line order, whatever order rows finished in.
    int width = 0;
    for (int i = 0; i < height; ++i) {
        if (row_results[i].failure()) {
            return Result::wrap(row_results[i].error, "line " + std::to_string(i + 1), row_results[i]);
        }
        const int line_width = static_cast<int>(rows[i].size());
        if (i == 0) {
            width = line_width;
        } else if (line_width != width) {
            return Result::fail(ErrorCode::WIDTH_MISMATCH,
                                "line " + std::to_string(i + 1) + " has width " + std::to_string(line_width) +
                                ", expected " + std::to_string(width));
        }
    }

    out.width = width;
    out.height = height;
    out.cells.reserve(static_cast<size_t>(width) * height);
    for (auto& row : rows) {
        for (auto& cell : row) {
            out.cells.push_back(std::move(cell));
        }
    }
    return Result::ok();
}

Result GridRenderer::render_row(const std::string& line, CellCache& cache, std::vector<CellPtr>& out) const {
    std::vector<ColorToken> tokens;
    Result res = parser_.parse_line(line, tokens);
    if (res.failure()) {
        return res;
    }

    out.clear();
    out.reserve(tokens.size());
    for (const ColorToken& token : tokens) {
        if (token.is_blank()) {
            out.push_back(blank_);
            continue;
        }
        CellPtr cell = cache.find(token);
        if (!cell) {
            // Rasterize outside the lock; a racing insert of the same token
            // keeps whichever landed first.
            cell = cache.insert(token, std::make_shared<const FrameBuffer>(cells_.render_glyph(token)));
        }
        out.push_back(std::move(cell));
    }
    return Result::ok();
}

}
