#include "textarea/text/line_breaker.h"
#include "textarea/core/utf8.h"

namespace textarea::text {

namespace {

float rowAdvance(const TextMeasurer& measurer, std::string_view row, std::uint32_t count, float letterSpacing) {
    return measurer.advanceX(row) + letterSpacing * static_cast<float>(count);
}

// Concatenated glyphs of cells [first, last]
std::string joinGlyphs(const std::vector<CharCell>& chars, std::uint32_t first, std::uint32_t last) {
    std::string out;
    for (std::uint32_t i = first; i <= last; ++i) {
        out += chars[i].glyph;
    }
    return out;
}

} // namespace

float measureInkExtent(const TextMeasurer& measurer, std::string_view text, std::uint32_t count, float letterSpacing) {
    const InkBounds bounds = measurer.measureBounds(text);
    if (bounds.width <= 0.0f) {
        return 0.0f;
    }
    return bounds.x + bounds.width + letterSpacing * static_cast<float>(count);
}

WrappedLayout wrapLines(const TextMeasurer& measurer, std::string_view text, const WrapOptions& options) {
    WrappedLayout out;
    std::vector<CharCell>& chars = out.chars;

    const std::vector<std::string> glyphs = splitCodepoints(text);
    chars.reserve(glyphs.size() + 1);

    const float ls = options.letterSpacing;
    std::string line;
    std::uint32_t row = 0;
    std::uint32_t rowFirst = 0;

    for (const std::string& glyph : glyphs) {
        const std::uint32_t n = static_cast<std::uint32_t>(chars.size());

        if (glyph == "\n") {
            const float x = (n == rowFirst) ? 0.0f : chars[n - 1].xEnd;
            chars.push_back({row, n - rowFirst, x, x, glyph});
            out.lines.push_back(line + "\n");
            out.sections.push_back({rowFirst, n});
            line.clear();
            row++;
            rowFirst = n + 1;
            continue;
        }

        const std::string candidate = line + glyph;
        const std::uint32_t count = n - rowFirst + 1;
        bool overflow = false;
        if (n > rowFirst) {
            if (options.maxWidth && measureInkExtent(measurer, candidate, count, ls) > *options.maxWidth) {
                overflow = true;
            }
            if (options.maxChars && count > *options.maxChars) {
                overflow = true;
            }
        }

        if (!overflow) {
            const float xStart = (n == rowFirst) ? 0.0f : chars[n - 1].xEnd;
            chars.push_back({row, n - rowFirst, xStart, rowAdvance(measurer, candidate, count, ls), glyph});
            line = candidate;
            continue;
        }

        if (options.wholeWords && candidate.find(' ') != std::string::npos) {
            // Break after the last space past the row's first cell; fall back
            // to breaking right before the overflowing codepoint.
            std::uint32_t breakAt = n - 1;
            for (std::uint32_t p = n - 1; p > rowFirst; --p) {
                if (chars[p].isSpace()) {
                    breakAt = p;
                    break;
                }
            }

            std::string closed = joinGlyphs(chars, rowFirst, breakAt);
            if (chars[breakAt].isSpace()) {
                closed.pop_back();
            }
            out.lines.push_back(std::move(closed));
            out.sections.push_back({rowFirst, breakAt});
            row++;
            rowFirst = breakAt + 1;

            // Carry the fragment after the break onto the new row at x = 0
            line.clear();
            if (rowFirst < n) {
                const float offset = chars[rowFirst].xStart;
                for (std::uint32_t p = rowFirst; p < n; ++p) {
                    CharCell& cell = chars[p];
                    cell.row = row;
                    cell.col = p - rowFirst;
                    cell.xStart -= offset;
                    cell.xEnd -= offset;
                    line += cell.glyph;
                }
            }
            line += glyph;

            const std::uint32_t carried = n - rowFirst + 1;
            const float xStart = (n == rowFirst) ? 0.0f : chars[n - 1].xEnd;
            chars.push_back({row, n - rowFirst, xStart, rowAdvance(measurer, line, carried, ls), glyph});
            continue;
        }

        out.lines.push_back(line);
        out.sections.push_back({rowFirst, n - 1});
        row++;
        rowFirst = n;
        line = glyph;
        chars.push_back({row, 0, 0.0f, rowAdvance(measurer, glyph, 1, ls), glyph});
    }

    // Sentinel: caret position after the last codepoint
    CharCell sentinel{};
    if (!chars.empty()) {
        const CharCell& last = chars.back();
        if (last.isNewline()) {
            sentinel.row = last.row + 1;
        } else {
            sentinel.row = last.row;
            sentinel.col = last.col + 1;
            sentinel.xStart = last.xEnd;
            sentinel.xEnd = last.xEnd;
        }
    }
    chars.push_back(sentinel);

    out.lines.push_back(line);
    out.sections.push_back({rowFirst, static_cast<std::uint32_t>(chars.size() - 1)});
    return out;
}

} // namespace textarea::text
