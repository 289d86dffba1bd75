#include "textarea/text/justifier.h"
#include <cmath>
#include <vector>

namespace textarea::text {

namespace {

struct SpaceRun {
    std::uint32_t first;
    std::uint32_t last;
    int added;
};

// Interior space runs of [first, lastVisible]; a run touching the row start is leading.
std::vector<SpaceRun> findGaps(const std::vector<CharCell>& chars, std::uint32_t first, std::uint32_t lastVisible) {
    std::vector<SpaceRun> runs;
    std::uint32_t p = first;
    while (p <= lastVisible) {
        if (!chars[p].isSpace()) {
            p++;
            continue;
        }
        const std::uint32_t start = p;
        while (p <= lastVisible && chars[p].isSpace()) {
            p++;
        }
        if (start > first) {
            runs.push_back({start, p - 1, 0});
        }
    }
    return runs;
}

} // namespace

std::optional<std::uint32_t> lastVisibleCell(const WrappedLayout& layout, std::uint32_t row) {
    if (row >= layout.sections.size()) {
        return std::nullopt;
    }
    const Section& sec = layout.sections[row];
    for (std::uint32_t p = sec.last + 1; p > sec.first; --p) {
        if (layout.chars[p - 1].isVisible()) {
            return p - 1;
        }
    }
    return std::nullopt;
}

float rowVisibleWidth(const WrappedLayout& layout, std::uint32_t row) {
    const auto last = lastVisibleCell(layout, row);
    return last ? layout.chars[*last].xEnd : 0.0f;
}

WrappedLayout justifyLayout(
    const WrappedLayout& layout,
    const TextMeasurer& measurer,
    float maxWidth,
    float letterSpacing
) {
    WrappedLayout out = layout;
    const std::uint32_t rows = out.rowCount();
    if (rows < 2) {
        return out;
    }

    const float spaceAdvance = measurer.advanceX("  ") - measurer.advanceX(" ") + letterSpacing;

    for (std::uint32_t r = 0; r + 1 < rows; ++r) {
        const Section sec = out.sections[r];
        if (out.chars[sec.last].isNewline()) {
            continue;
        }
        const auto visible = lastVisibleCell(out, r);
        if (!visible) {
            continue;
        }
        const int extra = static_cast<int>(std::floor(maxWidth - out.chars[*visible].xEnd));
        if (extra <= 0) {
            continue;
        }

        std::vector<SpaceRun> gaps = findGaps(out.chars, sec.first, *visible);
        if (gaps.empty()) {
            continue;
        }

        const int gapCount = static_cast<int>(gaps.size());
        const int base = extra / gapCount;
        const int remainder = extra % gapCount;
        for (int g = 0; g < gapCount; ++g) {
            gaps[g].added = base + (g < remainder ? 1 : 0);
        }

        // Byte length of the visible prefix, to keep the row string's tail
        std::size_t prefixBytes = 0;
        for (std::uint32_t p = sec.first; p <= *visible; ++p) {
            prefixBytes += out.chars[p].glyph.size();
        }

        std::string rebuilt;
        float shift = 0.0f;
        std::size_t g = 0;
        for (std::uint32_t p = sec.first; p <= sec.last; ++p) {
            CharCell& cell = out.chars[p];
            if (g < gaps.size() && p >= gaps[g].first && p <= gaps[g].last) {
                const SpaceRun& run = gaps[g];
                const float len = static_cast<float>(run.last - run.first + 1);
                const float step = static_cast<float>(run.added) / len;
                const float i = static_cast<float>(p - run.first);
                cell.xStart += shift + step * i;
                cell.xEnd += shift + step * (i + 1.0f);
                if (p <= *visible) rebuilt += cell.glyph;
                if (p == run.last) {
                    shift += static_cast<float>(run.added);
                    if (spaceAdvance > 0.0f) {
                        const int k = static_cast<int>(std::floor(static_cast<float>(run.added) / spaceAdvance));
                        rebuilt.append(static_cast<std::size_t>(k), ' ');
                    }
                    g++;
                }
                continue;
            }
            cell.xStart += shift;
            cell.xEnd += shift;
            if (p <= *visible) rebuilt += cell.glyph;
        }

        const std::string& original = out.lines[r];
        if (prefixBytes < original.size()) {
            rebuilt += original.substr(prefixBytes);
        }
        out.lines[r] = std::move(rebuilt);
    }

    return out;
}

WrappedLayout alignLayout(
    const WrappedLayout& layout,
    TextAlign align,
    float alignFraction,
    float maxWidth
) {
    WrappedLayout out = layout;

    float k = 0.0f;
    switch (align) {
        case TextAlign::Center: k = 0.5f; break;
        case TextAlign::Right: k = 1.0f; break;
        case TextAlign::Fraction: k = alignFraction; break;
        case TextAlign::Left:
        case TextAlign::Justify:
            return out;
    }

    for (std::uint32_t r = 0; r < out.rowCount(); ++r) {
        const float dx = k * (maxWidth - rowVisibleWidth(layout, r));
        const Section& sec = out.sections[r];
        for (std::uint32_t p = sec.first; p <= sec.last; ++p) {
            out.chars[p].xStart += dx;
            out.chars[p].xEnd += dx;
        }
    }
    return out;
}

} // namespace textarea::text
