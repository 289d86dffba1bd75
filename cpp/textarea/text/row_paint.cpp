#include "textarea/text/row_paint.h"

namespace textarea::text {

std::vector<std::optional<Paint>> resolveRowPaint(
    const std::vector<std::string>& lines,
    const std::optional<Paint>& color,
    const std::vector<Paint>& colors
) {
    std::vector<std::optional<Paint>> out;
    out.reserve(lines.size());

    std::size_t paragraph = 0;
    for (const std::string& line : lines) {
        if (paragraph < colors.size()) {
            out.push_back(colors[paragraph]);
        } else {
            out.push_back(color);
        }
        if (!line.empty() && line.back() == '\n') {
            paragraph++;
        }
    }
    return out;
}

} // namespace textarea::text
