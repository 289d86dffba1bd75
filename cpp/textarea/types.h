#ifndef TEXTAREA_TYPES_H
#define TEXTAREA_TYPES_H

#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>

// Lightweight types and constants shared by the text area engine.

namespace textarea {

// Configuration defaults
static constexpr std::size_t defaultUndoLevels = 10;
static constexpr float defaultCaretWidth = 2.0f;
static constexpr std::uint32_t defaultCaretColor = 0x000000;
static constexpr std::uint32_t defaultSelectionColor = 0x888888;
static constexpr float defaultSelectionAlpha = 0.25f;
static constexpr float defaultSliderWidth = 2.0f;
static constexpr std::uint32_t defaultSliderColor = 0x888888;
static constexpr float defaultSliderAlpha = 0.5f;
static constexpr const char* defaultSample = "qP|";

// Selection rectangles never collapse below this width.
static constexpr float minSelectionRectWidth = 2.0f;

// Guard subtracted from scroll ranges to avoid boundary flicker.
static constexpr float scrollRangeEpsilon = 1.0f;

enum class TextAlign : std::uint8_t {
    Left = 0,
    Center = 1,
    Right = 2,
    Justify = 3,
    Fraction = 4,   // Offset rows by alignFraction * free width
};

enum class Direction : std::uint8_t {
    Left = 0,
    Right = 1,
    Up = 2,
    Down = 3,
    Home = 4,
    End = 5,
    PageUp = 6,
    PageDown = 7,
};

// Why a focus session ended.
enum class BlurReason : std::uint8_t {
    Esc = 0,
    Go = 1,
    Switch = 2,
    Released = 3,   // Host removed focus explicitly
};

// Text color with alpha.
struct Paint {
    std::uint32_t rgb = 0;
    float alpha = 1.0f;

    bool operator==(const Paint& other) const {
        return rgb == other.rgb && alpha == other.alpha;
    }
    bool operator!=(const Paint& other) const { return !(*this == other); }
};

struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
};

// Raised when edit/scroll/focus is requested without the dimensions they need.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace textarea

#endif // TEXTAREA_TYPES_H
