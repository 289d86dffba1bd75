// TextArea editing operations
// Part of the text_area.h class split: text mutation, clipboard and history

#include "textarea/text_area.h"
#include "textarea/core/logging.h"
#include "textarea/core/utf8.h"

namespace textarea {

void TextArea::commitText(std::string newText) {
    history_.recordEdit(newText, cursor_.position());
    config_.text = std::move(newText);
    relayout();
}

bool TextArea::insertText(std::string_view text) {
    if (text.empty()) {
        return false;
    }

    const edit::Selection sel = cursor_.selection();
    std::uint32_t at = cursor_.position();
    std::string base = config_.text;
    if (!sel.empty()) {
        base = eraseCodepoints(base, sel.lo(), sel.hi() - sel.lo());
        at = sel.lo();
    }

    std::string next = insertCodepoints(base, at, text);
    if (config_.maxChars && codepointCount(next) > *config_.maxChars) {
        TEXTAREA_LOG_DEBUG("insert rejected: %u codepoints exceed capacity %u",
            codepointCount(next), *config_.maxChars);
        return false;
    }

    commitText(std::move(next));
    setCaret(at + codepointCount(text));
    cursor_.collapseSelection();
    return true;
}

bool TextArea::deleteSelection() {
    const edit::Selection sel = cursor_.selection();
    if (sel.empty()) {
        return false;
    }
    const std::uint32_t lo = sel.lo();
    commitText(eraseCodepoints(config_.text, lo, sel.hi() - lo));
    setCaret(lo);
    cursor_.collapseSelection();
    return true;
}

bool TextArea::backspace() {
    if (deleteSelection()) {
        return true;
    }
    const std::uint32_t pos = cursor_.position();
    if (pos == 0) {
        return false;
    }
    commitText(eraseCodepoints(config_.text, pos - 1, 1));
    setCaret(pos - 1);
    cursor_.collapseSelection();
    return true;
}

bool TextArea::deleteForward() {
    if (deleteSelection()) {
        return true;
    }
    const std::uint32_t pos = cursor_.position();
    if (pos >= charCount()) {
        return false;
    }
    commitText(eraseCodepoints(config_.text, pos, 1));
    setCaret(pos);
    cursor_.collapseSelection();
    return true;
}

bool TextArea::copy(edit::Clipboard& clipboard) const {
    if (cursor_.selection().empty()) {
        return false;
    }
    clipboard.set(selectedText());
    return true;
}

bool TextArea::cut(edit::Clipboard& clipboard) {
    if (!copy(clipboard)) {
        return false;
    }
    return deleteSelection();
}

bool TextArea::paste(edit::Clipboard& clipboard) {
    const std::string text = clipboard.get();
    if (text.empty()) {
        return false;
    }
    return insertText(text);
}

bool TextArea::duplicate() {
    if (!cursor_.selection().empty()) {
        const std::string text = selectedText();
        return insertText(text + text);
    }

    // Paragraph under the caret: from the previous row's newline (or the
    // start) up to this paragraph's newline (or the sentinel)
    const std::uint32_t pos = cursor_.position();
    const std::uint32_t row = layout_.chars[pos].row;
    std::uint32_t pos1 = 0;
    for (std::uint32_t r = row; r > 0; --r) {
        const std::uint32_t last = layout_.sections[r - 1].last;
        if (layout_.chars[last].isNewline()) {
            pos1 = last;
            break;
        }
    }
    std::uint32_t pos2 = layout_.sentinel();
    for (std::uint32_t r = row; r < layout_.rowCount(); ++r) {
        const std::uint32_t last = layout_.sections[r].last;
        if (layout_.chars[last].isNewline()) {
            pos2 = last;
            break;
        }
    }

    std::string paragraph = substrCodepoints(config_.text, pos1, pos2 - pos1);
    if (paragraph.empty() || paragraph.front() != '\n') {
        paragraph.insert(paragraph.begin(), '\n');
    }

    std::string next = insertCodepoints(config_.text, pos2, paragraph);
    if (config_.maxChars && codepointCount(next) > *config_.maxChars) {
        TEXTAREA_LOG_DEBUG("duplicate rejected: capacity %u", *config_.maxChars);
        return false;
    }

    commitText(std::move(next));
    setCaret(pos);
    cursor_.collapseSelection();
    return true;
}

void TextArea::selectAll() {
    cursor_.setSelection(0, charCount());
}

bool TextArea::undo() {
    std::optional<edit::TextSnapshot> snapshot = history_.navigate(-1, cursor_.position());
    if (!snapshot) {
        return false;
    }
    config_.text = std::move(snapshot->text);
    relayout();
    setCaret(snapshot->caret.value_or(cursor_.position()));
    cursor_.collapseSelection();
    return true;
}

bool TextArea::redo() {
    std::optional<edit::TextSnapshot> snapshot = history_.navigate(1, cursor_.position());
    if (!snapshot) {
        return false;
    }
    config_.text = std::move(snapshot->text);
    relayout();
    setCaret(snapshot->caret.value_or(cursor_.position()));
    cursor_.collapseSelection();
    return true;
}

} // namespace textarea
