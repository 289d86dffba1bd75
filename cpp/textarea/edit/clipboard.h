#pragma once

#include <optional>
#include <string>

namespace textarea::edit {

/**
 * Host clipboard adapter. Either call may throw; Clipboard contains failures.
 */
class HostClipboard {
public:
    virtual ~HostClipboard() = default;
    virtual std::optional<std::string> getText() = 0;
    virtual void setText(const std::string& text) = 0;
};

/**
 * Clipboard: host clipboard with an in-process buffer that always holds the
 * last copied text.
 */
class Clipboard {
public:
    explicit Clipboard(HostClipboard* host = nullptr) : host_(host) {}

    void setHost(HostClipboard* host) { host_ = host; }

    /**
     * Host text when the host provides one, else the internal buffer.
     */
    std::string get() const;

    /**
     * Store text in the internal buffer and forward it to the host.
     */
    void set(const std::string& text);

    const std::string& buffer() const noexcept { return buffer_; }

private:
    HostClipboard* host_;
    std::string buffer_;
};

} // namespace textarea::edit
