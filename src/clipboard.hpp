#pragma once

#include <optional>
#include <string>

namespace clipboard {

class IClipboard {
  public:
    virtual ~IClipboard() = default;
    // false with `error` filled when no clipboard tool worked
    virtual bool copy(const std::string& text, std::string& error) = 0;
    // X11 primary selection (terminal mouse selection), if readable
    virtual std::optional<std::string> primary_selection() = 0;
};

// pbcopy, wl-copy, xclip, xsel; first one on PATH that succeeds
class SystemClipboard : public IClipboard {
  public:
    bool copy(const std::string& text, std::string& error) override;
    std::optional<std::string> primary_selection() override;
};

} // namespace clipboard
