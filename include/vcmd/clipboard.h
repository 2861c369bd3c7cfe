#pragma once

#include <vcmd/base/event-loop.h>
#include <vcmd/result.hpp>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace vcmd {

//=============================================================================
// Clipboard - system clipboard collaborator
//
// Copy goes through the first available tool (wl-copy, xclip, xsel,
// pbcopy) and falls back to an OSC 52 sequence written to the host
// terminal; a tool that exits early counts as a failed copy. Paste needs
// a tool and runs on the loop's work pool when a loop is given.
//=============================================================================

class Clipboard {
public:
    using Ptr = std::shared_ptr<Clipboard>;
    // Receives raw bytes for the host terminal (OSC 52)
    using TerminalWriter = std::function<void(const std::string&)>;
    // Called on the loop thread with the clipboard contents
    using PasteCallback = std::function<void(Result<std::string>)>;

    static Result<Ptr> create(TerminalWriter terminalWriter = nullptr,
                              base::EventLoop::Ptr loop = nullptr) noexcept;

    virtual ~Clipboard() = default;

    virtual Result<void> copy(const std::string& text) = 0;
    // Without a loop the callback runs before this returns
    virtual Result<void> requestPaste(PasteCallback callback) = 0;

protected:
    Clipboard() = default;
};

std::string base64Encode(std::string_view data);

// ESC ] 52 ; c ; <base64> BEL
std::string osc52Sequence(const std::string& text);

} // namespace vcmd
