#pragma once

#include <vcmd/base/event.h>
#include <cstddef>
#include <string>
#include <vector>

namespace vcmd {

//=============================================================================
// InputDecoder - raw terminal input to UI events
//
// Understands xterm key sequences, SGR mouse reports (1006) and bracketed
// paste (2004). A sequence cut off at the end of a read is kept until the
// next feed() or flush().
//=============================================================================

class InputDecoder {
public:
    std::vector<base::Event> feed(const char* data, size_t len);
    std::vector<base::Event> feed(const std::string& data) { return feed(data.data(), data.size()); }

    // Give up on a pending partial sequence: a lone ESC becomes the Escape key
    std::vector<base::Event> flush();

    bool hasPending() const { return !_pending.empty(); }

private:
    // Bytes consumed at pos, 0 if the sequence is incomplete
    size_t decodeOne(const std::string& buf, size_t pos, std::vector<base::Event>& out);
    size_t decodeEscape(const std::string& buf, size_t pos, std::vector<base::Event>& out);
    size_t decodeCsi(const std::string& buf, size_t pos, std::vector<base::Event>& out);
    size_t decodeText(const std::string& buf, size_t pos, std::vector<base::Event>& out);

    std::string _pending;
    std::string _paste;
    bool _inPaste = false;
};

} // namespace vcmd
