#include "cli/terminal_input.hpp"

#include <poll.h>
#include <unistd.h>

namespace pm {

namespace {
// How long to wait for the rest of an escape sequence before treating ESC as a key.
constexpr int kEscSequenceTimeoutMs = 50;
}

void TerminalInput::SetRaw() {
    if (!is_tty_) return;
    struct termios raw = original_termios_;
    raw.c_iflag &= ~(BRKINT | ICRNL | INPCK | ISTRIP | IXON);
    raw.c_cflag |= (CS8);
    raw.c_lflag &= ~(ECHO | ICANON | IEXTEN | ISIG);
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    tcsetattr(STDIN_FILENO, TCSANOW, &raw);
}

void TerminalInput::Restore() {
    if (!is_tty_) return;
    tcsetattr(STDIN_FILENO, TCSANOW, &original_termios_);
}

TerminalInput::TerminalInput() {
    is_tty_ = isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &original_termios_) != -1;
}

TerminalInput::~TerminalInput() {
    Restore();
}

// 1 on success, 0 on EOF or timeout, -1 on error.
int TerminalInput::ReadByte(char& c, int timeout_ms) {
    if (timeout_ms >= 0) {
        struct pollfd pfd{STDIN_FILENO, POLLIN, 0};
        if (poll(&pfd, 1, timeout_ms) <= 0) return 0;
    }
    ssize_t n = read(STDIN_FILENO, &c, 1);
    if (n == 1) return 1;
    return n == 0 ? 0 : -1;
}

int TerminalInput::GetChar() {
    SetRaw();
    char c;
    int key;
    if (ReadByte(c, -1) != 1) {
        key = END_OF_INPUT;
    } else if (c == 3) {
        key = CTRL_C;
    } else if (c == '\x1b') {
        char seq[3];
        key = UNKNOWN;
        if (ReadByte(seq[0], kEscSequenceTimeoutMs) != 1) {
            key = ESC;
        } else if (ReadByte(seq[1], kEscSequenceTimeoutMs) == 1 && seq[0] == '[') {
            if (seq[1] >= '0' && seq[1] <= '9') {
                if (ReadByte(seq[2], kEscSequenceTimeoutMs) == 1 && seq[2] == '~' && seq[1] == '3') key = DEL;
            } else {
                switch (seq[1]) {
                    case 'A': key = UP; break;
                    case 'B': key = DOWN; break;
                    case 'C': key = RIGHT; break;
                    case 'D': key = LEFT; break;
                }
            }
        }
    } else if (c == 127 || c == 8) { // Backspace on Mac/Linux
        key = BACKSPACE;
    } else if (c == '\n' || c == '\r') {
        key = ENTER;
    } else if (c == '\t') {
        key = TAB;
    } else {
        unsigned char lead = static_cast<unsigned char>(c);
        size_t len = Utf8SequenceLength(lead);
        if (len <= 1) {
            key = (len == 1) ? lead : UNKNOWN;
        } else {
            std::string bytes(1, c);
            char next;
            while (bytes.size() < len && ReadByte(next, kEscSequenceTimeoutMs) == 1) bytes += next;
            key = DecodeUtf8(bytes);
        }
    }
    Restore();
    return key;
}

size_t Utf8SequenceLength(unsigned char lead) {
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
}

int DecodeUtf8(const std::string& bytes) {
    if (bytes.empty()) return UNKNOWN;
    unsigned char lead = static_cast<unsigned char>(bytes[0]);
    size_t len = Utf8SequenceLength(lead);
    if (len == 0 || bytes.size() != len) return UNKNOWN;
    if (len == 1) return lead;

    static const unsigned char kLeadMask[] = {0, 0, 0x1F, 0x0F, 0x07};
    static const int kMinCodePoint[] = {0, 0, 0x80, 0x800, 0x10000};
    int cp = lead & kLeadMask[len];
    for (size_t i = 1; i < len; ++i) {
        unsigned char b = static_cast<unsigned char>(bytes[i]);
        if ((b & 0xC0) != 0x80) return UNKNOWN;
        cp = (cp << 6) | (b & 0x3F);
    }
    if (cp < kMinCodePoint[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return UNKNOWN;
    return cp;
}

std::string KeyText(int key) {
    if (key < 0 || key > 0x10FFFF || key == 3 || key == 27 || (key >= 0xD800 && key <= 0xDFFF)) {
        return "";
    }
    std::string out;
    if (key < 0x80) {
        out += static_cast<char>(key);
    } else if (key < 0x800) {
        out += static_cast<char>(0xC0 | (key >> 6));
        out += static_cast<char>(0x80 | (key & 0x3F));
    } else if (key < 0x10000) {
        out += static_cast<char>(0xE0 | (key >> 12));
        out += static_cast<char>(0x80 | ((key >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (key & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (key >> 18));
        out += static_cast<char>(0x80 | ((key >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((key >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (key & 0x3F));
    }
    return out;
}

} // namespace pm
