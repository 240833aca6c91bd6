// Single-keystroke terminal input
#pragma once

#include <cstddef>
#include <string>

#include <termios.h>

namespace pm {

// Special key codes returned by GetChar
enum Key {
    // Other keys are returned as their Unicode code point
    UP = 0x110000,
    DOWN,
    LEFT,
    RIGHT,
    BACKSPACE,
    ENTER,
    TAB,
    DEL,
    ESC,
    CTRL_C,
    END_OF_INPUT,
    UNKNOWN
};

class KeySource {
public:
    virtual ~KeySource() = default;
    // Blocks for exactly one key.
    virtual int GetChar() = 0;
};

// Reads stdin one key at a time. The terminal is switched to raw mode (no
// echo, no line buffering) only while a key is being read.
class TerminalInput : public KeySource {
public:
    TerminalInput();
    ~TerminalInput() override;
    int GetChar() override;

    void Restore();
    void SetRaw();

private:
    int ReadByte(char& c, int timeout_ms);

    struct termios original_termios_;
    bool is_tty_ = false;
};

// Bytes in the UTF-8 sequence introduced by `lead`; 0 if `lead` cannot start one.
size_t Utf8SequenceLength(unsigned char lead);

// Code point of one complete UTF-8 sequence, or UNKNOWN if it is malformed.
int DecodeUtf8(const std::string& bytes);

// Text the operator typed for `key` (UTF-8); empty for special keys.
std::string KeyText(int key);

} // namespace pm
