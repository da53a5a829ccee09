#pragma once

#include <string>

namespace lexforge {

// Library-level failure: bad registration, unreadable or malformed rule file.
// Scan failures inside input text are ScanError values, not LexError.
struct LexError {
    enum Code {
        IO,
        Parse,
        Config,
        InvalidArg,
        NotFound
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;
    int column = 0;

    LexError() = default;
    LexError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    LexError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    LexError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // Attach a location, keeping any line/column already recorded
    LexError& located(std::string f);

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace lexforge
