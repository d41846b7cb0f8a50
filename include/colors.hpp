#pragma once
#include <unistd.h>  // for isatty(), STDERR_FILENO

#include <string>  // for std::string

namespace Color {
inline bool supports_color(int fd = STDERR_FILENO) {
    return isatty(fd);
}
const std::string reset = "\033[0m";

const std::string red = "\033[31m";

inline std::string paint(const std::string& text, const std::string& color, bool enabled) {
    return enabled ? color + text + reset : text;
}
}  // namespace Color
