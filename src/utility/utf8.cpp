#include "./utf8.hpp"

bool utility::validate_utf8(const std::uint8_t* data,
                            std::size_t length) noexcept(true) {
    std::size_t i = 0;
    while (i < length) {
        std::uint8_t byte = data[i];

        if ((byte & 0x80) == 0) {
            ++i;
            continue;
        }

        std::size_t n = 0;
        std::uint32_t cp = 0, min = 0;
        if ((byte & 0xE0) == 0xC0) {
            n = 1, cp = byte & 0x1F, min = 0x80;
        } else if ((byte & 0xF0) == 0xE0) {
            n = 2, cp = byte & 0x0F, min = 0x800;
        } else if ((byte & 0xF8) == 0xF0) {
            n = 3, cp = byte & 0x07, min = 0x10000;
        } else {
            return false;
        }
        if (length - i <= n) {
            return false;
        }
        for (std::size_t k = 1; k <= n; ++k) {
            if ((data[i + k] & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (data[i + k] & 0x3F);
        }
        if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += n + 1;
    }
    return true;
}
