#include <chdview/chd/chd_defs.hpp>

namespace chdview::chd {

std::string TagToString(uint32 tag) {
    std::string str(4, '.');
    for (uint32 i = 0; i < 4; i++) {
        const char ch = static_cast<char>(tag >> ((3 - i) * 8));
        if (ch >= 0x20 && ch < 0x7F) {
            str[i] = ch;
        }
    }
    return str;
}

} // namespace chdview::chd
