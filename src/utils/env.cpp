#include "wirehdr/utils/env.hpp"

#include <cstdlib>

namespace wirehdr::utils {

std::optional<std::string> getenv_os(const std::string& key) {
#ifdef _WIN32
    std::string os_key = key;
    if (key == "HOME") {
        os_key = "USERPROFILE"; // WindowsのHOME相当
    }
#else
    const std::string& os_key = key;
#endif
    const char* value = std::getenv(os_key.c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

} // namespace wirehdr::utils
