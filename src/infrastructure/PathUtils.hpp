// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace ledgerwise::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();

    /** @brief $XDG_DATA_HOME/Ledgerwise, created on demand. */
    static std::filesystem::path GetDefaultDataDir();
};

} // namespace ledgerwise::infrastructure
