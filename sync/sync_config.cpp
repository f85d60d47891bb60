// ============================================================
// sync_config.cpp
// ============================================================

#include "sync_config.hpp"
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

std::string default_ledger_path() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return (fs::path(home) / ".resumecp" / "ledger").string();
    }
    return ".resumecp_ledger";
}
