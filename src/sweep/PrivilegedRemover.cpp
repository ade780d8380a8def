#include "sweep/PrivilegedRemover.hpp"

#include <vector>

#include <spdlog/spdlog.h>

#include "sweep/Process.hpp"

bool SudoRemover::Remove(const std::string& path, const std::optional<std::string>& credential) {
    int code = -1;
    if (credential.has_value()) {
        // Empty prompt so nothing is written to the terminal notcurses owns.
        std::vector<std::string> args = {"sudo", "-S", "-p", "", "rm", "-rf", "--", path};
        code = RunProcess(args, *credential + "\n");
    } else {
        std::vector<std::string> args = {"sudo", "-n", "rm", "-rf", "--", path};
        code = RunProcess(args);
    }

    if (code == 0) {
        spdlog::info("Removed {}{}", path, credential ? " (with password)" : "");
        return true;
    }
    spdlog::info("sudo rm failed for {} (exit {})", path, code);
    return false;
}
