#ifndef SWEEP_PRIVILEGEDREMOVER_HPP
#define SWEEP_PRIVILEGEDREMOVER_HPP

#include <optional>
#include <string>

// Removes a directory tree that may need elevated permission.
// Implementations report only the outcome and never retain or log the credential.
class PrivilegedRemover {
public:
    virtual ~PrivilegedRemover() = default;

    // Without a credential this must not prompt; it simply fails when a password would be required.
    virtual bool Remove(const std::string& path, const std::optional<std::string>& credential) = 0;
};

// Runs `sudo rm -rf` on the path. The password, if any, travels over the child's stdin.
class SudoRemover : public PrivilegedRemover {
public:
    bool Remove(const std::string& path, const std::optional<std::string>& credential) override;
};

#endif // SWEEP_PRIVILEGEDREMOVER_HPP
