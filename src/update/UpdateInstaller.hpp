#pragma once

#include <string>

namespace configdesk {

/**
 * Swaps a downloaded binary in for the installed one.
 *
 * The staging file lives in the same directory as the target so the final
 * rename() is atomic. All failures are reported as InstallError.
 */
class UpdateInstaller {
public:
    explicit UpdateInstaller(std::string target = installTarget());

    // $APPIMAGE when running from an AppImage, the executable otherwise
    static std::string installTarget();

    // Lowercase hex SHA-256 of the file's content
    static std::string sha256File(const std::string& path);

    const std::string& target() const { return targetPath; }
    std::string stagingPath() const;

    // Throws when the digest differs (comparison ignores case)
    void verify(const std::string& stagedPath, const std::string& expectedSha256) const;

    // Makes the staged file executable and renames it over the target
    void install(const std::string& stagedPath) const;

    // Best effort; used when an install is abandoned
    void discard(const std::string& stagedPath) const;

private:
    std::string targetPath;
};

} // namespace configdesk
