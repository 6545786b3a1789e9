#include "UpdateInstaller.hpp"
#include "UpdateErrors.hpp"
#include "core/util/Env.hpp"
#include "utils/Logger.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace fs = std::filesystem;

namespace configdesk {

namespace {
struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
} // namespace

UpdateInstaller::UpdateInstaller(std::string target) : targetPath(std::move(target)) {}

std::string UpdateInstaller::installTarget() {
    std::string appImage = Env::get("APPIMAGE");
    if (!appImage.empty()) {
        return appImage;
    }
    return Env::executable();
}

std::string UpdateInstaller::stagingPath() const {
    const fs::path target(targetPath);
    return (target.parent_path() / ("." + target.filename().string() + ".update")).string();
}

std::string UpdateInstaller::sha256File(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw InstallError("Cannot open " + path + " for hashing");
    }

    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw InstallError("Failed to initialize SHA-256");
    }

    std::array<char, 64 * 1024> buffer{};
    while (file) {
        file.read(buffer.data(), buffer.size());
        const std::streamsize n = file.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(n)) != 1) {
            throw InstallError("SHA-256 update failed");
        }
    }
    if (file.bad()) {
        throw InstallError("Read error while hashing " + path);
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
        throw InstallError("SHA-256 finalization failed");
    }

    std::ostringstream hex;
    for (unsigned int i = 0; i < length; ++i) {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return hex.str();
}

void UpdateInstaller::verify(const std::string& stagedPath, const std::string& expectedSha256) const {
    const std::string actual = sha256File(stagedPath);
    if (actual != toLower(expectedSha256)) {
        throw InstallError("Checksum mismatch: expected " + expectedSha256 + ", got " + actual);
    }
    debug("UpdateInstaller: checksum verified for {}", stagedPath);
}

void UpdateInstaller::install(const std::string& stagedPath) const {
    std::error_code ec;
    if (!fs::is_regular_file(stagedPath, ec)) {
        throw InstallError("Downloaded update not found at " + stagedPath);
    }

    fs::permissions(stagedPath,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                        fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace, ec);
    if (ec) {
        throw InstallError("Failed to make " + stagedPath + " executable: " + ec.message());
    }

    // Replacing a running executable is fine: the old inode lives on until exit
    fs::rename(stagedPath, targetPath, ec);
    if (ec) {
        throw InstallError("Failed to replace " + targetPath + ": " + ec.message());
    }
    info("UpdateInstaller: installed update to {}", targetPath);
}

void UpdateInstaller::discard(const std::string& stagedPath) const {
    std::error_code ec;
    fs::remove(stagedPath, ec);
    if (ec) {
        warning("UpdateInstaller: could not remove {}: {}", stagedPath, ec.message());
    }
}

} // namespace configdesk
