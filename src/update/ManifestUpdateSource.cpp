#include "ManifestUpdateSource.hpp"
#include "UpdateErrors.hpp"
#include "core/util/Env.hpp"
#include "utils/Logger.hpp"

namespace configdesk {

namespace {
void replaceAll(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}
} // namespace

ManifestUpdateSource::ManifestUpdateSource(std::vector<std::string> endpoints,
                                           std::string currentVersion,
                                           UpdateInstaller installer,
                                           int timeoutMs)
    : endpoints(std::move(endpoints))
    , currentVersion(std::move(currentVersion))
    , arch(Env::architecture())
    , installer(std::move(installer)) {
    http.setTimeout(timeoutMs);
}

std::string ManifestUpdateSource::expandEndpoint(const std::string& endpoint,
                                                 const std::string& currentVersion,
                                                 const std::string& target,
                                                 const std::string& arch) {
    std::string url = endpoint;
    replaceAll(url, "{{current_version}}", HttpModule::urlEncode(currentVersion));
    replaceAll(url, "{{target}}", HttpModule::urlEncode(target));
    replaceAll(url, "{{arch}}", HttpModule::urlEncode(arch));
    return url;
}

std::optional<UpdateInfo> ManifestUpdateSource::evaluate(const UpdateManifest& manifest,
                                                         const Version& current,
                                                         const std::string& arch) {
    if (!(manifest.version > current)) {
        return std::nullopt;
    }

    const auto targets = UpdateManifest::targetsFor(arch);
    auto platform = manifest.findPlatform(targets);
    if (!platform) {
        throw UpdateCheckError("Update " + manifest.version.toString() +
                               " has no artifact for " + targets.back());
    }

    UpdateInfo update;
    update.version = manifest.version.toString();
    update.currentVersion = current.toString();
    update.body = manifest.notes;
    update.date = manifest.pubDate;
    update.target = platform->first;
    update.downloadUrl = platform->second.url;
    update.signature = platform->second.signature;
    update.sha256 = platform->second.sha256;
    return update;
}

std::optional<UpdateInfo> ManifestUpdateSource::check() {
    const auto current = Version::parse(currentVersion);
    if (!current) {
        throw UpdateCheckError("Running version '" + currentVersion + "' is not a valid version");
    }
    if (endpoints.empty()) {
        throw UpdateCheckError("No update endpoints configured");
    }

    const std::string target = "linux";
    std::string lastError;
    for (const auto& endpoint : endpoints) {
        const std::string url = expandEndpoint(endpoint, currentVersion, target, arch);
        debug("Checking for updates at {}", url);

        HttpResponse response = http.get(url, {{"Accept", "application/json"}});
        if (!response.error.empty()) {
            lastError = url + ": " + response.error;
            continue;
        }
        if (response.statusCode == 204) {
            return std::nullopt;
        }
        if (!response.ok()) {
            lastError = url + ": HTTP " + std::to_string(response.statusCode);
            continue;
        }

        try {
            return evaluate(UpdateManifest::parse(response.body), *current, arch);
        } catch (const UpdateCheckError& e) {
            lastError = url + ": " + e.what();
            warning("Update endpoint {} rejected: {}", url, e.what());
        }
    }
    throw UpdateCheckError(lastError);
}

void ManifestUpdateSource::downloadAndInstall(const UpdateInfo& update,
                                              const ChunkCallback& onChunk,
                                              const FinishCallback& onFinished) {
    const std::string staged = installer.stagingPath();
    info("Downloading update {} from {}", update.version, update.downloadUrl);

    HttpResponse response = http.download(update.downloadUrl, staged, onChunk);
    if (!response.error.empty()) {
        throw InstallError("Download failed: " + response.error);
    }
    if (onFinished) {
        onFinished();
    }

    try {
        if (update.sha256) {
            installer.verify(staged, *update.sha256);
        }
        installer.install(staged);
    } catch (const InstallError&) {
        installer.discard(staged);
        throw;
    }
}

} // namespace configdesk
