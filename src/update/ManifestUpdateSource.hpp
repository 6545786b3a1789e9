#pragma once

#include <string>
#include <vector>

#include "UpdateInstaller.hpp"
#include "UpdateManifest.hpp"
#include "UpdateSource.hpp"
#include "net/HttpModule.hpp"

namespace configdesk {

/**
 * Update source backed by static JSON manifests on one or more endpoints.
 *
 * Endpoint URLs may contain {{current_version}}, {{target}} and {{arch}}.
 * Endpoints are tried in order; HTTP 204 from any of them means "up to date".
 */
class ManifestUpdateSource : public UpdateSource {
public:
    ManifestUpdateSource(std::vector<std::string> endpoints,
                         std::string currentVersion,
                         UpdateInstaller installer = UpdateInstaller(),
                         int timeoutMs = 30000);

    std::optional<UpdateInfo> check() override;
    void downloadAndInstall(const UpdateInfo& update,
                            const ChunkCallback& onChunk,
                            const FinishCallback& onFinished) override;

    static std::string expandEndpoint(const std::string& endpoint,
                                      const std::string& currentVersion,
                                      const std::string& target,
                                      const std::string& arch);

    // The update `manifest` offers over `currentVersion`, if any.
    // Throws UpdateCheckError when it is newer but has no artifact for `arch`.
    static std::optional<UpdateInfo> evaluate(const UpdateManifest& manifest,
                                              const Version& currentVersion,
                                              const std::string& arch);

    const std::vector<std::string>& getEndpoints() const { return endpoints; }

private:
    std::vector<std::string> endpoints;
    std::string currentVersion;
    std::string arch;
    UpdateInstaller installer;
    HttpModule http;
};

} // namespace configdesk
