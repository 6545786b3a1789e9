#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>

#include "UpdateInfo.hpp"

namespace configdesk {

// Where updates come from. check() throws UpdateCheckError,
// downloadAndInstall() throws InstallError.
class UpdateSource {
public:
    using ChunkCallback = std::function<void(size_t chunkLength, std::optional<uint64_t> contentLength)>;
    using FinishCallback = std::function<void()>;

    virtual ~UpdateSource() = default;

    virtual std::optional<UpdateInfo> check() = 0;
    virtual void downloadAndInstall(const UpdateInfo& update,
                                    const ChunkCallback& onChunk,
                                    const FinishCallback& onFinished) = 0;
};

} // namespace configdesk
