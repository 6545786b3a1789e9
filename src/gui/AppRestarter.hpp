#pragma once

#include <string>

#include "update/UpdateCoordinator.hpp"

namespace configdesk {

// Starts a fresh copy of `executable` with the current arguments, then asks
// the Qt event loop to quit.
class AppRestarter : public AppControl {
public:
    explicit AppRestarter(std::string executable);

    void restart() override;

private:
    std::string executable;
};

} // namespace configdesk
