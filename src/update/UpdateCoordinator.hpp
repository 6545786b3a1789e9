#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "UpdateSource.hpp"
#include "gui/Dialogs.hpp"

namespace configdesk {

// Application lifecycle hooks the update flow needs
class AppControl {
public:
    virtual ~AppControl() = default;
    virtual void restart() = 0;
};

enum class UpdateState {
    Idle,
    Checking,
    NoUpdate,
    UpdateFound,
    Prompting,
    Declined,
    Accepted,
    Installing,
    InstallFailed,
    InstallSucceeded,
    Restarting
};

const char* toString(UpdateState state);

/**
 * One pass of the self-update flow:
 *
 *   Idle -> Checking -> NoUpdate -> Idle
 *                    -> UpdateFound -> Prompting -> Declined
 *                                                -> Accepted -> Installing -> InstallFailed
 *                                                                          -> InstallSucceeded -> Restarting
 *
 * A failed check goes straight back to Idle without bothering the user.
 * run() blocks (start delay, prompt, download) and belongs on a worker thread.
 */
class UpdateCoordinator {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    UpdateCoordinator(UpdateSource& source, Dialogs& dialogs, AppControl& app,
                      Sleeper sleeper = defaultSleeper());

    void run();

    UpdateState state() const;
    std::vector<UpdateState> history() const;

    static MessageDialog promptDialog(const UpdateInfo& update);
    static MessageDialog completeDialog();
    static MessageDialog failedDialog(const std::string& reason);

    static Sleeper defaultSleeper();

private:
    void transition(UpdateState next);

    UpdateSource& source;
    Dialogs& dialogs;
    AppControl& app;
    Sleeper sleeper;

    mutable std::mutex mutex;
    UpdateState current = UpdateState::Idle;
    std::vector<UpdateState> transitions{UpdateState::Idle};
};

} // namespace configdesk
