#include "UpdateCoordinator.hpp"
#include "UpdateErrors.hpp"
#include "configdesk/Constants.hpp"
#include "utils/Logger.hpp"
#include "utils/Text.hpp"

#include <thread>

namespace configdesk {

const char* toString(UpdateState state) {
    switch (state) {
        case UpdateState::Idle: return "Idle";
        case UpdateState::Checking: return "Checking";
        case UpdateState::NoUpdate: return "NoUpdate";
        case UpdateState::UpdateFound: return "UpdateFound";
        case UpdateState::Prompting: return "Prompting";
        case UpdateState::Declined: return "Declined";
        case UpdateState::Accepted: return "Accepted";
        case UpdateState::Installing: return "Installing";
        case UpdateState::InstallFailed: return "InstallFailed";
        case UpdateState::InstallSucceeded: return "InstallSucceeded";
        case UpdateState::Restarting: return "Restarting";
    }
    return "Unknown";
}

UpdateCoordinator::UpdateCoordinator(UpdateSource& source, Dialogs& dialogs, AppControl& app,
                                     Sleeper sleeper)
    : source(source), dialogs(dialogs), app(app), sleeper(std::move(sleeper)) {}

UpdateCoordinator::Sleeper UpdateCoordinator::defaultSleeper() {
    return [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

MessageDialog UpdateCoordinator::promptDialog(const UpdateInfo& update) {
    MessageDialog dialog;
    dialog.title = "Update Available";
    dialog.body = "A new version (" + update.version + ") is available!\n\n" +
                  text::truncateChars(update.body.value_or(""), RELEASE_NOTES_PREVIEW_CHARS) +
                  "\n\nWould you like to download and install it?";
    dialog.kind = MessageKind::Info;
    dialog.okLabel = "Update";
    dialog.cancelLabel = "Later";
    return dialog;
}

MessageDialog UpdateCoordinator::completeDialog() {
    MessageDialog dialog;
    dialog.title = "Update Complete";
    dialog.body = "Update installed! The app will now restart.";
    dialog.kind = MessageKind::Info;
    return dialog;
}

MessageDialog UpdateCoordinator::failedDialog(const std::string& reason) {
    MessageDialog dialog;
    dialog.title = "Update Failed";
    dialog.body = "Failed to install update: " + reason + "\n\nPlease download manually from GitHub.";
    dialog.kind = MessageKind::Error;
    return dialog;
}

void UpdateCoordinator::transition(UpdateState next) {
    std::lock_guard<std::mutex> lock(mutex);
    debug("Updater: {} -> {}", toString(current), toString(next));
    current = next;
    transitions.push_back(next);
}

UpdateState UpdateCoordinator::state() const {
    std::lock_guard<std::mutex> lock(mutex);
    return current;
}

std::vector<UpdateState> UpdateCoordinator::history() const {
    std::lock_guard<std::mutex> lock(mutex);
    return transitions;
}

void UpdateCoordinator::run() {
    sleeper(std::chrono::duration_cast<std::chrono::milliseconds>(UPDATE_CHECK_DELAY));
    transition(UpdateState::Checking);

    std::optional<UpdateInfo> update;
    try {
        update = source.check();
    } catch (const std::exception& e) {
        error("Failed to check for updates: {}", e.what());
        transition(UpdateState::Idle);
        return;
    }

    if (!update) {
        transition(UpdateState::NoUpdate);
        info("No updates available");
        transition(UpdateState::Idle);
        return;
    }

    transition(UpdateState::UpdateFound);
    info("Update {} available (running {})", update->version, update->currentVersion);

    transition(UpdateState::Prompting);
    if (!dialogs.ask(promptDialog(*update))) {
        transition(UpdateState::Declined);
        info("User postponed update to {}", update->version);
        return;
    }

    transition(UpdateState::Accepted);
    info("User accepted update to {}", update->version);

    transition(UpdateState::Installing);
    try {
        source.downloadAndInstall(*update,
                                  [](size_t, std::optional<uint64_t>) {},
                                  []() {});
    } catch (const std::exception& e) {
        transition(UpdateState::InstallFailed);
        error("Failed to install update: {}", e.what());
        dialogs.show(failedDialog(e.what()));
        return;
    }

    transition(UpdateState::InstallSucceeded);
    dialogs.show(completeDialog());

    transition(UpdateState::Restarting);
    app.restart();
}

} // namespace configdesk
