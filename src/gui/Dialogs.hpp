#pragma once

#include <string>

namespace configdesk {

enum class MessageKind { Info, Warning, Error };

struct MessageDialog {
    std::string title;
    std::string body;
    MessageKind kind = MessageKind::Info;
    std::string okLabel = "OK";
    std::string cancelLabel; // ask() only
};

// Modal message boxes. Both calls block the caller until dismissed and may be
// made from any thread.
class Dialogs {
public:
    virtual ~Dialogs() = default;

    // true when the OK button was chosen
    virtual bool ask(const MessageDialog& dialog) = 0;
    virtual void show(const MessageDialog& dialog) = 0;
};

} // namespace configdesk
