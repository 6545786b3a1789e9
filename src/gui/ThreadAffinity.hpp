#pragma once

#include <QMetaObject>
#include <QObject>
#include <memory>

namespace configdesk {

// Drops `owner` on the thread `context` belongs to, from its event loop.
// For objects holding QObjects that must not be destroyed on a worker thread.
template<typename T>
void releaseOnThreadOf(QObject* context, std::shared_ptr<T> owner) {
    QMetaObject::invokeMethod(context, [owner = std::move(owner)]() mutable {
        owner.reset();
    }, Qt::QueuedConnection);
}

} // namespace configdesk
