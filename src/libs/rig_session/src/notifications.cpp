#include <rig_session/notifications.hpp>

namespace rig_session {

void NotificationLog::notify(const Notification& notification) {
    entries_.push_back(notification);
    if (capacity_ > 0 && entries_.size() > capacity_)
        entries_.erase(entries_.begin(), entries_.begin() + (entries_.size() - capacity_));
}

const char* to_string(NotificationKind kind) {
    switch (kind) {
    case NotificationKind::Success:
        return "success";
    case NotificationKind::Error:
        return "error";
    case NotificationKind::Info:
        return "info";
    case NotificationKind::Warning:
        return "warning";
    }
    return "info";
}

} // namespace rig_session
