#pragma once

#include <string>
#include <vector>

namespace rig_session {

enum class NotificationKind { Success, Error, Info, Warning };

struct Notification {
    NotificationKind kind = NotificationKind::Info;
    std::string message;
};

// Receives user-facing notices (toasts in the editor).
class NotificationSink {
public:
    virtual ~NotificationSink() = default;
    virtual void notify(const Notification& notification) = 0;
};

// Keeps the most recent notices; used by the editor overlay and by tests.
class NotificationLog : public NotificationSink {
public:
    explicit NotificationLog(std::size_t capacity = 16) : capacity_(capacity) {}

    void notify(const Notification& notification) override;

    const std::vector<Notification>& entries() const { return entries_; }
    const Notification* last() const { return entries_.empty() ? nullptr : &entries_.back(); }
    void clear() { entries_.clear(); }

private:
    std::vector<Notification> entries_;
    std::size_t capacity_;
};

const char* to_string(NotificationKind kind);

} // namespace rig_session
