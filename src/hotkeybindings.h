#pragma once
#include <QString>

namespace clb {

enum class HotkeyAction { Next, Prev };

inline QString actionName(HotkeyAction a) {
    return a == HotkeyAction::Next ? QStringLiteral("next") : QStringLiteral("prev");
}

// User-editable global hot-keys, one combo per action
struct HotkeyBindings {
    QString next = QStringLiteral("ctrl+shift+alt+right");
    QString prev = QStringLiteral("ctrl+shift+alt+left");

    QString combo(HotkeyAction a) const { return a == HotkeyAction::Next ? next : prev; }

    bool operator==(const HotkeyBindings& o) const { return next == o.next && prev == o.prev; }
    bool operator!=(const HotkeyBindings& o) const { return !(*this == o); }
};

} // namespace clb
