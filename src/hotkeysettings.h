#pragma once
#include "hotkeybindings.h"
#include <QJsonObject>
#include <QStringList>

namespace clb {

struct HotkeySettingsLoad {
    HotkeyBindings bindings;    // defaults merged with stored overrides
    QStringList    warnings;    // problems found while reading, never fatal
};

// Hot-key bindings on disk:  { "hotkeys": { "next": "...", "prev": "..." } }
class HotkeySettings {
public:
    static QString defaultPath();

    static HotkeySettingsLoad load(const QString& path);
    static bool save(const QString& path, const HotkeyBindings& bindings,
                     QString* error = nullptr);

    static QJsonObject toJson(const HotkeyBindings& bindings);
    static HotkeyBindings fromJson(const QJsonObject& root, QStringList* warnings = nullptr);
};

} // namespace clb
