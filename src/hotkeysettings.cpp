#include "hotkeysettings.h"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStandardPaths>

namespace clb {

QString HotkeySettings::defaultPath() {
    QString dir = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    if (dir.isEmpty())
        dir = QDir::homePath() + QStringLiteral("/.config");
    return dir + QStringLiteral("/clipbeat_config.json");
}

QJsonObject HotkeySettings::toJson(const HotkeyBindings& b) {
    QJsonObject hotkeys;
    hotkeys["next"] = b.next;
    hotkeys["prev"] = b.prev;
    QJsonObject root;
    root["hotkeys"] = hotkeys;
    return root;
}

HotkeyBindings HotkeySettings::fromJson(const QJsonObject& root, QStringList* warnings) {
    HotkeyBindings b;
    if (!root.contains("hotkeys"))
        return b;

    QJsonValue hv = root.value("hotkeys");
    if (!hv.isObject()) {
        if (warnings) *warnings << QStringLiteral("\"hotkeys\" is not an object, using defaults");
        return b;
    }

    QJsonObject hotkeys = hv.toObject();
    for (HotkeyAction action : {HotkeyAction::Next, HotkeyAction::Prev}) {
        const QString key = actionName(action);
        if (!hotkeys.contains(key))
            continue;
        QJsonValue v = hotkeys.value(key);
        if (!v.isString()) {
            if (warnings) *warnings << QStringLiteral("\"hotkeys.%1\" is not a string, using default").arg(key);
            continue;
        }
        (action == HotkeyAction::Next ? b.next : b.prev) = v.toString().trimmed();
    }
    return b;
}

HotkeySettingsLoad HotkeySettings::load(const QString& path) {
    HotkeySettingsLoad r;
    QFile file(path);
    if (!file.exists())
        return r;

    if (!file.open(QIODevice::ReadOnly)) {
        r.warnings << QStringLiteral("could not read %1: %2").arg(path, file.errorString());
    } else {
        QJsonParseError err;
        QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
        if (err.error != QJsonParseError::NoError)
            r.warnings << QStringLiteral("%1 is not valid JSON (%2 at offset %3)")
                              .arg(path, err.errorString()).arg(err.offset);
        else if (!doc.isObject())
            r.warnings << QStringLiteral("%1 does not hold a JSON object").arg(path);
        else
            r.bindings = fromJson(doc.object(), &r.warnings);
    }

    for (const auto& w : r.warnings)
        qWarning() << "HotkeySettings:" << w;
    return r;
}

bool HotkeySettings::save(const QString& path, const HotkeyBindings& bindings, QString* error) {
    QDir().mkpath(QFileInfo(path).absolutePath());

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        if (error) *error = file.errorString();
        qWarning() << "HotkeySettings: Failed to open" << path << ":" << file.errorString();
        return false;
    }
    file.write(QJsonDocument(toJson(bindings)).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        if (error) *error = file.errorString();
        qWarning() << "HotkeySettings: Failed to write" << path << ":" << file.errorString();
        return false;
    }
    qDebug() << "HotkeySettings: Saved to" << path;
    return true;
}

} // namespace clb
