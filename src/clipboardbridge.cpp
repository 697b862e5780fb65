#include "clipboardbridge.h"
#include <QClipboard>
#include <QGuiApplication>

namespace clb {

QString SystemClipboard::read() const {
    auto* cb = QGuiApplication::clipboard();
    return cb ? cb->text() : QString();
}

bool SystemClipboard::write(const QString& text, QString* error) {
    auto* cb = QGuiApplication::clipboard();
    if (!cb) {
        if (error) *error = QStringLiteral("no clipboard available");
        return false;
    }
    cb->setText(text);

    // QClipboard has no failure channel; a read-back mismatch means
    // another client owns or locked the clipboard.
    if (read() != text) {
        if (error) *error = QStringLiteral("clipboard is in use by another application");
        return false;
    }
    return true;
}

} // namespace clb
