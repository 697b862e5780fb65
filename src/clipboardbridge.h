#pragma once
#include <QString>

namespace clb {

class ClipboardBridge {
public:
    virtual ~ClipboardBridge() = default;

    virtual QString read() const = 0;
    // Replaces the clipboard contents. Returns false and fills *error
    // when the clipboard could not be written.
    virtual bool write(const QString& text, QString* error = nullptr) = 0;
};

// QGuiApplication clipboard (Clipboard mode, not the X11 selection).
class SystemClipboard : public ClipboardBridge {
public:
    QString read() const override;
    bool write(const QString& text, QString* error = nullptr) override;
};

} // namespace clb
