#pragma once
#include <QString>
#include <functional>
#include <memory>

namespace clb {

/**
 * OS-level global hot-key capability.
 *
 * Callbacks are invoked on a thread owned by the backend, never on the
 * GUI thread. Receivers must marshal before touching any widget.
 */
class HotkeyBackend {
public:
    using Callback = std::function<void()>;

    virtual ~HotkeyBackend() = default;

    virtual QString name() const = 0;
    virtual bool isAvailable() const = 0;

    // Returns a handle > 0, or 0 with *error set when the combo is rejected
    virtual int registerCombo(const QString& combo, Callback callback, QString* error) = 0;

    // Drops every registration made so far
    virtual void unregisterAll() = 0;
};

class NullHotkeyBackend : public HotkeyBackend {
public:
    QString name() const override { return QStringLiteral("none"); }
    bool isAvailable() const override { return false; }
    int registerCombo(const QString& combo, Callback callback, QString* error) override;
    void unregisterAll() override {}
};

// X11 when the build found Xlib and a display can be opened, else null
std::unique_ptr<HotkeyBackend> createDefaultHotkeyBackend();

} // namespace clb
