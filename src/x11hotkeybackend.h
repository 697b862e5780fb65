#pragma once
#include "hotkeybackend.h"
#include <QByteArray>
#include <QMutex>
#include <QVector>
#include <memory>

struct _XDisplay;

namespace clb {

class X11HotkeyListener;

/**
 * Global hot-keys on X11 without grabbing.
 *
 * A listener thread with its own display connection samples the key
 * state every kPollMs and fires a binding on the press edge of its
 * combo. Keys are never grabbed, so a combo keeps working in the
 * focused application as well (the paste alias must not eat Ctrl+V).
 * A combo matches only when exactly its modifiers are held.
 *
 * Sampling means a key must stay down for at least one poll interval:
 * a tap shorter than kPollMs can fall between two samples and is missed.
 */
class X11HotkeyBackend : public HotkeyBackend {
public:
    static constexpr int kPollMs = 20;

    X11HotkeyBackend();
    ~X11HotkeyBackend() override;

    QString name() const override { return QStringLiteral("x11"); }
    bool isAvailable() const override { return m_display != nullptr; }
    int registerCombo(const QString& combo, Callback callback, QString* error) override;
    void unregisterAll() override;

private:
    friend class X11HotkeyListener;

    struct Binding {
        int           handle    = 0;
        unsigned char keycode   = 0;
        unsigned      modifiers = 0;   // KeyCombo::Modifier bits
        Callback      callback;
        bool          held      = false;
    };

    _XDisplay*  m_display = nullptr;   // GUI thread only: keycode lookups
    QByteArray  m_displayName;
    QVector<unsigned char> m_modifierKeys[4];  // indexed by KeyCombo modifier bit

    QMutex           m_mutex;              // guards m_bindings
    QVector<Binding> m_bindings;
    int              m_nextHandle = 1;

    std::unique_ptr<X11HotkeyListener> m_listener;

    void startListener();
    void stopListener();
    void poll(const char keys[32]);        // listener thread
};

} // namespace clb
