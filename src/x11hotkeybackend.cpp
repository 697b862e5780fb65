#include "x11hotkeybackend.h"
#include "hotkeycombo.h"
#include <QDebug>
#include <QHash>
#include <QMutexLocker>
#include <QThread>

// Xlib last: its macros (None, Bool, KeyPress...) collide with Qt names
#include <X11/Xlib.h>
#include <X11/keysym.h>

namespace clb {

// ── Listener thread ──

class X11HotkeyListener : public QThread {
public:
    X11HotkeyListener(X11HotkeyBackend* backend, const QByteArray& displayName)
        : m_backend(backend), m_displayName(displayName) {}

protected:
    void run() override {
        Display* dpy = XOpenDisplay(m_displayName.isEmpty() ? nullptr : m_displayName.constData());
        if (!dpy) {
            qWarning() << "X11HotkeyBackend: Listener could not open display" << m_displayName;
            return;
        }
        char keys[32];
        while (!isInterruptionRequested()) {
            XQueryKeymap(dpy, keys);
            m_backend->poll(keys);
            msleep(X11HotkeyBackend::kPollMs);
        }
        XCloseDisplay(dpy);
    }

private:
    X11HotkeyBackend* m_backend;
    QByteArray        m_displayName;
};

// ── Key name -> KeySym ──

static KeySym keysymFor(const QString& key) {
    static const QHash<QString, const char*> named = {
        {"left", "Left"},   {"right", "Right"}, {"up", "Up"},       {"down", "Down"},
        {"home", "Home"},   {"end", "End"},     {"pageup", "Prior"}, {"pagedown", "Next"},
        {"insert", "Insert"}, {"delete", "Delete"}, {"backspace", "BackSpace"},
        {"tab", "Tab"},     {"enter", "Return"}, {"space", "space"}, {"esc", "Escape"},
        {"plus", "plus"},
    };
    auto it = named.find(key);
    if (it != named.end())
        return XStringToKeysym(it.value());

    if (key.size() > 1 && key[0] == QLatin1Char('f'))
        return XStringToKeysym(key.toUpper().toLatin1().constData());

    if (key.size() == 1) {
        uint ucs = key[0].unicode();
        // Latin-1 keysyms equal their code point; everything else uses
        // the Unicode keysym range.
        return ucs < 0x100 ? KeySym(ucs) : KeySym(0x01000000 | ucs);
    }
    return NoSymbol;
}

static int modifierBitIndex(unsigned bit) {
    switch (bit) {
    case KeyCombo::Ctrl:  return 0;
    case KeyCombo::Shift: return 1;
    case KeyCombo::Alt:   return 2;
    case KeyCombo::Meta:  return 3;
    }
    return -1;
}

// ── Backend ──

X11HotkeyBackend::X11HotkeyBackend() {
    m_display = XOpenDisplay(nullptr);
    if (!m_display)
        return;
    m_displayName = QByteArray(DisplayString(m_display));

    auto addKeys = [this](unsigned bit, std::initializer_list<KeySym> syms) {
        auto& list = m_modifierKeys[modifierBitIndex(bit)];
        for (KeySym s : syms) {
            KeyCode kc = XKeysymToKeycode(m_display, s);
            if (kc && !list.contains(kc))
                list.append(kc);
        }
    };
    addKeys(KeyCombo::Ctrl,  {XK_Control_L, XK_Control_R});
    addKeys(KeyCombo::Shift, {XK_Shift_L, XK_Shift_R});
    addKeys(KeyCombo::Alt,   {XK_Alt_L, XK_Alt_R, XK_Meta_L, XK_Meta_R});
    addKeys(KeyCombo::Meta,  {XK_Super_L, XK_Super_R});

    qDebug() << "X11HotkeyBackend: Using display" << m_displayName;
}

X11HotkeyBackend::~X11HotkeyBackend() {
    stopListener();
    if (m_display)
        XCloseDisplay(m_display);
}

int X11HotkeyBackend::registerCombo(const QString& combo, Callback callback, QString* error) {
    if (!m_display) {
        if (error) *error = QStringLiteral("no X display");
        return 0;
    }

    auto parsed = KeyComboParser::parse(combo);
    if (!parsed.ok) {
        if (error) *error = parsed.error;
        return 0;
    }

    KeySym sym = keysymFor(parsed.combo.key);
    KeyCode kc = sym == NoSymbol ? 0 : XKeysymToKeycode(m_display, sym);
    if (!kc) {
        if (error) *error = QStringLiteral("key '%1' is not on the current keyboard layout")
                                .arg(parsed.combo.key);
        return 0;
    }

    for (unsigned bit : {unsigned(KeyCombo::Ctrl), unsigned(KeyCombo::Shift),
                         unsigned(KeyCombo::Alt), unsigned(KeyCombo::Meta)}) {
        if ((parsed.combo.modifiers & bit) && m_modifierKeys[modifierBitIndex(bit)].isEmpty()) {
            if (error) *error = QStringLiteral("modifier of '%1' is not on the current keyboard layout")
                                    .arg(combo);
            return 0;
        }
    }

    int handle;
    {
        QMutexLocker lock(&m_mutex);
        Binding b;
        b.handle = handle = m_nextHandle++;
        b.keycode = static_cast<unsigned char>(kc);
        b.modifiers = parsed.combo.modifiers;
        b.callback = std::move(callback);
        m_bindings.append(std::move(b));
    }
    startListener();
    return handle;
}

void X11HotkeyBackend::unregisterAll() {
    // Stop first so no callback copied out of the old table can still run
    stopListener();
    QMutexLocker lock(&m_mutex);
    m_bindings.clear();
}

void X11HotkeyBackend::startListener() {
    if (m_listener && m_listener->isRunning())
        return;
    m_listener = std::make_unique<X11HotkeyListener>(this, m_displayName);
    m_listener->start();
}

void X11HotkeyBackend::stopListener() {
    if (!m_listener)
        return;
    m_listener->requestInterruption();
    m_listener->wait();
    m_listener.reset();
}

void X11HotkeyBackend::poll(const char keys[32]) {
    auto isDown = [keys](unsigned char kc) {
        return (static_cast<unsigned char>(keys[kc >> 3]) >> (kc & 7)) & 1;
    };

    unsigned held = 0;
    for (unsigned bit : {unsigned(KeyCombo::Ctrl), unsigned(KeyCombo::Shift),
                         unsigned(KeyCombo::Alt), unsigned(KeyCombo::Meta)}) {
        for (unsigned char kc : m_modifierKeys[modifierBitIndex(bit)]) {
            if (isDown(kc)) {
                held |= bit;
                break;
            }
        }
    }

    QVector<Callback> fire;
    {
        QMutexLocker lock(&m_mutex);
        for (auto& b : m_bindings) {
            bool active = isDown(b.keycode) && held == b.modifiers;
            if (active && !b.held)
                fire.append(b.callback);
            b.held = active;
        }
    }
    for (const auto& cb : fire)
        cb();
}

} // namespace clb
