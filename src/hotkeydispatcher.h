#pragma once
#include "hotkeybackend.h"
#include "hotkeybindings.h"
#include <QObject>
#include <QVector>
#include <memory>

namespace clb {

struct BindingError {
    HotkeyAction action;
    QString      combo;
    QString      message;
};

// ── Hot-key dispatcher ──
//
// Owns the binding map and the backend registrations made for it.
// Backend callbacks arrive on a foreign thread; they only queue an
// action onto this object's thread, where nextRequested()/
// prevRequested() are emitted in the order the events were posted.

class HotkeyDispatcher : public QObject {
    Q_OBJECT
public:
    // Pasting into the window is how new items usually arrive, so the
    // paste shortcut also advances.
    static const QString kPasteCombo;

    explicit HotkeyDispatcher(std::unique_ptr<HotkeyBackend> backend, QObject* parent = nullptr);
    ~HotkeyDispatcher() override;

    bool isAvailable() const { return m_backend && m_backend->isAvailable(); }

    // Drops every previous registration, then registers next, prev and
    // the paste alias. A rejected combo fails only its own action.
    // Without a backend nothing is registered, but combos that do not
    // parse are still returned as errors.
    QVector<BindingError> registerAll(const HotkeyBindings& bindings);
    void clearAll();

    const HotkeyBindings& bindings() const { return m_bindings; }
    int registeredCount() const { return m_registered; }

signals:
    void nextRequested();
    void prevRequested();
    void bindingFailed(const QString& action, const QString& combo, const QString& message);

private:
    std::unique_ptr<HotkeyBackend> m_backend;
    HotkeyBindings m_bindings;
    int            m_registered = 0;

    bool bind(const QString& combo, HotkeyAction action, QString* error);
    void post(HotkeyAction action);   // any thread
    void dispatch(HotkeyAction action);
};

} // namespace clb
