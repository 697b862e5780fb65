#include "hotkeydispatcher.h"
#include "hotkeycombo.h"
#include <QDebug>
#include <QMetaObject>
#include <utility>

namespace clb {

const QString HotkeyDispatcher::kPasteCombo = QStringLiteral("ctrl+v");

HotkeyDispatcher::HotkeyDispatcher(std::unique_ptr<HotkeyBackend> backend, QObject* parent)
    : QObject(parent), m_backend(std::move(backend))
{}

HotkeyDispatcher::~HotkeyDispatcher() {
    // Backend threads must be gone before this object is
    clearAll();
    m_backend.reset();
}

void HotkeyDispatcher::clearAll() {
    if (m_backend)
        m_backend->unregisterAll();
    m_registered = 0;
}

QVector<BindingError> HotkeyDispatcher::registerAll(const HotkeyBindings& bindings) {
    clearAll();
    m_bindings = bindings;

    QVector<BindingError> errors;
    const bool available = isAvailable();
    if (!available)
        qDebug() << "HotkeyDispatcher: No global hot-key backend, local keys only";

    for (HotkeyAction action : {HotkeyAction::Next, HotkeyAction::Prev}) {
        const QString combo = bindings.combo(action);
        QString error;
        if (available) {
            if (bind(combo, action, &error))
                continue;
        } else {
            // Nothing to register, but a broken setting is still reported
            auto parsed = KeyComboParser::parse(combo);
            if (parsed.ok)
                continue;
            error = parsed.error;
        }
        qWarning() << "HotkeyDispatcher: Could not bind" << actionName(action)
                   << "to" << combo << ":" << error;
        errors.append({action, combo, error});
        emit bindingFailed(actionName(action), combo, error);
    }
    if (!available)
        return errors;

    QString error;
    if (!bind(kPasteCombo, HotkeyAction::Next, &error))
        qWarning() << "HotkeyDispatcher: Paste alias" << kPasteCombo << "unavailable:" << error;

    qDebug() << "HotkeyDispatcher: Registered" << m_registered << "global hot-key(s) via"
             << m_backend->name();
    return errors;
}

bool HotkeyDispatcher::bind(const QString& combo, HotkeyAction action, QString* error) {
    int handle = m_backend->registerCombo(combo, [this, action]() { post(action); }, error);
    if (handle <= 0)
        return false;
    m_registered++;
    return true;
}

void HotkeyDispatcher::post(HotkeyAction action) {
    QMetaObject::invokeMethod(this, [this, action]() { dispatch(action); },
                              Qt::QueuedConnection);
}

void HotkeyDispatcher::dispatch(HotkeyAction action) {
    if (action == HotkeyAction::Next)
        emit nextRequested();
    else
        emit prevRequested();
}

} // namespace clb
