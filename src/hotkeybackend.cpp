#include "hotkeybackend.h"
#include <QDebug>

#ifdef CLB_HAVE_X11
#include "x11hotkeybackend.h"
#endif

namespace clb {

int NullHotkeyBackend::registerCombo(const QString& combo, Callback, QString* error) {
    Q_UNUSED(combo);
    if (error) *error = QStringLiteral("no global hot-key backend on this system");
    return 0;
}

std::unique_ptr<HotkeyBackend> createDefaultHotkeyBackend() {
#ifdef CLB_HAVE_X11
    auto x11 = std::make_unique<X11HotkeyBackend>();
    if (x11->isAvailable())
        return x11;
    qDebug() << "HotkeyBackend: No X display, global hot-keys disabled";
#endif
    return std::make_unique<NullHotkeyBackend>();
}

} // namespace clb
