#pragma once
#include "itemparser.h"
#include <QObject>
#include <functional>

namespace clb {

// Host-side collaborators of the engine. All three are called on the
// engine's thread only.
struct CycleCallbacks {
    std::function<QString()>                                 readText;
    std::function<void(const ItemSequence& items, int cur)>  highlight;
    std::function<bool(const QString& text, QString* error)> copy;
};

// ── Cycle engine ──
//
// Circular cursor over the items of the current text. The sequence is
// re-parsed from readText() on every advance()/retreat() and is never
// cached, so edits made between two calls always take effect on the
// next one.
//
// advance() shows and copies the item under the cursor, then steps
// forward. retreat() steps back first, then shows and copies. Either
// way the indicator names the item that was just copied.

class CycleEngine : public QObject {
    Q_OBJECT
public:
    explicit CycleEngine(CycleCallbacks callbacks, QObject* parent = nullptr);

    int cursor() const { return m_cursor; }
    int count() const { return m_count; }

    static QString positionLabel(int shown, int total);

public slots:
    void advance();
    void retreat();

signals:
    // shown is the index of the item just copied, -1 when total == 0
    void positionChanged(int shown, int total);
    void copyFailed(const QString& message);

private:
    CycleCallbacks m_cb;
    int m_cursor = 0;
    int m_count  = 0;

    ItemSequence reparse();
    void showCurrent(const ItemSequence& items);
    void showEmpty();
};

} // namespace clb
