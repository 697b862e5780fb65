#include "cycleengine.h"
#include <QDebug>
#include <utility>

namespace clb {

CycleEngine::CycleEngine(CycleCallbacks callbacks, QObject* parent)
    : QObject(parent), m_cb(std::move(callbacks))
{}

QString CycleEngine::positionLabel(int shown, int total) {
    if (total <= 0)
        return QStringLiteral("0 / 0");
    int cur = ((shown % total) + total) % total;
    return QStringLiteral("%1 / %2").arg(cur + 1).arg(total);
}

ItemSequence CycleEngine::reparse() {
    ItemSequence items = ItemParser::parse(m_cb.readText ? m_cb.readText() : QString());
    m_count = items.size();
    // Clamp into the new range; an empty list parks the cursor at 0
    if (m_cursor > m_count - 1)
        m_cursor = qMax(0, m_count - 1);
    return items;
}

void CycleEngine::advance() {
    ItemSequence items = reparse();
    if (items.isEmpty()) {
        showEmpty();
        return;
    }
    showCurrent(items);
    m_cursor = (m_cursor + 1) % m_count;
}

void CycleEngine::retreat() {
    ItemSequence items = reparse();
    if (items.isEmpty()) {
        showEmpty();
        return;
    }
    m_cursor = (m_cursor - 1 + m_count) % m_count;
    showCurrent(items);
}

void CycleEngine::showCurrent(const ItemSequence& items) {
    if (m_cb.highlight)
        m_cb.highlight(items, m_cursor);

    const QString& text = items[m_cursor].text;
    if (m_cb.copy) {
        QString error;
        if (!m_cb.copy(text, &error)) {
            if (error.isEmpty())
                error = QStringLiteral("clipboard write failed");
            qWarning() << "CycleEngine: Copy of line" << items[m_cursor].line << "failed:" << error;
            emit copyFailed(error);
        }
    }

    emit positionChanged(m_cursor, m_count);
}

void CycleEngine::showEmpty() {
    if (m_cb.highlight)
        m_cb.highlight(ItemSequence(), 0);
    emit positionChanged(-1, 0);
}

} // namespace clb
