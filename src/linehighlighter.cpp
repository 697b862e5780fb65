#include "linehighlighter.h"
#include <Qsci/qsciscintilla.h>
#include <Qsci/qsciscintillabase.h>

namespace clb {

LineHighlighter::LineHighlighter(QsciScintilla* sci, const QColor& color)
    : m_sci(sci)
{
    m_sci->markerDefine(QsciScintilla::Background, kMarker);
    m_sci->setMarkerBackgroundColor(color, kMarker);
}

void LineHighlighter::clear() {
    m_sci->markerDeleteAll(kMarker);
}

void LineHighlighter::apply(const ItemSequence& items, int cursor) {
    clear();
    if (items.isEmpty())
        return;

    int line = items[cursor].line - 1;  // Scintilla lines are 0-based
    m_sci->markerAdd(line, kMarker);
    // Unfolds and scrolls; ensureLineVisible() alone only unfolds
    m_sci->SendScintilla(QsciScintillaBase::SCI_ENSUREVISIBLEENFORCEPOLICY, (unsigned long)line);
}

int LineHighlighter::markedLine() const {
    int line = m_sci->markerFindNext(0, 1u << kMarker);
    return line < 0 ? 0 : line + 1;
}

} // namespace clb
