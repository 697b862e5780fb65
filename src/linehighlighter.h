#pragma once
#include "itemparser.h"
#include <QColor>

class QsciScintilla;

namespace clb {

// Marks the source line of the current item with a full-line background
// marker. Stateless apart from the marker definition: every apply()
// clears the old mark before setting the new one.
class LineHighlighter {
public:
    static constexpr int kMarker = 20;  // clear of the fold margin markers (25..31)

    explicit LineHighlighter(QsciScintilla* sci, const QColor& color = QColor("#ffffaa"));

    void apply(const ItemSequence& items, int cursor);
    void clear();

    // 1-based line carrying the mark, 0 when nothing is marked
    int markedLine() const;

private:
    QsciScintilla* m_sci;
};

} // namespace clb
