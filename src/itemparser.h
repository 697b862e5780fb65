#pragma once
#include <QString>
#include <QVector>

namespace clb {

// One non-blank line of the item list, trimmed.
struct Item {
    int     line = 0;   // 1-based line number in the source text
    QString text;

    bool operator==(const Item& o) const { return line == o.line && text == o.text; }
    bool operator!=(const Item& o) const { return !(*this == o); }
};

using ItemSequence = QVector<Item>;

class ItemParser {
public:
    // Lines are split on \n, \r\n and \r. Blank and whitespace-only
    // lines are skipped but still counted.
    static ItemSequence parse(const QString& text);
};

} // namespace clb
