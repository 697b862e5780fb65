#include "itemparser.h"

namespace clb {

ItemSequence ItemParser::parse(const QString& text) {
    ItemSequence items;
    const int len = text.size();
    int lineNo = 1;
    int start = 0;

    auto emitLine = [&](int end) {
        QString t = text.mid(start, end - start).trimmed();
        if (!t.isEmpty())
            items.append({lineNo, t});
    };

    for (int i = 0; i < len; ++i) {
        QChar ch = text[i];
        if (ch != QLatin1Char('\n') && ch != QLatin1Char('\r'))
            continue;
        emitLine(i);
        if (ch == QLatin1Char('\r') && i + 1 < len && text[i + 1] == QLatin1Char('\n'))
            ++i;  // \r\n counts once
        start = i + 1;
        ++lineNo;
    }
    if (start < len)
        emitLine(len);

    return items;
}

} // namespace clb
