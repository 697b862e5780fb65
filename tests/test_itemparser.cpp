#include "itemparser.h"
#include <QTest>

using clb::Item;
using clb::ItemParser;
using clb::ItemSequence;

class TestItemParser : public QObject {
    Q_OBJECT

private slots:
    // -- Basics --

    void emptyText()       { QVERIFY(ItemParser::parse("").isEmpty()); }
    void onlyBlankLines()  { QVERIFY(ItemParser::parse("\n  \n\t\n").isEmpty()); }

    void singleLine() {
        auto items = ItemParser::parse("hello");
        QCOMPARE(items.size(), 1);
        QCOMPARE(items[0].line, 1);
        QCOMPARE(items[0].text, QString("hello"));
    }

    void skipsBlankKeepsLineNumbers() {
        auto items = ItemParser::parse("a\n\nb\nc");
        ItemSequence expected = {{1, "a"}, {3, "b"}, {4, "c"}};
        QCOMPARE(items, expected);
    }

    void trimsWhitespace() {
        auto items = ItemParser::parse("   first  \n\tsecond\t\n");
        QCOMPARE(items.size(), 2);
        QCOMPARE(items[0].text, QString("first"));
        QCOMPARE(items[1].text, QString("second"));
        QCOMPARE(items[1].line, 2);
    }

    void innerWhitespacePreserved() {
        auto items = ItemParser::parse("  two  words ");
        QCOMPARE(items[0].text, QString("two  words"));
    }

    void trailingNewlineAddsNothing() {
        auto items = ItemParser::parse("x\n");
        QCOMPARE(items.size(), 1);
    }

    // -- Line terminators --

    void crlfCountsAsOneBreak() {
        auto items = ItemParser::parse("a\r\n\r\nb");
        ItemSequence expected = {{1, "a"}, {3, "b"}};
        QCOMPARE(items, expected);
    }

    void bareCarriageReturn() {
        auto items = ItemParser::parse("a\rb\r\rc");
        ItemSequence expected = {{1, "a"}, {2, "b"}, {4, "c"}};
        QCOMPARE(items, expected);
    }

    void crlfAtEnd() {
        auto items = ItemParser::parse("a\r\n");
        QCOMPARE(items.size(), 1);
        QCOMPARE(items[0].text, QString("a"));
    }

    // -- Properties --

    void countMatchesNonBlankLines() {
        QStringList lines = {"one", "", "  ", "two", "three", "\t", "four"};
        auto items = ItemParser::parse(lines.join('\n'));
        int expected = 0;
        for (const auto& l : lines)
            if (!l.trimmed().isEmpty()) expected++;
        QCOMPARE(items.size(), expected);
        for (int i = 1; i < items.size(); ++i)
            QVERIFY(items[i - 1].line < items[i].line);
        for (const auto& it : items)
            QCOMPARE(it.text, lines[it.line - 1].trimmed());
    }

    void unicodeText() {
        auto items = ItemParser::parse(QString::fromUtf8("  caf\xc3\xa9 \n\xe2\x9c\x93"));
        QCOMPARE(items.size(), 2);
        QCOMPARE(items[0].text, QString::fromUtf8("caf\xc3\xa9"));
        QCOMPARE(items[1].text, QString::fromUtf8("\xe2\x9c\x93"));
    }

    void deterministic() {
        const QString text = "x\n\n y \nz";
        QCOMPARE(ItemParser::parse(text), ItemParser::parse(text));
    }
};

QTEST_MAIN(TestItemParser)
#include "test_itemparser.moc"
