#include <QtTest/QTest>
#include <QApplication>
#include <QClipboard>
#include <QFile>
#include <QLabel>
#include <QTemporaryDir>
#include <Qsci/qsciscintilla.h>
#include "mainwindow.h"
#include "hotkeycombo.h"
#include "hotkeysettings.h"

using namespace clb;

// Registers whatever parses; fire() runs the callbacks of a combo the way
// a backend thread would.
class FakeHotkeyBackend : public HotkeyBackend {
public:
    QVector<QPair<QString, Callback>> registered;

    QString name() const override { return QStringLiteral("fake"); }
    bool isAvailable() const override { return true; }

    int registerCombo(const QString& combo, Callback callback, QString* error) override {
        auto r = KeyComboParser::parse(combo);
        if (!r.ok) {
            *error = r.error;
            return 0;
        }
        registered.append({r.combo.toString(), std::move(callback)});
        return registered.size();
    }

    void unregisterAll() override { registered.clear(); }

    int fire(const QString& combo) {
        QString key = KeyComboParser::parse(combo).combo.toString();
        int n = 0;
        for (const auto& r : registered) {
            if (r.first == key) {
                r.second();
                n++;
            }
        }
        return n;
    }
};

class TestMainWindow : public QObject {
    Q_OBJECT
private:
    QTemporaryDir m_dir;

    QString settingsPath() const { return m_dir.filePath("clipbeat_config.json"); }

    static QsciScintilla* editorOf(MainWindow& w) {
        return w.findChild<QsciScintilla*>("editor");
    }
    static QString labelOf(MainWindow& w) {
        return w.findChild<QLabel*>("positionLabel")->text();
    }
    static int markedLineOf(MainWindow& w) {
        int line = editorOf(w)->markerFindNext(0, 1u << LineHighlighter::kMarker);
        return line < 0 ? 0 : line + 1;
    }
    static QString clipboardText() {
        return QGuiApplication::clipboard()->text();
    }

private slots:
    void initTestCase() {
        QVERIFY(m_dir.isValid());
    }

    void cleanup() {
        QFile::remove(settingsPath());
    }

    void startsEmpty() {
        MainWindow w(std::make_unique<NullHotkeyBackend>(), settingsPath());
        QVERIFY(editorOf(w));
        QCOMPARE(labelOf(w), QString("0 / 0"));
    }

    void arrowKeysCycleWithoutGlobalBackend() {
        MainWindow w(std::make_unique<NullHotkeyBackend>(), settingsPath());
        w.show();
        QVERIFY(QTest::qWaitForWindowExposed(&w));
        QCoreApplication::processEvents();

        auto* sci = editorOf(w);
        sci->setText("a\n\nb");

        QTest::keyClick(sci, Qt::Key_Right);
        QCOMPARE(labelOf(w), QString("1 / 2"));
        QCOMPARE(clipboardText(), QString("a"));
        QCOMPARE(markedLineOf(w), 1);

        QTest::keyClick(sci, Qt::Key_Right);
        QCOMPARE(labelOf(w), QString("2 / 2"));
        QCOMPARE(clipboardText(), QString("b"));
        QCOMPARE(markedLineOf(w), 3);

        // cursor wrapped to 0; retreat steps back onto the last item
        QTest::keyClick(sci, Qt::Key_Left);
        QCOMPARE(labelOf(w), QString("2 / 2"));
        QCOMPARE(clipboardText(), QString("b"));

        QTest::keyClick(sci, Qt::Key_Left);
        QCOMPARE(labelOf(w), QString("1 / 2"));
        QCOMPARE(clipboardText(), QString("a"));
        QCOMPARE(markedLineOf(w), 1);
    }

    void modifiedArrowDoesNotCycle() {
        MainWindow w(std::make_unique<NullHotkeyBackend>(), settingsPath());
        auto* sci = editorOf(w);
        sci->setText("a\nb");

        QTest::keyClick(sci, Qt::Key_Right, Qt::ShiftModifier);
        QTest::keyClick(sci, Qt::Key_Left, Qt::ControlModifier);
        QCOMPARE(labelOf(w), QString("0 / 0"));
        QCOMPARE(markedLineOf(w), 0);
    }

    void pasteAliasAdvancesOnGuiThread() {
        auto backend = std::make_unique<FakeHotkeyBackend>();
        FakeHotkeyBackend* fake = backend.get();
        MainWindow w(std::move(backend), settingsPath());

        // Settings are loaded and bound after the event loop starts
        QTRY_COMPARE(fake->registered.size(), 3);

        editorOf(w)->setText("x\ny");
        QCOMPARE(fake->fire("ctrl+v"), 1);
        QCOMPARE(labelOf(w), QString("0 / 0"));

        QCoreApplication::processEvents();
        QCOMPARE(labelOf(w), QString("1 / 2"));
        QCOMPARE(clipboardText(), QString("x"));

        fake->fire("ctrl+shift+alt+left");
        QCoreApplication::processEvents();
        QCOMPARE(labelOf(w), QString("1 / 2"));
        QCOMPARE(markedLineOf(w), 1);
    }

    void applyHotkeysSavesThenRebinds() {
        auto backend = std::make_unique<FakeHotkeyBackend>();
        FakeHotkeyBackend* fake = backend.get();
        MainWindow w(std::move(backend), settingsPath());
        QTRY_COMPARE(fake->registered.size(), 3);

        HotkeyBindings b;
        b.next = "ctrl+n";
        b.prev = "ctrl+p";
        w.applyHotkeys(b);

        QVERIFY(QFile::exists(settingsPath()));
        QCOMPARE(HotkeySettings::load(settingsPath()).bindings, b);

        editorOf(w)->setText("one\ntwo");
        QCOMPARE(fake->fire("ctrl+shift+alt+right"), 0);
        QCOMPARE(fake->fire("ctrl+n"), 1);
        QCoreApplication::processEvents();
        QCOMPARE(labelOf(w), QString("1 / 2"));
        QCOMPARE(clipboardText(), QString("one"));
    }
};

QTEST_MAIN(TestMainWindow)
#include "test_mainwindow.moc"
