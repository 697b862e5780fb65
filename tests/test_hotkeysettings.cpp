#include <QtTest/QTest>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>
#include "hotkeysettings.h"

using namespace clb;

static void writeFile(const QString& path, const QByteArray& data) {
    QFile f(path);
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.write(data);
}

class TestHotkeySettings : public QObject {
    Q_OBJECT
private:
    QTemporaryDir m_dir;

    QString path(const QString& name = "clipbeat_config.json") const {
        return m_dir.filePath(name);
    }

private slots:
    void initTestCase() {
        QVERIFY(m_dir.isValid());
    }

    void cleanup() {
        QFile::remove(path());
    }

    void defaults() {
        HotkeyBindings b;
        QCOMPARE(b.next, QString("ctrl+shift+alt+right"));
        QCOMPARE(b.prev, QString("ctrl+shift+alt+left"));
    }

    void missingFileGivesDefaultsSilently() {
        auto r = HotkeySettings::load(path("does_not_exist.json"));
        QCOMPARE(r.bindings, HotkeyBindings());
        QVERIFY(r.warnings.isEmpty());
    }

    void storedOverridesMerge() {
        writeFile(path(), R"({ "hotkeys": { "next": "ctrl+right" } })");
        auto r = HotkeySettings::load(path());
        QVERIFY(r.warnings.isEmpty());
        QCOMPARE(r.bindings.next, QString("ctrl+right"));
        QCOMPARE(r.bindings.prev, HotkeyBindings().prev);
    }

    void unknownKeysIgnored() {
        writeFile(path(), R"({ "theme": 3, "hotkeys": { "prev": "f7", "paste": "x" } })");
        auto r = HotkeySettings::load(path());
        QVERIFY(r.warnings.isEmpty());
        QCOMPARE(r.bindings.prev, QString("f7"));
        QCOMPARE(r.bindings.next, HotkeyBindings().next);
    }

    void malformedJsonWarns() {
        writeFile(path(), "{ \"hotkeys\": ");
        auto r = HotkeySettings::load(path());
        QCOMPARE(r.bindings, HotkeyBindings());
        QCOMPARE(r.warnings.size(), 1);
        QVERIFY(r.warnings[0].contains("not valid JSON"));
    }

    void nonObjectRootWarns() {
        writeFile(path(), "[1, 2]");
        auto r = HotkeySettings::load(path());
        QCOMPARE(r.bindings, HotkeyBindings());
        QCOMPARE(r.warnings.size(), 1);
    }

    void wrongTypesWarnPerKey() {
        writeFile(path(), R"({ "hotkeys": { "next": 5, "prev": "alt+p" } })");
        auto r = HotkeySettings::load(path());
        QCOMPARE(r.warnings.size(), 1);
        QVERIFY(r.warnings[0].contains("hotkeys.next"));
        QCOMPARE(r.bindings.next, HotkeyBindings().next);
        QCOMPARE(r.bindings.prev, QString("alt+p"));
    }

    void hotkeysNotAnObject() {
        writeFile(path(), R"({ "hotkeys": "ctrl+x" })");
        auto r = HotkeySettings::load(path());
        QCOMPARE(r.bindings, HotkeyBindings());
        QCOMPARE(r.warnings.size(), 1);
    }

    void saveThenLoad() {
        HotkeyBindings b;
        b.next = "meta+n";
        b.prev = "meta+p";
        QString error;
        QVERIFY(HotkeySettings::save(path(), b, &error));
        QVERIFY(error.isEmpty());

        auto r = HotkeySettings::load(path());
        QVERIFY(r.warnings.isEmpty());
        QCOMPARE(r.bindings, b);
    }

    void savedFileFormat() {
        HotkeyBindings b;
        b.next = "ctrl+shift+alt+right";
        b.prev = "bad!!combo";   // stored as typed; rejected later at registration
        QVERIFY(HotkeySettings::save(path(), b));

        QFile f(path());
        QVERIFY(f.open(QIODevice::ReadOnly));
        auto doc = QJsonDocument::fromJson(f.readAll());
        QVERIFY(doc.isObject());
        auto hk = doc.object().value("hotkeys").toObject();
        QCOMPARE(hk.value("next").toString(), b.next);
        QCOMPARE(hk.value("prev").toString(), b.prev);
        QCOMPARE(hk.size(), 2);
    }

    void saveCreatesDirectory() {
        QString nested = m_dir.filePath("a/b/config.json");
        QVERIFY(HotkeySettings::save(nested, HotkeyBindings()));
        QVERIFY(QFile::exists(nested));
    }

    void saveFailureReported() {
        // A directory where the file should be
        QVERIFY(QDir(m_dir.path()).mkpath("blocked.json"));
        QString error;
        QVERIFY(!HotkeySettings::save(path("blocked.json"), HotkeyBindings(), &error));
        QVERIFY(!error.isEmpty());
    }

    void defaultPathIsConfigFile() {
        QVERIFY(HotkeySettings::defaultPath().endsWith("clipbeat_config.json"));
    }
};

QTEST_MAIN(TestHotkeySettings)
#include "test_hotkeysettings.moc"
