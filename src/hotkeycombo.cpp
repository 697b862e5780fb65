#include "hotkeycombo.h"
#include <QHash>
#include <QStringList>

namespace clb {

// ── Key name tables ──

static const QHash<QString, unsigned>& modifierNames() {
    static const QHash<QString, unsigned> names = {
        {"ctrl",    KeyCombo::Ctrl},
        {"control", KeyCombo::Ctrl},
        {"shift",   KeyCombo::Shift},
        {"alt",     KeyCombo::Alt},
        {"option",  KeyCombo::Alt},
        {"meta",    KeyCombo::Meta},
        {"super",   KeyCombo::Meta},
        {"win",     KeyCombo::Meta},
        {"cmd",     KeyCombo::Meta},
    };
    return names;
}

// alias -> canonical
static const QHash<QString, QString>& namedKeys() {
    static const QHash<QString, QString> names = [] {
        QHash<QString, QString> h;
        for (const char* k : {"left", "right", "up", "down", "home", "end",
                              "pageup", "pagedown", "insert", "delete",
                              "backspace", "tab", "enter", "space", "esc",
                              "plus"})
            h.insert(QString::fromLatin1(k), QString::fromLatin1(k));
        h.insert("return",   "enter");
        h.insert("escape",   "esc");
        h.insert("del",      "delete");
        h.insert("ins",      "insert");
        h.insert("pgup",     "pageup");
        h.insert("pgdn",     "pagedown");
        h.insert("page up",  "pageup");
        h.insert("page down","pagedown");
        for (int i = 1; i <= 24; ++i)
            h.insert(QStringLiteral("f%1").arg(i), QStringLiteral("f%1").arg(i));
        return h;
    }();
    return names;
}

QString KeyComboParser::canonicalKey(const QString& token) {
    QString t = token.trimmed().toLower();
    if (t.size() == 1) {
        QChar c = t[0];
        if (c.isPrint() && !c.isSpace() && c != QLatin1Char('+'))
            return t;
        return {};
    }
    return namedKeys().value(t);
}

KeyComboParseResult KeyComboParser::parse(const QString& text) {
    KeyComboParseResult r;
    QString input = text.trimmed();
    if (input.isEmpty()) {
        r.error = QStringLiteral("empty combo");
        return r;
    }

    const QStringList tokens = input.split(QLatin1Char('+'));
    for (const QString& raw : tokens) {
        QString tok = raw.trimmed().toLower();
        if (tok.isEmpty()) {
            r.error = QStringLiteral("empty key in '%1'").arg(input);
            return r;
        }

        auto mod = modifierNames().find(tok);
        if (mod != modifierNames().end()) {
            r.combo.modifiers |= mod.value();
            continue;
        }

        QString key = canonicalKey(tok);
        if (key.isEmpty()) {
            r.error = QStringLiteral("unknown key '%1'").arg(raw.trimmed());
            return r;
        }
        if (!r.combo.key.isEmpty()) {
            r.error = QStringLiteral("more than one key in '%1'").arg(input);
            return r;
        }
        r.combo.key = key;
    }

    if (r.combo.key.isEmpty()) {
        r.error = QStringLiteral("'%1' has no key besides modifiers").arg(input);
        r.combo = KeyCombo();
        return r;
    }

    r.ok = true;
    return r;
}

QString KeyCombo::toString() const {
    QStringList parts;
    if (modifiers & Ctrl)  parts << QStringLiteral("ctrl");
    if (modifiers & Shift) parts << QStringLiteral("shift");
    if (modifiers & Alt)   parts << QStringLiteral("alt");
    if (modifiers & Meta)  parts << QStringLiteral("meta");
    parts << key;
    return parts.join(QLatin1Char('+'));
}

} // namespace clb
