#pragma once
#include <QString>

namespace clb {

// A key chord such as "ctrl+shift+alt+right". Independent of any hot-key
// backend; backends map the canonical key name to their own key codes.
struct KeyCombo {
    enum Modifier : unsigned {
        Ctrl  = 1u << 0,
        Shift = 1u << 1,
        Alt   = 1u << 2,
        Meta  = 1u << 3,
    };

    unsigned modifiers = 0;
    QString  key;   // canonical lower-case name: "v", "right", "f5", "pageup"

    bool isValid() const { return !key.isEmpty(); }
    QString toString() const;

    bool operator==(const KeyCombo& o) const { return modifiers == o.modifiers && key == o.key; }
    bool operator!=(const KeyCombo& o) const { return !(*this == o); }
};

struct KeyComboParseResult {
    bool     ok = false;
    KeyCombo combo;
    QString  error;
};

class KeyComboParser {
public:
    // Tokens are '+'-separated and case-insensitive. Exactly one
    // non-modifier key is required.
    static KeyComboParseResult parse(const QString& text);

    // Canonical name for a key token, or an empty string if unknown
    static QString canonicalKey(const QString& token);
};

} // namespace clb
