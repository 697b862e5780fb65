#pragma once
#include "hotkeybindings.h"
#include <QDialog>
#include <QLabel>
#include <QLineEdit>

namespace clb {

class HotkeyDialog : public QDialog {
    Q_OBJECT
public:
    explicit HotkeyDialog(const HotkeyBindings& current, bool globalAvailable = true,
                          QWidget* parent = nullptr);

    HotkeyBindings result() const;

private:
    void validate(QLineEdit* edit, QLabel* status);

    QLineEdit* m_nextEdit   = nullptr;
    QLineEdit* m_prevEdit   = nullptr;
    QLabel*    m_nextStatus = nullptr;
    QLabel*    m_prevStatus = nullptr;
};

} // namespace clb
