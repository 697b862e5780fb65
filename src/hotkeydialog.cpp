#include "hotkeydialog.h"
#include "hotkeycombo.h"
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QGroupBox>
#include <QPushButton>
#include <QVBoxLayout>

namespace clb {

HotkeyDialog::HotkeyDialog(const HotkeyBindings& current, bool globalAvailable, QWidget* parent)
    : QDialog(parent)
{
    setWindowTitle("Settings - Hot-keys");
    setModal(true);
    setMinimumWidth(320);

    auto* mainLayout = new QVBoxLayout(this);
    mainLayout->setSpacing(8);
    mainLayout->setContentsMargins(10, 10, 10, 10);

    auto* group = new QGroupBox("Global Hot-keys");
    auto* form = new QFormLayout(group);
    form->setSpacing(6);
    form->setFieldGrowthPolicy(QFormLayout::ExpandingFieldsGrow);

    m_nextEdit = new QLineEdit(current.next);
    m_nextEdit->setObjectName("nextEdit");
    m_nextEdit->setPlaceholderText("e.g. ctrl+shift+alt+right");
    form->addRow("Next item:", m_nextEdit);
    m_nextStatus = new QLabel;
    m_nextStatus->setObjectName("nextStatus");
    form->addRow(m_nextStatus);

    m_prevEdit = new QLineEdit(current.prev);
    m_prevEdit->setObjectName("prevEdit");
    m_prevEdit->setPlaceholderText("e.g. ctrl+shift+alt+left");
    form->addRow("Previous item:", m_prevEdit);
    m_prevStatus = new QLabel;
    m_prevStatus->setObjectName("prevStatus");
    form->addRow(m_prevStatus);

    mainLayout->addWidget(group);

    if (!globalAvailable) {
        auto* note = new QLabel(
            "Global hot-keys are not available on this system. "
            "The arrow keys and buttons still work inside the window.");
        note->setObjectName("unavailableNote");
        note->setWordWrap(true);
        mainLayout->addWidget(note);
    }
    mainLayout->addStretch();

    // Invalid combos may still be saved; registration reports them
    connect(m_nextEdit, &QLineEdit::textChanged, this, [this]() { validate(m_nextEdit, m_nextStatus); });
    connect(m_prevEdit, &QLineEdit::textChanged, this, [this]() { validate(m_prevEdit, m_prevStatus); });
    validate(m_nextEdit, m_nextStatus);
    validate(m_prevEdit, m_prevStatus);

    auto* buttons = new QDialogButtonBox(QDialogButtonBox::Save | QDialogButtonBox::Cancel);
    connect(buttons, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
    mainLayout->addWidget(buttons);
}

HotkeyBindings HotkeyDialog::result() const {
    HotkeyBindings r;
    r.next = m_nextEdit->text().trimmed();
    r.prev = m_prevEdit->text().trimmed();
    return r;
}

void HotkeyDialog::validate(QLineEdit* edit, QLabel* status) {
    auto parsed = KeyComboParser::parse(edit->text());
    status->setText(parsed.ok ? QString() : parsed.error);
    status->setVisible(!parsed.ok);
}

} // namespace clb
