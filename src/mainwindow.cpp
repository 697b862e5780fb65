#include "mainwindow.h"
#include "hotkeydialog.h"
#include "hotkeysettings.h"
#include <QCloseEvent>
#include <QFontDatabase>
#include <QHBoxLayout>
#include <QKeyEvent>
#include <QMessageBox>
#include <QSettings>
#include <QStatusBar>
#include <QTimer>
#include <QVBoxLayout>
#include <Qsci/qsciscintilla.h>
#include <Qsci/qsciscintillabase.h>

namespace clb {

MainWindow::MainWindow(std::unique_ptr<HotkeyBackend> backend, const QString& settingsPath,
                       QWidget* parent)
    : QMainWindow(parent)
    , m_settingsPath(settingsPath)
{
    setWindowTitle("ClipBeat");
    resize(500, 350);

    createWidgets();
    setupEditor();

    m_highlighter = std::make_unique<LineHighlighter>(m_sci);

    CycleCallbacks cb;
    cb.readText  = [this]() { return m_sci->text(); };
    cb.highlight = [this](const ItemSequence& items, int cur) { m_highlighter->apply(items, cur); };
    cb.copy      = [this](const QString& text, QString* error) { return m_clipboard.write(text, error); };
    m_engine = new CycleEngine(std::move(cb), this);

    connect(m_engine, &CycleEngine::positionChanged, this, &MainWindow::updatePosition);
    connect(m_engine, &CycleEngine::copyFailed, this, &MainWindow::reportCopyFailure);
    connect(m_nextButton, &QPushButton::clicked, m_engine, &CycleEngine::advance);
    connect(m_prevButton, &QPushButton::clicked, m_engine, &CycleEngine::retreat);
    connect(m_gearButton, &QToolButton::clicked, this, &MainWindow::showHotkeyDialog);

    // Local Left/Right always work, with or without global hot-keys
    m_sci->installEventFilter(this);
    installEventFilter(this);

    m_hotkeys = new HotkeyDispatcher(std::move(backend), this);
    connect(m_hotkeys, &HotkeyDispatcher::nextRequested, m_engine, &CycleEngine::advance);
    connect(m_hotkeys, &HotkeyDispatcher::prevRequested, m_engine, &CycleEngine::retreat);

    {
        QSettings s("ClipBeat", "ClipBeat");
        restoreGeometry(s.value("geometry").toByteArray());
    }

    // After show(), so any warning box has a parent on screen
    QTimer::singleShot(0, this, &MainWindow::loadHotkeys);
}

MainWindow::~MainWindow() {
    m_hotkeys->clearAll();
}

void MainWindow::createWidgets() {
    auto* central = new QWidget(this);
    auto* layout = new QVBoxLayout(central);
    layout->setContentsMargins(10, 0, 10, 0);
    layout->setSpacing(4);

    // Top bar: settings
    auto* topBar = new QHBoxLayout;
    topBar->addStretch();
    m_gearButton = new QToolButton;
    m_gearButton->setText(QStringLiteral("⚙"));
    m_gearButton->setToolTip("Hot-key settings");
    m_gearButton->setFocusPolicy(Qt::NoFocus);
    topBar->addWidget(m_gearButton);
    layout->addLayout(topBar);

    m_sci = new QsciScintilla;
    m_sci->setObjectName("editor");
    layout->addWidget(m_sci, 1);

    // Navigation bar: ◀  n / N  ▶
    auto* nav = new QHBoxLayout;
    nav->setSpacing(5);
    m_prevButton = new QPushButton(QStringLiteral("◀"));
    m_prevButton->setFixedWidth(48);
    m_prevButton->setToolTip("Previous item (Left)");
    m_posLabel = new QLabel(CycleEngine::positionLabel(-1, 0));
    m_posLabel->setObjectName("positionLabel");
    m_nextButton = new QPushButton(QStringLiteral("▶"));
    m_nextButton->setFixedWidth(48);
    m_nextButton->setToolTip("Next item (Right)");
    // Buttons never take focus: the editor keeps the caret and arrow keys
    m_prevButton->setFocusPolicy(Qt::NoFocus);
    m_nextButton->setFocusPolicy(Qt::NoFocus);
    nav->addWidget(m_prevButton);
    nav->addWidget(m_posLabel);
    nav->addWidget(m_nextButton);
    nav->addStretch();
    layout->addLayout(nav);

    setCentralWidget(central);
    statusBar()->setSizeGripEnabled(true);
}

void MainWindow::setupEditor() {
    QFont f = QFontDatabase::systemFont(QFontDatabase::FixedFont);
    m_sci->setFont(f);
    m_sci->setUtf8(true);
    m_sci->setWrapMode(QsciScintilla::WrapNone);
    m_sci->setTabWidth(4);
    m_sci->setIndentationsUseTabs(false);
    m_sci->setCaretLineVisible(false);
    m_sci->SendScintilla(QsciScintillaBase::SCI_SETEXTRAASCENT, (long)1);
    m_sci->SendScintilla(QsciScintillaBase::SCI_SETEXTRADESCENT, (long)1);

    // Line numbers, so the highlighted item can be matched to its line
    m_sci->setMarginType(0, QsciScintilla::NumberMargin);
    m_sci->setMarginWidth(0, "0000");
    m_sci->setMarginsFont(f);
    m_sci->setMarginWidth(1, 0);

    m_sci->setFocus();
}

void MainWindow::loadHotkeys() {
    auto loaded = HotkeySettings::load(m_settingsPath);
    if (!loaded.warnings.isEmpty())
        statusBar()->showMessage("Could not read settings: " + loaded.warnings.first(), 8000);
    registerGlobalHotkeys(loaded.bindings);
}

void MainWindow::registerGlobalHotkeys(const HotkeyBindings& bindings) {
    auto errors = m_hotkeys->registerAll(bindings);
    if (errors.isEmpty())
        return;

    QStringList lines;
    for (const auto& e : errors)
        lines << QString("%1 (%2): %3").arg(actionName(e.action), e.combo, e.message);
    QMessageBox::warning(this, "Hot-key error",
                         "Could not bind:\n" + lines.join('\n'));
}

void MainWindow::showHotkeyDialog() {
    HotkeyDialog dlg(m_hotkeys->bindings(), m_hotkeys->isAvailable(), this);
    if (dlg.exec() != QDialog::Accepted) return;

    applyHotkeys(dlg.result());
}

void MainWindow::applyHotkeys(const HotkeyBindings& bindings) {
    QString error;
    if (!HotkeySettings::save(m_settingsPath, bindings, &error))
        QMessageBox::warning(this, "Save Failed",
                             QString("Could not save settings to %1:\n%2").arg(m_settingsPath, error));
    registerGlobalHotkeys(bindings);
}

void MainWindow::updatePosition(int shown, int total) {
    m_posLabel->setText(CycleEngine::positionLabel(shown, total));
}

void MainWindow::reportCopyFailure(const QString& message) {
    statusBar()->showMessage("Clipboard: " + message, 5000);
}

bool MainWindow::eventFilter(QObject* obj, QEvent* event) {
    if ((obj == m_sci || obj == this) && event->type() == QEvent::KeyPress) {
        auto* ke = static_cast<QKeyEvent*>(event);
        auto mods = ke->modifiers() & ~Qt::KeypadModifier;
        if (mods == Qt::NoModifier) {
            // Not consumed: the caret still moves in the editor
            if (ke->key() == Qt::Key_Right)
                m_engine->advance();
            else if (ke->key() == Qt::Key_Left)
                m_engine->retreat();
        }
    }
    return QMainWindow::eventFilter(obj, event);
}

void MainWindow::closeEvent(QCloseEvent* event) {
    QSettings("ClipBeat", "ClipBeat").setValue("geometry", saveGeometry());
    QMainWindow::closeEvent(event);
}

} // namespace clb
