#pragma once
#include "clipboardbridge.h"
#include "cycleengine.h"
#include "hotkeydispatcher.h"
#include "linehighlighter.h"
#include <QLabel>
#include <QMainWindow>
#include <QPushButton>
#include <QToolButton>
#include <memory>

class QsciScintilla;

namespace clb {

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    MainWindow(std::unique_ptr<HotkeyBackend> backend, const QString& settingsPath,
               QWidget* parent = nullptr);
    ~MainWindow() override;

    // Saves the bindings to the settings file, then re-registers them
    void applyHotkeys(const HotkeyBindings& bindings);

private slots:
    void showHotkeyDialog();
    void updatePosition(int shown, int total);
    void reportCopyFailure(const QString& message);

private:
    QsciScintilla*    m_sci        = nullptr;
    QLabel*           m_posLabel   = nullptr;
    QPushButton*      m_prevButton = nullptr;
    QPushButton*      m_nextButton = nullptr;
    QToolButton*      m_gearButton = nullptr;

    SystemClipboard                  m_clipboard;
    std::unique_ptr<LineHighlighter> m_highlighter;
    CycleEngine*                     m_engine  = nullptr;
    HotkeyDispatcher*                m_hotkeys = nullptr;
    QString                          m_settingsPath;

    void createWidgets();
    void setupEditor();
    void loadHotkeys();
    void registerGlobalHotkeys(const HotkeyBindings& bindings);

protected:
    bool eventFilter(QObject* obj, QEvent* event) override;
    void closeEvent(QCloseEvent* event) override;
};

} // namespace clb
