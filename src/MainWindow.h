/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: Main window: test table, presets, duration
 *              fields, console and load gauges.
 * License: MIT
 * **********************************************************/

#pragma once

#include "BinaryInstaller.h"
#include "ConfigStore.h"
#include "RunLog.h"
#include "SessionManager.h"
#include "SystemMonitor.h"
#include "TestCatalog.h"
#include "TestSelection.h"

#include <QElapsedTimer>
#include <QMainWindow>
#include <QTimer>
#include <optional>

class AnsiConsole;
class DonutGauge;
class QLabel;
class QLineEdit;
class QProgressBar;
class QPushButton;
class QTreeWidget;
class QTreeWidgetItem;

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(const QString& configPath = ConfigStore::defaultPath(),
                        const QString& executable = QString(),
                        QWidget* parent = nullptr);

protected:
    void closeEvent(QCloseEvent* e) override;

private:
    // --- model ---
    TestCatalog     m_catalog;
    TestSelection   m_selection{m_catalog};
    ConfigStore     m_store;
    SessionManager  m_session;
    RunLog          m_runLog;
    BinaryInstaller m_installer;
    SystemMonitor   m_monitor;
    QString         m_executable;

    // --- UI ---
    QLineEdit *tlEdit=nullptr, *ptEdit=nullptr, *memEdit=nullptr;
    QLabel    *infoLabel=nullptr, *validationLabel=nullptr;
    QTreeWidget* testTree=nullptr;
    QPushButton *btnSelectAll=nullptr, *btnDeselectAll=nullptr;
    QList<QPushButton*> presetButtons;
    QPushButton *btnStart=nullptr,*btnStop=nullptr,*btnClear=nullptr;
    QProgressBar* progress=nullptr; QLabel* eta=nullptr;
    DonutGauge *gCpu=nullptr,*gMem=nullptr;
    AnsiConsole* output=nullptr;

    QTimer monitorTimer;
    QElapsedTimer runTimer;
    std::optional<int> expectedSeconds;
    bool darkTheme=true;

    // --- UI setup ---
    void buildUi();
    void buildMenus();
    QWidget* buildConfigRow();
    QWidget* buildTestTable();
    QWidget* buildControls();
    void connectSignals();

    // --- theme ---
    void applyPaletteCommon(const QColor& base, const QColor& text, const QColor& track);
    void applyLightTheme();
    void applyDarkTheme();

    // --- selection / configuration ---
    void refreshTree();
    void itemChanged(QTreeWidgetItem* item, int column);
    void selectAllClicked();
    void deselectAllClicked();
    void presetClicked(PresetKind kind);
    void timeLimitEdited();
    void perTestEdited();
    void memoryEdited();
    void updateConfigDisplay();
    void showSelectionStatus();
    static std::optional<std::optional<int>> parseSeconds(const QString& text);

    // --- session ---
    void startClicked();
    void stopClicked();
    void sessionOutput();
    void sessionStateChanged(SessionManager::State s);
    void sessionFinished(int rc);
    void sessionFailed(const QString& reason);
    void terminationTimedOut();
    void resetRunUi();
    void tickProgress();
    void updateDashboard();

    // --- y-cruncher binary ---
    bool ensureExecutable();
    void locateExecutableDialog();
    void downloadExecutable();
    void installerFinished(const QString& path);
    void installerFailed(const QString& reason);
    void setExecutable(const QString& path);

    // --- files ---
    void saveSettings(bool quiet);
    void saveOutputAs();
    void openLogFolder();
    void aboutDialog();
};
