/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: Main window: test table, presets, duration
 *              fields, console and load gauges.
 * License: MIT
 * **********************************************************/

#include "MainWindow.h"
#include "AnsiConsole.h"
#include "AppInfo.h"
#include "BinaryLocator.h"
#include "DonutGauge.h"
#include "Logging.h"

#include <QtWidgets>
#include <algorithm>

MainWindow::MainWindow(const QString& configPath, const QString& executable, QWidget* parent)
    : QMainWindow(parent),
      m_store(configPath)
{
    setWindowTitle(QString::fromUtf8(APP_NAME));
    resize(860, 900);
    setMinimumSize(800, 600);

    const PersistedConfig cfg = m_store.load();
    m_selection.applyPersisted(cfg);

    buildUi();
    connectSignals();
    applyDarkTheme();
    refreshTree();
    updateConfigDisplay();
    monitorTimer.start(1000);

    const QString preferred = executable.isEmpty() ? cfg.executable : executable;
    if (auto found = BinaryLocator().locate(preferred)) setExecutable(*found);
    else output->appendTagged("y-cruncher not found. Use Tools > Download y-cruncher or Tools > Locate y-cruncher.",
                              AnsiConsole::Tag::Error);
}

// -----------------------------
// UI setup
// -----------------------------

void MainWindow::buildUi() {
    QWidget *central = new QWidget;
    QGridLayout *grid = new QGridLayout(central);
    grid->setContentsMargins(10,10,10,10);
    grid->setSpacing(8);

    buildMenus();

    QLabel* header = new QLabel(APP_NAME);
    QFont hf = header->font(); hf.setBold(true); hf.setPointSize(16); header->setFont(hf);
    grid->addWidget(header,0,0);

    grid->addWidget(buildConfigRow(),1,0);
    grid->addWidget(buildTestTable(),2,0);
    grid->addWidget(buildControls(),3,0);

    // Dashboard
    QWidget* dash = new QWidget; QHBoxLayout* dh = new QHBoxLayout(dash);
    dh->setContentsMargins(0,0,0,0);
    dh->addStretch(1);
    gCpu = new DonutGauge; gCpu->setLabel("CPU");    gCpu->setArcColor(QColor("#84cc16"));
    gMem = new DonutGauge; gMem->setLabel("MEMORY"); gMem->setArcColor(QColor("#f59e0b"));
    gMem->setAlertThreshold(0.95);
    dh->addWidget(gCpu); dh->addWidget(gMem);
    dh->addStretch(1);
    grid->addWidget(dash,4,0);

    // Console
    QGroupBox* consoleBox = new QGroupBox("Console Output");
    QVBoxLayout* cv = new QVBoxLayout(consoleBox);
    output = new AnsiConsole;
    cv->addWidget(output);
    grid->addWidget(consoleBox,5,0);

    grid->setRowStretch(2,1);
    grid->setRowStretch(5,3);
    setCentralWidget(central);

    statusBar()->showMessage("Ready - Select tests and click Start");
}

void MainWindow::buildMenus() {
    QMenu *mFile = menuBar()->addMenu("&File");
    QAction *actSave = mFile->addAction("Save Output As…");
    QAction *actSettings = mFile->addAction("Save Settings");
    QAction *actLog  = mFile->addAction("Open Log Folder");
    mFile->addSeparator();
    QAction *actExit = mFile->addAction("Exit");

    QMenu *mTools = menuBar()->addMenu("&Tools");
    QAction *actLocate = mTools->addAction("Locate y-cruncher…");
    QAction *actDownload = mTools->addAction("Download y-cruncher…");
    mTools->addSeparator();
    QMenu *mTheme = mTools->addMenu("Theme");
    QAction *actLight = mTheme->addAction("Light Mode"); actLight->setCheckable(true);
    QAction *actDark  = mTheme->addAction("Dark Mode");  actDark->setCheckable(true); actDark->setChecked(true);
    QActionGroup *themeGroup = new QActionGroup(this);
    themeGroup->addAction(actLight); themeGroup->addAction(actDark);

    QMenu *mHelp = menuBar()->addMenu("&Help");
    QAction *actAbout = mHelp->addAction("About");

    connect(actSave,&QAction::triggered,this,&MainWindow::saveOutputAs);
    connect(actSettings,&QAction::triggered,this,[this]{ saveSettings(false); });
    connect(actLog,&QAction::triggered,this,&MainWindow::openLogFolder);
    connect(actExit,&QAction::triggered,this,&MainWindow::close);
    connect(actLocate,&QAction::triggered,this,&MainWindow::locateExecutableDialog);
    connect(actDownload,&QAction::triggered,this,&MainWindow::downloadExecutable);
    connect(actLight,&QAction::triggered,this,&MainWindow::applyLightTheme);
    connect(actDark,&QAction::triggered,this,&MainWindow::applyDarkTheme);
    connect(actAbout,&QAction::triggered,this,&MainWindow::aboutDialog);
}

QWidget* MainWindow::buildConfigRow() {
    QGroupBox* box = new QGroupBox("Test Configuration");
    QGridLayout* gl = new QGridLayout(box);

    tlEdit  = new QLineEdit; tlEdit->setMaximumWidth(90);
    ptEdit  = new QLineEdit; ptEdit->setMaximumWidth(90);
    memEdit = new QLineEdit; memEdit->setMaximumWidth(70);
    tlEdit->setToolTip("Total time limit (-TL). \"Auto\" = 1800 s per selected test.");
    ptEdit->setToolTip("Duration of each test (-D). \"Auto\" = 120 s.");
    memEdit->setToolTip("Memory to allocate (-M). \"Auto\" lets y-cruncher decide.");

    gl->addWidget(new QLabel("Time Limit:"),0,0); gl->addWidget(tlEdit,0,1); gl->addWidget(new QLabel("sec"),0,2);
    gl->addWidget(new QLabel("Per Test:"),0,3);   gl->addWidget(ptEdit,0,4); gl->addWidget(new QLabel("sec"),0,5);
    gl->addWidget(new QLabel("Memory:"),0,6);     gl->addWidget(memEdit,0,7);
    gl->addWidget(new QLabel("example: 64M,128M ... 8G,16G"),0,8);
    gl->setColumnStretch(9,1);

    infoLabel = new QLabel;
    infoLabel->setStyleSheet("color:#666666;");
    validationLabel = new QLabel;
    validationLabel->setStyleSheet("color:#cc0000;");
    gl->addWidget(infoLabel,1,0,1,10);
    gl->addWidget(validationLabel,2,0,1,10);
    return box;
}

QWidget* MainWindow::buildTestTable() {
    QGroupBox* box = new QGroupBox("Test Components");
    QVBoxLayout* v = new QVBoxLayout(box);

    testTree = new QTreeWidget;
    testTree->setColumnCount(4);
    testTree->setHeaderLabels({QString(QChar(0x2713)), "Test", "Component", "CPU-RAM Load"});
    testTree->setRootIsDecorated(false);
    testTree->setSelectionMode(QAbstractItemView::NoSelection);
    testTree->setFont(QFontDatabase::systemFont(QFontDatabase::FixedFont));

    for (const auto& t : m_catalog.tests()) {
        auto* item = new QTreeWidgetItem(testTree);
        item->setFlags(Qt::ItemIsEnabled | Qt::ItemIsUserCheckable);
        item->setData(0, Qt::UserRole, t.id);
        item->setCheckState(0, Qt::Unchecked);
        item->setText(1, t.id);
        item->setText(2, t.displayName);
        item->setText(3, TestCatalog::loadBar(t));
        item->setToolTip(3, QString("CPU load: %1, RAM load: %2")
                                .arg(TestCatalog::loadLevelName(t.cpuLoad), TestCatalog::loadLevelName(t.ramLoad)));
    }
    for (int c = 0; c < 4; ++c) testTree->resizeColumnToContents(c);
    v->addWidget(testTree);
    return box;
}

QWidget* MainWindow::buildControls() {
    QWidget* top = new QWidget;
    QVBoxLayout* topv = new QVBoxLayout(top);
    topv->setContentsMargins(0,0,0,0);

    // Selection + presets
    QWidget* sel = new QWidget; QHBoxLayout* sh = new QHBoxLayout(sel);
    sh->setContentsMargins(0,0,0,0);
    btnSelectAll = new QPushButton("Select All");
    btnDeselectAll = new QPushButton("Deselect All");
    sh->addWidget(btnSelectAll); sh->addWidget(btnDeselectAll);
    sh->addSpacing(12);
    sh->addWidget(new QLabel("Presets:"));
    for (const auto& p : m_catalog.presets()) {
        auto* b = new QPushButton(p.name);
        b->setToolTip(p.description);
        b->setProperty("presetKind", int(p.kind));
        presetButtons << b;
        sh->addWidget(b);
    }
    sh->addStretch(1);
    topv->addWidget(sel);

    // Run controls
    QWidget* ctrl = new QWidget; QHBoxLayout* ch = new QHBoxLayout(ctrl);
    ch->setContentsMargins(0,0,0,0);
    btnStart = new QPushButton("Start Test");
    btnStop  = new QPushButton("Stop Test"); btnStop->setEnabled(false);
    btnClear = new QPushButton("Clear Output");
    ch->addWidget(btnStart); ch->addWidget(btnStop); ch->addWidget(btnClear); ch->addStretch(1);
    topv->addWidget(ctrl);

    // Progress
    QWidget* prog = new QWidget; QHBoxLayout* ph = new QHBoxLayout(prog);
    ph->setContentsMargins(0,0,0,0);
    ph->addWidget(new QLabel("Progress:"));
    progress = new QProgressBar; progress->setRange(0,100); progress->setValue(0);
    progress->setTextVisible(false);
    ph->addWidget(progress,1);
    eta = new QLabel("ETA: --:--");
    ph->addWidget(eta);
    topv->addWidget(prog);
    return top;
}

void MainWindow::connectSignals() {
    connect(&monitorTimer,&QTimer::timeout,this,&MainWindow::updateDashboard);

    connect(testTree,&QTreeWidget::itemChanged,this,&MainWindow::itemChanged);
    connect(tlEdit,&QLineEdit::editingFinished,this,&MainWindow::timeLimitEdited);
    connect(ptEdit,&QLineEdit::editingFinished,this,&MainWindow::perTestEdited);
    connect(memEdit,&QLineEdit::editingFinished,this,&MainWindow::memoryEdited);

    connect(btnSelectAll,&QPushButton::clicked,this,&MainWindow::selectAllClicked);
    connect(btnDeselectAll,&QPushButton::clicked,this,&MainWindow::deselectAllClicked);
    for (auto* b : presetButtons) {
        const auto kind = PresetKind(b->property("presetKind").toInt());
        connect(b,&QPushButton::clicked,this,[this,kind]{ presetClicked(kind); });
    }

    connect(btnStart,&QPushButton::clicked,this,&MainWindow::startClicked);
    connect(btnStop,&QPushButton::clicked,this,&MainWindow::stopClicked);
    connect(btnClear,&QPushButton::clicked,output,&AnsiConsole::clearConsole);

    connect(&m_session,&SessionManager::outputReady,this,&MainWindow::sessionOutput);
    connect(&m_session,&SessionManager::stateChanged,this,&MainWindow::sessionStateChanged);
    connect(&m_session,&SessionManager::finished,this,&MainWindow::sessionFinished);
    connect(&m_session,&SessionManager::failed,this,&MainWindow::sessionFailed);
    connect(&m_session,&SessionManager::terminationTimedOut,this,&MainWindow::terminationTimedOut);

    connect(&m_installer,&BinaryInstaller::progress,this,[this](qint64 got, qint64 total){
        if (total > 0) statusBar()->showMessage(QString("Downloading y-cruncher… %1%").arg(got*100/total));
        else statusBar()->showMessage(QString("Downloading y-cruncher… %1 KiB").arg(got/1024));
    });
    connect(&m_installer,&BinaryInstaller::finished,this,&MainWindow::installerFinished);
    connect(&m_installer,&BinaryInstaller::failed,this,&MainWindow::installerFailed);
}

// -----------------------------
// Theme
// -----------------------------

void MainWindow::applyPaletteCommon(const QColor& base, const QColor& text, const QColor& track) {
    QPalette pal = qApp->palette();
    pal.setColor(QPalette::Window, base);
    pal.setColor(QPalette::Base, base.lighter(105));
    pal.setColor(QPalette::Text, text);
    pal.setColor(QPalette::WindowText, text);
    pal.setColor(QPalette::ButtonText, text);
    pal.setColor(QPalette::Button, base.lighter(102));
    qApp->setPalette(pal);
    setAutoFillBackground(true);

    for (auto* g : {gCpu,gMem}) {
        g->setTrackColor(track);
        g->setTextColor(text);
    }
    output->setDark(darkTheme);
}

void MainWindow::applyLightTheme() {
    darkTheme = false;
    applyPaletteCommon(QColor("#EFEFEF"), QColor("#111827"), QColor("#c7ced6"));
}

void MainWindow::applyDarkTheme() {
    darkTheme = true;
    applyPaletteCommon(QColor("#1f2937"), QColor("#E5E7EB"), QColor("#0b1620"));
}

// -----------------------------
// Selection / configuration
// -----------------------------

void MainWindow::refreshTree() {
    QSignalBlocker block(testTree);
    for (int i = 0; i < testTree->topLevelItemCount(); ++i) {
        auto* item = testTree->topLevelItem(i);
        const QString id = item->data(0, Qt::UserRole).toString();
        item->setCheckState(0, m_selection.isSelected(id) ? Qt::Checked : Qt::Unchecked);
    }
}

void MainWindow::itemChanged(QTreeWidgetItem* item, int column) {
    if (column != 0) return;
    m_selection.setSelected(item->data(0, Qt::UserRole).toString(), item->checkState(0) == Qt::Checked);
    updateConfigDisplay();
    showSelectionStatus();
}

void MainWindow::selectAllClicked() {
    m_selection.selectAll();
    refreshTree();
    updateConfigDisplay();
    showSelectionStatus();
}

void MainWindow::deselectAllClicked() {
    m_selection.deselectAll();
    refreshTree();
    updateConfigDisplay();
    showSelectionStatus();
}

void MainWindow::presetClicked(PresetKind kind) {
    m_selection.applyPreset(kind);
    refreshTree();
    updateConfigDisplay();
    const Preset& p = m_catalog.preset(kind);
    statusBar()->showMessage(QString("Applied %1 preset: %2 (%3 tests selected)")
                                 .arg(p.name, p.description).arg(m_selection.count()));
}

void MainWindow::showSelectionStatus() {
    const int n = m_selection.count();
    statusBar()->showMessage(n > 0 ? QString("Ready - %1 test(s) selected").arg(n)
                                   : QString("Ready - Select tests and click Start"));
}

// "Auto" -> nullopt, positive integer -> value, anything else -> no result
std::optional<std::optional<int>> MainWindow::parseSeconds(const QString& text) {
    const QString t = text.trimmed();
    if (t.isEmpty() || t.compare("auto", Qt::CaseInsensitive) == 0) return std::optional<int>();
    bool ok = false;
    const int n = t.toInt(&ok);
    if (!ok || n <= 0) return std::nullopt;
    return std::optional<int>(n);
}

void MainWindow::timeLimitEdited() {
    // the auto value shown in the field is not a manual override
    if (!m_selection.isTimeLimitManual() && tlEdit->text().trimmed() == QString::number(m_selection.timeLimitSeconds())) return;

    auto v = parseSeconds(tlEdit->text());
    if (!v || !m_selection.setTimeLimit(*v)) {
        validationLabel->setText(QString("Time Limit must be 1-%1 seconds or \"Auto\"").arg(TestSelection::MaxTimeLimit));
        QTimer::singleShot(5000, validationLabel, &QLabel::clear);
    }
    updateConfigDisplay();
}

void MainWindow::perTestEdited() {
    auto v = parseSeconds(ptEdit->text());
    if (!v || !m_selection.setPerTestDuration(*v)) {
        validationLabel->setText(QString("Per Test must be 1-%1 seconds or \"Auto\"").arg(TestSelection::MaxPerTestDuration));
        QTimer::singleShot(5000, validationLabel, &QLabel::clear);
    }
    updateConfigDisplay();
}

void MainWindow::memoryEdited() {
    if (!m_selection.setMemory(memEdit->text())) {
        validationLabel->setText("Memory must look like 512M, 8G or \"Auto\"");
        QTimer::singleShot(5000, validationLabel, &QLabel::clear);
    }
    updateConfigDisplay();
}

void MainWindow::updateConfigDisplay() {
    const int n = m_selection.count();
    const int tl = m_selection.timeLimitSeconds();

    if (m_selection.isTimeLimitManual()) tlEdit->setText(QString::number(*m_selection.manualTimeLimit()));
    else tlEdit->setText(n > 0 ? QString::number(tl) : QString("Auto"));

    const auto pt = m_selection.manualPerTestDuration();
    ptEdit->setText(pt ? QString::number(*pt) : QString("Auto"));
    memEdit->setText(m_selection.memory().isEmpty() ? QString("Auto") : m_selection.memory());

    if (n == 0) {
        infoLabel->setText("No tests selected");
        return;
    }

    if (m_selection.timeLimitCorrected()) {
        validationLabel->setText(QString("Time Limit auto-corrected to %1 sec (minimum required for %2 tests)")
                                     .arg(tl).arg(n));
        QTimer::singleShot(5000, validationLabel, &QLabel::clear);
    }

    const QString duration = pt ? QString("Per Test: %1 sec").arg(*pt)
                                : QString("Per Test: Auto (default: %1 sec)").arg(TestSelection::DefaultPerTestDuration);
    infoLabel->setText(QString("Time Limit: %1 sec%2 | %3 | Based on %4 selected tests")
                           .arg(tl)
                           .arg(m_selection.isTimeLimitManual() ? "" : " (auto)")
                           .arg(duration)
                           .arg(n));
}

// -----------------------------
// Session
// -----------------------------

void MainWindow::startClicked() {
    if (m_session.isActive()) {
        QMessageBox::warning(this,"Busy","A test is already running.");
        return;
    }
    const RunConfig rc = m_selection.runConfig();
    if (rc.tests.isEmpty()) {
        QMessageBox::warning(this,"Selection Error","Please select at least one component!");
        return;
    }
    if (!ensureExecutable()) return;

    const auto err = m_session.start(rc);
    if (err != SessionManager::Error::None) {
        const QString msg = SessionManager::errorString(err)
                          + (m_session.lastError().isEmpty() ? QString() : ": " + m_session.lastError());
        output->appendTagged("Error: " + msg, AnsiConsole::Tag::Error);
        statusBar()->showMessage("Error: " + msg);
        QMessageBox::critical(this,"Error",msg);
        return;
    }

    const QStringList cmd = m_session.lastCommand();
    if (!m_runLog.open(logDirPath(), "stress", cmd))
        output->appendTagged("Warning: cannot write run log in " + logDirPath(), AnsiConsole::Tag::Error);

    output->appendTagged("Starting: " + cmd.join(' '), AnsiConsole::Tag::Command);
    output->appendTagged(QString("Using calculated values based on %1 selected tests").arg(rc.tests.size()),
                         AnsiConsole::Tag::Info);

    gCpu->resetPeak(); gMem->resetPeak();
    expectedSeconds = rc.timeLimitSeconds;
    runTimer.restart();
    progress->setRange(0, *expectedSeconds);
    progress->setValue(0);
    eta->setText("ETA: calculating…");
    statusBar()->showMessage(QString("Running stress test with %1 components…").arg(rc.tests.size()));
    QTimer::singleShot(200, this, &MainWindow::tickProgress);
}

void MainWindow::stopClicked() {
    if (m_session.state() != SessionManager::State::Running) return;
    output->appendTagged("Stopping… attempting graceful termination.", AnsiConsole::Tag::Info);
    m_session.stop();
}

void MainWindow::sessionOutput() {
    const QStringList lines = m_session.takeOutput();
    for (const QString& l : lines) output->appendAnsi(l);
    m_runLog.append(lines);
}

void MainWindow::sessionStateChanged(SessionManager::State s) {
    const bool active = s == SessionManager::State::Running || s == SessionManager::State::Stopping;
    btnStart->setEnabled(!active);
    btnStop->setEnabled(s == SessionManager::State::Running);
    if (s == SessionManager::State::Stopping) statusBar()->showMessage("Stopping…");
    if (!active) resetRunUi();
}

void MainWindow::sessionFinished(int rc) {
    sessionOutput();
    if (rc != 0) output->appendTagged(QString("> Process exited with code: %1").arg(rc), AnsiConsole::Tag::Error);
    output->appendTagged("> Test completed or stopped.", AnsiConsole::Tag::Info);
    m_runLog.closeWithExit(rc);
    statusBar()->showMessage(QString("Finished with return code %1 - Ready for new test").arg(rc));
}

void MainWindow::sessionFailed(const QString& reason) {
    sessionOutput();
    output->appendTagged("Error: " + reason, AnsiConsole::Tag::Error);
    m_runLog.closeWithFailure(reason);
    statusBar()->showMessage("Error: " + reason);
    QMessageBox::warning(this,"Test Failed",reason);
}

void MainWindow::terminationTimedOut() {
    const QString msg = QString("y-cruncher ignored the terminate request for %1 s and was force-killed. "
                                "If it is still running, end it manually (e.g. pkill -f y-cruncher).")
                            .arg(m_session.gracePeriod()/1000.0);
    output->appendTagged(msg, AnsiConsole::Tag::Error);
    statusBar()->showMessage("Forced termination - check that y-cruncher is gone");
}

void MainWindow::resetRunUi() {
    expectedSeconds.reset();
    progress->setRange(0,100); progress->setValue(0);
    eta->setText("ETA: --:--");
}

void MainWindow::tickProgress() {
    if (!m_session.isActive()) return;
    if (expectedSeconds.has_value() && *expectedSeconds > 0) {
        int elapsed = int(runTimer.elapsed()/1000.0);
        progress->setValue(std::min(*expectedSeconds, std::max(0, elapsed)));
        int remain = std::max(0, *expectedSeconds - elapsed);
        int hh = remain/3600, mm = (remain/60)%60, ss = remain%60;
        eta->setText(QString("ETA: %1:%2:%3").arg(hh,2,10,QChar('0')).arg(mm,2,10,QChar('0')).arg(ss,2,10,QChar('0')));
    }
    QTimer::singleShot(200, this, &MainWindow::tickProgress);
}

void MainWindow::updateDashboard() {
    double c = m_monitor.sampleCpu();
    gCpu->setValue(c/100.0, "");

    const MemInfo m = m_monitor.sampleMemory();
    gMem->setValue(SystemMonitor::memPercent(m)/100.0,
                   QString("%1 GiB / %2 GiB").arg(QString::number(m.usedGiB(),'f',1), QString::number(m.totalGiB(),'f',1)));
}

// -----------------------------
// y-cruncher binary
// -----------------------------

bool MainWindow::ensureExecutable() {
    if (BinaryLocator::isUsable(m_executable)) return true;
    if (auto found = BinaryLocator().locate(m_executable)) { setExecutable(*found); return true; }

    auto r = QMessageBox::question(this,"y-cruncher not found",
                                   "y-cruncher was not found.\n\nDownload it now from numberworld.org?");
    if (r == QMessageBox::Yes) downloadExecutable();
    return false;
}

void MainWindow::setExecutable(const QString& path) {
    m_executable = path;
    m_session.setExecutable(path);
    output->appendTagged("Using y-cruncher: " + path, AnsiConsole::Tag::Info);
    qCInfo(lcUi) << "Using executable" << path;
}

void MainWindow::locateExecutableDialog() {
    QString fn = QFileDialog::getOpenFileName(this,"Locate y-cruncher",
                                              m_executable.isEmpty() ? QDir::currentPath() : QFileInfo(m_executable).absolutePath());
    if (fn.isEmpty()) return;
    if (!BinaryLocator::isUsable(fn)) {
        QMessageBox::critical(this,"Locate y-cruncher", fn + "\nis not an executable file.");
        return;
    }
    setExecutable(fn);
}

void MainWindow::downloadExecutable() {
    if (m_installer.isBusy()) {
        QMessageBox::information(this,"Download","A download is already in progress.");
        return;
    }
    const QString target = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    auto r = QMessageBox::question(this,"Download y-cruncher",
                                   QString("Download y-cruncher from\n%1\n\ninto\n%2 ?")
                                       .arg(QUrl(BinaryInstaller::DefaultUrl).toDisplayString(), target));
    if (r != QMessageBox::Yes) return;
    output->appendTagged("Downloading y-cruncher…", AnsiConsole::Tag::Info);
    m_installer.install(QUrl(BinaryInstaller::DefaultUrl), target);
}

void MainWindow::installerFinished(const QString& path) {
    setExecutable(path);
    saveSettings(true);
    statusBar()->showMessage("y-cruncher installed");
}

void MainWindow::installerFailed(const QString& reason) {
    output->appendTagged("Download failed: " + reason, AnsiConsole::Tag::Error);
    statusBar()->showMessage("Download failed");
    QMessageBox::critical(this,"Download y-cruncher",reason);
}

// -----------------------------
// Files
// -----------------------------

void MainWindow::saveSettings(bool quiet) {
    PersistedConfig cfg = m_selection.toPersisted();
    cfg.executable = m_executable;
    QString err;
    if (!m_store.save(cfg, &err)) {
        statusBar()->showMessage("Could not save settings: " + err);
        return;
    }
    if (!quiet) statusBar()->showMessage("Settings saved to " + m_store.path());
}

void MainWindow::saveOutputAs() {
    QString fn = QFileDialog::getSaveFileName(this,"Save Output As", QDir::homePath()+"/output.txt",
                                              "Text files (*.txt);;All files (*)");
    if (fn.isEmpty()) return;
    QSaveFile f(fn);
    if (!f.open(QIODevice::WriteOnly|QIODevice::Text)) {
        QMessageBox::critical(this,"Save Error","Cannot write file.");
        return;
    }
    QTextStream ts(&f); ts << output->toPlainText(); ts.flush();
    if (!f.commit()) {
        QMessageBox::critical(this,"Save Error","Cannot write file.");
        return;
    }
    QMessageBox::information(this,"Save Output", "Saved to:\n"+fn);
}

void MainWindow::openLogFolder() {
    QDesktopServices::openUrl(QUrl::fromLocalFile(logDirPath()));
}

void MainWindow::aboutDialog() {
    QMessageBox::about(this, "About",
        QString("<b>%1</b> %2 (%3)<br>%4<br><br>"
                "Front-end for the y-cruncher stress test.<br>"
                "Stopping sends SIGTERM to y-cruncher's process group and SIGKILL after %5 s.<br>"
                "If this window is killed abruptly, y-cruncher keeps running and must be ended manually.")
            .arg(QString(APP_NAME), QString(VERSION), QString(REVISION), QString(AUTHOR))
            .arg(SessionManager::DefaultGraceMs/1000));
}

void MainWindow::closeEvent(QCloseEvent* e) {
    if (m_session.isActive()) {
        auto r = QMessageBox::question(this,"Exit","A test is running. Stop it and exit?");
        if (r != QMessageBox::Yes) { e->ignore(); return; }
        output->appendTagged("Stopping running test before exit…", AnsiConsole::Tag::Info);
        m_session.stop();   // the session's destructor waits for the child
        m_runLog.closeWithFailure("window closed during the run");
    }
    m_installer.cancel();
    saveSettings(true);
    QMainWindow::closeEvent(e);
}
