#include "mainwindow.hpp"
#include <QToolBar>
#include <QAction>
#include <QApplication>
#include <QCoreApplication>
#include <QDateTime>
#include <QFormLayout>
#include <QMessageBox>
#include <QStatusBar>
#include <QVBoxLayout>
#include "ControlProgram.hpp"
#include "LabelPrinter.hpp"
#include "Logging.hpp"
#include "ManualEntryDialog.hpp"
#include "SerialPortProbe.hpp"

using namespace nhilabel;

static QLabel* makeValue(){ auto* l = new QLabel("-"); l->setTextInteractionFlags(Qt::TextSelectableByMouse); return l; }
static QString timestamp(){ return QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss"); }

MainWindow::MainWindow(AppConfig cfg)
    : cfg_(std::move(cfg)), renderer_(cfg_.label) {
    setWindowTitle(tr("NHI Card Label Printer"));
    resize(900, 600);

    auto* tb = addToolBar("Main");
    auto aRead   = tb->addAction(tr("Read Card"));
    auto aPrint  = tb->addAction(tr("Print"));
    auto aManual = tb->addAction(tr("Manual Entry"));
    auto aClear  = tb->addAction(tr("Clear"));
    tb->addSeparator();
    auto aStats  = tb->addAction(tr("Statistics"));
    auto aCheck  = tb->addAction(tr("Recheck Driver"));
    auto aPort   = tb->addAction(tr("Detect Port"));

    aRead->setShortcut(QKeySequence(Qt::Key_F5));
    aPrint->setShortcut(QKeySequence::Print);

    connect(aRead,&QAction::triggered,this,&MainWindow::onReadCard);
    connect(aPrint,&QAction::triggered,this,&MainWindow::onPrint);
    connect(aManual,&QAction::triggered,this,&MainWindow::onManualEntry);
    connect(aClear,&QAction::triggered,this,&MainWindow::onClear);
    connect(aStats,&QAction::triggered,this,&MainWindow::onStatistics);
    connect(aCheck,&QAction::triggered,this,&MainWindow::onRecheckDriver);
    connect(aPort,&QAction::triggered,this,&MainWindow::onDetectPort);

    auto* panel = new QWidget;
    auto* form = new QFormLayout;
    idValue_ = makeValue(); nameValue_ = makeValue(); dobValue_ = makeValue();
    sexValue_ = makeValue(); cardValue_ = makeValue(); sourceValue_ = makeValue();
    form->addRow(tr("ID number"), idValue_);
    form->addRow(tr("Name"), nameValue_);
    form->addRow(tr("Birth date"), dobValue_);
    form->addRow(tr("Sex"), sexValue_);
    form->addRow(tr("Card number"), cardValue_);
    form->addRow(tr("Source"), sourceValue_);
    note_ = new QLineEdit;
    copies_ = new QSpinBox; copies_->setRange(1, 20); copies_->setValue(1);
    form->addRow(tr("Note"), note_);
    form->addRow(tr("Copies"), copies_);
    auto* pl = new QVBoxLayout(panel);
    pl->addLayout(form);
    pl->addStretch();

    auto* split = new QSplitter;
    log_ = new QTextEdit; log_->setReadOnly(true);
    split->addWidget(panel);
    split->addWidget(log_);
    split->setStretchFactor(1, 1);
    setCentralWidget(split);

    status_ = new QLabel(tr("Ready")); statusBar()->addWidget(status_, 1);
    prog_ = new QProgressBar; prog_->setMinimum(0); prog_->setMaximum(0); prog_->setVisible(false);
    statusBar()->addPermanentWidget(prog_);

    try {
        records_ = std::make_unique<RecordLog>(cfg_.recordDir);
    } catch (const RecordLogError& ex) {
        log(tr("Record log disabled: %1").arg(QString::fromLocal8Bit(ex.what())));
    }

    const auto sources = CandidateSources::defaults(cfg_.reader.dllPath, QCoreApplication::applicationDirPath());
    orch_ = std::make_unique<AcquisitionOrchestrator>(
        makeBackendFactory(cfg_.reader, sources),
        CardDataDecoder(cfg_.reader.textEncoding, cfg_.reader.basicData),
        deviceLock_);

    connect(qApp, &QCoreApplication::aboutToQuit, this, [this]{
        if (orch_) orch_->wait();
    });

    log(tr("Configuration: %1").arg(cfg_.sourceFile.isEmpty() ? tr("defaults") : cfg_.sourceFile));
    checkDriver(false);
}

MainWindow::~MainWindow() = default;

void MainWindow::log(const QString& s){
    log_->append(QString("[%1] %2").arg(QTime::currentTime().toString("hh:mm:ss"), s));
    qCInfo(lcApp).noquote() << s;
}

void MainWindow::setBusy(bool busy){
    prog_->setVisible(busy);
    if (busy) status_->setText(tr("Reading card..."));
}

bool MainWindow::checkDriver(bool interactive){
    if (orch_->state()==AcquisitionOrchestrator::State::Reading){
        status_->setText(tr("A card read is in progress, try again when it finishes"));
        return false;
    }
    try {
        orch_->rebind();
        const QString desc = orch_->backendDescription();
        log(tr("Card reader: %1").arg(desc));
        status_->setText(desc.left(80));
        if (interactive) QMessageBox::information(this, tr("Card reader"), desc);
        return true;
    } catch (const NativeLibraryError& ex) {
        const QString remedy = remediationText(ex.category(), ex.checkedPaths());
        log(tr("Card reader unavailable (%1): %2").arg(categoryName(ex.category()), ex.message()));
        status_->setText(ex.message().left(80));
        if (interactive){
            QMessageBox box(QMessageBox::Warning, tr("Card reader"), ex.message(), QMessageBox::Ok, this);
            box.setDetailedText(remedy);
            box.exec();
        }
    } catch (const std::exception& ex) {
        log(tr("Card reader check failed: %1").arg(QString::fromLocal8Bit(ex.what())));
        if (interactive) QMessageBox::critical(this, tr("Card reader"), QString::fromLocal8Bit(ex.what()));
    }
    return false;
}

void MainWindow::onReadCard(){
    setBusy(true);
    orch_->startAcquisition(
        [this](const PatientRecord& rec){
            QMetaObject::invokeMethod(this, [this, rec]{ onCardRead(rec); }, Qt::QueuedConnection);
        },
        [this](const AcquisitionFailure& f){
            QMetaObject::invokeMethod(this, [this, f]{ onReadFailed(f); }, Qt::QueuedConnection);
        });
}

void MainWindow::onCardRead(const PatientRecord& rec){
    setBusy(false);
    current_ = toLabelFields(rec, note_->text().trimmed());
    currentOffline_ = false;
    showPatient();
    sourceValue_->setText(rec.source());
    status_->setText(tr("Card read: %1").arg(rec.idNumber()));
    log(tr("Read %1 %2 via %3").arg(rec.idNumber(), rec.fullName(), rec.source()));
    record(0, "read");
}

void MainWindow::onReadFailed(const AcquisitionFailure& f){
    if (f.category==ErrorCategory::Busy){
        status_->setText(f.shortText());
        return;
    }
    setBusy(false);
    status_->setText(f.shortText());
    log(tr("Read failed [%1]: %2 (%3)").arg(categoryName(f.category), f.message, f.context));

    if (f.category==ErrorCategory::OfflinePlaceholder){
        openManualEntry(f.message);
        return;
    }
    if (f.category==ErrorCategory::ConfigurationAbsent || f.category==ErrorCategory::BindingFailed
        || f.category==ErrorCategory::DeviceCallFailed){
        if (launchControlProgram(cfg_.reader.controlProgramPath))
            log(tr("Started the card reader control program"));
    }

    QMessageBox box(QMessageBox::Warning, tr("Card read failed"), f.message, QMessageBox::Ok, this);
    box.setInformativeText(isRetryable(f.category) ? tr("You can retry the read.") : QString());
    box.setDetailedText(f.fullText());
    box.exec();
}

void MainWindow::onManualEntry(){
    openManualEntry(QString());
}

void MainWindow::openManualEntry(const QString& reason){
    ManualEntryDialog dlg(reason, this);
    if (dlg.exec()!=QDialog::Accepted) return;
    current_ = dlg.fields();
    if (!current_->note.isEmpty()) note_->setText(current_->note);
    currentOffline_ = true;
    showPatient();
    sourceValue_->setText(tr("manual entry"));
    log(tr("Manual entry %1 %2").arg(current_->id, current_->name));
    record(0, "manual-entry");
}

void MainWindow::showPatient(){
    auto show = [](QLabel* l, const QString& v){ l->setText(v.isEmpty() ? "-" : v); };
    show(idValue_, current_ ? current_->id : QString());
    show(nameValue_, current_ ? current_->name : QString());
    show(dobValue_, current_ ? current_->dob : QString());
    show(sexValue_, current_ ? current_->sex : QString());
    show(cardValue_, current_ ? current_->cardNo : QString());
}

void MainWindow::record(int count, const QString& operation){
    if (!records_ || !current_) return;
    try {
        records_->logOperation(*current_, timestamp(), count,
                               currentOffline_ && operation!="manual-entry" ? operation + " (offline)" : operation);
    } catch (const RecordLogError& ex) {
        log(tr("Could not write the record log: %1").arg(QString::fromLocal8Bit(ex.what())));
    }
}

void MainWindow::onPrint(){
    if (!current_){
        QMessageBox::warning(this, tr("Print"), tr("Read a card or enter the data manually first."));
        return;
    }
    current_->note = note_->text().trimmed();
    const int copies = copies_->value();
    try {
        LabelPrinter printer(renderer_, this);
        if (!printer.print(*current_, copies)){
            status_->setText(tr("Printing cancelled"));
            return;
        }
    } catch (const LabelError& ex) {
        log(tr("Printing failed: %1").arg(QString::fromLocal8Bit(ex.what())));
        QMessageBox::critical(this, tr("Print"), QString::fromLocal8Bit(ex.what()));
        return;
    }
    log(tr("Printed %1 label(s) for %2").arg(copies).arg(current_->id));
    status_->setText(tr("Printed %1 label(s)").arg(copies));
    record(copies, "print");
}

void MainWindow::onClear(){
    current_.reset();
    currentOffline_ = false;
    note_->clear();
    copies_->setValue(1);
    showPatient();
    sourceValue_->setText("-");
    status_->setText(tr("Ready"));
}

void MainWindow::onStatistics(){
    if (!records_){
        QMessageBox::warning(this, tr("Statistics"), tr("The record log is not available."));
        return;
    }
    try {
        const RecordStats s = records_->statistics();
        QMessageBox::information(this, tr("Today's statistics"),
            tr("Card reads: %1\nPrint jobs: %2\nLabels printed: %3\nTotal operations: %4")
                .arg(s.reads).arg(s.prints).arg(s.labels).arg(s.total));
    } catch (const RecordLogError& ex) {
        QMessageBox::critical(this, tr("Statistics"), QString::fromLocal8Bit(ex.what()));
    }
}

void MainWindow::onRecheckDriver(){
    checkDriver(true);
}

void MainWindow::onDetectPort(){
    const auto port = SerialPortProbe::detect(cfg_.reader.comPort);
    if (!port){
        QMessageBox::warning(this, tr("Detect port"), tr("No serial port was found."));
        return;
    }
    log(tr("Detected reader port COM%1").arg(*port));
    if (*port==cfg_.reader.comPort){
        status_->setText(tr("Reader port COM%1 is already configured").arg(*port));
        return;
    }
    cfg_.saveComPort(*port);
    QMessageBox::information(this, tr("Detect port"),
        tr("Reader port COM%1 was saved to the configuration. Restart the program to use it.").arg(*port));
}
