#pragma once
#include <QMainWindow>
#include <QTextEdit>
#include <QProgressBar>
#include <QLabel>
#include <QLineEdit>
#include <QSpinBox>
#include <QSplitter>
#include <memory>
#include <mutex>
#include <optional>
#include "AcquisitionOrchestrator.hpp"
#include "AppConfig.hpp"
#include "LabelRenderer.hpp"
#include "RecordLog.hpp"

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(nhilabel::AppConfig cfg);
    ~MainWindow() override;

private slots:
    void onReadCard();
    void onPrint();
    void onManualEntry();
    void onClear();
    void onStatistics();
    void onRecheckDriver();
    void onDetectPort();

private:
    void onCardRead(const nhilabel::PatientRecord& rec);
    void onReadFailed(const nhilabel::AcquisitionFailure& f);
    void openManualEntry(const QString& reason);
    void showPatient();
    void record(int count, const QString& operation);
    bool checkDriver(bool interactive);
    void setBusy(bool busy);
    void log(const QString& s);

    nhilabel::AppConfig cfg_;
    std::mutex deviceLock_;
    std::unique_ptr<nhilabel::AcquisitionOrchestrator> orch_;
    std::unique_ptr<nhilabel::RecordLog> records_;
    nhilabel::LabelRenderer renderer_;

    std::optional<nhilabel::LabelFields> current_;
    bool currentOffline_ = false;

    QLabel* idValue_;
    QLabel* nameValue_;
    QLabel* dobValue_;
    QLabel* sexValue_;
    QLabel* cardValue_;
    QLabel* sourceValue_;
    QLineEdit* note_;
    QSpinBox* copies_;
    QTextEdit* log_;
    QLabel* status_;
    QProgressBar* prog_;
};
