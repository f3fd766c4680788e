#pragma once
#include <QDialog>
#include "PatientRecord.hpp"

class QComboBox;
class QLineEdit;

// Patient data typed in by the operator when no card can be read.
class ManualEntryDialog : public QDialog {
    Q_OBJECT
public:
    explicit ManualEntryDialog(const QString& reason, QWidget* parent = nullptr);

    nhilabel::LabelFields fields() const;

public slots:
    void accept() override;

private:
    QLineEdit* id_;
    QLineEdit* name_;
    QLineEdit* dob_;
    QComboBox* sex_;
    QLineEdit* note_;
};
