#include "ManualEntryDialog.hpp"
#include <QComboBox>
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QLabel>
#include <QLineEdit>
#include <QMessageBox>
#include <QRegularExpressionValidator>
#include <QVBoxLayout>

using namespace nhilabel;

ManualEntryDialog::ManualEntryDialog(const QString& reason, QWidget* parent) : QDialog(parent) {
    setWindowTitle(tr("Manual entry"));

    id_ = new QLineEdit;
    id_->setValidator(new QRegularExpressionValidator(QRegularExpression("[A-Za-z][0-9]{0,9}"), id_));
    id_->setPlaceholderText("A123456789");
    name_ = new QLineEdit;
    dob_ = new QLineEdit;
    dob_->setPlaceholderText(tr("YYYYMMDD or YYYMMDD (ROC)"));
    sex_ = new QComboBox;
    sex_->addItem(QString(), QString());
    sex_->addItem(sexLabel(Sex::Male), "M");
    sex_->addItem(sexLabel(Sex::Female), "F");
    note_ = new QLineEdit;

    auto* form = new QFormLayout;
    form->addRow(tr("ID number"), id_);
    form->addRow(tr("Name"), name_);
    form->addRow(tr("Birth date"), dob_);
    form->addRow(tr("Sex"), sex_);
    form->addRow(tr("Note"), note_);

    auto* buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel);
    connect(buttons, &QDialogButtonBox::accepted, this, &ManualEntryDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &ManualEntryDialog::reject);

    auto* lay = new QVBoxLayout(this);
    if (!reason.isEmpty()){
        auto* why = new QLabel(reason);
        why->setWordWrap(true);
        lay->addWidget(why);
    }
    lay->addLayout(form);
    lay->addWidget(buttons);
}

void ManualEntryDialog::accept(){
    if (!isNationalId(id_->text().trimmed().toUpper())){
        QMessageBox::warning(this, tr("Manual entry"), tr("The ID number must be one letter followed by nine digits."));
        id_->setFocus();
        return;
    }
    if (name_->text().trimmed().isEmpty()){
        QMessageBox::warning(this, tr("Manual entry"), tr("The name is required."));
        name_->setFocus();
        return;
    }
    const QString dob = dob_->text().trimmed();
    if (!dob.isEmpty() && !normalizeBirthDate(dob).recognized){
        if (QMessageBox::question(this, tr("Manual entry"),
                                  tr("The birth date \"%1\" is not a recognized date. Keep it as typed?").arg(dob))
                != QMessageBox::Yes) return;
    }
    QDialog::accept();
}

LabelFields ManualEntryDialog::fields() const {
    LabelFields f;
    f.id = id_->text().trimmed().toUpper();
    f.name = name_->text().trimmed();
    f.dob = normalizeBirthDate(dob_->text()).text;
    f.sex = sexLabel(parseSex(sex_->currentData().toString()));
    if (sex_->currentData().toString().isEmpty()) f.sex.clear();
    f.note = note_->text().trimmed();
    return f;
}
