// Windows only: COM automation through ActiveQt.
#include "AutomationObject.hpp"
#include "Logging.hpp"
#include <QAxObject>
#include <QMetaMethod>
#include <QMetaObject>
#include <objbase.h>

namespace nhilabel {
namespace {

class AxAutomationObject final : public AutomationObject {
public:
    explicit AxAutomationObject(std::unique_ptr<QAxObject> obj) : obj_(std::move(obj)) {
        QObject::connect(obj_.get(), &QAxObject::exception,
            [this](int code, const QString& source, const QString& desc, const QString&){
                err_ = QString("%1 (0x%2): %3").arg(source).arg(code, 0, 16).arg(desc);
            });
    }

    bool hasMember(const QString& name) const override {
        const QMetaObject* mo = obj_->metaObject();
        const QByteArray n = name.toLatin1();
        if (mo->indexOfProperty(n.constData()) >= 0) return true;
        for (int i = mo->methodOffset(); i < mo->methodCount(); ++i)
            if (mo->method(i).name() == n) return true;
        return false;
    }

    QVariant call(const QString& method) override {
        err_.clear();
        return obj_->dynamicCall((method + "()").toLatin1().constData());
    }

    QVariant property(const QString& name) const override {
        return obj_->property(name.toLatin1().constData());
    }

    QString lastError() const override { return err_; }

private:
    std::unique_ptr<QAxObject> obj_;
    QString err_;
};

} // namespace

bool automationSupported(){ return true; }

AutomationApartment::AutomationApartment(){
    const HRESULT hr = CoInitializeEx(nullptr, COINIT_APARTMENTTHREADED);
    entered_ = SUCCEEDED(hr);
    if (!entered_)
        qCWarning(lcBinder) << "CoInitializeEx failed: 0x" + QString::number(static_cast<quint32>(hr), 16);
}

AutomationApartment::~AutomationApartment(){
    if (entered_) CoUninitialize();
}

AutomationFactory defaultAutomationFactory(){
    return [](const QString& progId, QString* err) -> std::unique_ptr<AutomationObject> {
        auto obj = std::make_unique<QAxObject>();
        if (!obj->setControl(progId) || obj->isNull()){
            if (err) *err = QString("CoCreateInstance failed for %1").arg(progId);
            qCWarning(lcBinder) << "Automation object" << progId << "could not be created";
            return nullptr;
        }
        return std::make_unique<AxAutomationObject>(std::move(obj));
    };
}

} // namespace nhilabel
