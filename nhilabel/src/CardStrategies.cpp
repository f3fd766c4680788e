#include "CardStrategies.hpp"
#include "AutomationObject.hpp"
#include "Logging.hpp"
#include <QThread>
#include <vector>

namespace nhilabel {

VendorErrorTable::VendorErrorTable(){
    messages_ = {
        {4000, "Reader timeout"},
        {4001, "Serial port open failed"},
        {4012, "Secure access module card not inserted"},
        {4013, "Card not inserted or read failed"},
        {4029, "Card access rights insufficient"},
        {4033, "Inserted card is not an NHI card"},
        {4050, "Secure module authentication failed"},
        {4061, "Network unreachable"},
        {4071, "Card authentication against the IDC failed"},
    };
}

void VendorErrorTable::merge(const QMap<int, QString>& overrides){
    for (auto it = overrides.cbegin(); it != overrides.cend(); ++it) messages_.insert(it.key(), it.value());
}

QString VendorErrorTable::describe(int code) const {
    auto it = messages_.find(code);
    if (it != messages_.end()) return QString("%1 (code %2)").arg(*it).arg(code);
    return QString("Call failed, code %1").arg(code);
}

// --- A ---

BasicDataStrategy::BasicDataStrategy(NativeApi api, BasicDataLayout layout, VendorErrorTable errors)
    : api_(api), layout_(layout), errors_(std::move(errors)) {}

StrategyResult BasicDataStrategy::acquire(){
    if (!api_.hisGetBasicData)
        return StrategyResult::failure(ErrorCategory::DeviceCallFailed, "hisGetBasicData is not exported");

    std::vector<char> buf(static_cast<size_t>(layout_.bufferSize), '\0');
    int len = layout_.bufferSize;

    // The driver settles internally before and after the transfer; match its pace.
    if (layout_.preSettleMs > 0) QThread::msleep(static_cast<unsigned long>(layout_.preSettleMs));
    qCInfo(lcStrategy) << "Calling hisGetBasicData, buffer" << len << "bytes";
    const int rc = api_.hisGetBasicData(buf.data(), &len);
    if (layout_.postSettleMs > 0) QThread::msleep(static_cast<unsigned long>(layout_.postSettleMs));

    if (rc != 0){
        const QString msg = errors_.describe(rc);
        qCWarning(lcStrategy) << "hisGetBasicData returned" << rc << "-" << msg;
        return StrategyResult::failure(ErrorCategory::DeviceCallFailed, msg, rc);
    }
    if (len <= 0 || len > layout_.bufferSize) len = layout_.bufferSize;

    RawCardData d;
    d.format = BlobFormat::BasicData;
    d.blob = QByteArray(buf.data(), len);
    d.strategy = name();
    qCDebug(lcStrategy) << "hisGetBasicData blob:" << d.blob.toHex(' ');
    return StrategyResult::success(std::move(d));
}

// --- B ---

SimpleReadStrategy::SimpleReadStrategy(NativeApi api, int comPort, VendorErrorTable errors)
    : api_(api), comPort_(comPort), errors_(std::move(errors)) {}

StrategyResult SimpleReadStrategy::acquire(){
    if (!api_.csReadCard)
        return StrategyResult::failure(ErrorCategory::DeviceCallFailed, "csReadCard is not exported");

    if (api_.csOpenCom){
        qCInfo(lcStrategy) << "Opening reader port COM" << comPort_;
        const int rc = api_.csOpenCom(comPort_);
        if (rc != 0){
            const QString msg = QString("Opening reader port COM%1 failed: %2").arg(comPort_).arg(errors_.describe(rc));
            qCWarning(lcStrategy) << msg;
            return StrategyResult::failure(ErrorCategory::DeviceCallFailed, msg, rc);
        }
        portOpen_ = true;
    }

    std::vector<char> buf(kBufferSize, '\0');
    const int rc = api_.csReadCard(buf.data());
    if (rc != 0){
        const QString msg = QString("csReadCard failed: %1").arg(errors_.describe(rc));
        qCWarning(lcStrategy) << msg;
        return StrategyResult::failure(ErrorCategory::DeviceCallFailed, msg, rc);
    }
    buf.back() = '\0';

    RawCardData d;
    d.format = BlobFormat::Text;
    d.blob = QByteArray(buf.data());   // NUL-terminated
    d.strategy = name();
    return StrategyResult::success(std::move(d));
}

// --- legacy ---

QString LegacyFieldsStrategy::lastError() const {
    if (!api_.nhiGetLastError) return "no error text available";
    std::vector<char> buf(256, '\0');
    api_.nhiGetLastError(buf.data(), static_cast<int>(buf.size()));
    buf.back() = '\0';
    return QString::fromUtf8(buf.data()).trimmed();
}

QString LegacyFieldsStrategy::field(NativeApi::GetFieldFn fn, const char* fnName, int size) const {
    if (!fn){
        qCWarning(lcStrategy) << fnName << "is not exported";
        return {};
    }
    std::vector<char> buf(static_cast<size_t>(size), '\0');
    if (!fn(buf.data(), size)){
        qCWarning(lcStrategy) << fnName << "failed:" << lastError();
        return {};
    }
    buf.back() = '\0';
    return QString::fromUtf8(buf.data()).trimmed();
}

StrategyResult LegacyFieldsStrategy::acquire(){
    if (api_.nhiInitialize && !api_.nhiInitialize())
        return StrategyResult::failure(ErrorCategory::DeviceCallFailed, "NHI_Initialize failed: " + lastError());
    if (api_.nhiReadCard && !api_.nhiReadCard())
        return StrategyResult::failure(ErrorCategory::DeviceCallFailed, "NHI_ReadCard failed: " + lastError());

    RawCardData d;
    d.format = BlobFormat::None;
    d.strategy = name();
    d.fields.idNumber  = field(api_.nhiGetId, "NHI_GetID", 20);
    d.fields.fullName  = field(api_.nhiGetName, "NHI_GetName", 50);
    d.fields.birthDate = field(api_.nhiGetBirthDate, "NHI_GetBirthDate", 20);
    return StrategyResult::success(std::move(d));
}

// --- C ---

StrategyResult AutomationStrategy::acquire(){
    auto callChecked = [this](const char* method) -> bool {
        if (!obj_.hasMember(method)) return true;
        const QVariant r = obj_.call(method);
        return r.isValid() ? r.toBool() : obj_.lastError().isEmpty();
    };

    if (!callChecked("Open"))
        return StrategyResult::failure(ErrorCategory::DeviceCallFailed, "Could not open the reader port: " + obj_.lastError());
    if (!callChecked("GetPatientData"))
        return StrategyResult::failure(ErrorCategory::DeviceCallFailed, "Reading patient data failed: " + obj_.lastError());
    if (obj_.hasMember("CardCheck") && !obj_.property("CardCheck").toBool())
        return StrategyResult::failure(ErrorCategory::DeviceCallFailed, "No card detected, check that the card is inserted");

    RawCardData d;
    d.format = BlobFormat::None;
    d.strategy = name();
    d.fields.idNumber = obj_.property("GetPatientIdCard").toString();
    d.fields.fullName = obj_.property("GetPatientName").toString();
    d.fields.sex      = obj_.property("GetPatientSex").toString();
    return StrategyResult::success(std::move(d));
}

// --- D ---

StrategyResult OfflineStrategy::acquire(){
    return StrategyResult::failure(ErrorCategory::OfflinePlaceholder,
                                   QString("Offline, manual entry required: ") + reason_);
}

} // namespace nhilabel
