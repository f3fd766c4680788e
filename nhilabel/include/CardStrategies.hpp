#pragma once
#include "AppConfig.hpp"
#include "Errors.hpp"
#include "NativeApi.hpp"
#include "PatientRecord.hpp"
#include <QByteArray>
#include <QMap>
#include <memory>
#include <optional>
#include <vector>

namespace nhilabel {

class AutomationObject;

// How a blob must be decoded; set by the strategy that produced it.
enum class BlobFormat { None, BasicData, Text };

struct RawCardData {
    BlobFormat format = BlobFormat::None;
    QByteArray blob;
    CardFields fields;      // filled directly when format == None
    QString strategy;
};

class StrategyResult {
public:
    static StrategyResult success(RawCardData d){ StrategyResult r; r.data_ = std::move(d); return r; }
    static StrategyResult failure(ErrorCategory c, const QString& msg, int code = 0){
        StrategyResult r; r.category_ = c; r.message_ = msg; r.code_ = code; return r;
    }

    bool ok() const { return data_.has_value(); }
    const RawCardData& data() const { return *data_; }
    ErrorCategory category() const { return category_; }
    const QString& message() const { return message_; }
    int code() const { return code_; }

private:
    std::optional<RawCardData> data_;
    ErrorCategory category_ = ErrorCategory::DeviceCallFailed;
    QString message_;
    int code_ = 0;
};

class CardAcquisitionStrategy {
public:
    virtual ~CardAcquisitionStrategy() = default;
    virtual QString name() const = 0;
    // Terminal strategies end the cascade even though they fail.
    virtual bool terminal() const { return false; }
    virtual StrategyResult acquire() = 0;
};

// Vendor return codes of the basic-data and simple-read calls.
class VendorErrorTable {
public:
    VendorErrorTable();
    void merge(const QMap<int, QString>& overrides);
    QString describe(int code) const;
    bool knows(int code) const { return messages_.contains(code); }
private:
    QMap<int, QString> messages_;
};

// Strategy A: fixed-size buffer, by-reference length.
class BasicDataStrategy final : public CardAcquisitionStrategy {
public:
    BasicDataStrategy(NativeApi api, BasicDataLayout layout, VendorErrorTable errors);
    QString name() const override { return "basic-data"; }
    StrategyResult acquire() override;
private:
    NativeApi api_;
    BasicDataLayout layout_;
    VendorErrorTable errors_;
};

// Strategy B: single text buffer, optionally bracketed by csOpenCom.
class SimpleReadStrategy final : public CardAcquisitionStrategy {
public:
    static constexpr int kBufferSize = 1024;
    SimpleReadStrategy(NativeApi api, int comPort, VendorErrorTable errors);
    QString name() const override { return "simple-read"; }
    StrategyResult acquire() override;

    // Set once csOpenCom succeeded, until the owner closes the port.
    bool portOpen() const { return portOpen_; }
    void portClosed() { portOpen_ = false; }
private:
    NativeApi api_;
    int comPort_;
    VendorErrorTable errors_;
    bool portOpen_ = false;
};

// Older per-field API (NHI_Initialize / NHI_ReadCard / NHI_Get*).
class LegacyFieldsStrategy final : public CardAcquisitionStrategy {
public:
    explicit LegacyFieldsStrategy(NativeApi api) : api_(api) {}
    QString name() const override { return "legacy-fields"; }
    StrategyResult acquire() override;
private:
    QString field(NativeApi::GetFieldFn fn, const char* fnName, int size) const;
    QString lastError() const;
    NativeApi api_;
};

// Strategy C: NhiCard.Patient automation object; properties arrive already decoded.
class AutomationStrategy final : public CardAcquisitionStrategy {
public:
    explicit AutomationStrategy(AutomationObject& obj) : obj_(obj) {}
    QString name() const override { return "automation"; }
    StrategyResult acquire() override;
private:
    AutomationObject& obj_;
};

// Strategy D: no usable reader path, the operator has to type the data in.
class OfflineStrategy final : public CardAcquisitionStrategy {
public:
    explicit OfflineStrategy(QString reason) : reason_(std::move(reason)) {}
    QString name() const override { return "offline"; }
    bool terminal() const override { return true; }
    StrategyResult acquire() override;
private:
    QString reason_;
};

} // namespace nhilabel
