#pragma once
#include <QString>
#include <QVariant>
#include <functional>
#include <memory>

namespace nhilabel {

// Late-bound automation (COM) object as exposed by managed vendor components.
class AutomationObject {
public:
    virtual ~AutomationObject() = default;

    virtual bool hasMember(const QString& name) const = 0;
    virtual QVariant call(const QString& method) = 0;
    virtual QVariant property(const QString& name) const = 0;
    virtual QString lastError() const = 0;
};

// Returns nullptr when the object could not be created; `err` receives the reason.
using AutomationFactory = std::function<std::unique_ptr<AutomationObject>(const QString& progId, QString* err)>;

// Whether this build can host automation objects at all.
bool automationSupported();

// Enters a single-threaded COM apartment on the calling thread for the guard's
// lifetime. Automation objects must be created, used and destroyed inside it.
class AutomationApartment {
public:
    AutomationApartment();
    ~AutomationApartment();
    AutomationApartment(const AutomationApartment&) = delete;
    AutomationApartment& operator=(const AutomationApartment&) = delete;
private:
    bool entered_ = false;
};

// Platform factory (ActiveQt on Windows). Empty on hosts without automation support.
AutomationFactory defaultAutomationFactory();

} // namespace nhilabel
