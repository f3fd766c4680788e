// Hosts without COM: automation-bound drivers are reported as unsupported.
#include "AutomationObject.hpp"

namespace nhilabel {

bool automationSupported(){ return false; }

AutomationApartment::AutomationApartment() = default;
AutomationApartment::~AutomationApartment() = default;

AutomationFactory defaultAutomationFactory(){ return {}; }

} // namespace nhilabel
