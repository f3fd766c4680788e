#pragma once
#include <QString>

namespace nhilabel {

// Starts the vendor control program detached. False if it is missing or fails to start.
bool launchControlProgram(const QString& path);

} // namespace nhilabel
