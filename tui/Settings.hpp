// Reads the persistent settings (QSettings) into the activity configuration.
#pragma once
#include "termxfer/Config.hpp"

class QSettings;

namespace termxfer {

// Unknown or out-of-range values fall back to the Config defaults.
Config loadConfig(QSettings& s);

} // namespace termxfer
