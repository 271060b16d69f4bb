#include "powser/settings.hpp"

namespace powser {

Settings &
settings() {
    static Settings instance;
    return instance;
}

ScopedSettings::ScopedSettings(const Settings &temporary)
  : saved_(settings()) {
    settings() = temporary;
}

ScopedSettings::~ScopedSettings() { settings() = saved_; }

} // namespace powser
