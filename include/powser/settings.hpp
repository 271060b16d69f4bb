#ifndef POWSER_SETTINGS_HPP
#define POWSER_SETTINGS_HPP

#include <cstddef>

namespace powser {

/**
 * @brief Process-wide engine options.
 *
 * debug_print traces every computed coefficient to std::cerr.
 * comparison_terms is the number of leading coefficients equal_terms() compares
 * when no explicit count is given.
 */
struct Settings {
    bool debug_print = false;
    std::size_t comparison_terms = 10;
};

// Mutable process-wide instance. The engine is single-threaded.
Settings &
settings();

/**
 * @brief Applies a Settings value for the lifetime of the object and restores the
 *        previous one on destruction.
 */
class ScopedSettings {
  public:
    explicit ScopedSettings(const Settings &temporary);
    ~ScopedSettings();

    ScopedSettings(const ScopedSettings &) = delete;
    ScopedSettings &operator=(const ScopedSettings &) = delete;

  private:
    Settings saved_;
};

} // namespace powser

#endif // POWSER_SETTINGS_HPP
