// =================================================================
// include/Testgate/Notifier.hpp
// =================================================================
// User-facing notification surface.

#pragma once

#include <iosfwd>
#include <string>

namespace Testgate {

/**
 * @brief Shows warnings and information to the user. Fire-and-forget.
 */
class Notifier {
public:
    virtual ~Notifier() = default;

    virtual void warning(const std::string& message) = 0;
    virtual void info(const std::string& message) = 0;
};

/**
 * @brief Prints notifications to a terminal stream (stderr by default)
 */
class ConsoleNotifier : public Notifier {
public:
    ConsoleNotifier();
    ConsoleNotifier(std::ostream& out, bool use_color);

    void warning(const std::string& message) override;
    void info(const std::string& message) override;

private:
    std::ostream& m_out;
    bool m_use_color;

    void print(const std::string& color, const std::string& tag, const std::string& message);
};

} // namespace Testgate
