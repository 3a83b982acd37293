// =================================================================
// src/Testgate/Notifier.cpp
// =================================================================

#include "Testgate/Notifier.hpp"
#include <cstdio>
#include <iostream>

#if !defined(_WIN32)
#include <unistd.h>
#endif

namespace Testgate {

namespace {

bool stderrIsTerminal() {
#if !defined(_WIN32)
    return ::isatty(STDERR_FILENO) == 1;
#else
    return false;
#endif
}

} // namespace

ConsoleNotifier::ConsoleNotifier()
    : m_out(std::cerr), m_use_color(stderrIsTerminal()) {
}

ConsoleNotifier::ConsoleNotifier(std::ostream& out, bool use_color)
    : m_out(out), m_use_color(use_color) {
}

void ConsoleNotifier::warning(const std::string& message) {
    print("\033[33m", "WARNING", message);
}

void ConsoleNotifier::info(const std::string& message) {
    print("\033[32m", "INFO", message);
}

void ConsoleNotifier::print(const std::string& color, const std::string& tag, const std::string& message) {
    if (m_use_color) {
        m_out << color << tag << ":\033[0m " << message << std::endl;
    } else {
        m_out << tag << ": " << message << std::endl;
    }
}

} // namespace Testgate
