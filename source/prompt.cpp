#include <gitauto/process.hpp>
#include <gitauto/prompt.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <iostream>

namespace gitauto {

ConsolePrompter::ConsolePrompter() : ConsolePrompter(std::cin, std::cout) {}

bool ConsolePrompter::confirm(const std::string &message, bool default_value) {
  while (true) {
    out_ << message << (default_value ? " [Y/n] " : " [y/N] ") << std::flush;
    std::string line;
    if (!std::getline(in_, line))
      return default_value;
    line = trim(line);
    std::transform(line.begin(), line.end(), line.begin(), [](unsigned char c) {
      return static_cast<char>(std::tolower(c));
    });
    if (line.empty())
      return default_value;
    if (line == "y" || line == "yes")
      return true;
    if (line == "n" || line == "no")
      return false;
    out_ << "Please answer y or n.\n";
  }
}

std::string ConsolePrompter::ask(const std::string &message) {
  out_ << message << ": " << std::flush;
  std::string line;
  if (!std::getline(in_, line))
    return {};
  return trim(line);
}

bool NonInteractivePrompter::confirm(const std::string &message,
                                     bool default_value) {
  bool v = answer_.value_or(default_value);
  spdlog::info("[prompt] {} -> {}", message, v ? "yes" : "no");
  return v;
}

std::string NonInteractivePrompter::ask(const std::string &message) {
  spdlog::warn("[prompt] no answer for '{}' in non-interactive mode", message);
  return {};
}

} // namespace gitauto
