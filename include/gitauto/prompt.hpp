#pragma once
#include <iosfwd>
#include <optional>
#include <string>

namespace gitauto {

// Decision points of a workflow are resolved by the caller through this.
class Prompter {
public:
  virtual ~Prompter() = default;
  virtual bool confirm(const std::string &message, bool default_value) = 0;
  virtual std::string ask(const std::string &message) = 0;
};

// Reads answers from a stream (stdin by default). EOF takes the default.
class ConsolePrompter : public Prompter {
public:
  ConsolePrompter();
  ConsolePrompter(std::istream &in, std::ostream &out) : in_(in), out_(out) {}

  bool confirm(const std::string &message, bool default_value) override;
  std::string ask(const std::string &message) override;

private:
  std::istream &in_;
  std::ostream &out_;
};

// --yes / --no: every confirmation gets the fixed answer, or its default
// when no answer was fixed. ask() returns an empty string.
class NonInteractivePrompter : public Prompter {
public:
  explicit NonInteractivePrompter(std::optional<bool> answer = std::nullopt)
      : answer_(answer) {}

  bool confirm(const std::string &message, bool default_value) override;
  std::string ask(const std::string &message) override;

private:
  std::optional<bool> answer_;
};

} // namespace gitauto
