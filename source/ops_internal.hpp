#pragma once
#include <gitauto/operations.hpp>

#include <string>
#include <vector>

namespace gitauto::detail {

inline constexpr const char *kNotARepository = "This is not a Git repository!";

OperationResult ok(std::string message);
OperationResult failed(std::string message);
// Attaches the step's diagnostic and classification.
OperationResult failed(std::string message, const StepResult &step);
OperationResult not_a_repository();

// Non-empty lines of text, right-trimmed.
std::vector<std::string> split_lines(const std::string &text);

} // namespace gitauto::detail
