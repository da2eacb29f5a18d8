// Structural checks on extracted interface models.
#pragma once

#include "model.hpp"

#include <string>

namespace mockforge::codegen {

// Reject models the renderer cannot turn into valid source.
// Throws ExtractionError for duplicate or non-identifier method names and
// SignatureConstraintError for a variadic parameter that is not the last one.
void validate_model(const InterfaceModel &model);

// True if both models describe the same method set; parameter names are ignored.
bool models_equivalent(const InterfaceModel &lhs, const InterfaceModel &rhs);

// Human readable dump used by `generate --debug`.
std::string describe_model(const InterfaceModel &model);

} // namespace mockforge::codegen
