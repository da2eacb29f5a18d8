// Syntactic backend: builds an interface model straight from header text.
#pragma once

#include "extractor.hpp"

namespace mockforge::codegen {

// Parses the header and the project headers it includes without compiling.
// Keeps parameter names as written and handles one interface per run. Methods
// count as virtual when declared `virtual`, `override` or `final`.
class SyntacticExtractor final : public InterfaceExtractor {
  public:
    std::vector<InterfaceModel> extract(const SourceSpec &spec) override;
};

} // namespace mockforge::codegen
