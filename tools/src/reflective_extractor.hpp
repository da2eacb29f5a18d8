// Reflective backend: builds interface models from the clang AST.
#pragma once

#include "extractor.hpp"

namespace mockforge::codegen {

// Parses the header with clang libtooling. Types are recorded in canonical form
// (aliases resolved); parameter names are synthesized as p0, p1, ...
class ReflectiveExtractor final : public InterfaceExtractor {
  public:
    explicit ReflectiveExtractor(ExtractorConfig config);

    std::vector<InterfaceModel> extract(const SourceSpec &spec) override;

  private:
    ExtractorConfig config_;
};

} // namespace mockforge::codegen
