// Error taxonomy for a generation run. Every error aborts the run.
#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace mockforge::codegen {

class Error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// Interface or type not found, ambiguous request, unresolved include, parse failure.
class ExtractionError : public Error {
  public:
    using Error::Error;
};

// A type reference cannot be rendered in the destination's include context.
class GenerationError : public Error {
  public:
    using Error::Error;
};

// Malformed signature, e.g. a variadic parameter that is not last.
class SignatureConstraintError : public Error {
  public:
    using Error::Error;
};

// Conflicting or incomplete command line options.
class UsageError : public Error {
  public:
    using Error::Error;
};

class FileError : public Error {
  public:
    FileError(const std::filesystem::path &path, const std::string &what)
        : Error(path.string() + ": " + what), path_(path) {}

    const std::filesystem::path &path() const noexcept { return path_; }

  private:
    std::filesystem::path path_;
};

} // namespace mockforge::codegen
