#ifndef INVGEN_ERRORS_H
#define INVGEN_ERRORS_H

#include <stdexcept>
#include <string>

namespace InvGen {

class GeneralizerError : public std::runtime_error {
 public:
  explicit GeneralizerError(const std::string& what)
      : std::runtime_error(what) {}
};

/*
 * The oracle session could not be created or used. Fatal for the whole
 * analysis; never retried.
 */
class OracleUnavailable : public GeneralizerError {
 public:
  explicit OracleUnavailable(const std::string& what)
      : GeneralizerError("oracle unavailable: " + what) {}
};

/*
 * The oracle answered neither sat nor unsat (timeout, incomplete theory).
 * Engines catch it per variable and report that variable as unresolved.
 */
class OracleUnknown : public GeneralizerError {
 public:
  explicit OracleUnknown(const std::string& what)
      : GeneralizerError("oracle returned unknown: " + what) {}
};

/*
 * Malformed candidate, sort mismatch, invalid configuration or a term the
 * oracle rejected.
 */
class ConfigurationError : public GeneralizerError {
 public:
  explicit ConfigurationError(const std::string& what)
      : GeneralizerError(what) {}
};

}  // namespace InvGen

#endif  // INVGEN_ERRORS_H
