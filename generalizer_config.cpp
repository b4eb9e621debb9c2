#include "generalizer_config.h"

namespace InvGen {

std::string to_string(bool_strategy strategy) {
  switch (strategy) {
    case BOOL_DIRECT_QUERY:
      return "direct-query";
    case BOOL_MODEL_SAMPLING:
      return "model-sampling";
  }
  return "unknown";
}

std::string to_string(int_strategy strategy) {
  switch (strategy) {
    case INT_LINEAR_SCAN:
      return "linear-scan";
    case INT_BRACKET_BISECT:
      return "bracket-bisect";
  }
  return "unknown";
}

std::string to_string(report_status status) {
  switch (status) {
    case REPORT_OK:
      return "ok";
    case REPORT_NO_VARIABLES:
      return "no applicable variables";
    case REPORT_NO_SOLUTION:
      return "no solution exists";
    case REPORT_UNRESOLVED:
      return "unresolved";
  }
  return "unknown";
}

}  // namespace InvGen
