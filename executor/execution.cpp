#include "executor/execution.hpp"

namespace executor {

const char* StatusName(Status status) {
  switch (status) {
    case Status::SUCCESS:
      return "success";
    case Status::ERROR:
      return "error";
    case Status::TIMEOUT:
      return "timeout";
    case Status::FAILED:
      return "failed";
  }
  return "unknown";
}

}  // namespace executor
