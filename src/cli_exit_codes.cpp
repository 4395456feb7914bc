#include <codemem/cli_exit_codes.h>

namespace codemem {

int WriteExitCode(const WriteSummary &summary) {
  return summary.FailureCount() == 0 ? kExitSuccess : kExitPartialFailure;
}

int ForgetExitCode(const ForgetSummary &summary) {
  return summary.keys_failed == 0 ? kExitSuccess : kExitPartialFailure;
}

int VectorizeExitCode(const VectorizeSummary &summary) {
  return summary.failed == 0 && summary.failed_batches == 0
             ? kExitSuccess
             : kExitPartialFailure;
}

} // namespace codemem
