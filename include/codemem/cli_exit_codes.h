#pragma once

#include <codemem/models.h>

namespace codemem {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFatal = 1;
inline constexpr int kExitPartialFailure = 2;

int WriteExitCode(const WriteSummary &summary);
int ForgetExitCode(const ForgetSummary &summary);
int VectorizeExitCode(const VectorizeSummary &summary);

} // namespace codemem
