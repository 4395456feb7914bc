#pragma once

#include <codemem/models.h>

#include <string>
#include <vector>

namespace codemem {

enum class OutputFormat { kText, kJson };

std::string RenderWriteSummary(const WriteSummary &summary,
                               OutputFormat format);
std::string RenderForgetSummary(const ForgetSummary &summary,
                                OutputFormat format);
std::string RenderStatus(const StatusSummary &status, OutputFormat format);
std::string RenderEntities(const std::vector<EntityRecord> &entities,
                           OutputFormat format);
std::string RenderRecallResults(const std::vector<RecallResult> &results,
                                OutputFormat format);
std::string RenderVectorizeSummary(const VectorizeSummary &summary,
                                   OutputFormat format);

} // namespace codemem
