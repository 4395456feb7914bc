#include <codemem/output_format.h>

#include <codemem/entity_codec.h>

#include <nlohmann/json.hpp>

#include <iomanip>
#include <sstream>

namespace codemem {

namespace {
std::string Dump(const nlohmann::json &document) {
  return DumpJson(document, 2) + "\n";
}

std::string QualifiedName(const EntityRecord &entity) {
  return entity.parent_class ? *entity.parent_class + "." + entity.name
                             : entity.name;
}

void WriteEntityLine(std::ostringstream &out, const EntityRecord &entity) {
  out << EntityTypeName(entity.entity_type) << " " << QualifiedName(entity)
      << "  " << entity.file_path << ":" << entity.line_start << "-"
      << entity.line_end;
  if (entity.signature) {
    out << "\n    " << *entity.signature;
  }
  if (entity.bases && !entity.bases->empty()) {
    out << "\n    bases:";
    for (const auto &base : *entity.bases) {
      out << " " << base;
    }
  }
  if (entity.value_repr) {
    out << "\n    = " << *entity.value_repr;
  }
  out << "\n";
}

void WriteFailures(std::ostringstream &out, const std::string &label,
                   const std::vector<std::string> &values) {
  for (const auto &value : values) {
    out << "  " << label << ": " << value << "\n";
  }
}
} // namespace

std::string RenderWriteSummary(const WriteSummary &summary,
                               OutputFormat format) {
  if (format == OutputFormat::kJson) {
    return Dump({{"entities_written", summary.entities_written},
                 {"entities_failed", summary.entities_failed},
                 {"files_written", summary.files_written},
                 {"files_failed", summary.files_failed},
                 {"files_skipped", summary.files_skipped},
                 {"files_removed", summary.files_removed},
                 {"failed_keys", summary.failed_keys},
                 {"failed_files", summary.failed_files}});
  }
  std::ostringstream out;
  out << "Indexed " << summary.entities_written << " entities from "
      << summary.files_written << " files";
  if (summary.files_removed > 0) {
    out << ", removed " << summary.files_removed << " files";
  }
  out << "\n";
  if (summary.FailureCount() > 0) {
    out << "Failures: " << summary.entities_failed << " entities, "
        << summary.files_failed << " files failed, " << summary.files_skipped
        << " files skipped\n";
    WriteFailures(out, "key", summary.failed_keys);
    WriteFailures(out, "file", summary.failed_files);
  }
  return out.str();
}

std::string RenderForgetSummary(const ForgetSummary &summary,
                                OutputFormat format) {
  if (format == OutputFormat::kJson) {
    return Dump({{"keys_deleted", summary.keys_deleted},
                 {"keys_failed", summary.keys_failed}});
  }
  std::ostringstream out;
  out << "Deleted " << summary.keys_deleted << " keys";
  if (summary.keys_failed > 0) {
    out << " (" << summary.keys_failed << " failed)";
  }
  out << "\n";
  return out.str();
}

std::string RenderStatus(const StatusSummary &status, OutputFormat format) {
  if (format == OutputFormat::kJson) {
    return Dump({{"file_count", status.file_count},
                 {"entity_count", status.entity_count},
                 {"function_count", status.function_count},
                 {"class_count", status.class_count},
                 {"method_count", status.method_count},
                 {"variable_count", status.variable_count},
                 {"embedding_count", status.embedding_count},
                 {"files", status.files}});
  }
  std::ostringstream out;
  out << "Files:      " << status.file_count << "\n"
      << "Entities:   " << status.entity_count << "\n"
      << "  functions " << status.function_count << "\n"
      << "  classes   " << status.class_count << "\n"
      << "  methods   " << status.method_count << "\n"
      << "  variables " << status.variable_count << "\n"
      << "Embeddings: " << status.embedding_count << "\n";
  for (const auto &file : status.files) {
    out << "  " << file << "\n";
  }
  return out.str();
}

std::string RenderEntities(const std::vector<EntityRecord> &entities,
                           OutputFormat format) {
  if (format == OutputFormat::kJson) {
    auto document = nlohmann::json::array();
    for (const auto &entity : entities) {
      document.push_back(EntityToJson(entity));
    }
    return Dump(document);
  }
  if (entities.empty()) {
    return "No matching entities\n";
  }
  std::ostringstream out;
  for (const auto &entity : entities) {
    WriteEntityLine(out, entity);
  }
  return out.str();
}

std::string RenderRecallResults(const std::vector<RecallResult> &results,
                                OutputFormat format) {
  if (format == OutputFormat::kJson) {
    auto document = nlohmann::json::array();
    for (const auto &result : results) {
      document.push_back(
          {{"score", result.score}, {"entity", EntityToJson(result.entity)}});
    }
    return Dump(document);
  }
  if (results.empty()) {
    return "No matching entities\n";
  }
  std::ostringstream out;
  for (const auto &result : results) {
    out << std::fixed << std::setprecision(4) << result.score << "  ";
    WriteEntityLine(out, result.entity);
  }
  return out.str();
}

std::string RenderVectorizeSummary(const VectorizeSummary &summary,
                                   OutputFormat format) {
  if (format == OutputFormat::kJson) {
    return Dump({{"entities", summary.entities},
                 {"indexed", summary.indexed},
                 {"failed", summary.failed},
                 {"failed_batches", summary.failed_batches},
                 {"batches", summary.batches},
                 {"dry_run", summary.dry_run}});
  }
  std::ostringstream out;
  if (summary.dry_run) {
    out << "Dry run: " << summary.entities << " entities in "
        << summary.batches << " batches would be embedded\n";
    return out.str();
  }
  out << "Vectorized " << summary.indexed << " entities in " << summary.batches
      << " batches";
  if (summary.failed > 0 || summary.failed_batches > 0) {
    out << " (" << summary.failed << " failed, " << summary.failed_batches
        << " failed batches)";
  }
  out << "\n";
  return out.str();
}

} // namespace codemem
