#ifndef CODEMEM_TEST_SUPPORT_TEMPORARY_PROJECT_H
#define CODEMEM_TEST_SUPPORT_TEMPORARY_PROJECT_H

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace codemem {
namespace test {

// Scratch project directory removed on destruction. The directory name is
// the project name tests see in their keys.
class TemporaryProject {
public:
  explicit TemporaryProject(const std::string &name = "sample") {
    static std::atomic<int> counter{0};
    const auto timestamp =
        std::chrono::steady_clock::now().time_since_epoch().count();
    parent_ = std::filesystem::temp_directory_path() /
              ("codemem-" + std::to_string(timestamp) + "-" +
               std::to_string(counter.fetch_add(1)));
    root_ = parent_ / name;
    std::filesystem::create_directories(root_);
  }

  ~TemporaryProject() {
    std::error_code ignored;
    std::filesystem::remove_all(parent_, ignored);
  }

  TemporaryProject(const TemporaryProject &) = delete;
  TemporaryProject &operator=(const TemporaryProject &) = delete;

  std::filesystem::path AddFile(const std::filesystem::path &relative,
                                const std::string &content = "") const {
    const auto full_path = root_ / relative;
    std::filesystem::create_directories(full_path.parent_path());
    std::ofstream stream(full_path);
    stream << content;
    return full_path;
  }

  void RemoveFile(const std::filesystem::path &relative) const {
    std::filesystem::remove(root_ / relative);
  }

  const std::filesystem::path &root() const { return root_; }

private:
  std::filesystem::path parent_;
  std::filesystem::path root_;
};

} // namespace test
} // namespace codemem

#endif // CODEMEM_TEST_SUPPORT_TEMPORARY_PROJECT_H
