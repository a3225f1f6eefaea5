#pragma once

#include "docsandbox/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace docsandbox::render {

class IDocumentRenderer {
public:
  virtual ~IDocumentRenderer() = default;

  [[nodiscard]] virtual common::Status render(const std::string &markup,
                                              const std::filesystem::path &output,
                                              const std::filesystem::path &base_url) = 0;
};

/// Runs an external converter as
/// `<command> <args...> --base-url <base> - <output>` with markup on stdin.
class CommandRenderer final : public IDocumentRenderer {
public:
  CommandRenderer(std::string command, std::vector<std::string> args = {});

  [[nodiscard]] common::Status render(const std::string &markup,
                                      const std::filesystem::path &output,
                                      const std::filesystem::path &base_url) override;

  [[nodiscard]] std::vector<std::string> build_argv(const std::filesystem::path &output,
                                                    const std::filesystem::path &base_url) const;

private:
  std::string command_;
  std::vector<std::string> args_;
};

} // namespace docsandbox::render
