#pragma once

#include <xt/directive.hpp>
#include <xt/schema_variants.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace xt {

  // A directive resolved against the filesystem, with the schema factory
  // its test must use.
  struct test_input {
    std::filesystem::path file_path;
    component_variant variant = component_variant::plain;
    schema_factory factory;
    std::size_t expected_errors = 0;
    bool inspect = false;
    schema_version version = schema_version::v1_0;
    std::filesystem::path manifest;
    std::size_t line = 0;
  };

  enum class skip_reason { missing_file, suffix_mismatch };

  constexpr std::string_view
  to_string(skip_reason r) {
    return r == skip_reason::missing_file ? "no such file" : "suffix mismatch";
  }

  struct corpus_stats {
    std::size_t manifests = 0;
    std::size_t directives = 0;
    std::size_t resolved = 0;
    std::size_t skipped_missing = 0;
    std::size_t skipped_suffix = 0;
  };

  // Shell glob expansion of a manifest pattern, sorted. A pattern matching
  // nothing gives an empty list.
  std::vector<std::filesystem::path>
  expand_manifest_pattern(const std::string& pattern);

  // Reads manifests and turns their directives into test inputs.
  //
  // Directive filenames are relative to the manifest that names them.
  // Directives naming a missing file, or a file whose extension is not
  // `suffix` (compared case-insensitively), are skipped silently; they are
  // counted in stats() and reported to the skip handler when one is set.
  // A malformed directive throws configuration_error prefixed with
  // "manifest:line:" and aborts the load.
  class corpus_resolver {
  public:
    using skip_handler =
        std::function<void(const std::filesystem::path& manifest,
                           std::size_t line, const std::filesystem::path& file,
                           skip_reason reason)>;
    using input_handler = std::function<void(test_input)>;

  private:
    std::string suffix_;
    variant_selector variants_;
    skip_handler on_skip_;
    corpus_stats stats_;

    bool
    matches_suffix(const std::filesystem::path& file) const;

  public:
    corpus_resolver(std::string suffix, variant_selector variants);

    void
    set_skip_handler(skip_handler handler) {
      on_skip_ = std::move(handler);
    }

    const std::string&
    suffix() const {
      return suffix_;
    }

    const corpus_stats&
    stats() const {
      return stats_;
    }

    // Streams the inputs of every manifest matched by `patterns`, in
    // pattern order, then manifest order, then line order.
    void
    for_each(const std::vector<std::string>& patterns,
             const input_handler& fn);

    std::vector<test_input>
    resolve(const std::vector<std::string>& patterns);

    // Throws std::runtime_error when the manifest cannot be opened.
    void
    resolve_manifest(const std::filesystem::path& manifest,
                     const input_handler& fn);

    std::vector<test_input>
    resolve_manifest(const std::filesystem::path& manifest);
  };

} // namespace xt
