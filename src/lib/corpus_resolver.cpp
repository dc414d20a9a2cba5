#include <xt/corpus_resolver.hpp>

#include <glob.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace xt {

  namespace {

    std::string
    lower(std::string s) {
      std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
      });
      return s;
    }

  } // namespace

  std::vector<fs::path>
  expand_manifest_pattern(const std::string& pattern) {
    glob_t matches{};
    int rc = ::glob(pattern.c_str(), 0, nullptr, &matches);
    std::vector<fs::path> result;
    if (rc == 0) {
      for (std::size_t i = 0; i < matches.gl_pathc; ++i)
        result.emplace_back(matches.gl_pathv[i]);
    }
    ::globfree(&matches);
    if (rc != 0 && rc != GLOB_NOMATCH)
      throw std::runtime_error("cannot expand manifest pattern: " + pattern);
    std::sort(result.begin(), result.end());
    return result;
  }

  corpus_resolver::corpus_resolver(std::string suffix,
                                   variant_selector variants)
      : suffix_(std::move(suffix)), variants_(std::move(variants)) {
    if (!suffix_.empty() && suffix_.front() == '.') suffix_.erase(0, 1);
  }

  bool
  corpus_resolver::matches_suffix(const fs::path& file) const {
    return lower(file.extension().string()) == "." + lower(suffix_);
  }

  void
  corpus_resolver::resolve_manifest(const fs::path& manifest,
                                    const input_handler& fn) {
    std::ifstream in(manifest);
    if (!in)
      throw std::runtime_error("cannot open manifest: " + manifest.string());
    ++stats_.manifests;

    auto base = fs::absolute(manifest).parent_path();
    std::string text;
    std::size_t line = 0;
    while (std::getline(in, text)) {
      ++line;
      std::optional<directive> d;
      try {
        d = parse_directive(text);
      } catch (const configuration_error& e) {
        throw configuration_error(manifest.string() + ":" +
                                  std::to_string(line) + ": " + e.what());
      }
      if (!d) continue;
      ++stats_.directives;

      auto file = (base / d->filename).lexically_normal();
      std::error_code ec;
      if (!fs::is_regular_file(file, ec)) {
        ++stats_.skipped_missing;
        if (on_skip_) on_skip_(manifest, line, file, skip_reason::missing_file);
        continue;
      }
      if (!matches_suffix(file)) {
        ++stats_.skipped_suffix;
        if (on_skip_)
          on_skip_(manifest, line, file, skip_reason::suffix_mismatch);
        continue;
      }

      ++stats_.resolved;
      test_input input;
      input.file_path = file;
      input.variant = d->inspect ? component_variant::instrumented
                                 : component_variant::plain;
      input.factory = variants_.select(d->inspect);
      input.expected_errors = d->expected_errors;
      input.inspect = d->inspect;
      input.version = d->version;
      input.manifest = manifest;
      input.line = line;
      fn(std::move(input));
    }
  }

  std::vector<test_input>
  corpus_resolver::resolve_manifest(const fs::path& manifest) {
    std::vector<test_input> inputs;
    resolve_manifest(manifest,
                     [&](test_input input) { inputs.push_back(std::move(input)); });
    return inputs;
  }

  void
  corpus_resolver::for_each(const std::vector<std::string>& patterns,
                            const input_handler& fn) {
    for (const auto& pattern : patterns) {
      for (const auto& manifest : expand_manifest_pattern(pattern))
        resolve_manifest(manifest, fn);
    }
  }

  std::vector<test_input>
  corpus_resolver::resolve(const std::vector<std::string>& patterns) {
    std::vector<test_input> inputs;
    for_each(patterns,
             [&](test_input input) { inputs.push_back(std::move(input)); });
    return inputs;
  }

} // namespace xt
