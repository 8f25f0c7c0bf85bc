#pragma once
#include "source_mux/http_source.hpp"
#include "source_mux/source.hpp"
#include "source_mux/status.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace smux {

enum class FileFormat { CSV, JSONL, Unknown };

// Guess format from extension (.csv | .jsonl | .ndjson); URL queries ignored.
FileFormat detect_format(std::string_view path);

struct ResolveResult {
  SourceList sources;
  Status status;
};

// Turns one spec string into zero or more sources.
using SourceFactory = std::function<ResolveResult(const std::string& spec)>;

// Lowercased scheme of a spec: "file" for file: URLs and bare paths, the text
// before "://" otherwise.
std::string detect_scheme(std::string_view spec);

// Trims a file spec and turns file: URLs (hierarchical or opaque, with
// percent-escapes) into a glob pattern. Other URL schemes are rejected.
Status normalize_file_spec(std::string_view spec, std::string& out);

// Glob-expands a file spec into FileSources sorted by path. No match is an error.
ResolveResult resolve_files(const std::string& spec);

// Maps specs to sources through an immutable scheme -> factory table.
class SourceResolver {
public:
  explicit SourceResolver(std::map<std::string, SourceFactory> factories)
      : factories_(std::move(factories)) {}

  // file, http and https.
  static SourceResolver defaults(HttpSource::Config http = {});

  ResolveResult resolve(std::string_view spec) const;

  // Results of every spec, in order. Stops at the first failure.
  ResolveResult resolve_all(const std::vector<std::string>& specs) const;

  bool supports(const std::string& scheme) const { return factories_.count(scheme) != 0; }

private:
  const std::map<std::string, SourceFactory> factories_;
};

}
