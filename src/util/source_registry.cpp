#include "source_mux/source_registry.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <glob.h>
#include <string>
#include <utility>

namespace smux {

static std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace((unsigned char)s.front())) s.remove_prefix(1);
  while (!s.empty() && std::isspace((unsigned char)s.back())) s.remove_suffix(1);
  return s;
}

static std::string lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = (char)std::tolower((unsigned char)c);
  return out;
}

static bool starts_with_ci(std::string_view s, std::string_view pfx) {
  return s.size() >= pfx.size() && lower(s.substr(0, pfx.size())) == pfx;
}

// "C:\dir" or "C:/dir" or "C:"
static bool is_drive_path(std::string_view s) {
  if (s.size() < 2 || !std::isalpha((unsigned char)s[0]) || s[1] != ':') return false;
  return s.size() == 2 || s[2] == '\\' || s[2] == '/';
}

// RFC 3986 scheme followed by ':'; empty when there is none.
static std::string url_scheme(std::string_view s) {
  if (s.empty() || !std::isalpha((unsigned char)s[0])) return {};
  size_t i = 1;
  while (i < s.size() && (std::isalnum((unsigned char)s[i]) || s[i] == '+' || s[i] == '-' || s[i] == '.')) ++i;
  if (i >= s.size() || s[i] != ':') return {};
  return lower(s.substr(0, i));
}

static bool percent_decode(std::string_view in, std::string& out) {
  out.clear();
  auto hex = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] != '%') { out += in[i]; continue; }
    if (i + 2 >= in.size()) return false;
    const int hi = hex(in[i + 1]), lo = hex(in[i + 2]);
    if (hi < 0 || lo < 0) return false;
    out += (char)(hi * 16 + lo);
    i += 2;
  }
  return true;
}

static Status normalize_file_url(std::string_view spec, std::string& out) {
  std::string_view rest = spec.substr(5);  // after "file:"
  std::string_view raw_path;
  std::string host;

  if (rest.size() >= 2 && rest[0] == '/' && rest[1] == '/') {
    rest.remove_prefix(2);
    const auto cut = rest.find_first_of("?#");
    if (cut != std::string_view::npos) rest = rest.substr(0, cut);
    const auto slash = rest.find('/');
    if (!percent_decode(rest.substr(0, slash), host))
      return Status(StatusCode::Configuration, "invalid file URL \"" + std::string(spec) + "\"");
    raw_path = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash);
  } else {
    raw_path = rest;  // opaque: file:/abs, file:rel, file:c:\x
  }

  std::string path;
  if (!percent_decode(raw_path, path))
    return Status(StatusCode::Configuration, "invalid file URL \"" + std::string(spec) + "\"");
  if (!host.empty() && lower(host) != "localhost") path = "//" + host + path;

  // /C:/dir -> C:/dir
  if (path.size() >= 3 && path[0] == '/' && path[2] == ':') path.erase(0, 1);
  if (path.empty())
    return Status(StatusCode::Configuration, "empty file URI \"" + std::string(spec) + "\"");
  out = std::move(path);
  return {};
}

FileFormat detect_format(std::string_view path) {
  if (url_scheme(path).size() > 1) {
    const auto cut = path.find_first_of("?#");
    if (cut != std::string_view::npos) path = path.substr(0, cut);
  }
  auto ext = lower(std::filesystem::path(std::string(path)).extension().string());
  if (ext == ".csv") return FileFormat::CSV;
  if (ext == ".jsonl" || ext == ".ndjson") return FileFormat::JSONL;
  return FileFormat::Unknown;
}

std::string detect_scheme(std::string_view spec) {
  spec = trim(spec);
  if (starts_with_ci(spec, "file:")) return "file";
  const auto sep = spec.find("://");
  if (sep == std::string_view::npos) return "file";
  return lower(spec.substr(0, sep));
}

Status normalize_file_spec(std::string_view spec, std::string& out) {
  spec = trim(spec);
  const std::string scheme = url_scheme(spec);
  if (!scheme.empty() && scheme != "file" && !is_drive_path(spec))
    return Status(StatusCode::Configuration, "unsupported scheme \"" + scheme + "\"");
  if (scheme == "file") return normalize_file_url(spec, out);
  out = std::string(spec);
  return {};
}

ResolveResult resolve_files(const std::string& spec) {
  ResolveResult res;
  std::string pattern;
  res.status = normalize_file_spec(spec, pattern);
  if (!res.status.ok()) return res;

  glob_t g{};
  const int rc = ::glob(pattern.c_str(), 0, nullptr, &g);
  std::vector<std::string> names;
  if (rc == 0) {
    for (size_t i = 0; i < g.gl_pathc; ++i) names.emplace_back(g.gl_pathv[i]);
  }
  globfree(&g);

  if (rc == GLOB_NOMATCH || (rc == 0 && names.empty())) {
    res.status = Status(StatusCode::Configuration, "no files matched: \"" + pattern + "\"");
    return res;
  }
  if (rc != 0) {
    res.status = Status(StatusCode::Configuration, "glob failed for \"" + pattern + "\"");
    return res;
  }

  std::sort(names.begin(), names.end());
  for (auto& n : names) {
    res.sources.push_back(std::make_unique<FileSource>(
        std::filesystem::path(n).lexically_normal().string()));
  }
  return res;
}

SourceResolver SourceResolver::defaults(HttpSource::Config http) {
  auto web = [http](const std::string& spec) {
    ResolveResult r;
    r.sources.push_back(std::make_unique<HttpSource>(std::string(trim(spec)), http));
    return r;
  };
  std::map<std::string, SourceFactory> table;
  table.emplace("file", resolve_files);
  table.emplace("http", web);
  table.emplace("https", web);
  return SourceResolver(std::move(table));
}

ResolveResult SourceResolver::resolve(std::string_view spec) const {
  const std::string scheme = detect_scheme(spec);
  auto it = factories_.find(scheme);
  if (it == factories_.end()) {
    ResolveResult r;
    r.status = Status(StatusCode::Configuration, "no source factory for scheme \"" + scheme +
                      "\" (spec \"" + std::string(trim(spec)) + "\")");
    return r;
  }
  return it->second(std::string(spec));
}

ResolveResult SourceResolver::resolve_all(const std::vector<std::string>& specs) const {
  ResolveResult all;
  for (const auto& s : specs) {
    ResolveResult r = resolve(s);
    if (!r.status.ok()) {
      all.sources.clear();
      all.status = std::move(r.status);
      return all;
    }
    for (auto& src : r.sources) all.sources.push_back(std::move(src));
  }
  return all;
}

}
