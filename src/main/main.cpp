#include "source_mux/csv_decoder.hpp"
#include "source_mux/jsonl_decoder.hpp"
#include "source_mux/run_json.hpp"
#include "source_mux/source_registry.hpp"
#include "source_mux/stream_mux.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 2;
constexpr int kExitDecode = 3;
constexpr int kExitOutput = 4;  // records decoded but the summary file was not written

struct Cli {
  std::string format;            // csv|jsonl; empty: from the first source's extension
  std::string delimiter = ",";
  std::string header;            // comma-separated canonical header
  std::string summary_json;      // path; empty: no file
  std::size_t chunk_bytes = 32 * 1024;
  bool strict = true;
  bool print = false;
  bool verbose = false;
  bool help = false;
  std::vector<std::string> specs;
  std::string error;
};

const char* kUsage =
  "Usage: source-mux [--format=csv|jsonl] [--delimiter=C] [--header=a,b,...]\n"
  "                  [--chunk-bytes=N] [--lenient] [--print] [--verbose]\n"
  "                  [--summary-json=PATH] <spec>...\n"
  "  <spec>: path, glob, file: URL, http:// or https:// URL\n";

Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out) {
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    std::string num;
    if (eat("--format=", &c.format)) continue;
    if (eat("--delimiter=", &c.delimiter)) continue;
    if (eat("--header=", &c.header)) continue;
    if (eat("--summary-json=", &c.summary_json)) continue;
    if (eat("--chunk-bytes=", &num)) {
      try { c.chunk_bytes = std::stoul(num); }
      catch (const std::exception&) { c.error = "bad --chunk-bytes value: " + num; }
      continue;
    }
    if (a == "--lenient") { c.strict = false; continue; }
    if (a == "--print")   { c.print = true; continue; }
    if (a == "--verbose") { c.verbose = true; continue; }
    if (a == "-h" || a == "--help") { c.help = true; continue; }
    if (a == "--") {
      for (++i; i < argc; ++i) c.specs.emplace_back(argv[i]);
      break;
    }
    if (a.rfind("--", 0) == 0) { c.error = "unknown option: " + a; continue; }
    c.specs.push_back(a);
  }
  return c;
}

bool parse_delimiter(const std::string& s, char* out) {
  if (s == "\\t" || s == "tab") { *out = '\t'; return true; }
  if (s.size() != 1) return false;
  *out = s[0];
  return true;
}

std::vector<std::string> split_header(const std::string& s) {
  std::vector<std::string> out;
  if (s.empty()) return out;
  std::size_t start = 0;
  for (;;) {
    auto comma = s.find(',', start);
    out.push_back(s.substr(start, comma - start));
    if (comma == std::string::npos) break;
    start = comma + 1;
  }
  return out;
}

void write_field(std::ostream& o, std::string_view f, char delim) {
  const bool quote = !f.empty() &&
      (f.find_first_of(std::string{delim, '"', '\n', '\r'}) != std::string_view::npos ||
       f.front() == ' ' || f.front() == '\t');
  if (!quote) { o << f; return; }
  o << '"';
  for (char ch : f) { if (ch == '"') o << '"'; o << ch; }
  o << '"';
}

}

int main(int argc, char** argv) {
  namespace ch = std::chrono;
  auto cli = parse_cli(argc, argv);

  if (cli.help) { std::cout << kUsage; return kExitOk; }
  if (!cli.error.empty()) { std::cerr << "[mux] " << cli.error << "\n" << kUsage; return kExitUsage; }
  if (cli.specs.empty()) { std::cerr << "[mux] no source spec given\n" << kUsage; return kExitUsage; }

  char delim = ',';
  if (!parse_delimiter(cli.delimiter, &delim)) {
    std::cerr << "[mux] delimiter must be a single character: " << cli.delimiter << "\n";
    return kExitUsage;
  }

  // --- resolve
  const auto resolver = smux::SourceResolver::defaults();
  smux::ResolveResult resolved = resolver.resolve_all(cli.specs);
  if (!resolved.status.ok()) {
    std::cerr << "[resolve] " << resolved.status.to_string() << "\n";
    return kExitUsage;
  }
  for (const auto& s : resolved.sources) {
    if (cli.verbose) std::cerr << "[resolve] " << s->name() << "\n";
  }

  // --- choose format
  if (cli.format.empty()) {
    const auto fmt = resolved.sources.empty()
        ? smux::FileFormat::Unknown
        : smux::detect_format(resolved.sources.front()->name());
    if (fmt == smux::FileFormat::CSV) cli.format = "csv";
    else if (fmt == smux::FileFormat::JSONL) cli.format = "jsonl";
    else {
      std::cerr << "[mux] cannot infer format; pass --format=csv|jsonl\n";
      return kExitUsage;
    }
  }

  std::unique_ptr<smux::Decoder> decoder;
  if (cli.format == "csv") {
    smux::CsvDecoderOptions opt;
    opt.delimiter = delim;
    opt.header = split_header(cli.header);
    decoder = std::make_unique<smux::CsvDecoder>(std::move(opt));
  } else if (cli.format == "jsonl") {
    smux::JsonlDecoderOptions opt;
    opt.header = split_header(cli.header);
    opt.json.strict = cli.strict;
    decoder = std::make_unique<smux::JsonlDecoder>(std::move(opt));
  } else {
    std::cerr << "[mux] unsupported format: " << cli.format << "\n";
    return kExitUsage;
  }

  const auto t0 = ch::steady_clock::now();

  // --- mux + decode
  smux::StreamMux::Config mcfg;
  mcfg.chunk_bytes = cli.chunk_bytes;
  const std::size_t n_sources = resolved.sources.size();
  auto mux = std::make_unique<smux::StreamMux>(std::move(resolved.sources), mcfg);
  if (cli.verbose) std::cerr << "[mux] " << n_sources << " source(s), format=" << cli.format << "\n";

  smux::RunSummary summary;
  summary.format = cli.format;

  smux::DecodeResult dec = decoder->decode(smux::Context::background(), std::move(mux));
  smux::Status final_status;
  if (!dec.status.ok()) {
    final_status = dec.status;
  } else {
    auto& it = *dec.iter;
    std::vector<std::int64_t> source_bytes;
    bool header_taken = false;
    while (it.next()) {
      const smux::RecordView rec = it.record();
      if (!header_taken) { summary.header = rec.names(); header_taken = true; }
      const smux::SrcMeta& m = rec.meta();
      if (summary.sources.empty() || summary.sources.back().first != m.name) {
        if (cli.verbose) std::cerr << "[decode] source=" << m.name << "\n";
        summary.sources.emplace_back(m.name, 0);
        source_bytes.push_back(0);
      }
      ++summary.sources.back().second;
      source_bytes.back() = m.byte_offset;
      ++summary.rows;

      if (cli.print) {
        for (std::size_t i = 0; i < rec.size(); ++i) {
          if (i) std::cout << delim;
          write_field(std::cout, *rec.by_index(i), delim);
        }
        std::cout << "\n";
      }
    }
    final_status = it.err();
    const smux::Status cst = it.close();
    if (!cst.ok()) std::cerr << "[mux] close: " << cst.to_string() << "\n";
    for (auto b : source_bytes) summary.bytes += static_cast<std::uint64_t>(b);
  }

  const auto t1 = ch::steady_clock::now();
  summary.wall_time_ms = ch::duration<double, std::milli>(t1 - t0).count();
  const double sec = summary.wall_time_ms / 1000.0;
  summary.throughput_mb_s = sec > 0.0 ? (summary.bytes / (1024.0 * 1024.0)) / sec : 0.0;
  summary.rows_per_sec = sec > 0.0 ? summary.rows / sec : 0.0;
  summary.status = smux::to_string(final_status.code());
  summary.message = final_status.message();

  if (final_status.failed()) std::cerr << "[decode] error: " << final_status.to_string() << "\n";
  std::cerr << "[summary] rows=" << summary.rows << " sources=" << summary.sources.size()
            << " bytes=" << summary.bytes << " wall_ms=" << summary.wall_time_ms << "\n";

  if (!cli.summary_json.empty()) {
    std::ofstream out(cli.summary_json, std::ios::binary);
    if (out) out << smux::RunJsonWriter::to_json(summary) << "\n";
    if (!out) {
      std::cerr << "[summary] cannot write " << cli.summary_json << "\n";
      return final_status.failed() ? kExitDecode : kExitOutput;
    }
  }

  return final_status.failed() ? kExitDecode : kExitOk;
}
