#include "source_mux/token_jsonl_simdjson.hpp"

#include <simdjson.h>
#include <string>
#include <string_view>

namespace smux {

static std::string_view trim_right(std::string_view s) {
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n'))
    s.remove_suffix(1);
  return s;
}

static std::string copy_capped(std::string_view s, size_t cap) {
  if (s.size() <= cap) return std::string(s);
  if (cap <= 3) return std::string(s.substr(0, cap));
  std::string out;
  out.reserve(cap);
  out.append(s.substr(0, cap - 3));
  out.append("...");
  return out;
}

struct JsonlTokenizer::Impl {
  JsonlConfig cfg;
  simdjson::ondemand::parser parser;
  std::string scratch;

  explicit Impl(const JsonlConfig& c) : cfg(c) {}

  std::string render(simdjson::ondemand::value v) {
    switch (v.type().value()) {
      case simdjson::ondemand::json_type::number:
        // keep the document's own spelling (no double round-trip)
        return std::string(trim_right(v.raw_json_token()));
      case simdjson::ondemand::json_type::string:
        return std::string(v.get_string().value());
      case simdjson::ondemand::json_type::boolean:
        return v.get_bool().value() ? "true" : "false";
      case simdjson::ondemand::json_type::null:
        return {};
      default:
        // arrays/objects: cap their raw text
        return copy_capped(trim_right(v.raw_json().value()), cfg.cap_nested_value_bytes);
    }
  }
};

JsonlTokenizer::JsonlTokenizer(const JsonlConfig& cfg) : p_(new Impl(cfg)) {}
JsonlTokenizer::~JsonlTokenizer() { delete p_; }

bool JsonlTokenizer::parse_line(std::string_view line,
                                std::vector<std::string>& keys,
                                std::vector<std::string>& values) {
  keys.clear();
  values.clear();
  err_.clear();

  std::string& scratch = p_->scratch;
  scratch.assign(line.data(), line.size());
  scratch.resize(line.size() + simdjson::SIMDJSON_PADDING, '\0');
  simdjson::padded_string_view view(scratch.data(), line.size(), scratch.size());

  try {
    simdjson::ondemand::document doc = p_->parser.iterate(view);
    const auto t = doc.type().value();

    if (t == simdjson::ondemand::json_type::object) {
      simdjson::ondemand::object obj = doc.get_object().value();
      for (auto field : obj) {
        std::string_view k = field.unescaped_key().value();
        keys.emplace_back(k);
        values.push_back(p_->render(field.value()));
      }
      if (!doc.at_end()) { err_ = "trailing content after JSON object"; return false; }
      return true;
    }

    if (p_->cfg.strict) {
      err_ = "JSONL strict mode: non-object line";
      return false;
    }

    // Lenient scalar/array: one value holding its raw text.
    std::string_view raw = t == simdjson::ondemand::json_type::array
        ? doc.get_array().value().raw_json().value()
        : doc.raw_json_token().value();
    values.push_back(copy_capped(trim_right(raw), p_->cfg.cap_nested_value_bytes));
    return true;

  } catch (const simdjson::simdjson_error& e) {
    err_ = e.what();
    return false;
  }
}

}
