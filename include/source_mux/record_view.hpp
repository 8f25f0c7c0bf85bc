#pragma once
#include "source_mux/src_meta.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace smux {

// Canonical field names of a decode session, with a name -> index table.
class Header {
public:
  Header() = default;
  explicit Header(std::vector<std::string> names);

  std::size_t size() const noexcept { return names_.size(); }
  bool empty() const noexcept { return names_.empty(); }
  const std::vector<std::string>& names() const noexcept { return names_; }

  std::optional<std::size_t> index_of(std::string_view name) const;

  // Same length and the same name at every position.
  bool matches(const std::vector<std::string>& row) const;

  // First name that occurs twice, if any (case-sensitive).
  static std::optional<std::string> find_duplicate(const std::vector<std::string>& names);

private:
  std::vector<std::string> names_;
  std::map<std::string, std::size_t, std::less<>> index_;
};

// Lightweight view over one decoded record. Valid until the iterator that
// produced it advances.
class RecordView {
public:
  RecordView() = default;
  RecordView(const Header* header,
             const std::vector<std::string>* fields,
             const SrcMeta* meta)
      : header_(header), fields_(fields), meta_(meta) {}

  std::size_t size() const noexcept { return fields_ ? fields_->size() : 0; }

  std::optional<std::string_view> by_index(std::size_t i) const {
    if (!fields_ || i >= fields_->size()) return std::nullopt;
    return std::string_view((*fields_)[i]);
  }

  std::optional<std::string_view> by_name(std::string_view name) const {
    if (!header_) return std::nullopt;
    auto idx = header_->index_of(name);
    if (!idx) return std::nullopt;
    return by_index(*idx);
  }

  // Header names; empty when the record carries none.
  const std::vector<std::string>& names() const;

  // Provenance captured when the record was classified.
  const SrcMeta& meta() const;

  const std::vector<std::string>* fields() const noexcept { return fields_; }

private:
  const Header* header_{nullptr};
  const std::vector<std::string>* fields_{nullptr};
  const SrcMeta* meta_{nullptr};
};

}
