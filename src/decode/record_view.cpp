#include "source_mux/record_view.hpp"

#include <set>
#include <utility>

namespace smux {

Header::Header(std::vector<std::string> names) : names_(std::move(names)) {
  for (std::size_t i = 0; i < names_.size(); ++i) index_.emplace(names_[i], i);
}

std::optional<std::size_t> Header::index_of(std::string_view name) const {
  auto it = index_.find(name);
  if (it == index_.end()) return std::nullopt;
  return it->second;
}

bool Header::matches(const std::vector<std::string>& row) const {
  return row == names_;
}

std::optional<std::string> Header::find_duplicate(const std::vector<std::string>& names) {
  std::set<std::string_view> seen;
  for (const auto& n : names) {
    if (!seen.insert(n).second) return n;
  }
  return std::nullopt;
}

const std::vector<std::string>& RecordView::names() const {
  static const std::vector<std::string> none;
  return header_ ? header_->names() : none;
}

const SrcMeta& RecordView::meta() const {
  static const SrcMeta none;
  return meta_ ? *meta_ : none;
}

}
