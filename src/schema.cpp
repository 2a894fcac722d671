/** \file schema.cpp
 *  \brief Schema declarations and the map-backed record view
 */

#include "verdict/schema.hpp"

#include <utility>

namespace verdict {

auto Schema::from(std::vector<AttributeSpec> attributes) -> std::expected<Schema, core::error> {
  Schema schema;
  for (auto& decl : attributes) {
    auto r = schema.add(std::move(decl));
    if (!r) return std::unexpected(r.error());
  }
  return schema;
}

auto Schema::add(AttributeSpec decl) -> std::expected<std::size_t, core::error> {
  if (decl.name.empty()) {
    return std::unexpected(core::error{
        core::error_code::invalid_argument, "Attribute name must not be empty", "schema.add"});
  }
  if (slots_.find(decl.name) != slots_.end()) {
    return std::unexpected(core::error{
        core::error_code::invalid_argument,
        "Attribute '" + decl.name + "' declared twice",
        "schema.add"});
  }
  const std::size_t slot = attributes_.size();
  slots_.emplace(decl.name, slot);
  attributes_.push_back(std::move(decl));
  return slot;
}

auto Schema::find(std::string_view name) const -> std::optional<std::size_t> {
  auto it = slots_.find(name);
  if (it == slots_.end()) return std::nullopt;
  return it->second;
}

auto MapRecordView::value(std::size_t /*slot*/, std::string_view name) const -> std::optional<Value> {
  auto it = record_->find(name);
  if (it == record_->end()) return std::nullopt;
  return it->second;
}

} // namespace verdict
