#pragma once

/** \file schema.hpp
 *  \brief Attribute declarations and the record-reading seam.
 *
 * The classifier never inspects a record itself. It asks a RecordView for the
 * value of an attribute slot (its position in the Schema). Two views ship
 * with the library: MapRecordView over a name -> Value map, and
 * Binding<Record>::View, which calls per-attribute accessors on any record
 * type.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "verdict/error.hpp"
#include "verdict/value.hpp"

namespace verdict {

/** \brief Whether a record may omit an attribute. */
enum class Presence : std::uint8_t {
  required, /**< absence fails classify() with missing_attribute */
  optional, /**< absence is a wildcard-only lookup */
};

/** \brief Declaration of one attribute. */
struct AttributeSpec {
  std::string name;
  AttributeType type{AttributeType::string};
  Presence presence{Presence::required};
};

/** \brief Transparent string hash so lookups by string_view do not allocate. */
struct StringHash {
  using is_transparent = void;
  auto operator()(std::string_view s) const noexcept -> std::size_t {
    return std::hash<std::string_view>{}(s);
  }
};

/** \brief Ordered set of attribute declarations with unique names. */
class Schema {
public:
  Schema() = default;

  /** \brief Build from declarations; fails with invalid_argument on duplicate or empty names. */
  static auto from(std::vector<AttributeSpec> attributes) -> std::expected<Schema, core::error>;

  /** \brief Append a declaration. \return its slot */
  auto add(AttributeSpec decl) -> std::expected<std::size_t, core::error>;

  [[nodiscard]] auto find(std::string_view name) const -> std::optional<std::size_t>;
  [[nodiscard]] auto attribute(std::size_t slot) const -> const AttributeSpec& { return attributes_[slot]; }
  [[nodiscard]] auto attributes() const noexcept -> const std::vector<AttributeSpec>& { return attributes_; }
  [[nodiscard]] auto size() const noexcept -> std::size_t { return attributes_.size(); }

private:
  std::vector<AttributeSpec> attributes_;
  std::unordered_map<std::string, std::size_t, StringHash, std::equal_to<>> slots_;
};

/** \brief Per-record attribute reader supplied by the caller. */
class RecordView {
public:
  virtual ~RecordView() = default;

  /**
   * \brief Value of the attribute at \p slot (named \p name), or nullopt when absent.
   *
   * Thread-safety: must be callable concurrently if the same view is shared.
   */
  virtual auto value(std::size_t slot, std::string_view name) const -> std::optional<Value> = 0;
};

/** \brief Record as a plain name -> value map. */
using MapRecord = std::unordered_map<std::string, Value, StringHash, std::equal_to<>>;

/** \brief RecordView over a MapRecord; reads by attribute name. */
class MapRecordView final : public RecordView {
public:
  explicit MapRecordView(const MapRecord& record) noexcept : record_(&record) {}

  auto value(std::size_t slot, std::string_view name) const -> std::optional<Value> override;

private:
  const MapRecord* record_;
};

/**
 * \brief Accessor table binding a schema to an arbitrary record type.
 *
 * Example usage:
 * ```cpp
 * Binding<Order> binding(schema);
 * binding.bind("price", [](const Order& o) -> std::optional<Value> { return o.price; });
 * auto decision = classifier.classify(binding.view(order));
 * ```
 * Attributes without an accessor read as absent.
 */
template <typename Record>
class Binding {
public:
  using Accessor = std::function<std::optional<Value>(const Record&)>;

  explicit Binding(const Schema& schema) : schema_(schema), accessors_(schema.size()) {}

  /** \brief Attach an accessor; not_found if the schema lacks \p name. */
  auto bind(std::string_view name, Accessor accessor) -> std::expected<void, core::error> {
    const auto slot = schema_.find(name);
    if (!slot) {
      return std::unexpected(core::error{
          core::error_code::not_found,
          "Attribute '" + std::string(name) + "' is not declared in the schema",
          "binding.bind"});
    }
    accessors_[*slot] = std::move(accessor);
    return {};
  }

  /** \brief RecordView over one record; borrows both the binding and the record. */
  class View final : public RecordView {
  public:
    View(const Binding& binding, const Record& record) noexcept
        : binding_(&binding), record_(&record) {}

    auto value(std::size_t slot, std::string_view /*name*/) const -> std::optional<Value> override {
      if (slot >= binding_->accessors_.size()) return std::nullopt;
      const auto& fn = binding_->accessors_[slot];
      if (!fn) return std::nullopt;
      return fn(*record_);
    }

  private:
    const Binding* binding_;
    const Record* record_;
  };

  [[nodiscard]] auto view(const Record& record) const -> View { return View(*this, record); }

private:
  Schema schema_;
  std::vector<Accessor> accessors_;
};

} // namespace verdict
