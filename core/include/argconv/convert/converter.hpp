// argconv/convert/converter.hpp - Converter base class and registry
//
// A Converter turns a value into the declared type described by a TypeInfo.
// Converters form a tree mirroring the TypeInfo tree: `list[dict[str, int]]`
// becomes a list converter owning a dictionary converter owning a string and
// an integer converter. Trees are built once by Converter::converter_for()
// and are immutable afterwards.
//
// Following the LLVM/Clang style, each concrete converter has a
// ConverterKind and a classof() for isa/cast/dyn_cast.
//
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <gsl/span>

#include "argconv/basic/casting.hpp"
#include "argconv/basic/errors.hpp"
#include "argconv/types/type_info.hpp"
#include "argconv/value/value.hpp"

namespace argconv
{

class CustomConverters;
class Languages;

// ============================================================================
// Converter Kind
// ============================================================================

enum class ConverterKind : uint8_t {
  // Resolution
  Enum,

  // Scalars
  Any,
  String,
  Boolean,
  Integer,
  Float,
  Decimal,
  Bytes,
  ByteArray,
  DateTime,
  Date,
  TimeDelta,
  Path,
  None,

  // Containers
  List,
  Tuple,
  TypedDict,
  Dictionary,
  Set,
  FrozenSet,

  // Resolution
  Union,
  Literal,

  // Special
  Custom,
  Unknown,
};

[[nodiscard]] std::string_view to_string(ConverterKind kind) noexcept;

// ============================================================================
// Converter
// ============================================================================

class Converter
{
public:
  const ConverterKind kind;

  Converter(const Converter &) = delete;
  Converter & operator=(const Converter &) = delete;
  Converter(Converter &&) = delete;
  Converter & operator=(Converter &&) = delete;
  virtual ~Converter() = default;

  /**
   * Build the converter tree for a declared type.
   *
   * Resolution order, first match wins:
   * 1. unknown type: UnknownConverter
   * 2. a custom converter registered for exactly this type
   * 3. the built-in converter registered for exactly this type
   * 4. the first built-in (in registration order) that handles the type
   *    structurally, e.g. a class deriving from Sequence gets the list
   *    converter
   * 5. UnknownConverter
   *
   * @param custom Custom converters; may be null
   * @param languages Boolean vocabulary; created on first use when null
   */
  [[nodiscard]] static std::unique_ptr<Converter> converter_for(
    const TypeInfo & info, const CustomConverters * custom = nullptr,
    std::shared_ptr<const Languages> languages = nullptr);

  [[nodiscard]] ConverterKind get_kind() const noexcept { return kind; }

  /**
   * Convert a value.
   *
   * @param name Argument or item name used in error messages
   * @param kind What is converted ("Argument", "Item", "Key", ...)
   * @throws ConversionError describing the value, its type and the target type
   */
  [[nodiscard]] virtual Value convert(
    const Value & value, std::optional<std::string_view> name = std::nullopt,
    std::string_view kind = "Argument") const;

  /// Whether `value` already has the declared type.
  [[nodiscard]] virtual bool no_conversion_needed(const Value & value) const;

  /**
   * Check the whole tree for unrecognized types.
   *
   * @throws UnrecognizedTypeError
   */
  virtual void validate() const;

  [[nodiscard]] const TypeInfo & type_info() const noexcept { return type_info_; }

  /// Name used in messages: "integer", "list[int]", "int or None", ...
  [[nodiscard]] const std::string & type_name() const noexcept { return type_name_; }

  /// Accepted input types; an entry of TypeKind::Any accepts everything.
  [[nodiscard]] gsl::span<const DeclaredType> value_types() const noexcept { return value_types_; }

  [[nodiscard]] gsl::span<const std::unique_ptr<Converter>> nested() const noexcept
  {
    return nested_;
  }

  /// Documentation of the target type, if any.
  [[nodiscard]] virtual std::optional<std::string> doc() const { return std::nullopt; }

protected:
  Converter(
    ConverterKind k, TypeInfo info, const CustomConverters * custom,
    std::shared_ptr<const Languages> languages);

  /// Build nested converters and the type name; must run once after construction.
  void initialize();

  /// Build nested converters from `type_info().nested`.
  virtual void build_nested();

  /// The static name when nothing is nested, otherwise the declared type rendering.
  [[nodiscard]] virtual std::string compute_type_name() const;

  /// Whether `value` is of an accepted input type.
  [[nodiscard]] virtual bool handles_value(const Value & value) const;

  /// Convert string input.
  [[nodiscard]] virtual Value do_convert(const Value & value) const = 0;

  /// Convert non-string input; defaults to do_convert().
  [[nodiscard]] virtual Value non_string_convert(const Value & value) const
  {
    return do_convert(value);
  }

  /// Throw the uniform "cannot be converted" error, with `error` as detail.
  [[noreturn]] void handle_error(
    const Value & value, std::optional<std::string_view> name, std::string_view kind,
    const ConversionError * error) const;

  /// Evaluate literal text that must produce a value of kind `expected`.
  [[nodiscard]] static Value literal_eval(const std::string & text, TypeKind expected);

  /// Drop spaces and underscores used as digit separators.
  [[nodiscard]] static std::string remove_number_separators(std::string_view text);

  [[nodiscard]] std::unique_ptr<Converter> make_nested(const TypeInfo & info) const;

  [[nodiscard]] const Languages & languages() const;

  /// Type the converter produces; used when the declared type is not a class.
  DeclaredType primitive_type_;
  /// Name used when nothing is nested; empty to always render the declared type.
  std::string static_name_;
  std::vector<DeclaredType> value_types_ = {TypeKind::String};
  std::vector<std::unique_ptr<Converter>> nested_;

private:
  TypeInfo type_info_;
  std::string type_name_;
  const CustomConverters * custom_;
  mutable std::shared_ptr<const Languages> languages_;
};

// ============================================================================
// CRTP Base for Automatic classof()
// ============================================================================

/**
 * CRTP base class that implements classof().
 *
 * @tparam Derived The concrete converter class
 * @tparam Base The base class to inherit from
 * @tparam K The ConverterKind for this converter
 */
template <typename Derived, typename Base, ConverterKind K>
class ConverterBase : public Base
{
public:
  static constexpr ConverterKind converter_kind = K;

  static bool classof(const Converter * conv) { return conv->get_kind() == K; }

  /// Construct and initialize a converter of this kind.
  template <typename... Args>
  [[nodiscard]] static std::unique_ptr<Converter> create(Args &&... args)
  {
    std::unique_ptr<Derived> conv(new Derived(std::forward<Args>(args)...));
    conv->initialize();
    return conv;
  }

protected:
  ConverterBase(
    TypeInfo info, const CustomConverters * custom, std::shared_ptr<const Languages> languages)
  : Base(K, std::move(info), custom, std::move(languages))
  {
  }
};

/// Declares the protected constructor and lets create() reach it.
#define ARGCONV_CONVERTER_BOILERPLATE(Name, Base, Kind)      \
  friend class ConverterBase<Name, Base, ConverterKind::Kind>; \
                                                             \
protected:                                                   \
  Name(TypeInfo info, const CustomConverters * custom,       \
       std::shared_ptr<const Languages> languages);

// ============================================================================
// Unknown-Type Sentinel
// ============================================================================

/**
 * Stands in for a type no converter recognizes.
 *
 * Values pass through unchanged; validate() always fails so that callers
 * checking their declared types up front find the problem before any data
 * is converted.
 */
class UnknownConverter : public ConverterBase<UnknownConverter, Converter, ConverterKind::Unknown>
{
  friend class ConverterBase<UnknownConverter, Converter, ConverterKind::Unknown>;

public:
  [[nodiscard]] Value convert(
    const Value & value, std::optional<std::string_view> name = std::nullopt,
    std::string_view kind = "Argument") const override;

  void validate() const override;

protected:
  using ConverterBase::ConverterBase;

  [[nodiscard]] Value do_convert(const Value & value) const override { return value; }
};

}  // namespace argconv
