#pragma once

// Runtime schema interpreter for composite protocol types.
//
// A Schema tree describes the wire layout of a value (struct fields in
// declaration order, enum variants keyed by a discriminant, lists and
// optionals with caller-selected length/presence strategies). read_value and
// write_value walk the tree recursively; there is no per-type generated code.

#include "byte_buffer.hpp"
#include "options.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace shared::io {

// ============================================================================
// Schema description
// ============================================================================

enum class SchemaKind : std::uint8_t {
    Bool,
    Byte,
    UByte,
    Short,
    UShort,
    Int,
    Long,
    Float,
    Double,
    String,
    Identifier,
    Uuid,
    Bytes,
    List,
    Optional,
    Struct,
    Enum,
};

const char* to_string(SchemaKind kind);

enum class DiscriminantEncoding : std::uint8_t {
    VarInt,
    UByte,
};

struct Schema;
using SchemaPtr = std::shared_ptr<const Schema>;

struct FieldSchema {
    std::string name;
    SchemaPtr schema;
    // Overrides the field schema's defaults when not monostate.
    Options options{};
};

struct VariantSchema {
    std::int32_t discriminant{0};
    std::string name;
    std::vector<FieldSchema> fields;
};

struct Schema {
    SchemaKind kind{SchemaKind::Bool};
    Options defaults{};

    // List / Optional element.
    SchemaPtr element{};

    // Struct fields.
    std::vector<FieldSchema> fields{};

    // Enum variants.
    std::vector<VariantSchema> variants{};
    DiscriminantEncoding discriminantEncoding{DiscriminantEncoding::VarInt};

    const VariantSchema* find_variant(std::int32_t discriminant) const;
};

// Builders. Kept short so packet tables read like the wire layout.
namespace schema {

SchemaPtr boolean();
SchemaPtr i8();
SchemaPtr u8();
SchemaPtr i16();
SchemaPtr u16();
SchemaPtr i32();
SchemaPtr var_int();
SchemaPtr i64();
SchemaPtr var_long();
SchemaPtr f32();
SchemaPtr f64();
SchemaPtr string(std::size_t maxLen = kDefaultStringMaxLen);
SchemaPtr identifier();
SchemaPtr uuid();
SchemaPtr bytes(ListOptions options = {});
SchemaPtr list(SchemaPtr element, ListOptions options = {});
SchemaPtr optional(SchemaPtr element, OptionalOptions options = {});
SchemaPtr record(std::vector<FieldSchema> fields);
SchemaPtr enumeration(DiscriminantEncoding encoding, std::vector<VariantSchema> variants);

} // namespace schema

// ============================================================================
// Value - dynamically typed decode result / encode input
// ============================================================================

enum class ValueKind : std::uint8_t {
    Null,
    Bool,
    Int,
    Float,
    String,
    Bytes,
    Uuid,
    List,
    Optional,
    Struct,
    Enum,
};

const char* to_string(ValueKind kind);

class Value {
public:
    Value() = default;

    static Value of_bool(bool v);
    static Value of_int(std::int64_t v);
    static Value of_float(double v);
    static Value of_string(std::string v);
    static Value of_bytes(std::vector<std::uint8_t> v);
    static Value of_uuid(const Uuid& v);
    static Value list(std::vector<Value> items);
    static Value none();
    static Value some(Value inner);
    static Value record();
    static Value variant(std::int32_t discriminant);

    // Struct and Enum only. Replaces an existing field of the same name.
    Value& set(std::string name, Value v);

    ValueKind kind() const { return kind_; }

    // Accessors throw CodecError(InvalidEncoding) on a kind mismatch.
    bool as_bool() const;
    std::int64_t as_int() const;
    double as_float() const;
    const std::string& as_string() const;
    const std::vector<std::uint8_t>& as_bytes() const;
    const Uuid& as_uuid() const;

    const std::vector<Value>& items() const;

    bool has_value() const;
    const Value& value() const;

    const Value& field(std::string_view name) const;
    const Value* find(std::string_view name) const;
    const std::vector<std::string>& field_names() const { return names_; }

    std::int32_t discriminant() const;

    bool operator==(const Value& other) const;

private:
    using Scalar = std::variant<std::monostate, bool, std::int64_t, double, std::string, std::vector<std::uint8_t>, Uuid>;

    void expect_kind_(ValueKind kind) const;

    ValueKind kind_{ValueKind::Null};
    Scalar scalar_{};
    std::vector<Value> children_{};
    std::vector<std::string> names_{};
    std::int32_t discriminant_{0};
};

// ============================================================================
// Interpreter
// ============================================================================

Value read_value(ByteReader& reader, const Schema& schema, const Options& options = {});
void write_value(ByteWriter& writer, const Value& value, const Schema& schema, const Options& options = {});

// Decodes a whole packet body; leftover bytes are InvalidEncoding.
Value decode(std::span<const std::uint8_t> body, const Schema& schema);
std::vector<std::uint8_t> encode(const Value& value, const Schema& schema);

// Validates a namespaced key and adds the "minecraft" namespace when absent.
// Throws CodecError(InvalidEncoding) on characters outside [a-z0-9_.-] (path also allows '/').
std::string normalize_identifier(std::string_view key);

} // namespace shared::io
