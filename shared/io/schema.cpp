#include "schema.hpp"

#include <algorithm>
#include <limits>

namespace shared::io {

namespace {

const Options& effective_options(const Schema& schema, const Options& options) {
    if (std::holds_alternative<std::monostate>(options)) {
        return schema.defaults;
    }
    return options;
}

template <typename T>
T options_or_default(const Options& options) {
    if (const T* o = std::get_if<T>(&options)) {
        return *o;
    }
    return T{};
}

void check_range(std::int64_t v, std::int64_t lo, std::int64_t hi, SchemaKind kind) {
    if (v < lo || v > hi) {
        throw CodecError(ErrorKind::ExceededBound,
                         "value " + std::to_string(v) + " out of range for " + to_string(kind));
    }
}

bool is_namespace_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '.' || c == '-';
}

bool is_path_char(char c) {
    return is_namespace_char(c) || c == '/';
}

Value read_impl(ByteReader& reader, const Schema& schema, const Options& options, const Value* parent);
void write_impl(ByteWriter& writer, const Value& value, const Schema& schema, const Options& options, const Value* parent);

// Element count for a list-like value about to be read.
std::size_t read_count(ByteReader& reader, const ListOptions& opts) {
    std::size_t count = 0;
    switch (opts.length) {
        case LengthMode::VarIntPrefixed: count = reader.read_length(); break;
        case LengthMode::Fixed: count = opts.fixedCount; break;
        case LengthMode::Remaining: count = reader.remaining(); break;
    }
    if (opts.maxLen && count > *opts.maxLen) {
        throw CodecError(ErrorKind::ExceededBound,
                         "declared length " + std::to_string(count) + " exceeds max " + std::to_string(*opts.maxLen));
    }
    return count;
}

void write_count(ByteWriter& writer, std::size_t count, const ListOptions& opts) {
    if (opts.maxLen && count > *opts.maxLen) {
        throw CodecError(ErrorKind::ExceededBound,
                         "length " + std::to_string(count) + " exceeds max " + std::to_string(*opts.maxLen));
    }
    switch (opts.length) {
        case LengthMode::VarIntPrefixed:
            if (count > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
                throw CodecError(ErrorKind::ExceededBound, "length does not fit a VarInt");
            }
            writer.write_var_int(static_cast<std::int32_t>(count));
            break;
        case LengthMode::Fixed:
            if (count != opts.fixedCount) {
                throw CodecError(ErrorKind::InvalidEncoding,
                                 "expected exactly " + std::to_string(opts.fixedCount) + " elements, got " + std::to_string(count));
            }
            break;
        case LengthMode::Remaining:
            break;
    }
}

bool external_presence(const OptionalOptions& opts, const Value* parent) {
    const Value* tag = parent ? parent->find(opts.presentIf) : nullptr;
    if (!tag || tag->kind() != ValueKind::Bool) {
        throw CodecError(ErrorKind::InvalidEncoding,
                         "optional presence field '" + opts.presentIf + "' is missing or not a bool");
    }
    return tag->as_bool();
}

Value read_fields(ByteReader& reader, const std::vector<FieldSchema>& fields, Value out) {
    for (const auto& f : fields) {
        Value v = read_impl(reader, *f.schema, f.options, &out);
        out.set(f.name, std::move(v));
    }
    return out;
}

void write_fields(ByteWriter& writer, const Value& value, const std::vector<FieldSchema>& fields) {
    for (const auto& f : fields) {
        write_impl(writer, value.field(f.name), *f.schema, f.options, &value);
    }
}

Value read_impl(ByteReader& reader, const Schema& schema, const Options& options, const Value* parent) {
    const Options& opts = effective_options(schema, options);

    switch (schema.kind) {
        case SchemaKind::Bool: return Value::of_bool(reader.read_bool());
        case SchemaKind::Byte: return Value::of_int(reader.read_i8());
        case SchemaKind::UByte: return Value::of_int(reader.read_u8());
        case SchemaKind::Short: return Value::of_int(reader.read_i16());
        case SchemaKind::UShort: return Value::of_int(reader.read_u16());
        case SchemaKind::Int: {
            const bool varint = options_or_default<IntOptions>(opts).varint;
            return Value::of_int(varint ? reader.read_var_int() : reader.read_i32());
        }
        case SchemaKind::Long: {
            const bool varint = options_or_default<IntOptions>(opts).varint;
            return Value::of_int(varint ? reader.read_var_long() : reader.read_i64());
        }
        case SchemaKind::Float: return Value::of_float(reader.read_f32());
        case SchemaKind::Double: return Value::of_float(reader.read_f64());
        case SchemaKind::String: {
            const auto so = options_or_default<StringOptions>(opts);
            return Value::of_string(reader.read_string(so.maxLen.value_or(kDefaultStringMaxLen)));
        }
        case SchemaKind::Identifier:
            return Value::of_string(normalize_identifier(reader.read_string(kDefaultStringMaxLen)));
        case SchemaKind::Uuid: return Value::of_uuid(reader.read_uuid());
        case SchemaKind::Bytes: {
            const std::size_t count = read_count(reader, options_or_default<ListOptions>(opts));
            auto span = reader.read_bytes(count);
            return Value::of_bytes(std::vector<std::uint8_t>(span.begin(), span.end()));
        }
        case SchemaKind::List: {
            const auto lo = options_or_default<ListOptions>(opts);
            std::vector<Value> items;
            if (lo.length == LengthMode::Remaining) {
                while (!reader.at_end()) {
                    items.push_back(read_impl(reader, *schema.element, {}, nullptr));
                    if (lo.maxLen && items.size() > *lo.maxLen) {
                        throw CodecError(ErrorKind::ExceededBound, "list exceeds max " + std::to_string(*lo.maxLen));
                    }
                }
                return Value::list(std::move(items));
            }
            const std::size_t count = read_count(reader, lo);
            // A declared count cannot be trusted for the reservation; every element takes at least one byte.
            items.reserve(std::min(count, reader.remaining()));
            for (std::size_t i = 0; i < count; ++i) {
                items.push_back(read_impl(reader, *schema.element, {}, nullptr));
            }
            return Value::list(std::move(items));
        }
        case SchemaKind::Optional: {
            const auto oo = options_or_default<OptionalOptions>(opts);
            bool present = false;
            switch (oo.tag) {
                case TagMode::Bool: present = reader.read_bool(); break;
                case TagMode::External: present = external_presence(oo, parent); break;
                case TagMode::Remaining: present = !reader.at_end(); break;
            }
            if (!present) return Value::none();
            return Value::some(read_impl(reader, *schema.element, {}, nullptr));
        }
        case SchemaKind::Struct:
            return read_fields(reader, schema.fields, Value::record());
        case SchemaKind::Enum: {
            std::int32_t d = 0;
            if (schema.discriminantEncoding == DiscriminantEncoding::UByte) {
                d = reader.read_u8();
            } else {
                d = reader.read_var_int();
            }
            const VariantSchema* variant = schema.find_variant(d);
            if (!variant) {
                throw CodecError(ErrorKind::InvalidEncoding, "unknown enum discriminant " + std::to_string(d));
            }
            return read_fields(reader, variant->fields, Value::variant(d));
        }
    }
    throw CodecError(ErrorKind::InvalidEncoding, "unhandled schema kind");
}

void write_impl(ByteWriter& writer, const Value& value, const Schema& schema, const Options& options, const Value* parent) {
    const Options& opts = effective_options(schema, options);

    switch (schema.kind) {
        case SchemaKind::Bool: writer.write_bool(value.as_bool()); return;
        case SchemaKind::Byte: {
            const auto v = value.as_int();
            check_range(v, -128, 127, schema.kind);
            writer.write_i8(static_cast<std::int8_t>(v));
            return;
        }
        case SchemaKind::UByte: {
            const auto v = value.as_int();
            check_range(v, 0, 255, schema.kind);
            writer.write_u8(static_cast<std::uint8_t>(v));
            return;
        }
        case SchemaKind::Short: {
            const auto v = value.as_int();
            check_range(v, -32768, 32767, schema.kind);
            writer.write_i16(static_cast<std::int16_t>(v));
            return;
        }
        case SchemaKind::UShort: {
            const auto v = value.as_int();
            check_range(v, 0, 65535, schema.kind);
            writer.write_u16(static_cast<std::uint16_t>(v));
            return;
        }
        case SchemaKind::Int: {
            const auto v = value.as_int();
            check_range(v, std::numeric_limits<std::int32_t>::min(), std::numeric_limits<std::int32_t>::max(), schema.kind);
            if (options_or_default<IntOptions>(opts).varint) {
                writer.write_var_int(static_cast<std::int32_t>(v));
            } else {
                writer.write_i32(static_cast<std::int32_t>(v));
            }
            return;
        }
        case SchemaKind::Long: {
            const auto v = value.as_int();
            if (options_or_default<IntOptions>(opts).varint) {
                writer.write_var_long(v);
            } else {
                writer.write_i64(v);
            }
            return;
        }
        case SchemaKind::Float: writer.write_f32(static_cast<float>(value.as_float())); return;
        case SchemaKind::Double: writer.write_f64(value.as_float()); return;
        case SchemaKind::String: {
            const auto so = options_or_default<StringOptions>(opts);
            writer.write_string(value.as_string(), so.maxLen.value_or(kDefaultStringMaxLen));
            return;
        }
        case SchemaKind::Identifier:
            writer.write_string(normalize_identifier(value.as_string()), kDefaultStringMaxLen);
            return;
        case SchemaKind::Uuid: writer.write_uuid(value.as_uuid()); return;
        case SchemaKind::Bytes: {
            const auto& bytes = value.as_bytes();
            write_count(writer, bytes.size(), options_or_default<ListOptions>(opts));
            writer.write_bytes(bytes);
            return;
        }
        case SchemaKind::List: {
            const auto& items = value.items();
            write_count(writer, items.size(), options_or_default<ListOptions>(opts));
            for (const auto& item : items) {
                write_impl(writer, item, *schema.element, {}, nullptr);
            }
            return;
        }
        case SchemaKind::Optional: {
            const auto oo = options_or_default<OptionalOptions>(opts);
            const bool present = value.has_value();
            if (oo.tag == TagMode::Bool) {
                writer.write_bool(present);
            } else if (oo.tag == TagMode::External && external_presence(oo, parent) != present) {
                throw CodecError(ErrorKind::InvalidEncoding,
                                 "optional presence disagrees with field '" + oo.presentIf + "'");
            }
            if (present) {
                write_impl(writer, value.value(), *schema.element, {}, nullptr);
            }
            return;
        }
        case SchemaKind::Struct:
            if (value.kind() != ValueKind::Struct) {
                throw CodecError(ErrorKind::InvalidEncoding,
                                 std::string("expected struct value, got ") + to_string(value.kind()));
            }
            write_fields(writer, value, schema.fields);
            return;
        case SchemaKind::Enum: {
            const std::int32_t d = value.discriminant();
            const VariantSchema* variant = schema.find_variant(d);
            if (!variant) {
                throw CodecError(ErrorKind::InvalidEncoding, "unknown enum discriminant " + std::to_string(d));
            }
            if (schema.discriminantEncoding == DiscriminantEncoding::UByte) {
                check_range(d, 0, 255, SchemaKind::UByte);
                writer.write_u8(static_cast<std::uint8_t>(d));
            } else {
                writer.write_var_int(d);
            }
            write_fields(writer, value, variant->fields);
            return;
        }
    }
    throw CodecError(ErrorKind::InvalidEncoding, "unhandled schema kind");
}

SchemaPtr make(SchemaKind kind, Options defaults = {}) {
    auto s = std::make_shared<Schema>();
    s->kind = kind;
    s->defaults = std::move(defaults);
    return s;
}

} // namespace

// =============================================================================
// Names
// =============================================================================

const char* to_string(SchemaKind kind) {
    switch (kind) {
        case SchemaKind::Bool: return "Bool";
        case SchemaKind::Byte: return "Byte";
        case SchemaKind::UByte: return "UByte";
        case SchemaKind::Short: return "Short";
        case SchemaKind::UShort: return "UShort";
        case SchemaKind::Int: return "Int";
        case SchemaKind::Long: return "Long";
        case SchemaKind::Float: return "Float";
        case SchemaKind::Double: return "Double";
        case SchemaKind::String: return "String";
        case SchemaKind::Identifier: return "Identifier";
        case SchemaKind::Uuid: return "Uuid";
        case SchemaKind::Bytes: return "Bytes";
        case SchemaKind::List: return "List";
        case SchemaKind::Optional: return "Optional";
        case SchemaKind::Struct: return "Struct";
        case SchemaKind::Enum: return "Enum";
    }
    return "?";
}

const char* to_string(ValueKind kind) {
    switch (kind) {
        case ValueKind::Null: return "null";
        case ValueKind::Bool: return "bool";
        case ValueKind::Int: return "int";
        case ValueKind::Float: return "float";
        case ValueKind::String: return "string";
        case ValueKind::Bytes: return "bytes";
        case ValueKind::Uuid: return "uuid";
        case ValueKind::List: return "list";
        case ValueKind::Optional: return "optional";
        case ValueKind::Struct: return "struct";
        case ValueKind::Enum: return "enum";
    }
    return "?";
}

const VariantSchema* Schema::find_variant(std::int32_t discriminant) const {
    for (const auto& v : variants) {
        if (v.discriminant == discriminant) return &v;
    }
    return nullptr;
}

// =============================================================================
// Builders
// =============================================================================

namespace schema {

SchemaPtr boolean() { return make(SchemaKind::Bool); }
SchemaPtr i8() { return make(SchemaKind::Byte); }
SchemaPtr u8() { return make(SchemaKind::UByte); }
SchemaPtr i16() { return make(SchemaKind::Short); }
SchemaPtr u16() { return make(SchemaKind::UShort); }
SchemaPtr i32() { return make(SchemaKind::Int); }
SchemaPtr var_int() { return make(SchemaKind::Int, IntOptions{true}); }
SchemaPtr i64() { return make(SchemaKind::Long); }
SchemaPtr var_long() { return make(SchemaKind::Long, IntOptions{true}); }
SchemaPtr f32() { return make(SchemaKind::Float); }
SchemaPtr f64() { return make(SchemaKind::Double); }
SchemaPtr string(std::size_t maxLen) { return make(SchemaKind::String, StringOptions{maxLen}); }
SchemaPtr identifier() { return make(SchemaKind::Identifier); }
SchemaPtr uuid() { return make(SchemaKind::Uuid); }
SchemaPtr bytes(ListOptions options) { return make(SchemaKind::Bytes, options); }

SchemaPtr list(SchemaPtr element, ListOptions options) {
    auto s = std::make_shared<Schema>();
    s->kind = SchemaKind::List;
    s->defaults = options;
    s->element = std::move(element);
    return s;
}

SchemaPtr optional(SchemaPtr element, OptionalOptions options) {
    auto s = std::make_shared<Schema>();
    s->kind = SchemaKind::Optional;
    s->defaults = std::move(options);
    s->element = std::move(element);
    return s;
}

SchemaPtr record(std::vector<FieldSchema> fields) {
    auto s = std::make_shared<Schema>();
    s->kind = SchemaKind::Struct;
    s->fields = std::move(fields);
    return s;
}

SchemaPtr enumeration(DiscriminantEncoding encoding, std::vector<VariantSchema> variants) {
    auto s = std::make_shared<Schema>();
    s->kind = SchemaKind::Enum;
    s->discriminantEncoding = encoding;
    s->variants = std::move(variants);
    return s;
}

} // namespace schema

// =============================================================================
// Value
// =============================================================================

Value Value::of_bool(bool v) {
    Value out;
    out.kind_ = ValueKind::Bool;
    out.scalar_ = v;
    return out;
}

Value Value::of_int(std::int64_t v) {
    Value out;
    out.kind_ = ValueKind::Int;
    out.scalar_ = v;
    return out;
}

Value Value::of_float(double v) {
    Value out;
    out.kind_ = ValueKind::Float;
    out.scalar_ = v;
    return out;
}

Value Value::of_string(std::string v) {
    Value out;
    out.kind_ = ValueKind::String;
    out.scalar_ = std::move(v);
    return out;
}

Value Value::of_bytes(std::vector<std::uint8_t> v) {
    Value out;
    out.kind_ = ValueKind::Bytes;
    out.scalar_ = std::move(v);
    return out;
}

Value Value::of_uuid(const Uuid& v) {
    Value out;
    out.kind_ = ValueKind::Uuid;
    out.scalar_ = v;
    return out;
}

Value Value::list(std::vector<Value> items) {
    Value out;
    out.kind_ = ValueKind::List;
    out.children_ = std::move(items);
    return out;
}

Value Value::none() {
    Value out;
    out.kind_ = ValueKind::Optional;
    return out;
}

Value Value::some(Value inner) {
    Value out;
    out.kind_ = ValueKind::Optional;
    out.children_.push_back(std::move(inner));
    return out;
}

Value Value::record() {
    Value out;
    out.kind_ = ValueKind::Struct;
    return out;
}

Value Value::variant(std::int32_t discriminant) {
    Value out;
    out.kind_ = ValueKind::Enum;
    out.discriminant_ = discriminant;
    return out;
}

Value& Value::set(std::string name, Value v) {
    if (kind_ != ValueKind::Struct && kind_ != ValueKind::Enum) {
        throw CodecError(ErrorKind::InvalidEncoding,
                         std::string("cannot set field on ") + to_string(kind_) + " value");
    }
    for (std::size_t i = 0; i < names_.size(); ++i) {
        if (names_[i] == name) {
            children_[i] = std::move(v);
            return *this;
        }
    }
    names_.push_back(std::move(name));
    children_.push_back(std::move(v));
    return *this;
}

void Value::expect_kind_(ValueKind kind) const {
    if (kind_ != kind) {
        throw CodecError(ErrorKind::InvalidEncoding,
                         std::string("expected ") + to_string(kind) + " value, got " + to_string(kind_));
    }
}

bool Value::as_bool() const {
    expect_kind_(ValueKind::Bool);
    return std::get<bool>(scalar_);
}

std::int64_t Value::as_int() const {
    expect_kind_(ValueKind::Int);
    return std::get<std::int64_t>(scalar_);
}

double Value::as_float() const {
    expect_kind_(ValueKind::Float);
    return std::get<double>(scalar_);
}

const std::string& Value::as_string() const {
    expect_kind_(ValueKind::String);
    return std::get<std::string>(scalar_);
}

const std::vector<std::uint8_t>& Value::as_bytes() const {
    expect_kind_(ValueKind::Bytes);
    return std::get<std::vector<std::uint8_t>>(scalar_);
}

const Uuid& Value::as_uuid() const {
    expect_kind_(ValueKind::Uuid);
    return std::get<Uuid>(scalar_);
}

const std::vector<Value>& Value::items() const {
    expect_kind_(ValueKind::List);
    return children_;
}

bool Value::has_value() const {
    expect_kind_(ValueKind::Optional);
    return !children_.empty();
}

const Value& Value::value() const {
    if (!has_value()) {
        throw CodecError(ErrorKind::InvalidEncoding, "optional value is empty");
    }
    return children_.front();
}

const Value* Value::find(std::string_view name) const {
    if (kind_ != ValueKind::Struct && kind_ != ValueKind::Enum) {
        return nullptr;
    }
    for (std::size_t i = 0; i < names_.size(); ++i) {
        if (names_[i] == name) return &children_[i];
    }
    return nullptr;
}

const Value& Value::field(std::string_view name) const {
    const Value* v = find(name);
    if (!v) {
        throw CodecError(ErrorKind::InvalidEncoding, "missing field '" + std::string(name) + "'");
    }
    return *v;
}

std::int32_t Value::discriminant() const {
    expect_kind_(ValueKind::Enum);
    return discriminant_;
}

bool Value::operator==(const Value& other) const {
    return kind_ == other.kind_ &&
           discriminant_ == other.discriminant_ &&
           scalar_ == other.scalar_ &&
           names_ == other.names_ &&
           children_ == other.children_;
}

// =============================================================================
// Entry points
// =============================================================================

Value read_value(ByteReader& reader, const Schema& schema, const Options& options) {
    return read_impl(reader, schema, options, nullptr);
}

void write_value(ByteWriter& writer, const Value& value, const Schema& schema, const Options& options) {
    write_impl(writer, value, schema, options, nullptr);
}

Value decode(std::span<const std::uint8_t> body, const Schema& schema) {
    ByteReader reader(body);
    Value v = read_value(reader, schema);
    if (!reader.at_end()) {
        throw CodecError(ErrorKind::InvalidEncoding,
                         std::to_string(reader.remaining()) + " trailing bytes after " + to_string(schema.kind));
    }
    return v;
}

std::vector<std::uint8_t> encode(const Value& value, const Schema& schema) {
    ByteWriter writer;
    write_value(writer, value, schema);
    return writer.take();
}

std::string normalize_identifier(std::string_view key) {
    std::string_view ns = "minecraft";
    std::string_view path = key;

    const auto colon = key.find(':');
    if (colon != std::string_view::npos) {
        ns = key.substr(0, colon);
        path = key.substr(colon + 1);
    }

    if (ns.empty() || path.empty()) {
        throw CodecError(ErrorKind::InvalidEncoding, "empty namespace or path in key '" + std::string(key) + "'");
    }
    if (!std::all_of(ns.begin(), ns.end(), is_namespace_char)) {
        throw CodecError(ErrorKind::InvalidEncoding, "non [a-z0-9_.-] character in namespace: " + std::string(ns));
    }
    if (!std::all_of(path.begin(), path.end(), is_path_char)) {
        throw CodecError(ErrorKind::InvalidEncoding, "non [a-z0-9_.-/] character in path: " + std::string(path));
    }

    std::string out;
    out.reserve(ns.size() + 1 + path.size());
    out.append(ns);
    out.push_back(':');
    out.append(path);
    return out;
}

} // namespace shared::io
