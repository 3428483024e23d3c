#include "data.type.hh"
#include "errors.hh"
#include "macros.hh"

#include <charconv>

namespace {
struct TypeName
{
    DsioDataType kind;
    const char* name;
};

constexpr TypeName type_names[] = {
    { DsioDataType_uint8, "uint8" },     { DsioDataType_uint16, "uint16" },
    { DsioDataType_uint32, "uint32" },   { DsioDataType_uint64, "uint64" },
    { DsioDataType_int8, "int8" },       { DsioDataType_int16, "int16" },
    { DsioDataType_int32, "int32" },     { DsioDataType_int64, "int64" },
    { DsioDataType_float32, "float32" }, { DsioDataType_float64, "float64" },
    { DsioDataType_bool, "bool" },       { DsioDataType_object, "object" },
};

constexpr std::string_view string_prefix = "str";
} // namespace

size_t
dsio::bytes_of_type(DsioDataType data_type)
{
    switch (data_type) {
        case DsioDataType_int8:
        case DsioDataType_uint8:
        case DsioDataType_bool:
            return 1;
        case DsioDataType_int16:
        case DsioDataType_uint16:
            return 2;
        case DsioDataType_int32:
        case DsioDataType_uint32:
        case DsioDataType_float32:
            return 4;
        case DsioDataType_int64:
        case DsioDataType_uint64:
        case DsioDataType_float64:
        case DsioDataType_object: // pointer-sized references
            return 8;
        default:
            throw std::invalid_argument("Invalid data type: " +
                                        std::to_string(data_type));
    }
}

dsio::DataType::DataType(DsioDataType kind)
  : kind_(kind)
  , itemsize_(0)
{
    EXPECT_AS(UnsupportedDtypeError,
              kind < DsioDataTypeCount,
              "Invalid data type: ",
              static_cast<int>(kind));
    EXPECT_AS(UnsupportedDtypeError,
              kind != DsioDataType_string,
              "String types must be created with an explicit width");

    itemsize_ = bytes_of_type(kind);
}

dsio::DataType::DataType(DsioDataType kind, size_t itemsize)
  : kind_(kind)
  , itemsize_(itemsize)
{
}

dsio::DataType
dsio::DataType::string_of_width(size_t width)
{
    EXPECT_AS(UnsupportedDtypeError,
              width > 0,
              "String width must be nonzero");
    return { DsioDataType_string, width };
}

dsio::DataType
dsio::DataType::from_name(std::string_view name)
{
    for (const auto& [kind, type_name] : type_names) {
        if (name == type_name) {
            return DataType(kind);
        }
    }

    if (name.starts_with(string_prefix)) {
        const auto digits = name.substr(string_prefix.size());
        size_t width = 0;
        const auto [ptr, ec] = std::from_chars(
          digits.data(), digits.data() + digits.size(), width);
        if (ec == std::errc() && ptr == digits.data() + digits.size()) {
            return string_of_width(width);
        }
    }

    const std::string err =
      LOG_ERROR("Unrecognized data type: '", name, "'");
    throw UnsupportedDtypeError(err);
}

std::string
dsio::DataType::name() const
{
    if (kind_ == DsioDataType_string) {
        return std::string(string_prefix) + std::to_string(itemsize_);
    }

    for (const auto& [kind, type_name] : type_names) {
        if (kind == kind_) {
            return type_name;
        }
    }

    return "unknown";
}
