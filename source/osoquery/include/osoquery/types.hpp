#pragma once

#include "osoquery/string_pool.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace osoquery
{
    // ------------------------------------------------------------
    // Base types
    // ------------------------------------------------------------
    enum class BaseType : uint8_t
    {
        eUnknown = 0,
        eInt,
        eFloat,
        eString,
        ePoint,
        eVector,
        eNormal,
        eColor,
        eMatrix,
        eStruct,
        eVoid
    };

    // Number of scalar components per element: 3 for point/vector/normal/color,
    // 16 for matrix, 1 otherwise.
    uint32_t base_type_components(BaseType t);

    const char* base_type_name(BaseType t);

    // Returns false if the name is not a base type keyword.
    bool parse_base_type(std::string_view s, BaseType& out);

    // ------------------------------------------------------------
    // Type descriptor
    // ------------------------------------------------------------
    enum class ArrayKind : uint8_t
    {
        eNone = 0,
        eFixed,
        eUnsized
    };

    struct TypeDescriptor
    {
        BaseType  base      = BaseType::eUnknown;
        ArrayKind arrayKind = ArrayKind::eNone;

        // eFixed: declared length (0 is legal).
        // eUnsized: length resolved from the decoded default, 0 if none.
        uint32_t arrayLength = 0;

        bool isClosure = false;

        bool isArray() const { return arrayKind != ArrayKind::eNone; }
        bool isUnsizedArray() const { return arrayKind == ArrayKind::eUnsized; }

        bool operator==(const TypeDescriptor& o) const
        {
            return base == o.base && arrayKind == o.arrayKind && arrayLength == o.arrayLength &&
                   isClosure == o.isClosure;
        }
        bool operator!=(const TypeDescriptor& o) const { return !(*this == o); }
    };

    // "float", "color[3]", "string[]", "closure color"
    std::string type_descriptor_name(const TypeDescriptor& t);

    // ------------------------------------------------------------
    // Values
    // ------------------------------------------------------------
    enum class ValueKind : uint8_t
    {
        eInt = 0,
        eFloat,
        eString
    };

    // Tagged union over the three scalar sequences. Only the sequence
    // selected by `kind` is populated.
    struct ParameterValue
    {
        ValueKind kind = ValueKind::eFloat;

        std::vector<int32_t>  ints;
        std::vector<float>    floats;
        std::vector<StringId> strings;

        size_t size() const
        {
            switch (kind)
            {
                case ValueKind::eInt:
                    return ints.size();
                case ValueKind::eFloat:
                    return floats.size();
                case ValueKind::eString:
                    return strings.size();
            }
            return 0;
        }

        bool operator==(const ParameterValue& o) const
        {
            return kind == o.kind && ints == o.ints && floats == o.floats && strings == o.strings;
        }
        bool operator!=(const ParameterValue& o) const { return !(*this == o); }
    };

    // Scalar kind that values of this base type decode to.
    ValueKind value_kind_for(BaseType t);

    // ------------------------------------------------------------
    // Metadata / parameters
    // ------------------------------------------------------------
    struct Metadata
    {
        StringId       key = kInvalidStringId;
        TypeDescriptor type;
        ParameterValue value;

        bool operator==(const Metadata& o) const { return key == o.key && type == o.type && value == o.value; }
        bool operator!=(const Metadata& o) const { return !(*this == o); }
    };

    enum class Direction : uint8_t
    {
        eInput = 0,
        eOutput
    };

    struct Parameter
    {
        StringId       name = kInvalidStringId;
        TypeDescriptor type;
        Direction      direction = Direction::eInput;

        bool           hasDefault = false;
        ParameterValue defaultValue;

        std::vector<Metadata> metadata;

        // Compiler hints
        StringId              space      = kInvalidStringId; // %space{"world"}
        StringId              structName = kInvalidStringId; // %struct{"name"}
        std::vector<StringId> structFields;                  // %structfields{a,b}
        bool                  hasInitExpr = false;           // %initexpr

        bool isOutput() const { return direction == Direction::eOutput; }

        bool operator==(const Parameter& o) const
        {
            return name == o.name && type == o.type && direction == o.direction && hasDefault == o.hasDefault &&
                   defaultValue == o.defaultValue && metadata == o.metadata && space == o.space &&
                   structName == o.structName && structFields == o.structFields && hasInitExpr == o.hasInitExpr;
        }
        bool operator!=(const Parameter& o) const { return !(*this == o); }
    };
} // namespace osoquery
