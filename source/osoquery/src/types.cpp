#include "osoquery/result.hpp"
#include "osoquery/types.hpp"

namespace osoquery
{
    const char* error_code_name(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::eOk:
                return "Ok";
            case ErrorCode::eIO:
                return "IO";
            case ErrorCode::eInvalidArgument:
                return "InvalidArgument";
            case ErrorCode::eMalformedToken:
                return "MalformedToken";
            case ErrorCode::eUnknownType:
                return "UnknownType";
            case ErrorCode::eInvalidArraySize:
                return "InvalidArraySize";
            case ErrorCode::eArityMismatch:
                return "ArityMismatch";
            case ErrorCode::eTypeMismatch:
                return "TypeMismatch";
            case ErrorCode::eUnexpectedDeclaration:
                return "UnexpectedDeclaration";
            case ErrorCode::eDuplicateParameterName:
                return "DuplicateParameterName";
            case ErrorCode::eUnexpectedEndOfInput:
                return "UnexpectedEndOfInput";
            case ErrorCode::eIndexOutOfRange:
                return "IndexOutOfRange";
        }
        return "Unknown";
    }

    uint32_t base_type_components(BaseType t)
    {
        switch (t)
        {
            case BaseType::ePoint:
            case BaseType::eVector:
            case BaseType::eNormal:
            case BaseType::eColor:
                return 3;
            case BaseType::eMatrix:
                return 16;
            default:
                return 1;
        }
    }

    const char* base_type_name(BaseType t)
    {
        switch (t)
        {
            case BaseType::eUnknown:
                return "unknown";
            case BaseType::eInt:
                return "int";
            case BaseType::eFloat:
                return "float";
            case BaseType::eString:
                return "string";
            case BaseType::ePoint:
                return "point";
            case BaseType::eVector:
                return "vector";
            case BaseType::eNormal:
                return "normal";
            case BaseType::eColor:
                return "color";
            case BaseType::eMatrix:
                return "matrix";
            case BaseType::eStruct:
                return "struct";
            case BaseType::eVoid:
                return "void";
        }
        return "unknown";
    }

    bool parse_base_type(std::string_view s, BaseType& out)
    {
        static constexpr BaseType kAll[] = {BaseType::eInt,
                                            BaseType::eFloat,
                                            BaseType::eString,
                                            BaseType::ePoint,
                                            BaseType::eVector,
                                            BaseType::eNormal,
                                            BaseType::eColor,
                                            BaseType::eMatrix,
                                            BaseType::eStruct,
                                            BaseType::eVoid};

        for (BaseType t : kAll)
        {
            if (s == base_type_name(t))
            {
                out = t;
                return true;
            }
        }
        return false;
    }

    std::string type_descriptor_name(const TypeDescriptor& t)
    {
        std::string s;
        if (t.isClosure)
            s = "closure ";
        s += base_type_name(t.base);

        if (t.arrayKind == ArrayKind::eFixed)
            s += "[" + std::to_string(t.arrayLength) + "]";
        else if (t.arrayKind == ArrayKind::eUnsized)
            s += "[]";

        return s;
    }

    ValueKind value_kind_for(BaseType t)
    {
        switch (t)
        {
            case BaseType::eInt:
                return ValueKind::eInt;
            case BaseType::eString:
                return ValueKind::eString;
            default:
                return ValueKind::eFloat;
        }
    }
} // namespace osoquery
