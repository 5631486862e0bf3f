#include <tabula/core/view.hpp>

#include <cctype>
#include <string>

namespace tabula {

auto to_string(ControlType type) -> std::string_view {
    switch (type) {
        case ControlType::String:
            return "string";
        case ControlType::Number:
            return "number";
        case ControlType::Date:
            return "date";
        case ControlType::DateTime:
            return "datetime";
        case ControlType::Boolean:
            return "boolean";
        case ControlType::Dropdown:
            return "dropdown";
    }
    return "string";
}

auto parse_control_type(std::string_view name) -> ControlType {
    std::string lowered;
    lowered.reserve(name.size());
    for (char ch : name) {
        if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
            continue;
        }
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (lowered == "number" || lowered == "float" || lowered == "int" || lowered == "integer") {
        return ControlType::Number;
    }
    if (lowered == "date") {
        return ControlType::Date;
    }
    if (lowered == "datetime") {
        return ControlType::DateTime;
    }
    if (lowered == "bool" || lowered == "boolean") {
        return ControlType::Boolean;
    }
    if (lowered == "dropdown") {
        return ControlType::Dropdown;
    }
    return ControlType::String;
}

}  // namespace tabula
