#include "archlink/cli/ParseArgsInternals.h"
#include "archlink/exceptions/config_error.h"
#include "archlink/exceptions/descriptor_error.h"
#include "archlink/model/Descriptor.h"

namespace archlink::cli::detail {
    /***
     * Name: archlink::cli::detail::parseCallerValue
     * Purpose: Parse "<Class>#<name>#<descriptor>" into a CodeUnit.
     * Theory of Operation: The class may be given in internal ("a/b/C") or dotted form.
     */
    model::CodeUnit parseCallerValue(const std::string_view value) {
        const auto first = value.find('#');
        const auto second = first == std::string_view::npos ? first : value.find('#', first + 1);
        if (second == std::string_view::npos || first == 0 || second == first + 1 || second + 1 == value.size()) {
            throw exceptions::ConfigError("invalid --caller value '" + std::string(value) +
                                          "' (expected <Class>#<name>#<descriptor>)");
        }
        model::CodeUnit unit;
        try {
            unit.declaringClass = model::ownerTypeName(value.substr(0, first));
        } catch (const exceptions::DescriptorError &e) {
            throw exceptions::ConfigError("invalid --caller class: " + std::string(e.what()));
        }
        unit.name = std::string(value.substr(first + 1, second - first - 1));
        unit.descriptor = std::string(value.substr(second + 1));
        return unit;
    }
} // namespace archlink::cli::detail
