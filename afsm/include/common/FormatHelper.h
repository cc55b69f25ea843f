#pragma once

#include <spdlog/fmt/fmt.h>
#include <string>
#include <type_traits>

namespace AFSM {

/**
 * @brief Render a caller-defined State/Event/SideEffect value for log messages
 *
 * The engine knows nothing about these types beyond equality, so log lines use:
 * - the type's fmt formatter when one exists
 * - the underlying integer for enums without a formatter
 * - a fixed placeholder otherwise
 */
template <typename T> std::string describe(const T &value) {
    if constexpr (fmt::is_formattable<T>::value) {
        return fmt::format("{}", value);
    } else if constexpr (std::is_enum_v<T>) {
        return fmt::format("{}", static_cast<std::underlying_type_t<T>>(value));
    } else {
        return "<value>";
    }
}

}  // namespace AFSM
