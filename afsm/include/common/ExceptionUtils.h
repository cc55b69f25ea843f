#pragma once

#include <exception>
#include <string>

namespace AFSM {

/**
 * @brief Human readable message of a captured exception
 *
 * std::exception subclasses yield what(); anything else yields "unknown exception".
 * A null pointer yields "no exception".
 */
std::string describeException(const std::exception_ptr &failure);

}  // namespace AFSM
