#include "common/ExceptionUtils.h"

namespace AFSM {

std::string describeException(const std::exception_ptr &failure) {
    if (!failure) {
        return "no exception";
    }

    try {
        std::rethrow_exception(failure);
    } catch (const std::exception &e) {
        return e.what();
    } catch (...) {
        // Non-std exception types carry no message
        return "unknown exception";
    }
}

}  // namespace AFSM
