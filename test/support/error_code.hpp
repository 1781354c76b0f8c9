#ifndef PAIRAMM_TEST_ERROR_CODE_HPP
#define PAIRAMM_TEST_ERROR_CODE_HPP

#include <pairamm/types.hpp>

namespace pairamm {
namespace testing {

// Code of the AMMError thrown by `fn`, errors::OK when nothing is thrown
template <typename F>
int32_t error_code_of(F&& fn) {
    try {
        fn();
    } catch (const AMMError& e) {
        return e.code();
    }
    return errors::OK;
}

} // namespace testing
} // namespace pairamm

#endif // PAIRAMM_TEST_ERROR_CODE_HPP
