#pragma once
#include <string>
#include <typeinfo>
#include <gtest/gtest.h>

namespace argwire::test_jobs {

// Runs fn and returns the message of the ErrorT it throws.
// Records a failure when nothing is thrown; other exception types propagate.
template <typename ErrorT, typename Fn>
std::string capture_error(Fn&& fn) {
    try {
        fn();
    } catch (const ErrorT& e) {
        return e.what();
    }
    ADD_FAILURE() << "expected an exception of type " << typeid(ErrorT).name();
    return "";
}

} // namespace argwire::test_jobs
