#include "jobs/definition.hpp"
#include <cstdlib>
#include <cxxabi.h>

namespace argwire::jobs {

std::string demangle(const char* mangled) {
    int status = 0;
    char* readable = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
    if (status != 0 || readable == nullptr) {
        return mangled;
    }
    std::string out(readable);
    std::free(readable);
    return out;
}

} // namespace argwire::jobs
