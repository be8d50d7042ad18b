#include "orotune.hpp"

namespace orotune {

const char* build_info() {
    static const char* info =
        "OroTune v0.1.0\n"
        "Compiled: " __DATE__ " " __TIME__ "\n"
        "Eigen: " EIGEN_MAKESTRING(EIGEN_WORLD_VERSION) "."
                  EIGEN_MAKESTRING(EIGEN_MAJOR_VERSION) "."
                  EIGEN_MAKESTRING(EIGEN_MINOR_VERSION) "\n"
        "Compiler: "
#ifdef _MSC_VER
        "MSVC "
#elif defined(__clang__)
        "Clang "
#elif defined(__GNUC__)
        "GCC "
#else
        "Unknown "
#endif
        ;
    return info;
}

}  // namespace orotune
