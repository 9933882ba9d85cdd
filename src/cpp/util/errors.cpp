#include <kinetic/util/errors.h>

namespace kinetic {
    std::string describe_exception(std::exception_ptr ex) {
        if (!ex) { return "no exception"; }
        try {
            std::rethrow_exception(ex);
        } catch (const std::exception &e) {
            return fmt::format("{}", e.what());
        } catch (...) {
            return "unknown exception";
        }
    }
} // namespace kinetic
