#ifndef KINETIC_UTIL_SCOPE_H
#define KINETIC_UTIL_SCOPE_H

namespace kinetic {
    /**
     * Sets a flag for the lifetime of the guard and restores its previous value afterwards.
     */
    class FlagGuard {
    public:
        explicit FlagGuard(bool &flag) noexcept : _flag{flag}, _previous{flag} { _flag = true; }

        FlagGuard(const FlagGuard &) = delete;

        FlagGuard &operator=(const FlagGuard &) = delete;

        ~FlagGuard() { _flag = _previous; }

    private:
        bool &_flag;
        bool _previous;
    };
} // namespace kinetic
#endif  // KINETIC_UTIL_SCOPE_H
