#ifndef KINETIC_VALUE_VALUE_H
#define KINETIC_VALUE_VALUE_H

#include <kinetic/kinetic_export.h>
#include <kinetic/types/value/scalar_type.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace kinetic::value {

    struct KINETIC_EXPORT bad_value_type : std::runtime_error {
        bad_value_type(std::string_view expected, std::string_view actual);
    };

    /**
     * Value - owns a single value of any copyable type together with its TypeMeta.
     *
     * This is the storage every node holds. An empty Value (no meta) is valid and represents "no value yet".
     * Copies are deep, the referenced type's copy constructor is used through the TypeOps.
     */
    class KINETIC_EXPORT Value {
    public:
        Value() = default;

        template<typename T>
            requires (!std::is_same_v<std::remove_cvref_t<T>, Value>)
        explicit Value(T &&v) : _meta{type_meta<T>()} {
            _storage = allocate(_meta);
            new(_storage) std::remove_cvref_t<T>(std::forward<T>(v));
        }

        Value(const Value &other);

        Value(Value &&other) noexcept;

        Value &operator=(const Value &other);

        Value &operator=(Value &&other) noexcept;

        ~Value();

        [[nodiscard]] bool has_value() const { return _storage != nullptr; }

        [[nodiscard]] const TypeMeta *meta() const { return _meta; }

        [[nodiscard]] TypeKind kind() const;

        [[nodiscard]] bool is_scalar() const { return _meta != nullptr && _meta->is_scalar(); }

        template<typename T>
        [[nodiscard]] bool is() const {
            return _meta != nullptr && *_meta->type_info == typeid(T);
        }

        template<typename T>
        [[nodiscard]] const T &as() const {
            check_type(type_meta<T>());
            return *static_cast<const T *>(_storage);
        }

        template<typename T>
        [[nodiscard]] T &as() {
            check_type(type_meta<T>());
            return *static_cast<T *>(_storage);
        }

        /**
         * Same type and equal according to the type's operator==. Values of types without equality never compare
         * equal, two empty values do.
         */
        [[nodiscard]] bool equals(const Value &other) const;

        [[nodiscard]] bool same_type(const Value &other) const { return _meta == other._meta; }

        [[nodiscard]] std::string to_string() const;

        [[nodiscard]] std::string type_name() const;

        void reset();

    private:
        static void *allocate(const TypeMeta *meta);

        void release_storage();

        void check_type(const TypeMeta *expected) const;

        const TypeMeta *_meta{nullptr};
        void *_storage{nullptr};
    };

    template<typename T>
    [[nodiscard]] Value make_value(T &&v) { return Value{std::forward<T>(v)}; }

} // namespace kinetic::value

template<>
struct fmt::formatter<kinetic::value::Value> : fmt::formatter<std::string> {
    auto format(const kinetic::value::Value &v, format_context &ctx) const {
        return fmt::formatter<std::string>::format(v.to_string(), ctx);
    }
};

#endif // KINETIC_VALUE_VALUE_H
