#ifndef KINETIC_VALUE_SCALAR_TYPE_H
#define KINETIC_VALUE_SCALAR_TYPE_H

#include <kinetic/types/value/type_meta.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <memory>
#include <new>
#include <string>
#include <string_view>
#include <type_traits>

namespace kinetic::value {

    namespace detail {
        template<typename T>
        struct is_smart_pointer : std::false_type {};

        template<typename T>
        struct is_smart_pointer<std::shared_ptr<T> > : std::true_type {};

        template<typename T>
        struct is_smart_pointer<std::weak_ptr<T> > : std::true_type {};

        template<typename T, typename D>
        struct is_smart_pointer<std::unique_ptr<T, D> > : std::true_type {};
    } // namespace detail

    /**
     * Classifies a C++ type for the propagation rule. Specialise this for user types that should be treated as
     * scalars (for example a small value type with a meaningful operator==).
     */
    template<typename T>
    struct value_kind {
        static constexpr TypeKind kind = [] {
            if constexpr (std::is_arithmetic_v<T> || std::is_enum_v<T> || std::is_same_v<T, std::string> ||
                          std::is_same_v<T, std::string_view>) {
                return TypeKind::Scalar;
            } else if constexpr (std::is_pointer_v<T> || detail::is_smart_pointer<T>::value) {
                return TypeKind::Reference;
            } else {
                return TypeKind::Composite;
            }
        }();
    };

    template<typename T>
    inline constexpr TypeKind value_kind_v = value_kind<T>::kind;

    /**
     * ValueTypeOps - Generate TypeOps for a type T
     */
    template<typename T>
    struct ValueTypeOps {
        static void destruct(void *dest, const TypeMeta *) { static_cast<T *>(dest)->~T(); }

        static void copy_construct(void *dest, const void *src, const TypeMeta *) {
            new(dest) T(*static_cast<const T *>(src));
        }

        static bool equals(const void *a, const void *b, const TypeMeta *) {
            if constexpr (requires(const T &x, const T &y) { { x == y } -> std::convertible_to<bool>; }) {
                return *static_cast<const T *>(a) == *static_cast<const T *>(b);
            } else {
                return false;
            }
        }

        static std::string to_string(const void *v, const TypeMeta *meta) {
            if constexpr (fmt::is_formattable<T>::value) {
                return fmt::format("{}", *static_cast<const T *>(v));
            } else {
                return fmt::format("<{}@{:p}>", meta->type_name_str(), v);
            }
        }

        static std::string type_name(const TypeMeta *meta) {
            if constexpr (std::is_same_v<T, bool>) {
                return "bool";
            } else if constexpr (std::is_same_v<T, int>) {
                return "int";
            } else if constexpr (std::is_same_v<T, long>) {
                return "long";
            } else if constexpr (std::is_same_v<T, long long>) {
                return "long long";
            } else if constexpr (std::is_same_v<T, unsigned> || std::is_same_v<T, unsigned long> ||
                                 std::is_same_v<T, unsigned long long>) {
                return "unsigned";
            } else if constexpr (std::is_same_v<T, float>) {
                return "float";
            } else if constexpr (std::is_same_v<T, double>) {
                return "double";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return "string";
            } else if constexpr (std::is_same_v<T, std::string_view>) {
                return "string_view";
            } else {
                if (meta->name != nullptr) { return meta->name; }
                if (meta->type_info != nullptr) { return meta->type_info->name(); }
                return "<unknown>";
            }
        }

        static constexpr TypeOps ops = {
            .destruct = destruct,
            .copy_construct = copy_construct,
            .equals = equals,
            .to_string = to_string,
            .type_name = type_name,
        };
    };

    /**
     * ValueTypeMeta - one TypeMeta instance per C++ type, its address is the runtime type tag.
     *
     * Usage:
     *   const TypeMeta* double_meta = type_meta<double>();
     */
    template<typename T>
    struct ValueTypeMeta {
        static_assert(std::is_copy_constructible_v<T>, "Node values must be copy constructible");

        static const TypeMeta instance;

        static const TypeMeta *get() { return &instance; }
    };

    template<typename T>
    const TypeMeta ValueTypeMeta<T>::instance = {
        .size = sizeof(T),
        .alignment = alignof(T),
        .kind = value_kind_v<T>,
        .equatable = requires(const T &x, const T &y) { { x == y } -> std::convertible_to<bool>; },
        .ops = &ValueTypeOps<T>::ops,
        .type_info = &typeid(T),
        .name = nullptr,
    };

    template<typename T>
    const TypeMeta *type_meta() {
        return ValueTypeMeta<std::remove_cvref_t<T> >::get();
    }

} // namespace kinetic::value

#endif // KINETIC_VALUE_SCALAR_TYPE_H
