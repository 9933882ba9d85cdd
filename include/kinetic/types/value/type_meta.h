#ifndef KINETIC_VALUE_TYPE_META_H
#define KINETIC_VALUE_TYPE_META_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <typeinfo>

namespace kinetic::value {

    struct TypeMeta;

    /**
     * TypeOps - Function pointers for type operations
     *
     * All operations take raw pointers and the TypeMeta for context, this enables type-erased operations on
     * any value held by a node. Storage passed as dest is uninitialised for the construct operations.
     */
    struct TypeOps {
        // Lifecycle
        void (*destruct)(void *dest, const TypeMeta *meta);
        void (*copy_construct)(void *dest, const void *src, const TypeMeta *meta);

        // Comparison, false when the type has no equality operator
        bool (*equals)(const void *a, const void *b, const TypeMeta *meta);

        // String representation (for logging/debugging)
        std::string (*to_string)(const void *v, const TypeMeta *meta);

        // Readable type name used in error messages
        std::string (*type_name)(const TypeMeta *meta);
    };

    /**
     * TypeKind - Classification of types, this drives the propagation rule on write.
     */
    enum class TypeKind : uint8_t {
        Scalar,    // Cheap, trusted equality (numbers, enums, strings)
        Composite, // Aggregates, equality is not assumed to be cheap or meaningful
        Reference, // Pointers and handles, the referent may have changed behind the same address
    };

    /**
     * TypeMeta - Complete metadata for a type
     */
    struct TypeMeta {
        size_t size;
        size_t alignment;
        TypeKind kind;
        bool equatable;
        const TypeOps *ops;
        const std::type_info *type_info;
        const char *name;

        [[nodiscard]] bool is_scalar() const { return kind == TypeKind::Scalar; }

        void destruct_at(void *dest) const { ops->destruct(dest, this); }

        void copy_construct_at(void *dest, const void *src) const { ops->copy_construct(dest, src, this); }

        [[nodiscard]] bool equals_at(const void *a, const void *b) const {
            return equatable && ops->equals(a, b, this);
        }

        [[nodiscard]] std::string to_string_at(const void *v) const { return ops->to_string(v, this); }

        [[nodiscard]] std::string type_name_str() const;
    };

    const char *to_string(TypeKind kind);

} // namespace kinetic::value

#endif // KINETIC_VALUE_TYPE_META_H
