#include <kinetic/types/value/value.h>
#include <kinetic/util/errors.h>

#include <new>

namespace kinetic::value {

    const char *to_string(TypeKind kind) {
        switch (kind) {
            case TypeKind::Scalar: return "Scalar";
            case TypeKind::Composite: return "Composite";
            case TypeKind::Reference: return "Reference";
        }
        return "Unknown";
    }

    std::string TypeMeta::type_name_str() const {
        if (name != nullptr) { return name; }
        return ops->type_name(this);
    }

    bad_value_type::bad_value_type(std::string_view expected, std::string_view actual)
        : std::runtime_error{fmt::format("Expected value of type '{}', got: '{}'", expected, actual)} {
    }

    void *Value::allocate(const TypeMeta *meta) {
        return ::operator new(meta->size, std::align_val_t{meta->alignment});
    }

    void Value::release_storage() {
        if (_storage != nullptr) {
            _meta->destruct_at(_storage);
            ::operator delete(_storage, std::align_val_t{_meta->alignment});
            _storage = nullptr;
        }
    }

    Value::Value(const Value &other) : _meta{other._meta} {
        if (other._storage != nullptr) {
            _storage = allocate(_meta);
            try {
                _meta->copy_construct_at(_storage, other._storage);
            } catch (...) {
                ::operator delete(_storage, std::align_val_t{_meta->alignment});
                _storage = nullptr;
                throw;
            }
        }
    }

    Value::Value(Value &&other) noexcept : _meta{other._meta}, _storage{other._storage} {
        other._storage = nullptr;
        other._meta = nullptr;
    }

    Value &Value::operator=(const Value &other) {
        if (this != &other) {
            Value copy{other};
            *this = std::move(copy);
        }
        return *this;
    }

    Value &Value::operator=(Value &&other) noexcept {
        if (this != &other) {
            release_storage();
            _meta = other._meta;
            _storage = other._storage;
            other._storage = nullptr;
            other._meta = nullptr;
        }
        return *this;
    }

    Value::~Value() { release_storage(); }

    TypeKind Value::kind() const { return _meta != nullptr ? _meta->kind : TypeKind::Scalar; }

    bool Value::equals(const Value &other) const {
        if (_meta != other._meta) { return false; }
        if (_storage == nullptr || other._storage == nullptr) { return _storage == other._storage; }
        return _meta->equals_at(_storage, other._storage);
    }

    std::string Value::to_string() const {
        return _storage != nullptr ? _meta->to_string_at(_storage) : std::string{"<empty>"};
    }

    std::string Value::type_name() const { return _meta != nullptr ? _meta->type_name_str() : std::string{"<empty>"}; }

    void Value::reset() {
        release_storage();
        _meta = nullptr;
    }

    void Value::check_type(const TypeMeta *expected) const {
        if (_meta == nullptr || *_meta->type_info != *expected->type_info) {
            throw bad_value_type(expected->type_name_str(), type_name());
        }
    }

} // namespace kinetic::value
