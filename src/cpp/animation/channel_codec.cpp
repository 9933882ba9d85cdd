#include <kinetic/animation/channel_codec.h>
#include <kinetic/util/errors.h>

#include <array>
#include <cmath>
#include <cstdint>

namespace kinetic {
    namespace {
        template<typename T>
        void register_integral(ChannelCodec &codec) {
            codec.register_type<T>([](const T &v) { return channel_vector{static_cast<double>(v)}; },
                                   [](const channel_vector &c) { return static_cast<T>(std::lround(c[0])); });
        }

        template<size_t N>
        void register_array(ChannelCodec &codec) {
            using array_t = std::array<double, N>;
            codec.register_type<array_t>([](const array_t &v) { return channel_vector(v.begin(), v.end()); },
                                         [](const channel_vector &c) {
                                             array_t result{};
                                             for (size_t i = 0; i < N; ++i) { result[i] = c[i]; }
                                             return result;
                                         });
        }
    } // namespace

    ChannelCodec::ChannelCodec() {
        register_type<double>([](double v) { return channel_vector{v}; },
                              [](const channel_vector &c) { return c[0]; });
        register_type<float>([](float v) { return channel_vector{static_cast<double>(v)}; },
                             [](const channel_vector &c) { return static_cast<float>(c[0]); });
        register_integral<int>(*this);
        register_integral<long>(*this);
        register_integral<long long>(*this);
        register_type<channel_vector>([](const channel_vector &v) { return v; },
                                      [](const channel_vector &c) { return c; });
        register_array<2>(*this);
        register_array<3>(*this);
        register_array<4>(*this);
    }

    void ChannelCodec::register_type(const value::TypeMeta *meta, unpack_fn unpack, pack_fn pack) {
        if (meta == nullptr || !unpack || !pack) {
            throw_error<std::invalid_argument>("register_type requires a type and both conversion functions");
        }
        _entries.insert_or_assign(meta, Entry{std::move(unpack), std::move(pack)});
    }

    bool ChannelCodec::supports(const value::TypeMeta *meta) const { return _entries.contains(meta); }

    const ChannelCodec::Entry &ChannelCodec::entry(const value::TypeMeta *meta) const {
        auto it = _entries.find(meta);
        if (it == _entries.end()) {
            throw_error<std::invalid_argument>("No channel layout registered for type '{}'",
                                               meta == nullptr ? "<empty>" : meta->type_name_str());
        }
        return it->second;
    }

    channel_vector ChannelCodec::unpack(const value::Value &v) const { return entry(v.meta()).unpack(v); }

    value::Value ChannelCodec::pack(const channel_vector &channels, const value::TypeMeta *meta) const {
        return entry(meta).pack(channels);
    }

    Interpolator make_channel_interpolator(const ChannelCodec &codec) {
        return [&codec](const value::Value &from, const value::Value &to, double t) -> value::Value {
            if (!from.same_type(to) || !codec.supports(to.meta())) { return t < 0.5 ? from : to; }
            auto a = codec.unpack(from);
            const auto b = codec.unpack(to);
            // Variable length layouts (plain vectors) only interpolate when the shapes agree
            if (a.size() != b.size()) { return t < 0.5 ? from : to; }
            for (size_t i = 0; i < a.size(); ++i) { a[i] += (b[i] - a[i]) * t; }
            return codec.pack(a, to.meta());
        };
    }
} // namespace kinetic
