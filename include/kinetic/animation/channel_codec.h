#ifndef KINETIC_CHANNEL_CODEC_H
#define KINETIC_CHANNEL_CODEC_H

#include <kinetic/kinetic_base.h>
#include <kinetic/types/value/value.h>

#include <functional>
#include <vector>

namespace kinetic {

    // One scalar component per entry, in the codec's channel order.
    using channel_vector = std::vector<double>;

    /**
     * Decomposes values into flat numeric channels and reconstructs them, keyed by the value's TypeMeta.
     *
     * The codec is an external collaborator: the graph only needs pack/unpack. A default instance handles the
     * arithmetic types and plain double vectors/arrays, richer types (colours, geometry) are registered by the
     * embedding application. Channel order and rounding are part of the contract, a type must always unpack to
     * the same channel layout.
     */
    class KINETIC_EXPORT ChannelCodec {
    public:
        using unpack_fn = std::function<channel_vector(const value::Value &)>;
        using pack_fn = std::function<value::Value(const channel_vector &)>;

        // Registers the default numeric types.
        ChannelCodec();

        void register_type(const value::TypeMeta *meta, unpack_fn unpack, pack_fn pack);

        template<typename T, typename Unpack, typename Pack>
        void register_type(Unpack &&unpack, Pack &&pack) {
            register_type(
                value::type_meta<T>(),
                [unpack = std::forward<Unpack>(unpack)](const value::Value &v) -> channel_vector {
                    return unpack(v.as<T>());
                },
                [pack = std::forward<Pack>(pack)](const channel_vector &channels) -> value::Value {
                    return value::Value{static_cast<T>(pack(channels))};
                });
        }

        [[nodiscard]] bool supports(const value::TypeMeta *meta) const;

        // Throws std::invalid_argument for values whose type has not been registered.
        [[nodiscard]] channel_vector unpack(const value::Value &v) const;

        [[nodiscard]] value::Value pack(const channel_vector &channels, const value::TypeMeta *meta) const;

    private:
        struct Entry {
            unpack_fn unpack;
            pack_fn pack;
        };

        const Entry &entry(const value::TypeMeta *meta) const;

        dense_map<const value::TypeMeta *, Entry> _entries;
    };

    // Type-aware interpolation between two values, t in [0, 1] (easing curves may overshoot).
    using Interpolator = std::function<value::Value(const value::Value &, const value::Value &, double)>;

    /**
     * Linear per-channel interpolation through the codec. Values of different types, or types the codec does not
     * know, switch from the first to the second value at t = 0.5. The codec must outlive the interpolator.
     */
    KINETIC_EXPORT Interpolator make_channel_interpolator(const ChannelCodec &codec);

} // namespace kinetic

#endif // KINETIC_CHANNEL_CODEC_H
