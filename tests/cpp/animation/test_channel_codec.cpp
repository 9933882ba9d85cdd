#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <kinetic/animation/channel_codec.h>

#include <array>
#include <string>

namespace {
    struct Point {
        double x;
        double y;

        bool operator==(const Point &) const = default;
    };
} // namespace

TEST_CASE("Default channel layouts", "[channel_codec]") {
    using namespace kinetic;
    ChannelCodec codec;

    REQUIRE(codec.unpack(value::Value{2.5}) == channel_vector{2.5});
    REQUIRE(codec.unpack(value::Value{std::array<double, 3>{1.0, 2.0, 3.0}}) == channel_vector{1.0, 2.0, 3.0});

    // Integers round to nearest, halves away from zero
    REQUIRE(codec.pack(channel_vector{2.5}, value::type_meta<int>()).as<int>() == 3);
    REQUIRE(codec.pack(channel_vector{2.4}, value::type_meta<int>()).as<int>() == 2);
    REQUIRE(codec.pack(channel_vector{-2.5}, value::type_meta<long>()).as<long>() == -3);

    REQUIRE_FALSE(codec.supports(value::type_meta<std::string>()));
    REQUIRE_THROWS_AS(codec.unpack(value::Value{std::string{"x"}}), std::invalid_argument);
}

TEST_CASE("Registering an application type", "[channel_codec]") {
    using namespace kinetic;
    ChannelCodec codec;
    codec.register_type<Point>([](const Point &p) { return channel_vector{p.x, p.y}; },
                               [](const channel_vector &c) { return Point{c[0], c[1]}; });

    REQUIRE(codec.supports(value::type_meta<Point>()));
    auto packed = codec.pack(channel_vector{4.0, 5.0}, value::type_meta<Point>());
    REQUIRE(packed.as<Point>() == Point{4.0, 5.0});
}

TEST_CASE("Channel interpolation", "[channel_codec]") {
    using namespace kinetic;
    ChannelCodec codec;
    auto lerp = make_channel_interpolator(codec);

    auto mid = lerp(value::Value{std::array<double, 2>{0.0, 10.0}}, value::Value{std::array<double, 2>{10.0, 20.0}},
                    0.25);
    REQUIRE(mid.as<std::array<double, 2> >()[0] == Catch::Approx(2.5));
    REQUIRE(mid.as<std::array<double, 2> >()[1] == Catch::Approx(12.5));

    REQUIRE(lerp(value::Value{0}, value::Value{10}, 0.45).as<int>() == 5);

    // Mismatched or unknown types switch over half way
    REQUIRE(lerp(value::Value{1.0}, value::Value{std::string{"b"}}, 0.4).as<double>() == 1.0);
    REQUIRE(lerp(value::Value{1.0}, value::Value{std::string{"b"}}, 0.6).as<std::string>() == "b");
    REQUIRE(lerp(value::Value{std::string{"a"}}, value::Value{std::string{"b"}}, 0.2).as<std::string>() == "a");
}
