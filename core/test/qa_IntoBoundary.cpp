#include <boost/ut.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <bridge/IntoBoundary.hpp>

using namespace boost::ut;
using namespace std::string_literals;

namespace {

struct Session {
    std::string user;
    int         id = 0;
};

using Row = std::tuple<std::uint8_t, std::string>;

template<typename T>
struct TaggedAllocator {
    using value_type = T;

    int tag = 0;

    TaggedAllocator() = default;
    explicit TaggedAllocator(int tag_) noexcept : tag(tag_) {}

    template<typename U>
    TaggedAllocator(const TaggedAllocator<U>& other) noexcept : tag(other.tag) {}

    [[nodiscard]] T* allocate(std::size_t n) { return std::allocator<T>{}.allocate(n); }
    void             deallocate(T* p, std::size_t n) noexcept { std::allocator<T>{}.deallocate(p, n); }

    friend bool operator==(const TaggedAllocator&, const TaggedAllocator&) = default;
};

} // namespace

// target shapes are a function of the source shape alone
static_assert(std::same_as<bridge::into_boundary_t<std::int32_t>, std::int32_t>);
static_assert(std::same_as<bridge::into_boundary_t<std::vector<std::int32_t>>, std::vector<std::int32_t>>);
static_assert(std::same_as<bridge::into_boundary_t<std::unique_ptr<std::int32_t>>, std::int32_t>);
static_assert(std::same_as<bridge::into_boundary_t<std::vector<std::unique_ptr<double>>>, std::vector<double>>);
static_assert(std::same_as<bridge::into_boundary_t<std::optional<std::unique_ptr<std::string>>>, std::optional<std::string>>);
static_assert(std::same_as<bridge::into_boundary_t<std::tuple<std::unique_ptr<bool>, std::int8_t>>, std::tuple<bool, std::int8_t>>);
static_assert(std::same_as<bridge::into_boundary_t<std::pair<std::unique_ptr<float>, std::string>>, std::pair<float, std::string>>);
static_assert(std::same_as<bridge::into_boundary_t<std::array<std::uint8_t, 3>>, std::array<std::uint8_t, 3>>);
static_assert(std::same_as<bridge::into_boundary_t<bridge::ZeroCopyBuffer<std::vector<std::uint8_t>>>, bridge::ZeroCopyBuffer<std::vector<std::uint8_t>>>);
static_assert(std::same_as<bridge::into_boundary_t<bridge::SharedHandle<Session>>, bridge::SharedHandle<Session>>);
static_assert(bridge::ConvertsTo<std::vector<std::optional<Row>>, std::vector<std::optional<Row>>>);
static_assert(!bridge::ConvertsTo<std::unique_ptr<std::int32_t>, std::unique_ptr<std::int32_t>>);

// shapes without a rule do not convert
static_assert(!bridge::ConvertibleIntoBoundary<Session>);                                          // unregistered leaf
static_assert(!bridge::ConvertibleIntoBoundary<std::vector<Session>>);                             // ... also when nested
static_assert(!bridge::ConvertibleIntoBoundary<std::tuple<std::int32_t>>);                         // arity 1
static_assert(!bridge::ConvertibleIntoBoundary<std::tuple<int, int, int, int, int, int>>);         // arity 6
static_assert(!bridge::ConvertibleIntoBoundary<std::array<std::unique_ptr<int>, 2>>);              // array elements must already be representable
static_assert(!bridge::ConvertibleIntoBoundary<std::unique_ptr<std::unique_ptr<int>>>);            // box content must already be representable
static_assert(!bridge::ConvertibleIntoBoundary<std::unique_ptr<std::vector<std::unique_ptr<int>>>>); // ... at any depth
static_assert(!bridge::ConvertibleIntoBoundary<bridge::ZeroCopyBuffer<std::vector<std::string>>>);  // not a typed-data payload
static_assert(!bridge::ConvertibleIntoBoundary<const std::int32_t>);
static_assert(!bridge::ConvertibleIntoBoundary<std::int32_t&>);
static_assert(!bridge::ConvertibleIntoBoundary<char*>);

// conversion consumes its argument
template<typename T>
concept ConvertibleFromRvalue = requires(T value) { bridge::convert(std::move(value)); };

template<typename T>
concept ConvertibleFromLvalue = requires(T& value) { bridge::convert(value); };

static_assert(ConvertibleFromRvalue<std::vector<int>>);
static_assert(!ConvertibleFromLvalue<std::vector<int>>);
static_assert(!ConvertibleFromLvalue<std::int32_t>);

const suite<"IntoBoundary - identity leaves"> _leaves = [] {
    "primitive leaves convert to themselves"_test = [] {
        expect(eq(bridge::convert(std::int8_t{-8}), std::int8_t{-8}));
        expect(eq(bridge::convert(std::int16_t{-16}), std::int16_t{-16}));
        expect(eq(bridge::convert(std::int32_t{-32}), std::int32_t{-32}));
        expect(eq(bridge::convert(std::int64_t{-64}), std::int64_t{-64}));
        expect(eq(bridge::convert(std::uint8_t{8}), std::uint8_t{8}));
        expect(eq(bridge::convert(std::uint16_t{16}), std::uint16_t{16}));
        expect(eq(bridge::convert(std::uint32_t{32}), std::uint32_t{32}));
        expect(eq(bridge::convert(std::uint64_t{64}), std::uint64_t{64}));
        expect(eq(bridge::convert(std::size_t{7}), std::size_t{7}));
        expect(eq(bridge::convert(1.5f), 1.5f));
        expect(eq(bridge::convert(2.25), 2.25));
        expect(bridge::convert(true));
        expect(!bridge::convert(false));
        expect(bridge::convert(bridge::Unit{}) == bridge::Unit{});
        expect(eq(bridge::convert("text"s), "text"s));
    };

    "native handle leaves convert to themselves"_test = [] {
        expect(bridge::convert(bridge::ForeignObject{0xC0FFEEUZ, 3}) == bridge::ForeignObject{0xC0FFEEUZ, 3});
#if BRIDGE_RESTRICTED_PLATFORM
        expect(bridge::convert(bridge::ScriptValue{12U}) == bridge::ScriptValue{12U});
        expect(!bridge::ConvertibleIntoBoundary<bridge::NativeCarrier>);
#else
        expect(bridge::convert(bridge::NativeCarrier{bridge::NativeCarrier::Kind::Int64, 42UZ}) == bridge::NativeCarrier{bridge::NativeCarrier::Kind::Int64, 42UZ});
        expect(!bridge::ConvertibleIntoBoundary<bridge::ScriptValue>);
#endif
    };

    "convertTo names the expected target"_test = [] {
        const auto value = bridge::convertTo<std::string>("explicit"s);
        expect(eq(value, "explicit"s));
    };
};

const suite<"IntoBoundary - structural rules"> _structural = [] {
    "sequence preserves element order"_test = [] {
        std::vector<std::unique_ptr<std::int32_t>> boxes;
        boxes.push_back(std::make_unique<std::int32_t>(3));
        boxes.push_back(std::make_unique<std::int32_t>(1));
        boxes.push_back(std::make_unique<std::int32_t>(2));

        const std::vector<std::int32_t> converted = bridge::convert(std::move(boxes));
        expect(converted == std::vector<std::int32_t>{3, 1, 2});
    };

    "empty sequence stays empty"_test = [] {
        expect(bridge::convert(std::vector<std::string>{}).empty());
        expect(bridge::convert(std::vector<std::unique_ptr<bool>>{}).empty());
    };

    "sequence of leaves hands over its storage"_test = [] {
        std::vector<double> samples{1.0, 2.0, 3.0};
        const auto*         storage   = samples.data();
        const auto          converted = bridge::convert(std::move(samples));
        expect(converted == std::vector<double>{1.0, 2.0, 3.0});
        expect(converted.data() == storage);
    };

    "sequence keeps a stateful allocator"_test = [] {
        std::vector<std::unique_ptr<std::int32_t>, TaggedAllocator<std::unique_ptr<std::int32_t>>> boxes(TaggedAllocator<std::unique_ptr<std::int32_t>>{7});
        boxes.push_back(std::make_unique<std::int32_t>(4));
        boxes.push_back(std::make_unique<std::int32_t>(5));

        const auto converted = bridge::convert(std::move(boxes));
        static_assert(std::same_as<std::remove_cvref_t<decltype(converted)>, std::vector<std::int32_t, TaggedAllocator<std::int32_t>>>);
        expect(eq(converted.get_allocator().tag, 7));
        expect(eq(converted.size(), 2UZ));
        expect(eq(converted[0], 4) and eq(converted[1], 5));

        std::vector<double, TaggedAllocator<double>> samples({1.0, 2.0}, TaggedAllocator<double>{9});
        expect(eq(bridge::convert(std::move(samples)).get_allocator().tag, 9)) << "storage hand-over keeps the allocator too";
    };

    "sequence of bool"_test = [] {
        expect(bridge::convert(std::vector<bool>{true, false, true}) == std::vector<bool>{true, false, true});
    };

    "optional preserves presence"_test = [] {
        expect(bridge::convert(std::optional<std::int32_t>{}) == std::nullopt);
        expect(bridge::convert(std::optional<std::int32_t>{7}) == std::optional<std::int32_t>{7});

        std::optional<std::unique_ptr<std::string>> boxed{std::make_unique<std::string>("inner")};
        const std::optional<std::string>            unboxed = bridge::convert(std::move(boxed));
        expect(unboxed.has_value());
        expect(eq(*unboxed, "inner"s));

        expect(!bridge::convert(std::optional<std::unique_ptr<std::string>>{}).has_value());
    };

    "box converts to its bare content"_test = [] {
        const std::int32_t value = bridge::convert(std::make_unique<std::int32_t>(42));
        expect(eq(value, 42));

        auto box = std::make_unique<std::vector<std::uint16_t>>(std::vector<std::uint16_t>{1, 2});
        const std::vector<std::uint16_t> content = bridge::convert(std::move(box));
        expect(content == std::vector<std::uint16_t>{1, 2});
        expect(box == nullptr) << "the box is discarded";
    };

    "fixed-size array is passed through"_test = [] {
        const std::array<std::uint8_t, 3> converted = bridge::convert(std::array<std::uint8_t, 3>{1, 2, 3});
        expect(converted == std::array<std::uint8_t, 3>{1, 2, 3});

        const auto names = bridge::convert(std::array<std::string, 2>{"x", "y"});
        expect(names == std::array<std::string, 2>{"x", "y"});
    };

    "pair converts both slots in place"_test = [] {
        const std::pair<float, std::string> converted = bridge::convert(std::pair{std::make_unique<float>(0.5f), "second"s});
        expect(eq(converted.first, 0.5f));
        expect(eq(converted.second, "second"s));
    };

    "tuples of arity 2 to 5 keep positions"_test = [] {
        const auto two = bridge::convert(std::tuple{std::make_unique<std::int64_t>(1), std::int8_t{2}});
        expect(two == std::tuple<std::int64_t, std::int8_t>{1, 2});

        const auto three = bridge::convert(std::tuple{"a"s, std::make_unique<double>(2.0), std::optional<bool>{true}});
        expect(three == std::tuple<std::string, double, std::optional<bool>>{"a", 2.0, true});

        const auto four = bridge::convert(std::tuple{std::uint8_t{1}, std::uint16_t{2}, std::uint32_t{3}, std::uint64_t{4}});
        expect(four == std::tuple<std::uint8_t, std::uint16_t, std::uint32_t, std::uint64_t>{1, 2, 3, 4});

        const auto five = bridge::convert(std::tuple{1, 2.0f, 3.0, false, std::vector<std::string>{"e"}});
        expect(five == std::tuple<int, float, double, bool, std::vector<std::string>>{1, 2.0f, 3.0, false, {"e"}});
    };

    "zero-copy buffer is unwrapped, converted and rewrapped"_test = [] {
        bridge::ZeroCopyBuffer<std::vector<std::uint8_t>> buffer{{0xDE, 0xAD, 0xBE, 0xEF}};
        const auto*                                       storage   = buffer.value.data();
        const auto                                        converted = bridge::convert(std::move(buffer));
        expect(converted.value == std::vector<std::uint8_t>{0xDE, 0xAD, 0xBE, 0xEF});
        expect(converted.value.data() == storage) << "payload is not copied";
    };

    "shared handle keeps its payload"_test = [] {
        bridge::SharedHandle<Session> handle{Session{"alice", 7}};
        const auto                    copy      = handle;
        const auto                    converted = bridge::convert(std::move(handle));
        expect(converted == copy);
        expect(converted.get() == copy.get());
        expect(eq(converted->user, "alice"s));
    };
};

const suite<"IntoBoundary - composition"> _composition = [] {
    "sequence of optional tuples of shared handles"_test = [] {
        using Entry = std::tuple<bridge::SharedHandle<Session>, std::unique_ptr<std::int32_t>>;

        bridge::SharedHandle<Session> alice{Session{"alice", 1}};
        bridge::SharedHandle<Session> bob{Session{"bob", 2}};

        std::vector<std::optional<Entry>> input;
        input.emplace_back(Entry{alice, std::make_unique<std::int32_t>(10)});
        input.emplace_back(std::nullopt);
        input.emplace_back(Entry{bob, std::make_unique<std::int32_t>(20)});

        const std::vector<std::optional<std::tuple<bridge::SharedHandle<Session>, std::int32_t>>> output = bridge::convert(std::move(input));
        expect(eq(output.size(), 3UZ));
        expect(output[0].has_value());
        expect(!output[1].has_value());
        expect(output[2].has_value());
        expect(std::get<0>(*output[0]) == alice);
        expect(eq(std::get<1>(*output[0]), 10));
        expect(std::get<0>(*output[2]) == bob);
        expect(eq(std::get<1>(*output[2]), 20));
    };

    "optional rows stay structurally unchanged"_test = [] {
        std::vector<std::optional<Row>> input{Row{std::uint8_t{1}, "a"s}, std::nullopt};
        const auto                      output = bridge::convert(std::move(input));
        static_assert(std::same_as<std::remove_cvref_t<decltype(output)>, std::vector<std::optional<Row>>>);
        expect(eq(output.size(), 2UZ));
        expect(output[0] == std::optional<Row>{Row{std::uint8_t{1}, "a"s}});
        expect(output[1] == std::nullopt);
    };

    "nested sequences and buffers"_test = [] {
        std::vector<std::vector<std::unique_ptr<std::string>>> nested(2);
        nested[0].push_back(std::make_unique<std::string>("x"));
        nested[1].push_back(std::make_unique<std::string>("y"));
        nested[1].push_back(std::make_unique<std::string>("z"));

        const auto flat = bridge::convert(std::move(nested));
        expect(flat == std::vector<std::vector<std::string>>{{"x"}, {"y", "z"}});

        std::optional<bridge::ZeroCopyBuffer<std::vector<float>>> maybeBuffer{bridge::ZeroCopyBuffer<std::vector<float>>{{1.f, 2.f}}};
        const auto                                                converted = bridge::convert(std::move(maybeBuffer));
        expect(converted.has_value());
        expect(converted->value == std::vector<float>{1.f, 2.f});
    };
};

int main() { /* tests are statically executed */ }
