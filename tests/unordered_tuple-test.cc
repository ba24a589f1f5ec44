#include <unordered-core/unordered_tuple.hh>

#include <nexus/test.hh>

#include <algorithm>
#include <array>
#include <random>
#include <string>
#include <type_traits>
#include <unordered_set>

// ============================================================================
// Compile-time trait checks
// ============================================================================

static_assert(std::is_trivially_copyable_v<uc::unordered_pair<int>>, "unordered_pair<trivial> should be trivially copyable");
static_assert(std::is_trivially_copyable_v<uc::unordered_tuple<float, 4>>);
static_assert(std::is_trivially_destructible_v<uc::unordered_tuple<int, 3>>);
static_assert(sizeof(uc::unordered_tuple<int, 3>) == sizeof(int) * 3, "unordered_tuple should have no overhead");

static_assert(std::is_same_v<uc::unordered_pair<int>, uc::unordered_tuple<int, 2>>);
static_assert(uc::unordered_tuple<int, 5>::arity == 5);
static_assert(std::tuple_size_v<uc::unordered_tuple<int, 3>> == 3);
static_assert(std::is_same_v<std::tuple_element_t<1, uc::unordered_tuple<double, 2>>, double>);

// wrong number of elements does not construct
static_assert(std::is_constructible_v<uc::unordered_tuple<int, 3>, int, int, int>);
static_assert(!std::is_constructible_v<uc::unordered_tuple<int, 3>, int, int>);
static_assert(!std::is_constructible_v<uc::unordered_tuple<int, 3>, int, int, int, int>);

// pair conversion only exists for arity 2
static_assert(std::is_constructible_v<uc::unordered_pair<int>, uc::pair<int, int>>);
static_assert(!std::is_constructible_v<uc::unordered_tuple<int, 3>, uc::pair<int, int>>);

namespace
{
// equality but no ordering and no std::hash
struct color
{
    int r = 0;
    int g = 0;
    int b = 0;

    friend bool operator==(color const&, color const&) = default;
};

// no equality at all
struct opaque
{
    int v = 0;
};

template <class T>
concept std_hashable = requires(T const& v) { std::hash<T>{}(v); };
} // namespace

static_assert(std::equality_comparable<uc::unordered_pair<int>>);
static_assert(std::equality_comparable<uc::unordered_pair<color>>);
static_assert(!std::equality_comparable<uc::unordered_pair<opaque>>);

static_assert(std_hashable<uc::unordered_pair<int>>);
static_assert(std_hashable<uc::unordered_tuple<std::string, 3>>);
static_assert(!std_hashable<uc::unordered_pair<color>>, "hashing needs an ordering on the elements");

// constexpr equality
static_assert(uc::unordered_tuple<int, 3>{0, 3, 5} == uc::unordered_tuple<int, 3>{5, 0, 3});
static_assert(uc::unordered_pair<int>{1, 1} != uc::unordered_pair<int>{1, 2});

// ============================================================================
// Construction and access
// ============================================================================

TEST("unordered_tuple - construction")
{
    SECTION("from values keeps storage order")
    {
        auto const t = uc::unordered_tuple<int, 3>{4, 1, 7};
        CHECK(t[0] == 4);
        CHECK(t[1] == 1);
        CHECK(t[2] == 7);
        CHECK(t.size() == 3);
        CHECK(!t.empty());
    }

    SECTION("from fixed_array")
    {
        auto const arr = uc::fixed_array<int, 3>{9, 8, 7};
        uc::unordered_tuple<int, 3> t = arr;
        CHECK(t.elements() == arr);
    }

    SECTION("from pair")
    {
        auto const e = uc::unordered_pair<int>(uc::pair<int, int>{2, 5});
        CHECK(e[0] == 2);
        CHECK(e[1] == 5);
    }

    SECTION("deduction guides")
    {
        auto const a = uc::unordered_tuple{1, 2, 3};
        static_assert(std::is_same_v<std::remove_const_t<decltype(a)>, uc::unordered_tuple<int, 3>>);

        auto const b = uc::unordered_tuple{uc::fixed_array<double, 2>{1.0, 2.0}};
        static_assert(std::is_same_v<std::remove_const_t<decltype(b)>, uc::unordered_tuple<double, 2>>);

        auto const c = uc::unordered_tuple{uc::pair<char, char>{'a', 'b'}};
        static_assert(std::is_same_v<std::remove_const_t<decltype(c)>, uc::unordered_pair<char>>);

        CHECK(a[2] == 3);
        CHECK(b[0] == 1.0);
        CHECK(c[1] == 'b');
    }

    SECTION("converting element construction")
    {
        auto const t = uc::unordered_tuple<std::string, 2>{"b", "a"};
        CHECK(t[0] == "b");
        CHECK(t[1] == "a");
    }

    SECTION("copy of a single-element tuple is a copy")
    {
        auto const a = uc::unordered_tuple<int, 1>{42};
        auto b = a;
        auto c = b;
        CHECK(c[0] == 42);
        CHECK(c == a);
    }
}

TEST("unordered_tuple - element access")
{
    auto t = uc::unordered_tuple<int, 3>{1, 2, 3};

    SECTION("mutation through operator[]")
    {
        t[1] = 20;
        CHECK(t[1] == 20);
        CHECK((t == uc::unordered_tuple<int, 3>{20, 1, 3}));
    }

    SECTION("iteration visits storage order")
    {
        int sum = 0;
        int first = -1;
        for (auto v : t)
        {
            if (first < 0)
                first = v;
            sum += v;
        }
        CHECK(first == 1);
        CHECK(sum == 6);
    }

    SECTION("structured bindings")
    {
        auto const e = uc::unordered_pair<int>{3, 4};
        auto const [a, b] = e;
        CHECK(a == 3);
        CHECK(b == 4);
    }

    SECTION("get<I>")
    {
        t.get<2>() = 30;
        CHECK(t.get<0>() == 1);
        CHECK(t[2] == 30);
    }
}

// ============================================================================
// Multiset equality
// ============================================================================

TEST("unordered_tuple - equality ignores order")
{
    SECTION("pairs")
    {
        CHECK((uc::unordered_pair<int>{0, 1} == uc::unordered_pair<int>{1, 0}));
        CHECK((uc::unordered_pair<int>{0, 1} == uc::unordered_pair<int>{0, 1}));
        CHECK((uc::unordered_pair<int>{0, 1} != uc::unordered_pair<int>{0, 2}));
    }

    SECTION("every permutation of a triple is equal")
    {
        auto const base = uc::unordered_tuple<int, 3>{0, 3, 5};
        auto perm = std::array<int, 3>{0, 3, 5};
        int count = 0;
        do
        {
            auto const t = uc::unordered_tuple<int, 3>{perm[0], perm[1], perm[2]};
            CHECK(t == base);
            CHECK(base == t);
            ++count;
        } while (std::next_permutation(perm.begin(), perm.end()));
        CHECK(count == 6);
    }

    SECTION("different elements are unequal")
    {
        CHECK((uc::unordered_tuple<int, 3>{0, 3, 5} != uc::unordered_tuple<int, 3>{0, 3, 6}));
        CHECK((uc::unordered_tuple<int, 3>{0, 3, 5} != uc::unordered_tuple<int, 3>{5, 5, 0}));
    }

    SECTION("elements without ordering")
    {
        auto const red = color{255, 0, 0};
        auto const blue = color{0, 0, 255};
        CHECK((uc::unordered_pair<color>{red, blue} == uc::unordered_pair<color>{blue, red}));
        CHECK((uc::unordered_pair<color>{red, red} != uc::unordered_pair<color>{red, blue}));
    }
}

TEST("unordered_tuple - equality counts duplicates")
{
    CHECK((uc::unordered_pair<int>{1, 1} == uc::unordered_pair<int>{1, 1}));
    CHECK((uc::unordered_pair<int>{1, 1} != uc::unordered_pair<int>{1, 2}));
    CHECK((uc::unordered_pair<int>{1, 2} != uc::unordered_pair<int>{1, 1}));

    CHECK((uc::unordered_tuple<int, 3>{0, 4, 0} == uc::unordered_tuple<int, 3>{0, 0, 4}));
    CHECK((uc::unordered_tuple<int, 3>{0, 4, 0} != uc::unordered_tuple<int, 3>{0, 4, 4}));
    CHECK((uc::unordered_tuple<int, 4>{2, 2, 2, 1} != uc::unordered_tuple<int, 4>{2, 1, 1, 2}));
}

TEST("unordered_tuple - degenerate arities")
{
    SECTION("singleton behaves like its element")
    {
        CHECK((uc::unordered_tuple<int, 1>{7} == uc::unordered_tuple<int, 1>{7}));
        CHECK((uc::unordered_tuple<int, 1>{7} != uc::unordered_tuple<int, 1>{8}));
    }

    SECTION("empty tuples are all equal")
    {
        auto const a = uc::unordered_tuple<int, 0>{};
        auto const b = uc::unordered_tuple<int, 0>{};
        CHECK(a == b);
        CHECK(a.empty());
        CHECK(a.size() == 0);
        CHECK((std::hash<uc::unordered_tuple<int, 0>>{}(a) == std::hash<uc::unordered_tuple<int, 0>>{}(b)));
    }
}

TEST("unordered_tuple - singleton equality matches element equality (random)")
{
    auto rng = std::mt19937(12345);
    auto dist = std::uniform_int_distribution<int>(0, 4);

    for (auto i = 0; i < 500; ++i)
    {
        auto const x = dist(rng);
        auto const y = dist(rng);
        CHECK((uc::unordered_tuple<int, 1>{x} == uc::unordered_tuple<int, 1>{y}) == (x == y));
    }
}

TEST("unordered_tuple - pair equality is equality up to swap (random)")
{
    auto rng = std::mt19937(12345);
    auto dist = std::uniform_int_distribution<int>(0, 4);

    for (auto i = 0; i < 1000; ++i)
    {
        auto const a = dist(rng);
        auto const b = dist(rng);
        auto const c = dist(rng);
        auto const d = dist(rng);

        auto const same = (a == c && b == d) || (a == d && b == c);
        CHECK((uc::unordered_pair<int>{a, b} == uc::unordered_pair<int>{c, d}) == same);

        if (b != c)
            CHECK((uc::unordered_pair<int>{a, b} != uc::unordered_pair<int>{a, c}));
        if (a != b)
            CHECK((uc::unordered_pair<int>{a, a} != uc::unordered_pair<int>{a, b}));
    }
}

// ============================================================================
// Hashing
// ============================================================================

TEST("unordered_tuple - equal tuples hash equally")
{
    auto const h = std::hash<uc::unordered_tuple<int, 3>>{};

    CHECK(h({0, 3, 5}) == h({5, 0, 3}));
    CHECK(h({0, 3, 5}) == h({3, 5, 0}));
    CHECK(uc::hash_value(uc::unordered_pair<int>{8, 9}) == uc::hash_value(uc::unordered_pair<int>{9, 8}));

    auto const hs = std::hash<uc::unordered_pair<std::string>>{};
    CHECK(hs({"left", "right"}) == hs({"right", "left"}));
}

TEST("unordered_tuple - hash is consistent with equality (random)")
{
    auto rng = std::mt19937(12345);
    auto dist = std::uniform_int_distribution<int>(0, 4); // small range so duplicates and collisions happen

    auto const hp = std::hash<uc::unordered_pair<int>>{};
    auto const ht = std::hash<uc::unordered_tuple<int, 3>>{};

    int equal_pairs = 0;
    for (auto i = 0; i < 1000; ++i)
    {
        auto const a = uc::unordered_pair<int>{dist(rng), dist(rng)};
        auto const b = uc::unordered_pair<int>{dist(rng), dist(rng)};
        if (a == b)
        {
            ++equal_pairs;
            CHECK(hp(a) == hp(b));
        }
    }
    CHECK(equal_pairs > 0);

    int equal_triples = 0;
    for (auto i = 0; i < 1000; ++i)
    {
        auto const a = uc::unordered_tuple<int, 3>{dist(rng), dist(rng), dist(rng)};
        auto b = a;
        std::shuffle(b.begin(), b.end(), rng);
        CHECK(a == b);
        CHECK(ht(a) == ht(b));

        auto const c = uc::unordered_tuple<int, 3>{dist(rng), dist(rng), dist(rng)};
        if (a == c)
        {
            ++equal_triples;
            CHECK(ht(a) == ht(c));
        }
    }
    CHECK(equal_triples > 0);
}

TEST("unordered_tuple - usable as hash set key")
{
    auto edges = std::unordered_set<uc::unordered_pair<int>>();
    edges.insert({0, 1});
    edges.insert({1, 2});
    edges.insert({1, 0});
    edges.insert({2, 1});
    edges.insert({2, 2});

    CHECK(edges.size() == 3);
    CHECK(edges.contains({0, 1}));
    CHECK(edges.contains({2, 1}));
    CHECK(edges.contains({2, 2}));
    CHECK(!edges.contains({0, 2}));
}

// ============================================================================
// Conversions
// ============================================================================

TEST("unordered_tuple - conversions")
{
    SECTION("to_array returns storage order")
    {
        auto const t = uc::unordered_tuple<int, 3>{3, 1, 2};
        auto const arr = t.to_array();
        CHECK(arr[0] == 3);
        CHECK(arr[1] == 1);
        CHECK(arr[2] == 2);
        CHECK((static_cast<uc::fixed_array<int, 3>>(t) == arr));
    }

    SECTION("pair round trip keeps order when nothing else intervenes")
    {
        auto const p = uc::pair<int, int>{5, 2};
        auto const e = uc::unordered_pair<int>(p);
        CHECK(e.to_pair() == p);
        CHECK((static_cast<uc::pair<int, int>>(e) == p));
    }

    SECTION("equal unordered pairs may yield different ordered pairs")
    {
        auto const a = uc::unordered_pair<int>{1, 2};
        auto const b = uc::unordered_pair<int>{2, 1};
        CHECK(a == b);
        CHECK(a.to_pair() != b.to_pair());
    }

    SECTION("rvalue conversion moves elements out")
    {
        auto t = uc::unordered_pair<std::string>{"abc", "def"};
        auto const p = uc::move(t).to_pair();
        CHECK(p.first == "abc");
        CHECK(p.second == "def");
    }
}

// ============================================================================
// Debug output
// ============================================================================

TEST("unordered_tuple - to_debug_string")
{
    CHECK(uc::to_debug_string(uc::unordered_tuple<int, 3>{0, 3, 5}) == "{0, 3, 5}");
    CHECK(uc::to_debug_string(uc::unordered_pair<std::string>{"a", "b"}) == "{\"a\", \"b\"}");
    CHECK(uc::to_debug_string(uc::unordered_tuple<int, 0>{}) == "{}");

    // nested in a range
    auto const edges = std::array{uc::unordered_pair<int>{0, 1}, uc::unordered_pair<int>{1, 2}};
    CHECK(uc::to_debug_string(edges) == "[{0, 1}, {1, 2}]");
}
