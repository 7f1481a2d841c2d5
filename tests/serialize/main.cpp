#define RYML_SINGLE_HDR_DEFINE_NOW
#include "YamlFusion/YamlFusion.hpp"
#include "../test_helpers.hpp"
#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>

using namespace YamlFusion;
using namespace TestHelpers;

struct Point {
    double x;
    double y;
};

struct Size {
    double width;
    double height;
};

struct Person {
    std::string name;
    int age;
};

struct WithOptionals {
    std::string id;
    std::optional<int> shown_as_null;
    Annotated<std::optional<int>, options::default_on_absence> omitted;
    std::unique_ptr<std::string> boxed;
};

struct Renamed {
    Annotated<int, options::key<"max-depth">> maxDepth;
    Annotated<int, options::skip> internal;
    bool enabled;
};

struct Sample {
    Annotated<double, options::allow_non_finite> lenient;
    double strict;
};

struct Pair {
    int first;
    std::string second;
};

struct Line {
    Annotated<Pair, options::as_sequence> ends;
    std::tuple<int, std::string, bool> info;
};

struct Sparse {
    std::optional<int> a;
    std::optional<int> b;
};

int main() {
    std::cout << "=== Serializer Tests ===\n\n";

    // Test 1: Record with ambiguous key is quoted
    {
        std::cout << "Test 1: Ambiguous keys are quoted... ";
        Point p{1.0, 2.0};
        std::string out = SerializeToString(p);
        assert(out == "x: 1.0\n'y': 2.0\n");
        std::cout << "PASSED\n";
    }

    // Test 2: Record with plain keys stays plain
    {
        std::cout << "Test 2: Plain keys... ";
        Size s{1.0, 2.0};
        assert(SerializesTo(s, "width: 1.0\nheight: 2.0\n"));
        std::cout << "PASSED\n";
    }

    // Test 3: Scalars at the root
    {
        std::cout << "Test 3: Root scalars... ";
        assert(SerializesTo(42, "42\n"));
        assert(SerializesTo(-3, "-3\n"));
        assert(SerializesTo(true, "true\n"));
        assert(SerializesTo(std::string("hello"), "hello\n"));
        assert(SerializesTo(std::string("true"), "'true'\n"));
        assert(SerializesTo(1.0, "1.0\n"));
        assert(SerializesTo(0.1f, "0.1\n"));
        assert(SerializesTo(std::optional<int>{}, "null\n"));
        std::cout << "PASSED\n";
    }

    // Test 4: Sequences
    {
        std::cout << "Test 4: Sequences... ";
        assert(SerializesTo(std::vector<int>{1, 2, 3}, "- 1\n- 2\n- 3\n"));
        assert(SerializesTo(std::list<std::string>{"a", "no"}, "- a\n- 'no'\n"));
        assert(SerializesTo(std::array<bool, 2>{true, false}, "- true\n- false\n"));
        std::cout << "PASSED\n";
    }

    // Test 5: Absent optionals: null, omitted, skipped by record option
    {
        std::cout << "Test 5: Absent optionals... ";
        WithOptionals w{"a1", std::nullopt, std::nullopt, nullptr};
        assert(SerializesTo(w, "id: a1\nshown_as_null: null\nboxed: null\n"));

        w.shown_as_null = 1;
        w.omitted = std::optional<int>(2);
        w.boxed = std::make_unique<std::string>("in a box");
        assert(SerializesTo(w, "id: a1\nshown_as_null: 1\nomitted: 2\nboxed: in a box\n"));

        Annotated<Sparse, options::skip_nulls> sparse;
        sparse.value.b = 5;
        assert(SerializesTo(sparse, "b: 5\n"));
        std::cout << "PASSED\n";
    }

    // Test 6: Renamed and skipped fields
    {
        std::cout << "Test 6: Key and skip options... ";
        Renamed r{};
        r.maxDepth = 3;
        r.internal = 99;
        r.enabled = true;
        assert(SerializesTo(r, "max-depth: 3\nenabled: true\n"));
        std::cout << "PASSED\n";
    }

    // Test 7: Mapping preserves insertion order
    {
        std::cout << "Test 7: Mapping insertion order... ";
        Mapping m;
        m.insert(Value("name"), Value("Alice"));
        m.insert(Value("age"), Value(30));
        std::string out = SerializeToString(Value(m));
        assert(out.find("name") < out.find("age"));
        assert(out == "name: Alice\nage: 30\n");
        std::cout << "PASSED\n";
    }

    // Test 8: Typed maps with string and integer keys
    {
        std::cout << "Test 8: Typed maps... ";
        std::map<std::string, int> m{{"a", 1}, {"true", 2}};
        assert(SerializesTo(m, "a: 1\n'true': 2\n"));
        std::map<int, std::string> im{{1, "one"}, {20, "twenty"}};
        assert(SerializesTo(im, "1: one\n20: twenty\n"));
        std::cout << "PASSED\n";
    }

    // Test 9: Non-finite floats
    {
        std::cout << "Test 9: Non-finite floats... ";
        Sample s{};
        s.lenient = std::numeric_limits<double>::infinity();
        s.strict = 1.5;
        assert(SerializesTo(s, "lenient: .inf\nstrict: 1.5\n"));

        s.strict = std::numeric_limits<double>::quiet_NaN();
        std::string out;
        auto r = Serialize(s, out);
        assert(!r);
        assert(r.kind() == ErrorKind::NON_FINITE_NUMBER);
        assert(!r.error().position.has_value());
        assert(out.empty());

        // Value numbers are emitted as they are
        assert(SerializesTo(Value(std::numeric_limits<double>::quiet_NaN()), ".nan\n"));
        assert(SerializesTo(Value(-std::numeric_limits<double>::infinity()), "-.inf\n"));
        std::cout << "PASSED\n";
    }

    // Test 10: as_sequence records and tuples
    {
        std::cout << "Test 10: Positional records and tuples... ";
        Line l{};
        l.ends.value = Pair{1, "x"};
        l.info = {7, "y", false};
        std::string out = SerializeToString(l);
        assert(!out.empty());
        Value v;
        assert(Parse(v, out));
        assert(v["ends"].is_sequence());
        assert(v["ends"][0] == 1 && v["ends"][1] == "x");
        assert(v["info"][0] == 7 && v["info"][1] == "y" && v["info"][2] == false);
        std::cout << "PASSED\n";
    }

    // Test 11: Multi-line strings use literal block style
    {
        std::cout << "Test 11: Literal block strings... ";
        std::string text = "first line\nsecond line\n";
        std::string out = SerializeToString(text);
        assert(out.find('|') != std::string::npos);
        std::string back;
        assert(ParseSucceeds(back, out));
        assert(back == text);
        std::cout << "PASSED\n";
    }

    // Test 12: Serialize to a stream
    {
        std::cout << "Test 12: Stream output... ";
        std::ostringstream os;
        Person p{"Alice", 30};
        auto r = SerializeToStream(p, os);
        assert(r);
        assert(os.str() == "name: Alice\nage: 30\n");

        std::ostringstream broken;
        broken.setstate(std::ios::badbit);
        auto r2 = SerializeToStream(p, broken);
        assert(!r2);
        assert(r2.kind() == ErrorKind::IO);
        std::cout << "PASSED\n";
    }

    // Test 13: Mapping keys must be scalars in text
    {
        std::cout << "Test 13: Non-scalar Value keys... ";
        Mapping m;
        m.insert(Value(Sequence{Value(1)}), Value("v"));
        std::string out;
        auto r = Serialize(Value(m), out);
        assert(!r);
        assert(r.kind() == ErrorKind::UNEXPECTED_SHAPE);
        assert(out.empty());

        // the same tree is fine without text
        Value copy;
        assert(ToValue(Value(m), copy));
        std::cout << "PASSED\n";
    }

    // Test 14: Round trips of typed values
    {
        std::cout << "Test 14: Typed round trips... ";
        assert(RoundTrips(std::vector<std::string>{"a", "", "yes", "multi\nline"}));
        assert(RoundTrips(std::map<std::string, std::vector<int>>{{"k", {1, 2}}, {"e", {}}}));
        assert(RoundTrips(std::tuple<int, double, std::string>{-1, 0.25, "z"}));
        assert(RoundTrips(std::optional<std::uint8_t>{255}));
        assert(RoundTrips(std::numeric_limits<std::int64_t>::min()));
        assert(RoundTrips(std::numeric_limits<std::uint64_t>::max()));
        std::cout << "PASSED\n";
    }

    // Test 15: Deep Value trees hit the recursion limit
    {
        std::cout << "Test 15: Value depth limit... ";
        Value deep;
        for (int i = 0; i < 300; i++) {
            deep = Value(Sequence{std::move(deep)});
        }
        std::string out;
        auto r = Serialize(deep, out);
        assert(!r);
        assert(r.kind() == ErrorKind::UNEXPECTED_SHAPE);
        assert(r.message() == "recursion limit exceeded");
        Value copy;
        assert(!ToValue(deep, copy));

        Value shallow;
        for (int i = 0; i < 20; i++) {
            shallow = Value(Sequence{std::move(shallow)});
        }
        assert(Serialize(shallow, out));
        assert(ToValue(shallow, copy) && copy == shallow);
        std::cout << "PASSED\n";
    }

    std::cout << "\n=== All Serializer tests passed! ===\n";
    return 0;
}
