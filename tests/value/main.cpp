#define RYML_SINGLE_HDR_DEFINE_NOW
#include "YamlFusion/YamlFusion.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace YamlFusion;

struct Point {
    double x;
    double y;
};

struct Person {
    std::string name;
    int age;
    std::optional<std::string> email;
    std::vector<std::string> tags;
};

int main() {
    std::cout << "=== Value Model Tests ===\n\n";

    // Test 1: Kinds and typed accessors
    {
        std::cout << "Test 1: Kinds and typed accessors... ";
        Value n;
        assert(n.is_null() && n.kind() == ValueKind::Null);
        Value b(true);
        assert(b.is_bool() && b.as_bool() == true);
        assert(!b.as_u64().has_value());
        Value u(std::uint64_t{18446744073709551615ull});
        assert(u.is_u64() && !u.is_i64());
        assert(u.as_u64() == 18446744073709551615ull);
        assert(!u.as_i64().has_value());
        Value i(-5);
        assert(i.is_i64() && !i.is_u64());
        assert(i.as_i64() == -5);
        assert(i.as_f64() == -5.0);
        Value f(2.5);
        assert(f.is_f64() && f.as_f64() == 2.5);
        assert(!f.as_i64().has_value());
        Value s("text");
        assert(s.is_string() && *s.as_string() == "text");
        assert(s.as_sequence() == nullptr);
        assert(s.as_mapping() == nullptr);
        std::cout << "PASSED\n";
    }

    // Test 2: Keyed and indexed access
    {
        std::cout << "Test 2: Keyed and indexed access... ";
        Value seq(Sequence{Value(1), Value("two"), Value(3.0)});
        assert(seq.get(0) != nullptr && *seq.get(0) == 1);
        assert(seq.get(3) == nullptr);
        assert(seq.get(-1) == nullptr);
        assert(seq[1] == "two");
        assert(seq[10].is_null());
        assert(seq.get("key") == nullptr);

        Value map(Mapping{{Value("a"), Value(1)}, {Value(2), Value("int key")}});
        assert(map["a"] == 1);
        assert(map[Value(2)] == "int key");
        assert(map.get("missing") == nullptr);
        assert(map["missing"].is_null());
        assert(map.get(0) == nullptr);
        std::cout << "PASSED\n";
    }

    // Test 3: Mapping keeps insertion order, replaces duplicates in place
    {
        std::cout << "Test 3: Mapping order and duplicates... ";
        Mapping m;
        assert(m.insert(Value("name"), Value("Alice")));
        assert(m.insert(Value("age"), Value(30)));
        assert(!m.insert(Value("name"), Value("Bob")));
        assert(m.size() == 2);
        auto it = m.begin();
        assert(it->first == "name" && it->second == "Bob");
        ++it;
        assert(it->first == "age");
        assert(m.contains(Value("age")));
        assert(m.remove(Value("age")));
        assert(!m.remove(Value("age")));
        assert(m.size() == 1 && !m.empty());
        std::cout << "PASSED\n";
    }

    // Test 4: Deep equality ignores entry order and position
    {
        std::cout << "Test 4: Deep equality... ";
        Value a(Mapping{{Value("x"), Value(1)}, {Value("y"), Value(Sequence{Value(true), Value()})}});
        Value b(Mapping{{Value("y"), Value(Sequence{Value(true), Value()})}, {Value("x"), Value(1)}});
        assert(a == b);
        b.set_position(Position{3, 2, 1});
        assert(a == b);
        Value c(Mapping{{Value("x"), Value(2)}});
        assert(!(a == c));
        // integer and float views of 1 are different numbers
        assert(!(Value(1) == Value(1.0)));
        std::cout << "PASSED\n";
    }

    // Test 5: Comparisons with primitives
    {
        std::cout << "Test 5: Comparisons with primitives... ";
        assert(Value("abc") == "abc");
        assert(Value("abc") == std::string("abc"));
        assert(Value("abc") == std::string_view("abc"));
        assert(!(Value("abc") == 1));
        assert(Value(true) == true);
        assert(!(Value(1) == true));
        assert(Value(42) == 42);
        assert(Value(42) == 42u);
        assert(Value(-1) == -1);
        assert(!(Value(-1) == 18446744073709551615ull));
        assert(Value(0.5) == 0.5);
        assert(Value(2) == 2.0);
        std::cout << "PASSED\n";
    }

    // Test 6: Tagged strips the leading '!' and deep copies
    {
        std::cout << "Test 6: Tagged values... ";
        Tagged t("!Circle", Value(1.5));
        assert(t.tag() == "Circle");
        Tagged u("Circle", Value(1.5));
        assert(t == u);
        Value v(t);
        Value copy = v;
        assert(copy.is_tagged());
        assert(copy.as_tagged()->tag() == "Circle");
        assert(copy.as_tagged()->value() == 1.5);
        assert(copy == v);
        assert(!(Value(Tagged("Square", Value(1.5))) == v));
        std::cout << "PASSED\n";
    }

    // Test 7: Number text forms
    {
        std::cout << "Test 7: Number text forms... ";
        assert(Number(1.0).to_string() == "1.0");
        assert(Number(0.1).to_string() == "0.1");
        assert(Number(0.1f).to_string() == "0.1");
        assert(Number(std::numeric_limits<double>::quiet_NaN()).to_string() == ".nan");
        assert(Number(std::numeric_limits<double>::infinity()).to_string() == ".inf");
        assert(Number(-std::numeric_limits<double>::infinity()).to_string() == "-.inf");
        assert(Number(-7).to_string() == "-7");
        assert(Number(std::numeric_limits<double>::quiet_NaN()).is_nan());
        assert(Number(std::numeric_limits<double>::infinity()).is_infinite());
        assert(!Number(std::numeric_limits<double>::infinity()).is_finite());
        assert(Number(3).is_finite());
        std::cout << "PASSED\n";
    }

    // Test 8: Typed value into a Value tree without text
    {
        std::cout << "Test 8: ToValue... ";
        Person p{"Alice", 30, std::nullopt, {"admin", "ops"}};
        Value v;
        auto r = ToValue(p, v);
        assert(r);
        assert(v.is_mapping());
        assert(v["name"] == "Alice");
        assert(v["age"] == 30);
        assert(v.get("email") != nullptr && v["email"].is_null());
        assert(v["tags"][1] == "ops");
        auto it = v.as_mapping()->begin();
        assert(it->first == "name");
        std::cout << "PASSED\n";
    }

    // Test 9: Value tree into a typed value without text
    {
        std::cout << "Test 9: FromValue... ";
        Value v(Mapping{
            {Value("name"), Value("Bob")},
            {Value("age"), Value(41)},
            {Value("tags"), Value(Sequence{Value("x")})}
        });
        Person p{};
        auto r = FromValue(p, v);
        assert(r);
        assert(p.name == "Bob");
        assert(p.age == 41);
        assert(!p.email.has_value());
        assert(p.tags.size() == 1 && p.tags[0] == "x");

        // a Value reader does not coerce numbers into strings outside keys
        Value wrong(Mapping{{Value("name"), Value(5)}, {Value("age"), Value(1)}, {Value("tags"), Value(Sequence{})}});
        auto r2 = FromValue(p, wrong);
        assert(!r2);
        assert(r2.kind() == ErrorKind::UNEXPECTED_SHAPE);
        assert(r2.errorPath() == "name");
        std::cout << "PASSED\n";
    }

    // Test 10: Typed maps with integer keys through Value
    {
        std::cout << "Test 10: Integer-keyed maps... ";
        std::map<int, std::string> m{{1, "one"}, {2, "two"}};
        Value v;
        assert(ToValue(m, v));
        assert(v[Value(1)] == "one");
        std::map<int, std::string> back;
        assert(FromValue(back, v));
        assert(back == m);
        std::cout << "PASSED\n";
    }

    // Test 11: Value <-> Value copies the tree
    {
        std::cout << "Test 11: Value to Value... ";
        Value src(Sequence{Value(Tagged("T", Value(Mapping{{Value("k"), Value()}}))), Value(-3)});
        Value dst;
        assert(ToValue(src, dst));
        assert(dst == src);
        Value parsed;
        assert(FromValue(parsed, src));
        assert(parsed == src);
        std::cout << "PASSED\n";
    }

    // Test 12: Round trip through text keeps Value trees equal
    {
        std::cout << "Test 12: Text round trip of Value trees... ";
        Value v(Mapping{
            {Value("s"), Value("hello world")},
            {Value("quoted"), Value("true")},
            {Value("multi"), Value("line one\nline two\n")},
            {Value("n"), Value(-12)},
            {Value("f"), Value(1.0)},
            {Value("nan"), Value(std::numeric_limits<double>::quiet_NaN())},
            {Value("inf"), Value(-std::numeric_limits<double>::infinity())},
            {Value("null"), Value()},
            {Value("b"), Value(false)},
            {Value("seq"), Value(Sequence{Value(1), Value(Sequence{}), Value(Mapping{})})},
            {Value(7), Value("int key")},
            {Value("tagged"), Value(Tagged("Point", Value(Mapping{{Value("x"), Value(1)}})))}
        });
        std::string text;
        auto r = Serialize(v, text);
        assert(r);
        Value back;
        auto pr = Parse(back, text);
        assert(pr);
        assert(back == v);
        std::cout << "PASSED\n";
    }

    // Test 13: Parsed values carry source positions
    {
        std::cout << "Test 13: Source positions... ";
        Value v;
        auto r = Parse(v, "a: 1\nb:\n  - x\n");
        assert(r);
        assert(v.position().has_value());
        const Value* x = v["b"].get(0);
        assert(x != nullptr);
        assert(x->position().has_value());
        assert(x->position()->line == 3);
        std::cout << "PASSED\n";
    }

    // Test 14: Record serialized into Value then parsed back from Value
    {
        std::cout << "Test 14: Record through Value... ";
        Point p{1.0, 2.0};
        Value v;
        assert(ToValue(p, v));
        assert(v["x"] == 1.0 && v["y"] == 2.0);
        Point back{};
        assert(FromValue(back, v));
        assert(back.x == 1.0 && back.y == 2.0);
        std::cout << "PASSED\n";
    }

    // Test 15: Editing entries in place
    {
        std::cout << "Test 15: In-place edits... ";
        Value v(Mapping{{Value("name"), Value("Alice")},
                        {Value("tags"), Value(Sequence{Value("dev"), Value("ops")})}});
        Value* name = v.get("name");
        assert(name != nullptr);
        *name = Value("Bob");
        assert(v["name"] == "Bob");

        Value* second = v.get("tags") != nullptr ? v.get("tags")->get(1) : nullptr;
        assert(second != nullptr);
        *second = Value(7);
        assert(v["tags"][1] == 7);

        assert(v.get("missing") == nullptr);
        assert(v.get("tags")->get(5) == nullptr);
        assert(v.as_mapping()->size() == 2);

        // std::string keys resolve without ambiguity
        const std::string key = "name";
        assert(v[key] == "Bob");
        assert(v.get(key) != nullptr);
        const Value& cv = v;
        assert(cv.get(std::string("tags")) != nullptr);
        assert(cv[std::string("absent")].is_null());
        std::cout << "PASSED\n";
    }

    std::cout << "\n=== All Value Model tests passed! ===\n";
    return 0;
}
