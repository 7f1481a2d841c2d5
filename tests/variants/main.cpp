#define RYML_SINGLE_HDR_DEFINE_NOW
#include "YamlFusion/YamlFusion.hpp"
#include "../test_helpers.hpp"
#include <cassert>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

using namespace YamlFusion;
using namespace TestHelpers;

struct Person {
    std::string name;
    int age;

    bool operator==(const Person&) const = default;
};

using Shape = std::variant<
    Case<"Empty">,
    Case<"Circle", double>,
    Case<"Rect", double, double>,
    Case<"Owner", Person>
>;

using Inner = std::variant<Case<"Num", int>, Case<"Off">>;

struct Wrapper {
    Inner inner;
};

using Outer = std::variant<Case<"Wrap", Wrapper>, Case<"Nothing">>;

struct Document {
    Annotated<Outer, options::singleton_map_recursive> root;
};

struct OptionalDocument {
    Annotated<std::optional<Outer>, options::singleton_map_recursive> root;
};

struct Drawing {
    std::string title;
    Annotated<Shape, options::singleton_map> shape;
    Annotated<std::optional<Shape>, options::singleton_map_optional> backup;
};

struct Gallery {
    std::vector<Shape> items;
    std::map<std::string, Shape> byName;
};

struct Exhibition {
    Annotated<Gallery, options::singleton_map_recursive> gallery;
};

// Tag form inside tag form cannot be written
using Nested = std::variant<Case<"Outer", Shape>>;

namespace {

// Circle is written as {radius: r}; the other cases are refused
bool writeShape(const Shape& s, Value& payload) {
    if (const auto* c = std::get_if<Case<"Circle", double>>(&s)) {
        payload = Value(Mapping{{Value("radius"), Value(c->value)}});
        return true;
    }
    return std::holds_alternative<Case<"Empty">>(s);
}

bool readShape(std::string_view name, const Value& payload, Shape& s) {
    if (name == "Empty") {
        s = Case<"Empty">{};
        return true;
    }
    if (name != "Circle") {
        return false;
    }
    const Value* r = payload.get("radius");
    if (r == nullptr || !r->as_f64()) {
        return false;
    }
    s = Case<"Circle", double>{*r->as_f64()};
    return true;
}

using CustomShape = Annotated<Shape, options::singleton_map_with<&writeShape, &readShape>>;

}

int main() {
    std::cout << "=== Variant Representation Tests ===\n\n";

    // Test 1: Tag form, unit case is its bare name
    {
        std::cout << "Test 1: Tag form unit case... ";
        Shape s = Case<"Empty">{};
        assert(SerializesTo(s, "Empty\n"));

        Shape back = Case<"Circle", double>{1.0};
        assert(ParseSucceeds(back, "Empty"));
        assert(std::holds_alternative<Case<"Empty">>(back));

        back = Case<"Circle", double>{1.0};
        assert(ParseSucceeds(back, "!Empty"));
        assert(std::holds_alternative<Case<"Empty">>(back));
        std::cout << "PASSED\n";
    }

    // Test 2: Tag form, newtype and tuple cases
    {
        std::cout << "Test 2: Tag form payloads... ";
        Shape s = Case<"Circle", double>{1.5};
        assert(RoundTripsAsValue(s, Value(Tagged("Circle", Value(1.5)))));
        assert(RoundTrips(s));

        Shape parsed;
        assert(ParseSucceeds(parsed, "!Rect [2.0, 3.5]"));
        const auto* rect = std::get_if<Case<"Rect", double, double>>(&parsed);
        assert(rect != nullptr);
        assert(std::get<0>(rect->value) == 2.0 && std::get<1>(rect->value) == 3.5);
        assert(RoundTrips(parsed));

        assert(ParseSucceeds(parsed, "!Owner {name: Alice, age: 30}"));
        const auto* owner = std::get_if<Case<"Owner", Person>>(&parsed);
        assert(owner != nullptr && owner->value == (Person{"Alice", 30}));
        assert(RoundTrips(parsed));
        std::cout << "PASSED\n";
    }

    // Test 3: Tag form errors
    {
        std::cout << "Test 3: Tag form errors... ";
        Shape s;
        assert(ParseFailsWith(s, "!Hexagon 3", ErrorKind::UNKNOWN_VARIANT));
        assert(ParseFailsWith(s, "Hexagon", ErrorKind::UNKNOWN_VARIANT));
        assert(ParseFailsWith(s, "{Circle: 1.5}", ErrorKind::UNEXPECTED_SHAPE));
        assert(ParseFailsWith(s, "[1, 2]", ErrorKind::UNEXPECTED_SHAPE));
        // newtype case named without its payload
        assert(ParseFailsWith(s, "Circle", ErrorKind::UNEXPECTED_SHAPE));
        // unit case with a payload
        assert(ParseFailsWith(s, "!Empty 5", ErrorKind::UNEXPECTED_SHAPE));

        auto r = Parse(s, "!Hexagon 3");
        assert(r.message().find("`Hexagon`") != std::string::npos);
        assert(r.message().find("`Circle`") != std::string::npos);
        std::cout << "PASSED\n";
    }

    // Test 4: A tagged payload inside a tagged case is rejected by the writer
    {
        std::cout << "Test 4: Nested tags... ";
        Nested n = Case<"Outer", Shape>{Shape{Case<"Circle", double>{1.0}}};
        assert(SerializeFailsWith(n, ErrorKind::UNEXPECTED_SHAPE));

        // a unit inner case carries no tag and is fine
        Nested unit = Case<"Outer", Shape>{Shape{Case<"Empty">{}}};
        assert(RoundTripsAsValue(unit, Value(Tagged("Outer", Value("Empty")))));
        std::cout << "PASSED\n";
    }

    // Test 5: singleton_map on a field
    {
        std::cout << "Test 5: Singleton map... ";
        Drawing d;
        d.title = "logo";
        d.shape = Shape{Case<"Circle", double>{2.0}};
        std::string out = SerializeToString(d);
        assert(!out.empty());
        Value v;
        assert(Parse(v, out));
        assert(v["shape"].is_mapping());
        assert(v["shape"].as_mapping()->size() == 1);
        assert(v["shape"]["Circle"] == 2.0);
        assert(v["backup"].is_null());

        Drawing back;
        assert(ParseSucceeds(back, out));
        assert(back.shape.value == d.shape.value);
        assert(!back.backup.value.has_value());

        // unit case: {Empty: null} or the bare name
        d.shape = Shape{Case<"Empty">{}};
        assert(Parse(v, SerializeToString(d)));
        assert(v["shape"].get("Empty") != nullptr && v["shape"]["Empty"].is_null());
        assert(ParseSucceeds(back, "title: t\nshape: Empty\n"));
        assert(std::holds_alternative<Case<"Empty">>(back.shape.value));
        std::cout << "PASSED\n";
    }

    // Test 6: singleton_map wrong shapes
    {
        std::cout << "Test 6: Singleton map errors... ";
        Drawing d;
        assert(ParseFailsAtPath(d, "title: t\nshape: {Circle: 1, Empty: null}\n",
                                ErrorKind::AMBIGUOUS_VARIANT_REPRESENTATION, "shape"));
        assert(ParseFailsWith(d, "title: t\nshape: {}\n", ErrorKind::AMBIGUOUS_VARIANT_REPRESENTATION));
        assert(ParseFailsWith(d, "title: t\nshape: {Square: 1}\n", ErrorKind::UNKNOWN_VARIANT));
        assert(ParseFailsWith(d, "title: t\nshape: !Circle 1\n", ErrorKind::UNEXPECTED_SHAPE));
        assert(ParseFailsAtPath(d, "title: t\nshape: {Circle: x}\n", ErrorKind::UNEXPECTED_SHAPE, "shape.Circle"));
        std::cout << "PASSED\n";
    }

    // Test 7: singleton_map_optional
    {
        std::cout << "Test 7: Optional singleton map... ";
        Drawing d;
        d.title = "t";
        d.shape = Shape{Case<"Empty">{}};
        d.backup = std::optional<Shape>(Shape{Case<"Rect", double, double>{{1.0, 2.0}}});
        std::string out = SerializeToString(d);
        Value v;
        assert(Parse(v, out));
        assert(v["backup"]["Rect"].is_sequence());
        assert(v["backup"]["Rect"][1] == 2.0);

        Drawing back;
        assert(ParseSucceeds(back, out));
        assert(back.backup.value.has_value());
        assert(*back.backup.value == *d.backup.value);

        assert(ParseSucceeds(back, "title: t\nshape: Empty\nbackup: null\n"));
        assert(!back.backup.value.has_value());
        assert(ParseSucceeds(back, "title: t\nshape: Empty\n"));
        assert(!back.backup.value.has_value());
        std::cout << "PASSED\n";
    }

    // Test 8: singleton_map_recursive reaches nested variants
    {
        std::cout << "Test 8: Recursive singleton map... ";
        Document doc;
        doc.root = Outer{Case<"Wrap", Wrapper>{Wrapper{Inner{Case<"Num", int>{5}}}}};
        std::string out = SerializeToString(doc);
        Value v;
        assert(Parse(v, out));
        assert(v["root"]["Wrap"]["inner"]["Num"] == 5);

        Document back;
        assert(ParseSucceeds(back, out));
        assert(back.root.value == doc.root.value);

        assert(ParseSucceeds(back, "root:\n  Wrap:\n    inner: Off\n"));
        const auto* wrap = std::get_if<Case<"Wrap", Wrapper>>(&back.root.value);
        assert(wrap != nullptr);
        assert(std::holds_alternative<Case<"Off">>(wrap->value.inner));

        // tag form is not accepted below a recursive singleton map
        assert(ParseFailsWith(back, "root:\n  Wrap:\n    inner: !Num 5\n", ErrorKind::UNEXPECTED_SHAPE));
        std::cout << "PASSED\n";
    }

    // Test 9: singleton_map_recursive on an absent optional
    {
        std::cout << "Test 9: Recursive singleton map, absent... ";
        OptionalDocument doc;
        assert(SerializesTo(doc, "root: null\n"));
        OptionalDocument back;
        back.root = std::optional<Outer>(Outer{Case<"Nothing">{}});
        assert(ParseSucceeds(back, "root: null\n"));
        assert(!back.root.value.has_value());

        doc.root = std::optional<Outer>(Outer{Case<"Wrap", Wrapper>{Wrapper{Inner{Case<"Off">{}}}}});
        Value v;
        assert(Parse(v, SerializeToString(doc)));
        assert(v["root"]["Wrap"]["inner"].get("Off") != nullptr);
        std::cout << "PASSED\n";
    }

    // Test 10: Tag form stays the default outside the recursive field
    {
        std::cout << "Test 10: Plain variants next to recursive ones... ";
        Wrapper w{Inner{Case<"Num", int>{7}}};
        assert(RoundTripsAsValue(w, Value(Mapping{{Value("inner"), Value(Tagged("Num", Value(7)))}})));
        std::cout << "PASSED\n";
    }

    // Test 11: Custom singleton map hooks
    {
        std::cout << "Test 11: Custom hooks... ";
        CustomShape s;
        s.value = Case<"Circle", double>{4.0};
        std::string out = SerializeToString(s);
        Value v;
        assert(Parse(v, out));
        assert(v["Circle"]["radius"] == 4.0);

        CustomShape back;
        assert(ParseSucceeds(back, "Circle: {radius: 1.25}\n"));
        const auto* c = std::get_if<Case<"Circle", double>>(&back.value);
        assert(c != nullptr && c->value == 1.25);

        assert(ParseSucceeds(back, "Empty"));
        assert(std::holds_alternative<Case<"Empty">>(back.value));
        std::cout << "PASSED\n";
    }

    // Test 12: Custom hooks that refuse a case
    {
        std::cout << "Test 12: Custom hooks failures... ";
        CustomShape s;
        s.value = Case<"Rect", double, double>{{1.0, 1.0}};
        std::string out;
        auto r = Serialize(s, out);
        assert(!r);
        assert(r.kind() == ErrorKind::UNEXPECTED_SHAPE);
        assert(r.message() == "variant `Rect` rejected by custom serializer");
        assert(out.empty());

        CustomShape back;
        auto pr = Parse(back, "Circle: {diameter: 2}\n");
        assert(!pr);
        assert(pr.kind() == ErrorKind::UNEXPECTED_SHAPE);
        assert(pr.message() == "variant `Circle` rejected by custom deserializer");
        assert(ParseFailsWith(back, "Rect: [1, 2]\n", ErrorKind::UNEXPECTED_SHAPE));
        assert(ParseFailsWith(back, "Pentagon: 1\n", ErrorKind::UNKNOWN_VARIANT));
        std::cout << "PASSED\n";
    }

    // Test 13: Variants through Value without text
    {
        std::cout << "Test 13: Variants and Value trees... ";
        Shape s = Case<"Rect", double, double>{{1.0, 2.0}};
        Value v;
        assert(ToValue(s, v));
        assert(v.is_tagged() && v.as_tagged()->tag() == "Rect");
        assert(v.as_tagged()->value()[0] == 1.0);
        Shape back;
        assert(FromValue(back, v));
        assert(back == s);

        std::vector<Shape> many{Case<"Empty">{}, Case<"Circle", double>{0.5}};
        assert(RoundTrips(many));
        std::cout << "PASSED\n";
    }

    // Test 14: singleton_map_recursive reaches sequence and mapping elements
    {
        std::cout << "Test 14: Recursive singleton map through containers... ";
        Exhibition e;
        e.gallery.value.items = {Case<"Circle", double>{1.5}, Case<"Empty">{}};
        e.gallery.value.byName = {{"round", Case<"Circle", double>{1.5}},
                                  {"box", Case<"Rect", double, double>{{2.0, 3.0}}}};
        std::string out = SerializeToString(e);
        assert(!out.empty());

        Value v;
        assert(Parse(v, out));
        const Value& items = v["gallery"]["items"];
        assert(items.is_sequence() && items.as_sequence()->size() == 2);
        assert(items[0] == Value(Mapping{{Value("Circle"), Value(1.5)}}));
        assert(items[1].get("Empty") != nullptr && items[1]["Empty"].is_null());
        const Value& byName = v["gallery"]["byName"];
        assert(byName["round"] == Value(Mapping{{Value("Circle"), Value(1.5)}}));
        assert(byName["box"]["Rect"][0] == 2.0 && byName["box"]["Rect"][1] == 3.0);

        Exhibition back;
        assert(ParseSucceeds(back, out));
        assert(back.gallery.value.items == e.gallery.value.items);
        assert(back.gallery.value.byName == e.gallery.value.byName);

        assert(ParseSucceeds(back, "gallery:\n  items:\n    - {Circle: 1.5}\n  byName:\n    c: {Circle: 1.5}\n"));
        assert(back.gallery.value.items.size() == 1);
        assert(std::get<Case<"Circle", double>>(back.gallery.value.items[0]).value == 1.5);
        assert(std::get<Case<"Circle", double>>(back.gallery.value.byName.at("c")).value == 1.5);

        // elements keep the singleton form, tags are refused
        assert(ParseFailsAtPath(back, "gallery:\n  items:\n    - !Circle 1.5\n  byName: {}\n",
                                ErrorKind::UNEXPECTED_SHAPE, "gallery.items[0]"));
        std::cout << "PASSED\n";
    }

    // Test 15: singleton_map with a record payload
    {
        std::cout << "Test 15: Singleton map record payload... ";
        Drawing d;
        d.title = "portrait";
        d.shape = Shape{Case<"Owner", Person>{Person{"Ann", 41}}};
        std::string out = SerializeToString(d);
        Value v;
        assert(Parse(v, out));
        assert(v["shape"].as_mapping()->size() == 1);
        assert(v["shape"]["Owner"]["name"] == "Ann");
        assert(v["shape"]["Owner"]["age"] == 41);

        Drawing back;
        assert(ParseSucceeds(back, "title: t\nshape:\n  Owner:\n    name: Bo\n    age: 42\n"));
        const auto* owner = std::get_if<Case<"Owner", Person>>(&back.shape.value);
        assert(owner != nullptr);
        assert(owner->value == (Person{"Bo", 42}));
        assert(ParseSucceeds(back, out));
        assert(back.shape.value == d.shape.value);

        assert(ParseFailsAtPath(back, "title: t\nshape: {Owner: {name: Bo}}\n",
                                ErrorKind::MISSING_FIELD, "shape.Owner"));
        std::cout << "PASSED\n";
    }

    std::cout << "\n=== All Variant Representation tests passed! ===\n";
    return 0;
}
