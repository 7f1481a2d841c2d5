#define RYML_SINGLE_HDR_DEFINE_NOW
#include "YamlFusion/YamlFusion.hpp"
#include <array>
#include <cstdint>
#include <iostream>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <unordered_map>
#include <variant>
#include <vector>

using namespace YamlFusion;
using namespace YamlFusion::static_schema;

struct Point {
    double x;
    double y;
};

struct Labeled {
    Annotated<int, options::key<"ID">> id;
    Annotated<std::string, options::skip> cache;
    std::optional<std::string> label;
};

struct Registered {
    int id;
    std::string label;
};

template<>
struct YamlFusion::StructMeta<Registered> {
    using Fields = StructFields<
        Field<&Registered::id, "ID">,
        Field<&Registered::label, "label">
    >;
};

struct Sparse {
    std::optional<int> a;
    Annotated<int, options::default_on_absence> retries = 3;
    Annotated<std::string, options::skip> scratch;
};

class NotAggregate {
public:
    explicit NotAggregate(int v) : v_(v) {}
private:
    int v_;
};

using Shape = std::variant<Case<"Empty">, Case<"Circle", double>, Case<"Rect", double, double>>;
using PlainVariant = std::variant<int, std::string>;
using Duplicated = std::variant<Case<"A">, Case<"A", int>>;

/* ######## Scalars ######## */
static_assert(YamlBool<bool>);
static_assert(!YamlNumber<bool>);
static_assert(YamlNumber<std::uint8_t>);
static_assert(YamlNumber<std::int64_t>);
static_assert(YamlNumber<float>);
static_assert(YamlString<std::string>);
static_assert(YamlString<std::string_view>);
static_assert(YamlParsableString<std::string>);
static_assert(!YamlParsableString<std::string_view>);
static_assert(YamlValueNode<Value>);
static_assert(YamlNumber<Annotated<double, options::allow_non_finite>>);

/* ######## Containers ######## */
static_assert(YamlSerializableArray<std::vector<int>>);
static_assert(YamlParsableArray<std::list<std::string>>);
static_assert(YamlParsableArray<std::array<bool, 3>>);
static_assert(YamlSerializableArray<std::set<int>>);
static_assert(!YamlSerializableArray<std::string>);
static_assert(!YamlSerializableArray<std::map<std::string, int>>);
static_assert(YamlSerializableMap<std::map<std::string, int>>);
static_assert(YamlParsableMap<std::map<int, std::vector<double>>>);
static_assert(YamlParsableMap<std::unordered_map<std::string, Point>>);
static_assert(YamlMapKey<std::string>);
static_assert(YamlMapKey<int>);
static_assert(!YamlMapKey<bool>);
static_assert(!YamlMapKey<double>);
static_assert(!YamlSerializableMap<std::map<double, int>>);
static_assert(YamlTuple<std::tuple<int, std::string>>);

/* ######## Records ######## */
static_assert(YamlRecord<Point>);
static_assert(YamlRecord<Labeled>);
static_assert(YamlRecord<Registered>);
static_assert(YamlRecord<Annotated<Point, options::as_sequence>>);
static_assert(!YamlRecord<NotAggregate>);
static_assert(!YamlRecord<std::optional<Point>>);
static_assert(!YamlRecord<Value>);

static_assert(struct_fields_helper::FieldsHelper<Labeled>::rawFieldsCount == 3);
static_assert(struct_fields_helper::FieldsHelper<Labeled>::fieldsCount == 2);
static_assert(struct_fields_helper::FieldsHelper<Labeled>::fieldIndexesToFieldNames[0].name == "ID");
static_assert(struct_fields_helper::FieldsHelper<Labeled>::fieldIndexesToFieldNames[1].name == "label");
static_assert(struct_fields_helper::FieldsHelper<Labeled>::fieldIndexesToFieldNames[1].originalIndex == 2);
static_assert(struct_fields_helper::FieldsHelper<Labeled>::findField("cache") == struct_fields_helper::NOT_FOUND);
static_assert(struct_fields_helper::FieldsHelper<Point>::findField("y") == 1);
static_assert(struct_fields_helper::FieldsHelper<Registered>::fieldIndexesToFieldNames[0].name == "ID");

static_assert(introspection::fieldCount<Labeled> == 3);
static_assert(introspection::RecordField<Labeled, 0>::name == "ID");
static_assert(std::same_as<introspection::RecordField<Labeled, 0>::value_type, int>);
static_assert(introspection::RecordField<Labeled, 0>::absence == introspection::Absence::required);
static_assert(introspection::RecordField<Labeled, 1>::skipped);
static_assert(introspection::RecordField<Labeled, 2>::absence == introspection::Absence::null);
static_assert(introspection::RecordField<Sparse, 1>::absence == introspection::Absence::keep_default);
static_assert(introspection::RecordField<Point, 1>::name == "y");
static_assert(introspection::has_registered_fields<Registered>);
static_assert(!introspection::has_registered_fields<Point>);
static_assert(introspection::fieldCount<Registered> == 2);
static_assert(introspection::RecordField<Registered, 0>::name == "ID");
static_assert(std::same_as<introspection::RecordField<Registered, 1>::value_type, std::string>);

static_assert(recordFieldsAllOptional<Sparse>());
static_assert(!recordFieldsAllOptional<Point>());
static_assert(!recordFieldsAllOptional<std::optional<int>>());

/* ######## Variants ######## */
static_assert(YamlVariant<Shape>);
static_assert(!YamlVariant<PlainVariant>);
static_assert(variant_detail::variant_traits<Shape>::casesCount == 3);
static_assert(variant_detail::variant_traits<Shape>::find("Rect") == 2);
static_assert(variant_detail::variant_traits<Shape>::find("Square") == variant_detail::NOT_FOUND);
static_assert(variant_detail::variant_traits<Shape>::arities[0] == 0);
static_assert(variant_detail::variant_traits<Shape>::arities[2] == 2);
static_assert(variant_detail::variant_traits<Shape>::namesAreUnique);
static_assert(!variant_detail::variant_traits<Duplicated>::namesAreUnique);
static_assert(std::same_as<Case<"Rect", double, double>::payload_type, std::tuple<double, double>>);

/* ######## Value model ######## */
static_assert(YamlParsableValue<Point>);
static_assert(YamlSerializableValue<Point>);
static_assert(YamlParsableValue<std::optional<Shape>>);
static_assert(YamlParsableValue<std::unique_ptr<Point>>);
static_assert(YamlNullableParsableValue<std::optional<int>>);
static_assert(!YamlNullableParsableValue<int>);
static_assert(YamlParsableValue<Annotated<std::optional<Shape>, options::singleton_map_optional>>);
static_assert(YamlSerializableValue<std::vector<std::map<std::string, Shape>>>);
static_assert(!YamlParsableValue<PlainVariant>);
static_assert(!YamlParsableValue<NotAggregate>);
static_assert(!YamlParsableValue<int*>);
static_assert(!YamlSerializableValue<void*>);

/* ######## Option packs ######## */
using SingletonOpts = options::detail::annotation_meta_getter<Annotated<Shape, options::singleton_map>>::options;
static_assert(SingletonOpts::variant_repr == options::VariantRepr::singleton_map);
using PlainOpts = options::detail::annotation_meta_getter<Shape>::options;
static_assert(PlainOpts::variant_repr == options::VariantRepr::tag);
static_assert(options::variant_repr_to_string(options::VariantRepr::singleton_map_recursive) == "singleton_map_recursive");

/* ######## Reader and writer models ######## */
static_assert(reader::ReaderLike<RapidYamlReader>);
static_assert(reader::ReaderLike<ValueReader>);
static_assert(writer::WriterLike<RapidYamlWriter>);
static_assert(writer::WriterLike<ValueWriter>);

int main() {
    std::cout << "=== Compile-time Schema Tests ===\n\n";
    std::cout << "All static assertions hold\n";
    return 0;
}
