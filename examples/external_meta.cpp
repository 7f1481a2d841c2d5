#define RYML_SINGLE_HDR_DEFINE_NOW
#include <YamlFusion/serializer.hpp>
#include <YamlFusion/parser.hpp>
#include <YamlFusion/error_formatting.hpp>
using YamlFusion::Annotated;
using YamlFusion::options::as_sequence, YamlFusion::options::skip, YamlFusion::options::deny_unknown_fields;
#include <iostream>
#include <format>
using std::cout;
using std::endl;
using std::format;


struct Vec {
    float x = 1, y = 2, z = 3;
};
template<> struct YamlFusion::Annotated<Vec> {
    using Options = OptionsPack<
        as_sequence
        >;
};

template<> struct YamlFusion::AnnotatedField<Vec, 1> {
    using Options = OptionsPack<
        skip
        >;
};

// Third-party type that cannot be touched: register its keys from outside
struct Endpoint {
    std::string hostName;
    int portNumber;
};
template<> struct YamlFusion::StructMeta<Endpoint> {
    using Fields = StructFields<
        Field<&Endpoint::hostName, "host">,
        Field<&Endpoint::portNumber, "port">
        >;
};


int main() {
    struct TopLevel {
        struct VecInner {
            float x = 4, y = 5, z = 6;
        };
        Annotated<VecInner, as_sequence> vec1;
        Vec vec2;
        Annotated<Endpoint, deny_unknown_fields> endpoint{Endpoint{"example.org", 443}};
    };
    std::string out;
    if (auto r = YamlFusion::Serialize(TopLevel{}, out); !r) {
        cout << r.error().to_string() << endl;
        return 1;
    }
    cout << out << endl;
    /*
    vec1:
      - 4.0
      - 5.0
      - 6.0
    vec2:
      - 1.0
      - 3.0
    endpoint:
      host: example.org
      port: 443
    */
    TopLevel t;
    if (auto r = YamlFusion::Parse(t, out); !r) {
        cout << YamlFusion::FormatError(r, out) << endl;
        return 1;
    }
    cout << format("vec1: ({}, {}, {}), vec2: ({}, {}, {}), endpoint: {}:{}",
                   t.vec1->x, t.vec1->y, t.vec1->z, t.vec2.x, t.vec2.y, t.vec2.z,
                   t.endpoint->hostName, t.endpoint->portNumber) << endl;
    /* vec1: (4, 5, 6), vec2: (1, 2, 3), endpoint: example.org:443 */
}
