// The same enum-like data under each variant representation
// Compile: g++ -std=c++20 -I../include variant_modes.cpp -o variant_modes

#define RYML_SINGLE_HDR_DEFINE_NOW
#include <YamlFusion/YamlFusion.hpp>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

using namespace YamlFusion;
using namespace YamlFusion::options;

using Action = std::variant<
    Case<"Stop">,
    Case<"Move", double>,
    Case<"Goto", double, double>
>;

struct Step {
    std::string label;
    Action action;
};

struct Program {
    std::vector<Step> steps;
    Annotated<Action, singleton_map> fallback;
    Annotated<std::optional<Action>, singleton_map_optional> onError;
};

struct RecursiveProgram {
    Annotated<std::vector<Step>, singleton_map_recursive> steps;
};

// Move is stored as {meters: d} instead of a bare number
bool writeAction(const Action& a, Value& payload) {
    if (const auto* m = std::get_if<Case<"Move", double>>(&a)) {
        payload = Value(Mapping{{Value("meters"), Value(m->value)}});
        return true;
    }
    if (std::holds_alternative<Case<"Stop">>(a)) {
        return true;
    }
    return false;
}

bool readAction(std::string_view name, const Value& payload, Action& a) {
    if (name == "Stop") {
        a = Case<"Stop">{};
        return true;
    }
    if (name == "Move") {
        if (const Value* m = payload.get("meters"); m != nullptr && m->as_f64()) {
            a = Case<"Move", double>{*m->as_f64()};
            return true;
        }
    }
    return false;
}

struct CustomProgram {
    Annotated<Action, singleton_map_with<&writeAction, &readAction>> first;
};

template<class T>
void show(std::string_view title, const T& obj) {
    std::string out;
    if (auto r = Serialize(obj, out); !r) {
        std::cout << title << ": " << r.error().to_string() << "\n\n";
        return;
    }
    std::cout << "# " << title << "\n" << out << "\n";
}

int main() {
    std::vector<Step> steps{
        {"halt", Case<"Stop">{}},
        {"forward", Case<"Move", double>{2.5}},
        {"dock", Case<"Goto", double, double>{{10.0, -4.0}}}
    };

    Program p{steps, Action{Case<"Stop">{}}, std::nullopt};
    show("tags", p);

    RecursiveProgram rp{steps};
    show("singleton_map_recursive", rp);

    CustomProgram cp{Action{Case<"Move", double>{1.0}}};
    show("singleton_map_with", cp);

    const std::string_view yaml = "steps:\n  - label: x\n    action: !Teleport 3\nfallback: Stop\n";
    Program parsed;
    if (auto r = Parse(parsed, yaml); !r) {
        std::cout << FormatError(r, yaml) << std::endl;
    }
    return 0;
}
