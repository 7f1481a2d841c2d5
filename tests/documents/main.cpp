#define RYML_SINGLE_HDR_DEFINE_NOW
#include "YamlFusion/YamlFusion.hpp"
#include "../test_helpers.hpp"
#include <cassert>
#include <cstddef>
#include <iostream>
#include <span>
#include <sstream>
#include <string>
#include <vector>

using namespace YamlFusion;
using namespace TestHelpers;

struct Entry {
    int a;
};

struct Config {
    std::string host;
    int port;
    std::vector<std::string> tags;

    bool operator==(const Config&) const = default;
};

int main() {
    std::cout << "=== Documents and Streams Tests ===\n\n";

    // Test 1: Every document of a stream
    {
        std::cout << "Test 1: Multiple documents... ";
        std::vector<Entry> docs;
        auto r = ParseDocuments(docs, "a: 1\n---\na: 2\n");
        assert(r);
        assert(r.document_count() == 2);
        assert(docs.size() == 2);
        assert(docs[0].a == 1 && docs[1].a == 2);

        std::vector<Value> values;
        assert(ParseDocuments(values, "--- 1\n--- [x]\n--- {k: v}\n"));
        assert(values.size() == 3);
        assert(values[0] == 1);
        assert(values[1][0] == "x");
        assert(values[2]["k"] == "v");
        std::cout << "PASSED\n";
    }

    // Test 2: A single document through ParseDocuments
    {
        std::cout << "Test 2: Single document stream... ";
        std::vector<Entry> docs;
        auto r = ParseDocuments(docs, "a: 7\n");
        assert(r);
        assert(docs.size() == 1 && docs[0].a == 7);
        std::cout << "PASSED\n";
    }

    // Test 3: One bad document fails the whole stream
    {
        std::cout << "Test 3: Failing document... ";
        std::vector<Entry> docs;
        auto r = ParseDocuments(docs, "a: 1\n---\na: nope\n---\na: 3\n");
        assert(!r);
        assert(r.kind() == ErrorKind::UNEXPECTED_SHAPE);
        assert(r.errorPath() == "a");
        assert(r.position().has_value() && r.position()->line == 3);
        assert(docs.empty());
        std::cout << "PASSED\n";
    }

    // Test 4: Parse refuses more than one document
    {
        std::cout << "Test 4: Parse with several documents... ";
        Entry e;
        auto r = Parse(e, "a: 1\n---\na: 2\n");
        assert(!r);
        assert(r.kind() == ErrorKind::PARSE_SYNTAX);
        assert(r.message() == "deserializing from YAML containing more than one document is not supported");
        assert(r.document_count() == 2);

        // an explicit start marker is still one document
        assert(ParseSucceeds(e, "---\na: 4\n"));
        assert(e.a == 4);
        assert(ParseSucceeds(e, "---\na: 5\n...\n"));
        assert(e.a == 5);
        std::cout << "PASSED\n";
    }

    // Test 5: Parse from an input stream
    {
        std::cout << "Test 5: Input streams... ";
        std::istringstream is("host: example.org\nport: 8080\ntags: [a, b]\n");
        Config c;
        auto r = ParseStream(c, is);
        assert(r);
        assert(c.host == "example.org");
        assert(c.port == 8080);
        assert(c.tags.size() == 2);

        std::istringstream broken("host: x\n");
        broken.setstate(std::ios::badbit);
        auto r2 = ParseStream(c, broken);
        assert(!r2);
        assert(r2.kind() == ErrorKind::IO);
        assert(r2.message() == "failed to read from input stream");

        std::istringstream invalid("host: \xFF\n");
        assert(ParseStream(c, invalid).kind() == ErrorKind::UTF8);
        std::cout << "PASSED\n";
    }

    // Test 6: Parse from raw bytes
    {
        std::cout << "Test 6: Byte buffers... ";
        const std::string text = "host: h\nport: 1\ntags: []\n";
        std::vector<std::byte> bytes;
        for (char ch : text) {
            bytes.push_back(static_cast<std::byte>(ch));
        }
        Config c;
        auto r = ParseBytes(c, std::span<const std::byte>(bytes));
        assert(r);
        assert(c.host == "h" && c.port == 1 && c.tags.empty());
        std::cout << "PASSED\n";
    }

    // Test 7: Stream round trip
    {
        std::cout << "Test 7: Stream round trip... ";
        Config c{"db.local", 5432, {"primary", "on"}};
        std::stringstream ss;
        assert(SerializeToStream(c, ss));
        Config back;
        assert(ParseStream(back, ss));
        assert(back == c);
        std::cout << "PASSED\n";
    }

    // Test 8: Empty input
    {
        std::cout << "Test 8: Empty input... ";
        std::vector<Entry> docs;
        auto r = ParseDocuments(docs, "");
        assert(r);
        assert(docs.empty());
        assert(r.document_count() == 0);

        Value v;
        auto r2 = Parse(v, "");
        assert(!r2);
        assert(r2.kind() == ErrorKind::PARSE_SYNTAX);
        assert(r2.message() == "EOF while parsing a value");
        std::cout << "PASSED\n";
    }

    std::cout << "\n=== All Documents and Streams tests passed! ===\n";
    return 0;
}
