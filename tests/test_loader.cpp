/**
 * @file test_loader.cpp
 * @brief Tests for config file loading and person file decoding
 *
 * Tests cover:
 * - JSON and TOML config files, format chosen by extension
 * - Person documents: decoding, error locations, encoding
 */

#include <catch2/catch_all.hpp>
#include "persondir/Loader.hpp"
#include "persondir/Errors.hpp"

#include <fstream>
#include <filesystem>
#include <cstdlib>

namespace fs = std::filesystem;

using namespace persondir;

// ============================================================================
// Test fixtures and helpers
// ============================================================================

/**
 * @brief RAII helper for creating temporary files.
 */
class TempFile {
public:
    TempFile(const std::string& content, const std::string& extension = ".json")
        : path_(fs::temp_directory_path() /
                ("persondir_test_" + std::to_string(std::rand()) + extension)) {
        std::ofstream out(path_);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

// ============================================================================
// Config files
// ============================================================================

TEST_CASE("load_json_file - reads objects", "[loader][json]") {
    TempFile file(R"({"merger": {"strategy": "replacing", "distinct": true}})");

    Value doc = load_json_file(file.path());

    REQUIRE(doc["merger"]["strategy"] == "replacing");
    REQUIRE(doc["merger"]["distinct"] == true);
}

TEST_CASE("load_json_file - keeps key order", "[loader][json]") {
    TempFile file(R"({"zeta": 1, "alpha": 2, "mid": 3})");

    Value doc = load_json_file(file.path());

    std::vector<std::string> keys;
    for (auto it = doc.begin(); it != doc.end(); ++it) keys.push_back(it.key());
    REQUIRE(keys == std::vector<std::string>{"zeta", "alpha", "mid"});
}

TEST_CASE("load_json_file - errors", "[loader][json]") {
    SECTION("Missing file") {
        REQUIRE_THROWS_AS(load_json_file("/nonexistent/persondir.json"), FileNotFoundError);
    }

    SECTION("Invalid syntax") {
        TempFile file(R"({"merger": )");
        try {
            load_json_file(file.path());
            FAIL("Expected ConfigParseError");
        } catch (const ConfigParseError& e) {
            REQUIRE(e.file() == file.path());
            REQUIRE_FALSE(e.details().empty());
        }
    }
}

TEST_CASE("load_toml_file - tables become objects", "[loader][toml]") {
    TempFile file(
        "[lookup]\n"
        "username = \"uid\"\n"
        "[merger]\n"
        "strategy = \"noncolliding\"\n"
        "recover = true\n"
        "[sources]\n"
        "files = [\"hr.json\", \"ldap.json\"]\n",
        ".toml");

    Value doc = load_toml_file(file.path());

    REQUIRE(doc["lookup"]["username"] == "uid");
    REQUIRE(doc["merger"]["strategy"] == "noncolliding");
    REQUIRE(doc["merger"]["recover"] == true);
    REQUIRE(doc["sources"]["files"] == Value::array({"hr.json", "ldap.json"}));
}

TEST_CASE("load_toml_file - invalid syntax reports position", "[loader][toml]") {
    TempFile file("[merger\nstrategy = \n", ".toml");

    try {
        load_toml_file(file.path());
        FAIL("Expected ConfigParseError");
    } catch (const ConfigParseError& e) {
        REQUIRE(e.line() > 0);
    }
}

TEST_CASE("load_config_file - dispatch by extension", "[loader]") {
    SECTION("Empty path loads nothing") {
        Value doc = load_config_file("");
        REQUIRE(doc.is_object());
        REQUIRE(doc.empty());
    }

    SECTION("Uppercase extension") {
        TempFile file(R"({"a": 1})", ".JSON");
        REQUIRE(load_config_file(file.path())["a"] == 1);
    }

    SECTION("Unsupported extension") {
        TempFile file("a: 1\n", ".yaml");
        REQUIRE_THROWS_AS(load_config_file(file.path()), ConfigError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(load_config_file("/nonexistent/persondir.toml"), FileNotFoundError);
    }
}

TEST_CASE("get_file_extension", "[loader]") {
    REQUIRE(get_file_extension("conf/persondir.TOML") == ".toml");
    REQUIRE(get_file_extension("people.json") == ".json");
    REQUIRE(get_file_extension("README").empty());
}

// ============================================================================
// Person documents
// ============================================================================

TEST_CASE("people_from_json - named and unnamed records", "[loader][people]") {
    Value doc = Value::parse(R"([
        {"name": "bob", "attributes": {"mail": ["bob@x.org"], "phone": null}},
        {"attributes": {"uid": ["carol"]}},
        {"name": null},
        {"name": "dave", "attributes": {"groups": [], "level": [3, true]}}
    ])");

    PersonSet people = people_from_json(doc, "people.json");
    REQUIRE(people.size() == 4);

    REQUIRE(people[0]->name() == std::optional<std::string>("bob"));
    REQUIRE(people[0]->attributes().at("mail") == AttributeValues{"bob@x.org"});
    REQUIRE_FALSE(people[0]->attributes().at("phone").has_value());

    REQUIRE_FALSE(people[1]->name().has_value());
    REQUIRE(people[1]->attribute_value("uid") == std::optional<Value>("carol"));

    REQUIRE_FALSE(people[2]->name().has_value());
    REQUIRE(people[2]->attributes().empty());

    REQUIRE(people[3]->attributes().at("groups")->empty());
    REQUIRE(people[3]->attributes().at("level")->size() == 2);
}

TEST_CASE("people_from_json - attribute order is kept", "[loader][people]") {
    Value doc = Value::parse(R"([{"name": "bob", "attributes": {"z": [1], "a": [2], "m": null}}])");

    PersonSet people = people_from_json(doc, "people.json");

    std::vector<std::string> keys;
    for (const auto& entry : people[0]->attributes()) keys.push_back(entry.first);
    REQUIRE(keys == std::vector<std::string>{"z", "a", "m"});
}

TEST_CASE("people_from_json - shape errors name the location", "[loader][people]") {
    SECTION("Top level is not an array") {
        REQUIRE_THROWS_AS(people_from_json(Value::object(), "p.json"), DataFormatError);
    }

    SECTION("Record is not an object") {
        try {
            people_from_json(Value::parse(R"([{"name": "bob"}, 7])"), "p.json");
            FAIL("Expected DataFormatError");
        } catch (const DataFormatError& e) {
            REQUIRE(e.where() == "p.json[1]");
        }
    }

    SECTION("Name is not a string") {
        try {
            people_from_json(Value::parse(R"([{"name": 42}])"), "p.json");
            FAIL("Expected DataFormatError");
        } catch (const DataFormatError& e) {
            REQUIRE(e.where() == "p.json[0].name");
        }
    }

    SECTION("Attribute is a scalar") {
        try {
            people_from_json(Value::parse(R"([{"name": "bob", "attributes": {"mail": "bob@x.org"}}])"), "p.json");
            FAIL("Expected DataFormatError");
        } catch (const DataFormatError& e) {
            REQUIRE(e.where() == "p.json[0].attributes.mail");
        }
    }
}

TEST_CASE("people_to_json - writes records", "[loader][people]") {
    PersonSet people{
        make_person("bob", AttributeMap{{"mail", AttributeValues{"bob@x.org"}}, {"phone", std::nullopt}}),
        make_unnamed_person(AttributeMap{})
    };

    Value doc = people_to_json(people);

    REQUIRE(doc.size() == 2);
    REQUIRE(doc[0]["name"] == "bob");
    REQUIRE(doc[0]["attributes"]["mail"] == Value::array({"bob@x.org"}));
    REQUIRE(doc[0]["attributes"]["phone"].is_null());
    REQUIRE(doc[1]["name"].is_null());
    REQUIRE(doc[1]["attributes"].empty());

    PersonSet decoded = people_from_json(doc, "round-trip");
    REQUIRE(*decoded[0] == *people[0]);
    REQUIRE(*decoded[1] == *people[1]);
}

TEST_CASE("load_people_file", "[loader][people]") {
    TempFile file(R"([{"name": "bob", "attributes": {"dept": ["eng"]}}])");

    PersonSet people = load_people_file(file.path());
    REQUIRE(people.size() == 1);
    REQUIRE(people[0]->attribute_value("dept") == std::optional<Value>("eng"));

    TempFile bad(R"({"name": "bob"})");
    REQUIRE_THROWS_AS(load_people_file(bad.path()), DataFormatError);
}
