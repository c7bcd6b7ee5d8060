/**
 * @file test_loader.cpp
 * @brief Tests for file loading and saving (Catch2)
 *
 * Tests cover:
 * - RULE F1: Missing files throw FileNotFoundError
 * - RULE F2: Document errors surface unchanged
 * - RULE F3: Extension-based import of JSON files
 * - Saving and re-loading documents
 *
 * @copyright (c) 2026. MIT License.
 */

#include <catch2/catch_all.hpp>
#include "pyson/Errors.hpp"
#include "pyson/Loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace pyson;

// ============================================================================
// Test fixtures and helpers
// ============================================================================

/**
 * @brief RAII helper for creating temporary files.
 */
class TempFile {
public:
    TempFile(const std::string& content, const std::string& extension = ".pyson")
        : path_(fs::temp_directory_path() /
                ("pyson_test_" + std::to_string(std::rand()) + extension)) {
        std::ofstream out(path_, std::ios::binary);
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
// RULE F1-F2: Loading pyson files
// ============================================================================

TEST_CASE("load_document_file - basic loading", "[loader][rule-f2]") {
    SECTION("Entries in file order") {
        TempFile file("b:int:2\na:str:hello\nl:list:x(*)y\n");

        Document doc = load_document_file(file.path());

        REQUIRE(doc.size() == 3);
        CHECK(doc[0] == NamedValue("b", 2));
        CHECK(doc[1] == NamedValue("a", "hello"));
        CHECK(doc[2].value() == Value(Value::List{"x", "y"}));
    }

    SECTION("Empty file") {
        TempFile file("");
        CHECK(load_document_file(file.path()).empty());
    }

    SECTION("Map form") {
        TempFile file("a:int:1\n\nb:float:0.5\n");

        DocumentMap m = load_document_file_as_map(file.path());

        REQUIRE(m.size() == 2);
        CHECK(m.at("a") == Value(1));
        CHECK(m.at("b") == Value(0.5));
    }
}

TEST_CASE("load_document_file - error handling", "[loader][rule-f1][rule-f2]") {
    SECTION("File not found throws FileNotFoundError") {
        CHECK_THROWS_AS(load_document_file("/nonexistent/path.pyson"), FileNotFoundError);
        CHECK_THROWS_AS(load_document_file_as_map("/nonexistent/path.pyson"), FileNotFoundError);
    }

    SECTION("FileNotFoundError carries the path") {
        try {
            read_text_file("/nonexistent/x.pyson");
            FAIL("expected FileNotFoundError");
        } catch (const FileNotFoundError& e) {
            CHECK(e.path() == "/nonexistent/x.pyson");
            CHECK(e.code() == ErrorCode::FileNotFound);
        }
    }

    SECTION("Directory is not a document") {
        CHECK_THROWS_AS(load_document_file(fs::temp_directory_path().string()), FileNotFoundError);
    }

    SECTION("Invalid entry surfaces as EntryError") {
        TempFile file("a:int:1\nbroken\n");
        try {
            load_document_file(file.path());
            FAIL("expected EntryError");
        } catch (const EntryError& e) {
            CHECK(e.line_index() == 1);
            CHECK(e.cause() == ErrorCode::MalformedEntry);
        }
    }

    SECTION("Duplicate names surface as DuplicateName") {
        TempFile file("a:int:1\na:int:2\n");
        CHECK_THROWS_AS(load_document_file(file.path()), DuplicateName);
        CHECK_THROWS_AS(load_document_file_as_map(file.path()), DuplicateName);
    }
}

// ============================================================================
// RULE F3: Extension-based loading
// ============================================================================

TEST_CASE("load_any_file - format detection", "[loader][rule-f3]") {
    SECTION("JSON object is imported") {
        TempFile file(R"({"port": 8080, "tags": ["a", "b"]})", ".json");

        DocumentMap m = to_map(load_any_file(file.path()));

        CHECK(m.at("port") == Value(8080));
        CHECK(m.at("tags") == Value(Value::List{"a", "b"}));
    }

    SECTION("Uppercase extension is recognised") {
        TempFile file(R"({"x": "y"})", ".JSON");
        CHECK(load_any_file(file.path()).size() == 1);
    }

    SECTION("Invalid JSON throws ConversionError") {
        TempFile file("{ invalid json }", ".json");
        CHECK_THROWS_AS(load_any_file(file.path()), ConversionError);
    }

    SECTION("Other extensions are read as pyson") {
        TempFile file("a:int:1\n", ".txt");
        CHECK(load_any_file(file.path())[0] == NamedValue("a", 1));
    }

    SECTION("Missing file") {
        CHECK_THROWS_AS(load_any_file("/nonexistent/file.json"), FileNotFoundError);
    }
}

TEST_CASE("get_file_extension", "[loader]") {
    CHECK(get_file_extension("a/b/c.PYSON") == ".pyson");
    CHECK(get_file_extension("noext") == "");
}

// ============================================================================
// Saving
// ============================================================================

TEST_CASE("save_document_file", "[loader][save]") {
    TempFile file("", ".pyson");

    SECTION("Save then load round-trips") {
        Document doc = {NamedValue("name", "pyson"), NamedValue("version", 3),
                        NamedValue("ratio", 0.125), NamedValue("langs", Value::List{"c++", "js"})};

        save_document_file(file.path(), doc);

        CHECK(read_text_file(file.path()) ==
              "name:str:pyson\nversion:int:3\nratio:float:0.125\nlangs:list:c++(*)js\n");
        CHECK(load_document_file(file.path()) == doc);
    }

    SECTION("Edit in place with swap") {
        save_document_file(file.path(), {NamedValue("a", 1), NamedValue("b", 2)});

        Document doc = load_document_file(file.path());
        Value old = doc[1].swap_value("two");
        std::string old_name = doc[0].swap_name("first");
        save_document_file(file.path(), doc);

        CHECK(old == Value(2));
        CHECK(old_name == "a");
        CHECK(read_text_file(file.path()) == "first:int:1\nb:str:two\n");
    }

    SECTION("Duplicate names leave the file untouched") {
        save_document_file(file.path(), {NamedValue("a", 1)});

        Document dup = {NamedValue("x", 1), NamedValue("x", 2)};
        CHECK_THROWS_AS(save_document_file(file.path(), dup), DuplicateName);
        CHECK(read_text_file(file.path()) == "a:int:1\n");
    }
}
