#include <gtest/gtest.h>
#include "language_registry.h"
#include "constants.h"
#include <json/json.h>
#include <sstream>

namespace runbox {
namespace {

class LanguageRegistryTest : public ::testing::Test {
protected:
    static Json::Value parse(const std::string& text) {
        Json::CharReaderBuilder builder;
        Json::Value root;
        std::string errors;
        std::istringstream stream(text);
        EXPECT_TRUE(Json::parseFromStream(builder, stream, &root, &errors)) << errors;
        return root;
    }

    static LanguageDescriptor interpreted(const std::string& id) {
        LanguageDescriptor language;
        language.id = id;
        language.runtime_image = "python:3.11-slim";
        language.file_extension = "py";
        language.run_command = {"python", "{file}"};
        return language;
    }
};

// ============================================================================
// Built-in Table Tests
// ============================================================================

TEST_F(LanguageRegistryTest, Builtin_ContainsEveryShippedLanguage) {
    // Given: The built-in table
    // When: Listing its ids
    // Then: All shipped languages are present and resolvable

    LanguageRegistry registry = LanguageRegistry::builtin();
    for (const char* id : {"python", "javascript", "go", "sh", "c", "cpp", "rust"}) {
        EXPECT_TRUE(registry.contains(id)) << id;
        auto language = registry.resolve(id);
        ASSERT_TRUE(language) << id;
        EXPECT_FALSE(language->runtime_image.empty());
    }
    EXPECT_EQ(registry.size(), 7u);
}

TEST_F(LanguageRegistryTest, Resolve_UnknownLanguageIsValidationError) {
    LanguageRegistry registry = LanguageRegistry::builtin();

    auto result = registry.resolve("cobol");

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ErrorKind::Validation);
    EXPECT_NE(result.error().message.find("cobol"), std::string::npos);
}

// ============================================================================
// Command Construction Tests
// ============================================================================

TEST_F(LanguageRegistryTest, BuildArgv_InterpretedSubstitutesWholeArgument) {
    // Given: A file name containing shell metacharacters
    // When: Building the python argv
    // Then: The name is a single untouched argument

    auto python = LanguageRegistry::builtin().resolve("python");
    ASSERT_TRUE(python);

    auto argv = python->build_argv("a b;rm -rf.py");

    ASSERT_EQ(argv.size(), 2u);
    EXPECT_EQ(argv[0], "python");
    EXPECT_EQ(argv[1], "a b;rm -rf.py");
}

TEST_F(LanguageRegistryTest, BuildArgv_TwoStageUsesPositionalScript) {
    // Given: The C language (compile then run)
    // When: Building the argv for main.c
    // Then: sh -c receives only positional references and the arguments follow

    auto c = LanguageRegistry::builtin().resolve("c");
    ASSERT_TRUE(c);
    ASSERT_TRUE(c->two_stage());

    auto argv = c->build_argv("main.c");

    ASSERT_GE(argv.size(), 5u);
    EXPECT_EQ(argv[0], "sh");
    EXPECT_EQ(argv[1], "-c");
    EXPECT_EQ(argv[3], "sh");
    EXPECT_EQ(argv[2].find("main"), std::string::npos) << "Script must not embed user data";
    EXPECT_NE(argv[2].find(COMPILE_FAILURE_MARKER), std::string::npos);
    EXPECT_NE(argv[2].find("exec \"${"), std::string::npos);

    std::vector<std::string> tail(argv.begin() + 4, argv.end());
    std::vector<std::string> expected = {"gcc", "-O2", "-o", "/tmp/main", "main.c", "-lm",
                                         "/tmp/main"};
    EXPECT_EQ(tail, expected);
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST_F(LanguageRegistryTest, Construct_RejectsDuplicateIds) {
    EXPECT_THROW(LanguageRegistry({interpreted("py"), interpreted("py")}), ConfigError);
}

TEST_F(LanguageRegistryTest, Validate_RejectsMalformedDescriptors) {
    auto bad_id = interpreted("Py thon");
    EXPECT_THROW(validate_descriptor(bad_id), ConfigError);

    auto no_image = interpreted("python");
    no_image.runtime_image.clear();
    EXPECT_THROW(validate_descriptor(no_image), ConfigError);

    auto embedded_file = interpreted("python");
    embedded_file.run_command = {"python", "--script={file}"};
    EXPECT_THROW(validate_descriptor(embedded_file), ConfigError);

    auto unknown_placeholder = interpreted("python");
    unknown_placeholder.run_command = {"python", "{file}", "{dir}"};
    EXPECT_THROW(validate_descriptor(unknown_placeholder), ConfigError);

    auto no_file = interpreted("python");
    no_file.run_command = {"python"};
    EXPECT_THROW(validate_descriptor(no_file), ConfigError);

    auto packages_without_installer = interpreted("python");
    packages_without_installer.extra_packages = {"numpy"};
    EXPECT_THROW(validate_descriptor(packages_without_installer), ConfigError);
}

// ============================================================================
// JSON Table Tests
// ============================================================================

TEST_F(LanguageRegistryTest, FromJson_ParsesTableAndIgnoresUnknownKeys) {
    // Given: A table in the external configuration format
    // When: Loading it
    // Then: Fields map onto descriptors; unknown keys are ignored

    auto table = parse(R"({
        "python": {"image": "python:3.12", "file_ext": ".py", "cmd": "python",
                   "install_cmd": "pip install", "packages": ["numpy", "sympy"],
                   "comment": "ignored"},
        "zig": {"image": "zig:0.11", "file_ext": "zig", "cmd": ["zig", "run", "{file}"]}
    })");

    LanguageRegistry registry = LanguageRegistry::from_json(table);

    ASSERT_EQ(registry.size(), 2u);
    auto python = registry.resolve("python");
    ASSERT_TRUE(python);
    EXPECT_EQ(python->file_extension, "py");
    EXPECT_EQ(python->run_command, (std::vector<std::string>{"python", "{file}"}));
    EXPECT_EQ(python->install_command, (std::vector<std::string>{"pip", "install"}));
    EXPECT_EQ(python->extra_packages, (std::vector<std::string>{"numpy", "sympy"}));

    auto zig = registry.resolve("zig");
    ASSERT_TRUE(zig);
    EXPECT_EQ(zig->build_argv("x.zig"), (std::vector<std::string>{"zig", "run", "x.zig"}));
}

TEST_F(LanguageRegistryTest, FromJson_MissingRequiredFieldIsFatal) {
    EXPECT_THROW(LanguageRegistry::from_json(parse(R"({"go": {"file_ext": "go", "cmd": "go run"}})")),
                 ConfigError);
    EXPECT_THROW(LanguageRegistry::from_json(parse(R"({"go": {"image": "golang", "cmd": "go run"}})")),
                 ConfigError);
    EXPECT_THROW(LanguageRegistry::from_json(parse(R"({"go": {"image": "golang", "file_ext": "go"}})")),
                 ConfigError);
}

TEST_F(LanguageRegistryTest, FromJson_WrongTypesAreFatal) {
    EXPECT_THROW(LanguageRegistry::from_json(parse(R"(["python"])")), ConfigError);
    EXPECT_THROW(LanguageRegistry::from_json(parse(
                     R"({"py": {"image": 3, "file_ext": "py", "cmd": "python"}})")),
                 ConfigError);
    EXPECT_THROW(LanguageRegistry::from_json(parse(
                     R"({"py": {"image": "p", "file_ext": "py", "cmd": "python", "packages": "numpy"}})")),
                 ConfigError);
}

} // namespace
} // namespace runbox
