#include <string>
#include <gtest/gtest.h>
#include "script/script.hpp"
#include "script/script_language.hpp"

namespace {

using warden::script::all_languages;
using warden::script::describe_languages;
using warden::script::language_from_file_name;
using warden::script::LanguageSet;
using warden::script::parse_language;
using warden::script::Script;
using warden::script::ScriptLanguage;

TEST(ScriptLanguageTest, DetectsLanguageFromExtension) {
    EXPECT_EQ(language_from_file_name("extract.py"), ScriptLanguage::Python);
    EXPECT_EQ(language_from_file_name("setup.sh"), ScriptLanguage::Bash);
    EXPECT_EQ(language_from_file_name("setup.bash"), ScriptLanguage::Bash);
    EXPECT_EQ(language_from_file_name("render.js"), ScriptLanguage::JavaScript);
    EXPECT_EQ(language_from_file_name("render.mjs"), ScriptLanguage::JavaScript);
    EXPECT_EQ(language_from_file_name("build.kts"), ScriptLanguage::KotlinScript);
}

TEST(ScriptLanguageTest, ExtensionMatchIsCaseInsensitive) {
    EXPECT_EQ(language_from_file_name("SCRIPT.PY"), ScriptLanguage::Python);
    EXPECT_EQ(language_from_file_name("Run.Sh"), ScriptLanguage::Bash);
}

TEST(ScriptLanguageTest, UnknownExtensionsHaveNoLanguage) {
    EXPECT_FALSE(language_from_file_name("README.md").has_value());
    EXPECT_FALSE(language_from_file_name("Makefile").has_value());
    EXPECT_FALSE(language_from_file_name("archive.tar.gz").has_value());
    EXPECT_FALSE(language_from_file_name("trailing.").has_value());
}

TEST(ScriptLanguageTest, NamesParseBack) {
    for (const auto language : all_languages()) {
        EXPECT_EQ(parse_language(warden::script::to_string(language)), language);
    }
    EXPECT_EQ(parse_language("Python"), ScriptLanguage::Python);
    EXPECT_FALSE(parse_language("ruby").has_value());
}

TEST(ScriptLanguageTest, DescribesSetsInTableOrder) {
    EXPECT_EQ(describe_languages({ScriptLanguage::Bash, ScriptLanguage::Python}), "python, bash");
    EXPECT_EQ(describe_languages(LanguageSet{}), "none");
    EXPECT_EQ(describe_languages(all_languages()), "python, bash, javascript, kotlin_script");
}

TEST(ScriptLanguageTest, DefaultInterpreters) {
    EXPECT_EQ(warden::script::default_interpreter(ScriptLanguage::Python),
              std::vector<std::string>{"python3"});
    EXPECT_EQ(warden::script::default_interpreter(ScriptLanguage::Bash),
              std::vector<std::string>{"bash"});
    EXPECT_EQ(warden::script::default_interpreter(ScriptLanguage::JavaScript),
              std::vector<std::string>{"node"});
}

TEST(ScriptTest, BuildsPathAndToolName) {
    const auto script = Script::from_file("pdf", "extract_text.py", "/skills/pdf");
    EXPECT_EQ(script.language, ScriptLanguage::Python);
    EXPECT_EQ(script.script_path(), std::filesystem::path("/skills/pdf/scripts/extract_text.py"));
    EXPECT_EQ(script.tool_name(), "pdf_extract_text");
}

TEST(ScriptTest, ToolNameDropsOnlyTheLastExtension) {
    EXPECT_EQ(Script::from_file("docs", "build.main.kts", "/s").tool_name(), "docs_build.main");
    EXPECT_EQ(Script::from_file("docs", "Makefile", "/s").tool_name(), "docs_Makefile");
}

}  // namespace
