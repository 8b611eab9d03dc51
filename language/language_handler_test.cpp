#include "language/language_handler.hpp"

#include <stdexcept>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "language/language_factory.hpp"

namespace {

using ::testing::_;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::MockFunction;
using ::testing::Return;
using ::testing::StartsWith;

using namespace language;  // NOLINT

// NOLINTNEXTLINE
TEST(LanguageTest, ParseLanguage) {
  EXPECT_EQ(ParseLanguage("python"), Language::PYTHON);
  EXPECT_EQ(ParseLanguage("py"), Language::PYTHON);
  EXPECT_EQ(ParseLanguage("Python"), Language::PYTHON);
  EXPECT_EQ(ParseLanguage("js"), Language::JAVASCRIPT);
  EXPECT_EQ(ParseLanguage("c++"), Language::CPP);
  EXPECT_EQ(ParseLanguage("golang"), Language::GO);
  EXPECT_EQ(ParseLanguage("rb"), Language::RUBY);
  EXPECT_THROW(ParseLanguage("cobol"), std::invalid_argument);
  EXPECT_THROW(ParseLanguage(""), std::invalid_argument);
}

// NOLINTNEXTLINE
TEST(LanguageTest, FactoryCreatesEveryLanguage) {
  for (Language language :
       {Language::PYTHON, Language::JAVASCRIPT, Language::JAVA, Language::CPP,
        Language::GO, Language::RUBY}) {
    std::unique_ptr<LanguageHandler> handler =
        LanguageHandlerFactory::Create(language);
    ASSERT_TRUE(handler);
    EXPECT_EQ(handler->GetLanguage(), language);
    EXPECT_EQ(ParseLanguage(handler->Name()), language);
    EXPECT_FALSE(handler->DefaultImage().empty());
    EXPECT_FALSE(handler->BuildInstallCommand({}, "/sandbox"));
    EXPECT_FALSE(handler->BuildRunCommands("/sandbox/x", "/sandbox").empty());
  }
}

// NOLINTNEXTLINE
TEST(LanguageTest, PythonCommands) {
  auto handler = LanguageHandlerFactory::Create("py");
  EXPECT_EQ(handler->CodeFileName(), "code.py");
  auto install = handler->BuildInstallCommand({"numpy", "pandas>=2"}, "/sb");
  ASSERT_TRUE(install);
  EXPECT_EQ(install->text,
            "pip install --quiet --no-cache-dir numpy 'pandas>=2'");
  EXPECT_EQ(install->workdir, "/sb");
  auto run = handler->BuildRunCommands("/sb/code.py", "/sb");
  ASSERT_EQ(run.size(), 1u);
  EXPECT_EQ(run[0].text, "python3 -u /sb/code.py");
  EXPECT_TRUE(handler->SupportsArtifactDetection());
}

// NOLINTNEXTLINE
TEST(LanguageTest, CompiledLanguagesBuildThenRun) {
  auto java = LanguageHandlerFactory::Create(Language::JAVA);
  EXPECT_EQ(java->CodeFileName(), "Main.java");
  auto run = java->BuildRunCommands("/sb/Main.java", "/sb");
  ASSERT_EQ(run.size(), 2u);
  EXPECT_THAT(run[0].text, StartsWith("javac"));
  EXPECT_EQ(run[1].text, "java -cp /sb Main");
  EXPECT_FALSE(java->BuildInstallCommand({"guava"}, "/sb"));

  auto cpp = LanguageHandlerFactory::Create(Language::CPP);
  run = cpp->BuildRunCommands("/sb/code.cpp", "/sb");
  ASSERT_EQ(run.size(), 2u);
  EXPECT_THAT(run[0].text, StartsWith("g++"));
  EXPECT_EQ(run[1].text, "/sb/a.out");
}

// NOLINTNEXTLINE
TEST(LanguageTest, GoInitializesModule) {
  auto handler = LanguageHandlerFactory::Create(Language::GO);
  auto setup = handler->BuildSetupCommands("/sb");
  ASSERT_EQ(setup.size(), 2u);
  EXPECT_EQ(setup[0].text, "mkdir -p /sb");
  EXPECT_EQ(setup[0].workdir, "/");
  EXPECT_THAT(setup[1].text, HasSubstr("go mod init"));
  EXPECT_EQ(setup[1].workdir, "/sb");
}

// NOLINTNEXTLINE
TEST(LanguageTest, UnsupportedArtifactDetection) {
  auto handler = LanguageHandlerFactory::Create(Language::RUBY);
  EXPECT_FALSE(handler->SupportsArtifactDetection());
  EXPECT_THROW(handler->InjectArtifactCapture("puts 1", "/out"),
               std::logic_error);
}

// NOLINTNEXTLINE
TEST(LanguageTest, PythonCaptureIsPrepended) {
  auto handler = LanguageHandlerFactory::Create(Language::PYTHON);
  std::string code = handler->InjectArtifactCapture("print(1)\n", "/out");
  EXPECT_THAT(code, HasSubstr("matplotlib"));
  EXPECT_THAT(code, HasSubstr("'/out'"));
  EXPECT_EQ(code.substr(code.size() - 9), "print(1)\n");
}

// NOLINTNEXTLINE
TEST(LanguageTest, PythonExtractsBase64Files) {
  auto handler = LanguageHandlerFactory::Create(Language::PYTHON);
  MockFunction<core::ConsoleOutput(const core::Command&)> runner;
  EXPECT_CALL(runner, Call(Field(&core::Command::text, StartsWith("find"))))
      .WillOnce(Return(core::ConsoleOutput(0, "plot_0001.png\nnotes.TXT\n")));
  EXPECT_CALL(runner, Call(Field(&core::Command::text,
                                 "base64 -w 0 /out/plot_0001.png")))
      .WillOnce(Return(core::ConsoleOutput(0, "aGVsbG8=")));
  EXPECT_CALL(runner,
              Call(Field(&core::Command::text, "base64 -w 0 /out/notes.TXT")))
      .WillOnce(Return(core::ConsoleOutput(1, "", "No such file")));
  std::vector<core::Artifact> artifacts =
      handler->ExtractArtifacts(runner.AsStdFunction(), "/out", "");
  ASSERT_EQ(artifacts.size(), 1u);
  EXPECT_EQ(artifacts[0].name, "plot_0001.png");
  EXPECT_EQ(artifacts[0].format, "png");
  EXPECT_EQ(artifacts[0].content, "hello");
}

// NOLINTNEXTLINE
TEST(LanguageTest, MissingArtifactDirectory) {
  auto handler = LanguageHandlerFactory::Create(Language::PYTHON);
  MockFunction<core::ConsoleOutput(const core::Command&)> runner;
  EXPECT_CALL(runner, Call(_))
      .WillOnce(Return(core::ConsoleOutput(1, "", "No such directory")));
  EXPECT_TRUE(
      handler->ExtractArtifacts(runner.AsStdFunction(), "/out", "").empty());
}

}  // namespace
